#pragma once
#include "image_stack.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace dcp {
// Read side of a disk-backed (or in-memory) stack of frames.
class ArraySource {
public:
    virtual ~ArraySource() = default;
    virtual int length() const = 0;
    virtual cv::Size frame_size() const = 0;
    virtual int type() const = 0;
    virtual std::string name() const = 0;
    // Frames [start, stop) as a freshly materialized stack. stop is clipped to length().
    virtual ImageStack read(int start, int stop) const = 0;
};

// Write side: a resizable stack accepting slice writes.
class ArrayTarget {
public:
    virtual ~ArrayTarget() = default;
    virtual int length() const = 0;
    virtual void resize(int length) = 0;
    virtual void write(int start, const ImageStack& rows) = 0;
};

class MemoryArray : public ArraySource, public ArrayTarget {
public:
    MemoryArray(std::string name, cv::Size frame_size, int type, int length = 0);
    MemoryArray(std::string name, ImageStack stack);

    int length() const override;
    cv::Size frame_size() const override { return frame_size_; }
    int type() const override { return type_; }
    std::string name() const override { return name_; }
    ImageStack read(int start, int stop) const override;

    void resize(int length) override;
    void write(int start, const ImageStack& rows) override;

    // Direct access for fixtures; not synchronized with concurrent writes.
    cv::Mat frame(int i) const { return stack_.frame(i); }
    int read_count() const;

private:
    std::string name_;
    cv::Size frame_size_;
    int type_;
    ImageStack stack_;
    mutable std::mutex mu_;
    mutable int reads_ = 0;
};

using SourcePtr = std::shared_ptr<const ArraySource>;
using TargetPtr = std::shared_ptr<ArrayTarget>;
}
