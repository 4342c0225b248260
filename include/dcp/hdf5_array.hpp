#pragma once
#include "array_source.hpp"
#include <hdf5.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dcp {
// The HDF5 C library is not assumed to be built thread-safe; every call made
// through these wrappers holds this mutex.
std::mutex& hdf5_mutex();

class Hdf5File {
public:
    enum class Mode { ReadOnly, ReadWrite, Truncate };

    Hdf5File(const std::string& path, Mode mode);
    ~Hdf5File();
    Hdf5File(const Hdf5File&) = delete;
    Hdf5File& operator=(const Hdf5File&) = delete;

    const std::string& path() const { return path_; }
    hid_t id() const { return id_; }
    bool writable() const { return mode_ != Mode::ReadOnly; }

    bool has(const std::string& object) const;
    std::vector<hsize_t> dims(const std::string& dataset) const;

    std::vector<double> read_vector(const std::string& dataset) const;
    // Appends to a 1-D extendable float64 dataset, creating it on first use.
    void append_vector(const std::string& dataset, const std::vector<double>& values);

    bool has_attr(const std::string& name) const;
    double attr_double(const std::string& name) const;
    std::string attr_string(const std::string& name) const;
    void set_attr(const std::string& name, const std::string& value);
    void set_attr(const std::string& name, double value);

    void flush();

private:
    std::string path_;
    Mode mode_;
    hid_t id_ = -1;
};

using FilePtr = std::shared_ptr<Hdf5File>;

// (N, H, W) image dataset, chunked along N and resizable along N.
class Hdf5ImageDataset : public ArraySource, public ArrayTarget {
public:
    Hdf5ImageDataset(FilePtr file, std::string dataset);
    ~Hdf5ImageDataset() override;
    Hdf5ImageDataset(const Hdf5ImageDataset&) = delete;
    Hdf5ImageDataset& operator=(const Hdf5ImageDataset&) = delete;

    static std::shared_ptr<Hdf5ImageDataset> create(FilePtr file, const std::string& dataset,
                                                    cv::Size frame_size, int type, int length,
                                                    bool compress = true);

    int length() const override;
    cv::Size frame_size() const override { return frame_size_; }
    int type() const override { return type_; }
    std::string name() const override { return file_->path() + ":" + dataset_; }
    ImageStack read(int start, int stop) const override;

    void resize(int length) override;
    void write(int start, const ImageStack& rows) override;

private:
    // Element type used for reads and writes; the caller closes it.
    hid_t memory_type() const;

    FilePtr file_;
    std::string dataset_;
    hid_t id_ = -1;
    cv::Size frame_size_;
    int type_ = -1;
    bool is_enum_ = false;
};
}
