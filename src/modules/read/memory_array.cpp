#include "dcp/array_source.hpp"
#include "dcp/errors.hpp"
#include <algorithm>

namespace dcp {
MemoryArray::MemoryArray(std::string name, cv::Size frame_size, int type, int length)
    : name_(std::move(name)), frame_size_(frame_size), type_(type),
      stack_(length, frame_size, type) {}

MemoryArray::MemoryArray(std::string name, ImageStack stack)
    : name_(std::move(name)), frame_size_(stack.frame_size), type_(stack.type()),
      stack_(std::move(stack)) {}

int MemoryArray::length() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stack_.size();
}

ImageStack MemoryArray::read(int start, int stop) const {
    std::lock_guard<std::mutex> lk(mu_);
    stop = std::min(stop, stack_.size());
    if (start < 0 || start > stop)
        throw OutOfBounds("Slice [" + std::to_string(start) + ", " + std::to_string(stop) +
                          ") out of bounds for " + name_);
    ++reads_;
    return stack_.rows(start, stop).clone();
}

void MemoryArray::resize(int length) {
    std::lock_guard<std::mutex> lk(mu_);
    ImageStack grown(length, frame_size_, type_);
    int keep = std::min(length, stack_.size());
    if (keep > 0) stack_.data.rowRange(0, keep).copyTo(grown.data.rowRange(0, keep));
    stack_ = std::move(grown);
}

void MemoryArray::write(int start, const ImageStack& rows) {
    std::lock_guard<std::mutex> lk(mu_);
    if (rows.frame_size != frame_size_)
        throw IoError("Frame size mismatch when writing to " + name_);
    if (start < 0 || start + rows.size() > stack_.size())
        throw OutOfBounds("Write [" + std::to_string(start) + ", " +
                          std::to_string(start + rows.size()) + ") out of bounds for " + name_);
    rows.data.convertTo(stack_.data.rowRange(start, start + rows.size()), type_);
}

int MemoryArray::read_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return reads_;
}
}
