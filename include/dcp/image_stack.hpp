#pragma once
#include <opencv2/core.hpp>

namespace dcp {
// A run of frames stored as one row per frame (N x H*W), so that a chunk is a
// single contiguous cv::Mat and frame access needs no copy.
struct ImageStack {
    cv::Mat data;
    cv::Size frame_size;

    ImageStack() = default;
    ImageStack(int frames, cv::Size size, int type)
        : data(frames, size.area(), type, cv::Scalar(0)), frame_size(size) {}
    ImageStack(cv::Mat rows, cv::Size size) : data(std::move(rows)), frame_size(size) {}

    int size() const { return data.rows; }
    bool empty() const { return data.empty(); }
    int type() const { return data.type(); }

    // H x W view of frame i (shares memory with the stack).
    cv::Mat frame(int i) const { return data.row(i).reshape(1, frame_size.height); }

    ImageStack rows(int start, int stop) const { return {data.rowRange(start, stop), frame_size}; }
    ImageStack clone() const { return {data.clone(), frame_size}; }
};
}
