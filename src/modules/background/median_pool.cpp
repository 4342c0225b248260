#include "dcp/background.hpp"
#include "dcp/errors.hpp"
#include "dcp/logger.hpp"
#include <algorithm>

namespace dcp {
MedianWorkerPool::MedianWorkerPool(int num_workers, int kernel_size, int num_pixels, int block_pixels)
    : kernel_size_(kernel_size), num_pixels_(num_pixels), block_pixels_(block_pixels),
      input_(kernel_size, num_pixels, CV_8U, cv::Scalar(0)),
      output_(1, num_pixels, CV_8U, cv::Scalar(0)) {
    if (num_workers <= 0 || kernel_size <= 0 || block_pixels <= 0)
        throw ConfigError("MedianWorkerPool: worker count, kernel size and block size must be positive");
    done_ = std::make_unique<ProgressMonitor>(num_workers);
    for (int i = 0; i < num_workers; ++i) workers_.emplace_back([this, i] { work(i); });
}

MedianWorkerPool::~MedianWorkerPool() { stop(); }

void MedianWorkerPool::stop() {
    stop_ = true;
    for (auto& w : workers_)
        if (w.joinable()) w.join();
}

cv::Mat MedianWorkerPool::median(const cv::Mat& window) {
    if (window.rows != kernel_size_ || window.cols != num_pixels_ || window.type() != CV_8U)
        throw ConfigError("Median window must be a " + std::to_string(kernel_size_) + " x " +
                          std::to_string(num_pixels_) + " uint8 array");
    window.copyTo(input_);
    done_->reset();

    uint64_t num_jobs = 0;
    for (int start = 0; start < num_pixels_; start += block_pixels_) {
        jobs_.push({start, std::min(start + block_pixels_, num_pixels_)});
        ++num_jobs;
    }
    done_->wait_for_total(num_jobs);
    return output_.clone();
}

void MedianWorkerPool::work(int worker_index) {
    // Element of rank k/2, the upper middle for an even window.
    const int kth = kernel_size_ / 2;
    std::vector<uchar> column(kernel_size_);
    while (!stop_) {
        auto job = jobs_.pop(std::chrono::milliseconds(100));
        if (!job) continue;
        uchar* out = output_.ptr<uchar>(0);
        for (int p = job->start; p < job->stop; ++p) {
            for (int r = 0; r < kernel_size_; ++r) column[r] = input_.ptr<uchar>(r)[p];
            std::nth_element(column.begin(), column.begin() + kth, column.end());
            out[p] = column[kth];
        }
        done_->increment(worker_index);
    }
}
}
