#pragma once
#include "array_source.hpp"
#include "blocking_queue.hpp"
#include "ppid.hpp"
#include "progress_monitor.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace dcp {
// Timing information available for a measurement; any member may be empty/zero.
struct TimeInfo {
    std::vector<double> time;   // recorded per-frame time [s]
    std::vector<double> frame;  // recorded frame numbers
    double frame_rate = 0;      // [Hz]
};

struct SparseMedianParams {
    int kernel_size = 200;
    double split_time = 1.0;
    double thresh_cleansing = 0;
    double frac_cleansing = 0.8;

    static const KwargSpec& spec();
    static SparseMedianParams from_kwargs(const Kwargs& kwargs);
    Kwargs to_kwargs() const;
    void validate() const;
};

// Computes per-pixel medians of a kernel_size x npix block on a fixed set of
// threads. The block is split into column jobs of `block_pixels`.
class MedianWorkerPool {
public:
    MedianWorkerPool(int num_workers, int kernel_size, int num_pixels, int block_pixels = 500);
    ~MedianWorkerPool();
    MedianWorkerPool(const MedianWorkerPool&) = delete;
    MedianWorkerPool& operator=(const MedianWorkerPool&) = delete;

    // Rows of `window` are frames; returns a 1 x npix CV_8U row of medians.
    cv::Mat median(const cv::Mat& window);
    void stop();
    int num_workers() const { return static_cast<int>(workers_.size()); }

private:
    struct Job { int start; int stop; };
    void work(int worker_index);

    int kernel_size_;
    int num_pixels_;
    int block_pixels_;
    cv::Mat input_;   // kernel_size x npix, CV_8U
    cv::Mat output_;  // 1 x npix, CV_8U
    BlockingQueue<Job> jobs_;
    std::unique_ptr<ProgressMonitor> done_;
    std::atomic<bool> stop_{false};
    std::vector<std::thread> workers_;
};

// Sparse median background: one median image every `split_time` seconds,
// optionally cleansed of images that contain objects, each frame assigned the
// nearest surviving image in time.
class BackgroundSparseMedian {
public:
    BackgroundSparseMedian(SourcePtr input, TargetPtr output, SparseMedianParams params,
                           TimeInfo time_info = {}, int num_cpus = 0);
    ~BackgroundSparseMedian();

    void process();

    static std::string get_ppid_code() { return "sparsemed"; }
    std::string get_ppid() const;
    static std::string get_ppid_from_ppkw(const Kwargs& kwargs);
    static Kwargs get_ppkw_from_ppid(const std::string& ppid);

    const SparseMedianParams& params() const { return params_; }
    const std::vector<double>& time() const { return time_; }
    const std::vector<double>& step_times() const { return step_times_; }
    const std::vector<cv::Mat>& bg_images() const { return bg_images_; }
    const std::vector<bool>& used() const { return used_; }
    const std::vector<int>& bg_index() const { return bg_idx_; }

    // Helpers, exposed for testing.
    static std::vector<double> build_time_axis(int event_count, const TimeInfo& info);
    static std::vector<double> make_step_times(double duration, double split_time);
    // First frame of the median window for a step time, clamped to the input.
    static int window_start(const std::vector<double>& time, double t, int kernel_size);
    // Images kept by the cleansing algorithm (all true if frac_cleansing == 1).
    static std::vector<bool> cleanse(const std::vector<cv::Mat>& images, double thresh_cleansing,
                                     double frac_cleansing);
    // Index into `step_times` for every frame: nearest in time, ties to the earlier.
    static std::vector<int> assign_background(const std::vector<double>& time,
                                              const std::vector<double>& step_times);

private:
    void process_step(size_t ii, double t);
    void write_output(const std::vector<cv::Mat>& images, const std::vector<int>& index);

    SourcePtr input_;
    TargetPtr output_;
    SparseMedianParams params_;
    int event_count_;
    cv::Size frame_size_;
    std::vector<double> time_;
    std::vector<double> step_times_;
    std::vector<cv::Mat> bg_images_;
    std::vector<bool> used_;
    std::vector<int> bg_idx_;
    std::unique_ptr<MedianWorkerPool> pool_;
};
}
