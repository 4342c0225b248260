#include "dcp/background.hpp"
#include "dcp/errors.hpp"
#include "dcp/logger.hpp"
#include "dcp/stats.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace dcp {
namespace {
std::vector<double> linspace(double start, double stop, int n) {
    std::vector<double> out(n);
    if (n == 1) out[0] = start;
    for (int i = 0; i < n && n > 1; ++i) out[i] = start + (stop - start) * i / (n - 1);
    return out;
}

double variance(const std::vector<double>& x) {
    if (x.empty()) return 0;
    double mean = std::accumulate(x.begin(), x.end(), 0.0) / x.size();
    double acc = 0;
    for (double v : x) acc += (v - mean) * (v - mean);
    return acc / x.size();
}
}  // namespace

const KwargSpec& SparseMedianParams::spec() {
    static const KwargSpec s = {
        {"kernel_size", 200},
        {"split_time", 1.0},
        {"thresh_cleansing", 0.0},
        {"frac_cleansing", 0.8},
    };
    return s;
}

SparseMedianParams SparseMedianParams::from_kwargs(const Kwargs& kwargs) {
    Kwargs full = defaults_of(spec());
    for (auto& kv : kwargs) full[kv.first] = kv.second;
    SparseMedianParams p;
    p.kernel_size = kwarg<int>(full, "kernel_size");
    p.split_time = kwarg<double>(full, "split_time");
    p.thresh_cleansing = kwarg<double>(full, "thresh_cleansing");
    p.frac_cleansing = kwarg<double>(full, "frac_cleansing");
    return p;
}

Kwargs SparseMedianParams::to_kwargs() const {
    return {{"kernel_size", kernel_size},
            {"split_time", split_time},
            {"thresh_cleansing", thresh_cleansing},
            {"frac_cleansing", frac_cleansing}};
}

void SparseMedianParams::validate() const {
    if (kernel_size <= 0) throw ConfigError("kernel_size must be > 0");
    if (split_time <= 0) throw ConfigError("split_time must be > 0");
    if (thresh_cleansing < 0) throw ConfigError("Cleansing threshold must be >= 0");
    if (frac_cleansing <= 0 || frac_cleansing > 1)
        throw ConfigError("Cleansing fraction must be in (0, 1]");
}

BackgroundSparseMedian::BackgroundSparseMedian(SourcePtr input, TargetPtr output,
                                               SparseMedianParams params, TimeInfo time_info,
                                               int num_cpus)
    : input_(std::move(input)), output_(std::move(output)), params_(params) {
    params_.validate();
    event_count_ = input_->length();
    frame_size_ = input_->frame_size();
    if (event_count_ == 0) throw ConfigError("Cannot compute a background for empty input " + input_->name());
    if (input_->type() != CV_8U) throw ConfigError("Background input must be uint8: " + input_->name());

    if (params_.kernel_size > event_count_) {
        Logger::warn("The kernel size %d is too large for input data size %d. "
                     "Setting it to input data size!", params_.kernel_size, event_count_);
        params_.kernel_size = event_count_;
    }

    time_ = build_time_axis(event_count_, time_info);
    step_times_ = make_step_times(time_.back() - time_.front(), params_.split_time);
    bg_images_.resize(step_times_.size());

    if (num_cpus <= 0) num_cpus = std::max(1u, std::thread::hardware_concurrency());
    pool_ = std::make_unique<MedianWorkerPool>(num_cpus, params_.kernel_size, frame_size_.area());
}

BackgroundSparseMedian::~BackgroundSparseMedian() = default;

std::string BackgroundSparseMedian::get_ppid() const {
    return get_ppid_from_ppkw(params_.to_kwargs());
}

std::string BackgroundSparseMedian::get_ppid_from_ppkw(const Kwargs& kwargs) {
    return get_ppid_code() + ":" + kwargs_to_ppid(SparseMedianParams::spec(), kwargs);
}

Kwargs BackgroundSparseMedian::get_ppkw_from_ppid(const std::string& ppid) {
    return ppid_to_kwargs(SparseMedianParams::spec(), split_ppid(ppid, get_ppid_code()));
}

std::vector<double> BackgroundSparseMedian::build_time_axis(int event_count, const TimeInfo& info) {
    std::vector<double> time;
    if (static_cast<int>(info.time.size()) == event_count && event_count > 0) {
        time = info.time;
        double t0 = time.front();
        for (auto& t : time) t -= t0;
    } else if (info.frame_rate > 0) {
        if (static_cast<int>(info.frame.size()) == event_count && event_count > 0) {
            time.resize(event_count);
            for (int i = 0; i < event_count; ++i) time[i] = (info.frame[i] - info.frame[0]) / info.frame_rate;
        } else {
            double dur = event_count / info.frame_rate * 1.5;
            Logger::info("Approximating duration: %.1fmin", dur / 60);
            time = linspace(0, dur, event_count);
        }
    } else {
        double dur = event_count / 3600.0 * 1.5;
        Logger::info("Guessing duration: %.1fmin", dur / 60);
        time = linspace(0, dur, event_count);
    }
    return time;
}

std::vector<double> BackgroundSparseMedian::make_step_times(double duration, double split_time) {
    std::vector<double> steps;
    for (long k = 0; k * split_time < duration; ++k) steps.push_back(k * split_time);
    if (steps.empty()) steps.push_back(0);
    return steps;
}

int BackgroundSparseMedian::window_start(const std::vector<double>& time, double t, int kernel_size) {
    int n = static_cast<int>(time.size());
    int idx_start = 0;
    double best = std::abs(time[0] - t);
    for (int i = 1; i < n; ++i) {
        double d = std::abs(time[i] - t);
        if (d < best) {
            best = d;
            idx_start = i;
        }
    }
    int idx_stop = idx_start + kernel_size;
    if (idx_stop >= n) {
        idx_stop = n;
        idx_start = std::max(0, idx_stop - kernel_size);
    }
    return idx_start;
}

void BackgroundSparseMedian::process_step(size_t ii, double t) {
    int start = window_start(time_, t, params_.kernel_size);
    ImageStack window = input_->read(start, start + params_.kernel_size);
    if (window.size() != params_.kernel_size)
        throw IoError("Short read from " + input_->name() + " at frame " + std::to_string(start));
    cv::Mat med = pool_->median(window.data);
    bg_images_[ii] = med.reshape(1, frame_size_.height).clone();
}

void BackgroundSparseMedian::process() {
    for (size_t ii = 0; ii < step_times_.size(); ++ii) {
        Logger::debug("Computing background %.0f%%", 100.0 * ii / step_times_.size());
        process_step(ii, step_times_[ii]);
    }
    Logger::info("Computed %zu background images", step_times_.size());

    if (params_.frac_cleansing != 1) {
        used_ = cleanse(bg_images_, params_.thresh_cleansing, params_.frac_cleansing);
    } else {
        Logger::info("Background series cleansing disabled.");
        used_.assign(bg_images_.size(), true);
    }

    std::vector<double> times;
    std::vector<cv::Mat> images;
    for (size_t i = 0; i < used_.size(); ++i) {
        if (!used_[i]) continue;
        times.push_back(step_times_[i]);
        images.push_back(bg_images_[i]);
    }
    bg_idx_ = assign_background(time_, times);
    write_output(images, bg_idx_);
    pool_->stop();
}

void BackgroundSparseMedian::write_output(const std::vector<cv::Mat>& images,
                                          const std::vector<int>& index) {
    output_->resize(event_count_);
    const int step = 1000;
    for (int pos = 0; pos < event_count_; pos += step) {
        int stop = std::min(pos + step, event_count_);
        ImageStack rows(stop - pos, frame_size_, CV_8U);
        for (int r = 0; r < rows.size(); ++r)
            images[index[pos + r]].reshape(1, 1).copyTo(rows.data.row(r));
        output_->write(pos, rows);
    }
}

std::vector<bool> BackgroundSparseMedian::cleanse(const std::vector<cv::Mat>& images,
                                                  double thresh_cleansing, double frac_cleansing) {
    const size_t n = images.size();
    if (n == 0 || frac_cleansing == 1) return std::vector<bool>(n, true);
    const int height = images[0].rows;

    // Peak-to-peak gray value along the channel axis, one profile per image.
    std::vector<std::vector<double>> prof(n, std::vector<double>(height));
    for (size_t i = 0; i < n; ++i) {
        for (int y = 0; y < height; ++y) {
            double lo, hi;
            cv::minMaxLoc(images[i].row(y), &lo, &hi);
            prof[i][y] = hi - lo;
        }
    }
    // Normalize by the median profile and average over the channel center.
    int spread = std::max(20, height / 4);
    int c0 = std::max(0, height / 2 - spread);
    int c1 = std::min(height, height / 2 + spread);
    std::vector<double> cent(n, 0);
    for (int y = c0; y < c1; ++y) {
        std::vector<double> col(n);
        for (size_t i = 0; i < n; ++i) col[i] = prof[i][y];
        double med = median(col);
        for (size_t i = 0; i < n; ++i) cent[i] += prof[i][y] - med;
    }
    for (auto& c : cent) c /= std::max(1, c1 - c0);

    // Images with objects stand out against a time-smoothed baseline. The
    // window of 10 is in background steps, i.e. time, not frames.
    std::vector<double> base = median_filter_1d(cent, 10);
    std::vector<double> x(n);
    for (size_t i = 0; i < n; ++i) x[i] = cent[i] - base[i];
    double xm = median(x);
    std::vector<double> ref(n);
    for (size_t i = 0; i < n; ++i) ref[i] = std::abs(x[i] - xm);

    double thresh_fact = variance(ref) * 150;
    double thresh = thresh_cleansing != 0 ? thresh_fact / thresh_cleansing : quantile(ref, frac_cleansing);

    auto select = [&](double th, std::vector<bool>& used) {
        used.assign(n, false);
        size_t removed = 0;
        for (size_t i = 0; i < n; ++i) {
            used[i] = ref[i] <= th;
            if (!used[i]) ++removed;
        }
        return static_cast<double>(removed) / n;
    };
    std::vector<bool> used;
    double frac_remove = select(thresh, used);

    if (thresh_cleansing != 0 && (1 - frac_remove) < frac_cleansing) {
        double frac_remove_user = frac_remove;
        thresh = quantile(ref, frac_cleansing);
        frac_remove = select(thresh, used);
        Logger::warn("%.1f%% of the background images would be removed with the current settings, "
                     "so we enforce `frac_cleansing`. To avoid this warning, try decreasing "
                     "`thresh_cleansing` or `frac_cleansing`. The new threshold is %g.",
                     frac_remove_user * 100, thresh > 0 ? thresh_fact / thresh : 0.0);
    }
    Logger::info("Removed %.2f%% of the background series", frac_remove * 100);
    return used;
}

std::vector<int> BackgroundSparseMedian::assign_background(const std::vector<double>& time,
                                                           const std::vector<double>& step_times) {
    if (step_times.empty()) throw ConfigError("No background images to assign");
    std::vector<int> idx(time.size());
    const int last = static_cast<int>(step_times.size()) - 1;
    for (size_t f = 0; f < time.size(); ++f) {
        double t = time[f];
        int j = static_cast<int>(std::lower_bound(step_times.begin(), step_times.end(), t) -
                                 step_times.begin());
        if (j > last) idx[f] = last;
        else if (j == 0) idx[f] = 0;
        else idx[f] = (t - step_times[j - 1] <= step_times[j] - t) ? j - 1 : j;
    }
    return idx;
}
}
