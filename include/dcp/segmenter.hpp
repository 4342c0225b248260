#pragma once
#include "chunk_cache.hpp"
#include "ppid.hpp"
#include "slots.hpp"
#include <exception>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace dcp {
struct ThreshParams {
    double thresh = -6;

    static const KwargSpec& spec();
    static ThreshParams from_kwargs(const Kwargs& kwargs);
    Kwargs to_kwargs() const;
};

struct MaskPostParams {
    bool clear_border = true;
    bool fill_holes = true;
    int closing_disk = 2;

    static const KwargSpec& spec();
    static MaskPostParams from_kwargs(const Kwargs& kwargs);
    Kwargs to_kwargs() const;
};

// Segments background-corrected frames by thresholding: pixels darker than
// the background by more than |thresh| belong to an object.
class SegmenterThresh {
public:
    explicit SegmenterThresh(ThreshParams params = {}, MaskPostParams mask = {});

    // Binary mask (CV_8U, 0/255) after mask post-processing.
    cv::Mat segment_mask(const cv::Mat& image_corr) const;
    // Labels 1..n (CV_16S) of the objects in one frame; returns n.
    int segment_frame(const cv::Mat& image_corr, cv::Mat& labels) const;
    // Segments every frame of `corr` into the first rows of `labels`.
    void segment_chunk(const ImageStack& corr, ImageStack& labels, std::vector<int>& label_counts) const;

    static std::string get_ppid_code() { return "thresh"; }
    std::string get_ppid() const;
    static std::string get_ppid_from_ppkw(const Kwargs& kwargs, const Kwargs& kwargs_mask);
    static std::pair<Kwargs, Kwargs> get_ppkw_from_ppid(const std::string& ppid);

    const ThreshParams& params() const { return params_; }
    const MaskPostParams& mask_params() const { return mask_; }

private:
    ThreshParams params_;
    MaskPostParams mask_;
    cv::Mat closing_kernel_;
};

// Producer side of the slot handoff: segments every chunk of the corrected
// image cache into free slots, in chunk order.
class SegmenterManager {
public:
    SegmenterManager(SegmenterThresh segmenter, CorrectedImageCache& image_corr, SlotArray& slots);
    ~SegmenterManager();

    void start();
    // Rethrows an exception raised on the segmenter thread.
    void join();
    void run();

    int chunks_segmented() const { return chunks_segmented_; }

private:
    int wait_for_free_slot();

    SegmenterThresh segmenter_;
    CorrectedImageCache& image_corr_;
    SlotArray& slots_;
    int last_slot_ = -1;
    int chunks_segmented_ = 0;
    std::thread thread_;
    std::exception_ptr error_;
};
}
