#include "dcp/segmenter.hpp"
#include "dcp/errors.hpp"
#include <opencv2/imgproc.hpp>

namespace dcp {
namespace {
// Removes objects that touch the image border.
void clear_border(cv::Mat& mask) {
    const int h = mask.rows, w = mask.cols;
    auto wipe = [&](int x, int y) {
        if (mask.at<uchar>(y, x)) cv::floodFill(mask, cv::Point(x, y), cv::Scalar(0), nullptr,
                                                cv::Scalar(), cv::Scalar(), 8);
    };
    for (int x = 0; x < w; ++x) {
        wipe(x, 0);
        wipe(x, h - 1);
    }
    for (int y = 0; y < h; ++y) {
        wipe(0, y);
        wipe(w - 1, y);
    }
}

// Fills background regions not connected to the image border.
void fill_holes(cv::Mat& mask) {
    cv::Mat padded;
    cv::copyMakeBorder(mask, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
    cv::floodFill(padded, cv::Point(0, 0), cv::Scalar(255), nullptr, cv::Scalar(), cv::Scalar(), 4);
    cv::Mat holes;
    cv::bitwise_not(padded(cv::Rect(1, 1, mask.cols, mask.rows)), holes);
    cv::bitwise_or(mask, holes, mask);
}
}  // namespace

const KwargSpec& ThreshParams::spec() {
    static const KwargSpec s = {{"thresh", -6.0}};
    return s;
}

ThreshParams ThreshParams::from_kwargs(const Kwargs& kwargs) {
    Kwargs full = defaults_of(spec());
    for (auto& kv : kwargs) full[kv.first] = kv.second;
    ThreshParams p;
    p.thresh = kwarg<double>(full, "thresh");
    return p;
}

Kwargs ThreshParams::to_kwargs() const { return {{"thresh", thresh}}; }

const KwargSpec& MaskPostParams::spec() {
    static const KwargSpec s = {{"clear_border", true}, {"fill_holes", true}, {"closing_disk", 2}};
    return s;
}

MaskPostParams MaskPostParams::from_kwargs(const Kwargs& kwargs) {
    Kwargs full = defaults_of(spec());
    for (auto& kv : kwargs) full[kv.first] = kv.second;
    MaskPostParams p;
    p.clear_border = kwarg<bool>(full, "clear_border");
    p.fill_holes = kwarg<bool>(full, "fill_holes");
    p.closing_disk = kwarg<int>(full, "closing_disk");
    if (p.closing_disk < 0) throw ConfigError("closing_disk must be >= 0");
    return p;
}

Kwargs MaskPostParams::to_kwargs() const {
    return {{"clear_border", clear_border}, {"fill_holes", fill_holes}, {"closing_disk", closing_disk}};
}

SegmenterThresh::SegmenterThresh(ThreshParams params, MaskPostParams mask)
    : params_(params), mask_(mask) {
    if (!(params_.thresh < 0)) throw ConfigError("Threshold values above zero are not supported");
    if (mask_.closing_disk > 0) {
        int d = 2 * mask_.closing_disk + 1;
        closing_kernel_ = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(d, d));
    }
}

cv::Mat SegmenterThresh::segment_mask(const cv::Mat& image_corr) const {
    cv::Mat corr;
    image_corr.convertTo(corr, CV_32F);
    cv::Mat mask = corr < params_.thresh;
    if (mask_.clear_border) clear_border(mask);
    if (mask_.fill_holes) fill_holes(mask);
    if (!closing_kernel_.empty()) cv::morphologyEx(mask, mask, cv::MORPH_CLOSE, closing_kernel_);
    return mask;
}

int SegmenterThresh::segment_frame(const cv::Mat& image_corr, cv::Mat& labels) const {
    cv::Mat mask = segment_mask(image_corr);
    cv::Mat lab;
    int n = cv::connectedComponents(mask, lab, 8, CV_32S) - 1;
    if (n > 32767) throw ConfigError("Too many objects in one frame for int16 labels");
    lab.convertTo(labels, CV_16S);
    return n;
}

void SegmenterThresh::segment_chunk(const ImageStack& corr, ImageStack& labels,
                                    std::vector<int>& label_counts) const {
    if (corr.size() > labels.size())
        throw ConfigError("Chunk of " + std::to_string(corr.size()) + " frames does not fit a label buffer of " +
                          std::to_string(labels.size()));
    label_counts.clear();
    for (int i = 0; i < corr.size(); ++i) {
        cv::Mat dst = labels.frame(i);
        cv::Mat lab;
        label_counts.push_back(segment_frame(corr.frame(i), lab));
        lab.copyTo(dst);
    }
}

std::string SegmenterThresh::get_ppid() const {
    return get_ppid_from_ppkw(params_.to_kwargs(), mask_.to_kwargs());
}

std::string SegmenterThresh::get_ppid_from_ppkw(const Kwargs& kwargs, const Kwargs& kwargs_mask) {
    return get_ppid_code() + ":" + kwargs_to_ppid(ThreshParams::spec(), kwargs) + ":" +
           kwargs_to_ppid(MaskPostParams::spec(), kwargs_mask);
}

std::pair<Kwargs, Kwargs> SegmenterThresh::get_ppkw_from_ppid(const std::string& ppid) {
    std::string rest = split_ppid(ppid, get_ppid_code());
    auto colon = rest.find(':');
    std::string seg = rest.substr(0, colon);
    std::string mask = colon == std::string::npos ? std::string() : rest.substr(colon + 1);
    return {ppid_to_kwargs(ThreshParams::spec(), seg), ppid_to_kwargs(MaskPostParams::spec(), mask)};
}
}
