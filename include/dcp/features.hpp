#pragma once
#include <opencv2/core.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace dcp {
// Feature name -> one value per event.
using FeatureMap = std::map<std::string, std::vector<double>>;

// Events detected in one frame: one mask per event plus its features.
struct EventBatch {
    std::vector<cv::Mat> masks;
    FeatureMap features;

    size_t size() const { return masks.size(); }
    bool empty() const { return masks.empty(); }
    // Keeps the events where keep[i] is true, in every column.
    void filter(const std::vector<bool>& keep);
};

// Geometry from contour and pixel moments. Always contains "valid" (1/0):
// events without a usable contour are flagged 0 and dropped downstream.
FeatureMap moments_based_features(const std::vector<cv::Mat>& masks, double pixel_size);

// Brightness statistics inside each mask of the raw and corrected image.
FeatureMap brightness_features(const std::vector<cv::Mat>& masks, const cv::Mat& image,
                               const cv::Mat& image_bg, const cv::Mat& image_corr);

// Haralick texture (mean and peak-to-peak over four directions) of the
// background-corrected image inside each mask. Events whose co-occurrence
// matrix is empty get NaN.
FeatureMap haralick_texture_features(const std::vector<cv::Mat>& masks, const cv::Mat& image_corr);

const std::vector<std::string>& haralick_names();

// The 13 Haralick features of a gray-level image where 0 means "ignore",
// for each of the directions (0,1), (1,1), (1,0), (1,-1). Throws
// EmptyCooccurrence if any direction has no co-occurring pixel pair.
std::vector<std::vector<double>> haralick(const cv::Mat& image);

// Feature computations used by the extractor. Replaceable for testing.
struct FeatureFunctions {
    std::function<FeatureMap(const std::vector<cv::Mat>&, double)> moments = moments_based_features;
    std::function<FeatureMap(const std::vector<cv::Mat>&, const cv::Mat&, const cv::Mat&,
                             const cv::Mat&)> brightness = brightness_features;
    std::function<FeatureMap(const std::vector<cv::Mat>&, const cv::Mat&)> haralick =
        haralick_texture_features;
};
}
