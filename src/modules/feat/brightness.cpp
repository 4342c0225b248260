#include "dcp/features.hpp"
#include "dcp/stats.hpp"

namespace dcp {
FeatureMap brightness_features(const std::vector<cv::Mat>& masks, const cv::Mat& image,
                               const cv::Mat& image_bg, const cv::Mat& image_corr) {
    cv::Mat corr = image_corr;
    if (corr.empty()) cv::subtract(image, image_bg, corr, cv::noArray(), CV_16S);
    else if (corr.type() != CV_16S) corr.convertTo(corr, CV_16S);

    const size_t n = masks.size();
    FeatureMap out;
    for (auto name : {"bright_avg", "bright_sd", "bright_bc_avg", "bright_bc_sd", "bright_perc_10",
                      "bright_perc_90"})
        out[name].assign(n, 0);

    for (size_t i = 0; i < n; ++i) {
        cv::Scalar mean, sd;
        cv::meanStdDev(image, mean, sd, masks[i]);
        out["bright_avg"][i] = mean[0];
        out["bright_sd"][i] = sd[0];
        cv::meanStdDev(corr, mean, sd, masks[i]);
        out["bright_bc_avg"][i] = mean[0];
        out["bright_bc_sd"][i] = sd[0];

        std::vector<double> values;
        for (int y = 0; y < corr.rows; ++y) {
            const uchar* m = masks[i].ptr<uchar>(y);
            const short* c = corr.ptr<short>(y);
            for (int x = 0; x < corr.cols; ++x)
                if (m[x]) values.push_back(c[x]);
        }
        out["bright_perc_10"][i] = quantile(values, 0.1);
        out["bright_perc_90"][i] = quantile(values, 0.9);
    }
    return out;
}
}
