#include "dcp/features.hpp"
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <limits>

namespace dcp {
namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const std::vector<std::string>& moment_names() {
    static const std::vector<std::string> names = {
        "area_msd", "area_cvx", "area_ratio", "area_um", "circ", "deform", "inert_ratio_cvx",
        "inert_ratio_raw", "pos_x", "pos_y", "size_x", "size_y", "tilt", "valid"};
    return names;
}

double ratio_sqrt(double num, double den) { return den > 0 && num >= 0 ? std::sqrt(num / den) : kNaN; }
}  // namespace

void EventBatch::filter(const std::vector<bool>& keep) {
    std::vector<cv::Mat> m;
    for (size_t i = 0; i < masks.size(); ++i)
        if (keep[i]) m.push_back(masks[i]);
    masks.swap(m);
    for (auto& kv : features) {
        std::vector<double> v;
        for (size_t i = 0; i < kv.second.size(); ++i)
            if (keep[i]) v.push_back(kv.second[i]);
        kv.second.swap(v);
    }
}

FeatureMap moments_based_features(const std::vector<cv::Mat>& masks, double pixel_size) {
    const size_t n = masks.size();
    FeatureMap out;
    for (auto& name : moment_names()) out[name].assign(n, kNaN);
    const double px2 = pixel_size * pixel_size;

    for (size_t i = 0; i < n; ++i) {
        out["valid"][i] = 0;
        cv::Moments pix = cv::moments(masks[i], true);
        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(masks[i], contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);
        if (contours.empty() || pix.m00 == 0) continue;

        size_t largest = 0;
        for (size_t c = 1; c < contours.size(); ++c)
            if (contours[c].size() > contours[largest].size()) largest = c;
        const auto& cont = contours[largest];

        std::vector<cv::Point> hull;
        cv::convexHull(cont, hull);
        cv::Moments mc = cv::moments(cont);
        cv::Moments mh = cv::moments(hull);
        double area_msd = std::abs(mc.m00);
        double area_cvx = std::abs(mh.m00);
        double perimeter = cv::arcLength(hull, true);

        out["area_msd"][i] = area_msd;
        out["area_cvx"][i] = area_cvx;
        out["area_ratio"][i] = area_msd > 0 ? area_cvx / area_msd : kNaN;
        out["area_um"][i] = area_cvx * px2;
        double circ = perimeter > 0 ? 2 * std::sqrt(CV_PI * area_cvx) / perimeter : kNaN;
        out["circ"][i] = circ;
        out["deform"][i] = 1 - circ;

        // Degenerate hulls (lines) have no area; fall back to pixel moments.
        const cv::Moments& geo = mh.m00 != 0 ? mh : pix;
        out["pos_x"][i] = geo.m10 / geo.m00 * pixel_size;
        out["pos_y"][i] = geo.m01 / geo.m00 * pixel_size;
        out["inert_ratio_cvx"][i] = ratio_sqrt(geo.mu20, geo.mu02);
        out["inert_ratio_raw"][i] = ratio_sqrt(pix.mu20, pix.mu02);
        out["tilt"][i] = std::abs(0.5 * std::atan2(-2 * geo.mu11, geo.mu02 - geo.mu20));

        cv::Rect box = cv::boundingRect(cont);
        out["size_x"][i] = box.width * pixel_size;
        out["size_y"][i] = box.height * pixel_size;
        out["valid"][i] = 1;
    }
    return out;
}
}
