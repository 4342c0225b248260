#include "dcp/errors.hpp"
#include "dcp/features.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace dcp {
namespace {
double entropy(const std::vector<double>& p) {
    double h = 0;
    for (double v : p)
        if (v > 0) h -= v * std::log2(v);
    return h;
}

// Symmetric co-occurrence counts for one (dy, dx) offset, zeros ignored.
cv::Mat cooccurrence(const cv::Mat& img, int levels, int dy, int dx) {
    cv::Mat c(levels, levels, CV_64F, cv::Scalar(0));
    for (int y = 0; y < img.rows; ++y) {
        int y2 = y + dy;
        if (y2 < 0 || y2 >= img.rows) continue;
        const uchar* a = img.ptr<uchar>(y);
        const uchar* b = img.ptr<uchar>(y2);
        for (int x = 0; x < img.cols; ++x) {
            int x2 = x + dx;
            if (x2 < 0 || x2 >= img.cols) continue;
            c.at<double>(a[x], b[x2]) += 1;
            c.at<double>(b[x2], a[x]) += 1;
        }
    }
    c.row(0).setTo(0);
    c.col(0).setTo(0);
    return c;
}

std::vector<double> haralick_one(const cv::Mat& cmat) {
    const int n = cmat.rows;
    cv::Mat p = cmat / cv::sum(cmat)[0];
    std::vector<double> f(13, 0.0);

    std::vector<double> px(n, 0), py(n, 0), pxpy(2 * n, 0), pxmy(n, 0);
    double ij_p = 0, idm = 0, asm_ = 0;
    std::vector<double> flat;
    flat.reserve(n * n);
    for (int i = 0; i < n; ++i) {
        const double* row = p.ptr<double>(i);
        for (int j = 0; j < n; ++j) {
            double v = row[j];
            flat.push_back(v);
            px[j] += v;
            py[i] += v;
            pxpy[i + j] += v;
            pxmy[std::abs(i - j)] += v;
            ij_p += static_cast<double>(i) * j * v;
            idm += v / ((i - j) * (i - j) + 1.0);
            asm_ += v * v;
        }
    }
    double ux = 0, uy = 0, vx = 0, vy = 0;
    for (int k = 0; k < n; ++k) {
        ux += k * px[k];
        uy += k * py[k];
        vx += static_cast<double>(k) * k * px[k];
        vy += static_cast<double>(k) * k * py[k];
    }
    vx -= ux * ux;
    vy -= uy * uy;
    double sx = std::sqrt(std::max(vx, 0.0)), sy = std::sqrt(std::max(vy, 0.0));

    f[0] = asm_;
    for (int k = 0; k < n; ++k) f[1] += static_cast<double>(k) * k * pxmy[k];
    f[2] = (sx == 0 || sy == 0) ? 1.0 : (ij_p - ux * uy) / (sx * sy);
    f[3] = vx;
    f[4] = idm;
    for (int k = 0; k < 2 * n; ++k) f[5] += k * pxpy[k];
    for (int k = 0; k < 2 * n; ++k) f[6] += (k - f[5]) * (k - f[5]) * pxpy[k];
    f[7] = entropy(pxpy);
    f[8] = entropy(flat);
    double mean_d = 0;
    for (double v : pxmy) mean_d += v;
    mean_d /= n;
    for (double v : pxmy) f[9] += (v - mean_d) * (v - mean_d);
    f[9] /= n;
    f[10] = entropy(pxmy);

    double hx = entropy(px), hy = entropy(py);
    double hxy1 = 0, hxy2 = 0;
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            double cross = px[i] * py[j];
            double logc = cross > 0 ? std::log2(cross) : 0.0;
            hxy1 -= p.at<double>(i, j) * logc;
            hxy2 -= cross * logc;
        }
    }
    double hmax = std::max(hx, hy);
    f[11] = hmax > 0 ? (f[8] - hxy1) / hmax : 0.0;
    f[12] = std::sqrt(std::max(0.0, 1 - std::exp(-2.0 * (hxy2 - f[8]))));
    return f;
}
}  // namespace

const std::vector<std::string>& haralick_names() {
    static const std::vector<std::string> names = {
        "tex_asm_avg", "tex_asm_ptp", "tex_con_avg", "tex_con_ptp", "tex_cor_avg", "tex_cor_ptp",
        "tex_den_avg", "tex_den_ptp", "tex_ent_avg", "tex_ent_ptp", "tex_f12_avg", "tex_f12_ptp",
        "tex_f13_avg", "tex_f13_ptp", "tex_idm_avg", "tex_idm_ptp", "tex_sen_avg", "tex_sen_ptp",
        "tex_sva_avg", "tex_sva_ptp", "tex_var_avg", "tex_var_ptp"};
    return names;
}

std::vector<std::vector<double>> haralick(const cv::Mat& image) {
    CV_Assert(image.type() == CV_8U);
    double maxv;
    cv::minMaxLoc(image, nullptr, &maxv);
    const int levels = static_cast<int>(maxv) + 1;
    static const int deltas[4][2] = {{0, 1}, {1, 1}, {1, 0}, {1, -1}};

    std::vector<std::vector<double>> out;
    for (auto& d : deltas) {
        cv::Mat c = cooccurrence(image, levels, d[0], d[1]);
        if (cv::sum(c)[0] == 0)
            throw EmptyCooccurrence("haralick: the input is empty, cannot compute features");
        out.push_back(haralick_one(c));
    }
    return out;
}

FeatureMap haralick_texture_features(const std::vector<cv::Mat>& masks, const cv::Mat& image_corr) {
    const size_t n = masks.size();
    FeatureMap out;
    for (auto& name : haralick_names()) out[name].assign(n, std::numeric_limits<double>::quiet_NaN());

    // (name, index into the 13 Haralick features). Sum average (5) duplicates
    // the corrected brightness and difference variance (9) depends on the gray
    // offset, so neither is reported.
    static const std::vector<std::pair<std::string, int>> used = {
        {"asm", 0}, {"con", 1}, {"cor", 2}, {"var", 3}, {"idm", 4}, {"sva", 6},
        {"sen", 7}, {"ent", 8}, {"den", 10}, {"f12", 11}, {"f13", 12}};

    cv::Mat corr;
    image_corr.convertTo(corr, CV_32S);
    for (size_t i = 0; i < n; ++i) {
        double minval;
        cv::minMaxLoc(corr, &minval, nullptr, nullptr, nullptr, masks[i]);
        // Shift to positive gray values, zero (= ignored) outside the mask.
        // Values more than 254 above the in-mask minimum saturate at 255.
        cv::Mat shifted = corr - static_cast<int>(minval) + 1;
        cv::Mat gray;
        shifted.convertTo(gray, CV_8U);
        cv::Mat img(gray.size(), CV_8U, cv::Scalar(0));
        gray.copyTo(img, masks[i]);

        std::vector<std::vector<double>> feats;
        try {
            feats = haralick(img);
        } catch (const EmptyCooccurrence&) {
            // e.g. a one-pixel line has no diagonal or vertical neighbours
            continue;
        }
        for (auto& u : used) {
            double lo = feats[0][u.second], hi = lo, sum = 0;
            for (auto& dir : feats) {
                lo = std::min(lo, dir[u.second]);
                hi = std::max(hi, dir[u.second]);
                sum += dir[u.second];
            }
            out["tex_" + u.first + "_avg"][i] = sum / feats.size();
            out["tex_" + u.first + "_ptp"][i] = hi - lo;
        }
    }
    return out;
}
}
