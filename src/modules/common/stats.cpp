#include "dcp/stats.hpp"
#include <algorithm>
#include <cmath>

namespace dcp {
std::vector<double> median_filter_1d(const std::vector<double>& x, int size) {
    const int n = static_cast<int>(x.size());
    std::vector<double> out(n);
    if (n == 0) return out;
    auto reflect = [n](int j) {
        while (j < 0 || j >= n) j = j < 0 ? -j - 1 : 2 * n - j - 1;
        return j;
    };
    std::vector<double> window(size);
    const int left = size / 2;
    for (int i = 0; i < n; ++i) {
        for (int k = 0; k < size; ++k) window[k] = x[reflect(i - left + k)];
        std::nth_element(window.begin(), window.begin() + size / 2, window.end());
        out[i] = window[size / 2];
    }
    return out;
}

double quantile(std::vector<double> x, double q) {
    if (x.empty()) return 0;
    std::sort(x.begin(), x.end());
    double pos = q * (x.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, x.size() - 1);
    return x[lo] + (x[hi] - x[lo]) * (pos - lo);
}

double median(std::vector<double> x) { return quantile(std::move(x), 0.5); }
}
