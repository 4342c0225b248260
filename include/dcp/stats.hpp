#pragma once
#include <vector>

namespace dcp {
// Linear-interpolated quantile, q in [0, 1].
double quantile(std::vector<double> x, double q);
// Mean of the two middle values for even sizes.
double median(std::vector<double> x);
// 1-D median filter with reflected borders; for an even window the upper of
// the two middle values is taken.
std::vector<double> median_filter_1d(const std::vector<double>& x, int size);
}
