#include "StatsUtils.h"

#include <algorithm>
#include <cmath>

namespace StatsUtils {
double runningMean(const std::vector<double>& values) {
    double mean = 0.0;
    size_t count = 0;
    for (double value : values) {
        ++count;
        mean += (value - mean) / static_cast<double>(count);
    }
    return mean;
}

double percentileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.size() == 1) return sorted.front();

    const double qq = std::clamp(q, 0.0, 1.0);
    const double pos = qq * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));
    const double t = pos - static_cast<double>(lo);
    if (lo == hi) return sorted[lo];
    return sorted[lo] + (sorted[hi] - sorted[lo]) * t;
}
}
