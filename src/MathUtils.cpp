#include "MathUtils.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>

namespace {
// Largest absolute deviation from the mean; deviations are divided by it so
// squared sums stay finite for any finite input.
double deviationScale(const std::vector<double>& v, double mean) {
    double scale = 0.0;
    for (double value : v) scale = std::max(scale, std::abs(value - mean));
    return scale;
}
} // namespace

std::optional<double> MathUtils::calculatePearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;

    const double meanX = StatsUtils::runningMean(x);
    const double meanY = StatsUtils::runningMean(y);
    const double scaleX = deviationScale(x, meanX);
    const double scaleY = deviationScale(y, meanY);
    if (!(scaleX > 0.0) || !(scaleY > 0.0) || !std::isfinite(scaleX) || !std::isfinite(scaleY)) {
        return std::nullopt;
    }

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double dx = (x[i] - meanX) / scaleX;
        const double dy = (y[i] - meanY) / scaleY;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (!(sxx > 0.0) || !(syy > 0.0)) return std::nullopt;

    const double r = sxy / (std::sqrt(sxx) * std::sqrt(syy));
    if (!std::isfinite(r)) return std::nullopt;
    return std::clamp(r, -1.0, 1.0);
}
