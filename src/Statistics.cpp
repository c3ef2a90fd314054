#include "Statistics.h"
#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

std::vector<FrequencyEntry> CategoricalStats::top(size_t n) const {
    const size_t k = std::min(n, frequencies.size());
    return std::vector<FrequencyEntry>(frequencies.begin(), frequencies.begin() + static_cast<long>(k));
}

namespace {
// Stores value only when it is finite; an overflowed measure stays undefined.
void setFinite(std::optional<double>& field, double value) {
    if (std::isfinite(value)) field = value;
}

// Shape terms use z = (x - mean) / stddev on the scaled sample, so the third
// and fourth powers cannot overflow.
void fillShape(NumericStats& stats, const std::vector<double>& scaled, double mean, double stddev) {
    const size_t n = scaled.size();
    if (n < 3 || !(stddev > 0.0)) return;

    double m3 = 0.0;
    double m4 = 0.0;
    for (double val : scaled) {
        const double z = (val - mean) / stddev;
        const double z2 = z * z;
        m3 += z2 * z;
        m4 += z2 * z2;
    }

    const double nd = static_cast<double>(n);
    setFinite(stats.skewness, nd / ((nd - 1.0) * (nd - 2.0)) * m3);

    if (n > 3) {
        const double termK1 = (nd * (nd + 1.0)) / ((nd - 1.0) * (nd - 2.0) * (nd - 3.0));
        const double termK2 = (3.0 * (nd - 1.0) * (nd - 1.0)) / ((nd - 2.0) * (nd - 3.0));
        setFinite(stats.kurtosis, termK1 * m4 - termK2);
    }
}
} // namespace

namespace Statistics {

NumericStats describeNumeric(const std::vector<double>& values) {
    NumericStats stats;
    stats.count = values.size();
    if (values.empty()) return stats;

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    // Moments run on values divided by the largest magnitude and are scaled back.
    const double scale = std::max(std::abs(sorted.front()), std::abs(sorted.back()));
    std::vector<double> scaled = values;
    if (scale > 0.0) {
        for (double& v : scaled) v /= scale;
    }
    const double unscale = scale > 0.0 ? scale : 1.0;

    // Welford keeps the running variance stable for large magnitudes.
    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : scaled) {
        ++count;
        const double delta = value - mean;
        mean += delta / static_cast<double>(count);
        m2 += delta * (value - mean);
    }
    stats.mean = mean * unscale;

    double scaledStddev = 0.0;
    if (count > 1) {
        const double scaledVariance = std::max(0.0, m2 / static_cast<double>(count - 1));
        scaledStddev = std::sqrt(scaledVariance);
        setFinite(stats.variance, scaledVariance * unscale * unscale);
        setFinite(stats.stddev, scaledStddev * unscale);
    }

    stats.min = sorted.front();
    stats.max = sorted.back();
    setFinite(stats.range, sorted.back() - sorted.front());
    stats.q1 = StatsUtils::percentileSorted(sorted, 0.25);
    stats.median = StatsUtils::percentileSorted(sorted, 0.50);
    stats.q3 = StatsUtils::percentileSorted(sorted, 0.75);
    setFinite(stats.iqr, *stats.q3 - *stats.q1);

    fillShape(stats, scaled, mean, scaledStddev);
    return stats;
}

CategoricalStats describeCategorical(const std::vector<std::string>& values) {
    CategoricalStats stats;
    stats.count = values.size();

    std::unordered_map<std::string, size_t> slot;
    slot.reserve(values.size());
    for (const auto& value : values) {
        auto it = slot.find(value);
        if (it == slot.end()) {
            slot.emplace(value, stats.frequencies.size());
            stats.frequencies.emplace_back(value, 1);
        } else {
            ++stats.frequencies[it->second].second;
        }
    }

    std::stable_sort(stats.frequencies.begin(), stats.frequencies.end(),
                     [](const FrequencyEntry& a, const FrequencyEntry& b) { return a.second > b.second; });

    stats.distinctCount = stats.frequencies.size();
    if (!stats.frequencies.empty()) {
        stats.mostFrequent = stats.frequencies.front().first;
        stats.mostFrequentCount = stats.frequencies.front().second;
    }
    return stats;
}

} // namespace Statistics
