#include "OutlierDetector.h"
#include "StatsUtils.h"

#include <algorithm>
#include <stdexcept>

namespace OutlierDetector {

OutlierReport detect(const std::vector<double>& values,
                     const std::vector<size_t>& rows,
                     double iqrMultiplier) {
    if (values.size() != rows.size()) {
        throw std::invalid_argument("OutlierDetector::detect: values and rows differ in length");
    }

    OutlierReport report;
    if (values.size() < kMinSamples) return report;

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    const double q1 = StatsUtils::percentileSorted(sorted, 0.25);
    const double q3 = StatsUtils::percentileSorted(sorted, 0.75);
    const double iqr = q3 - q1;
    const double lo = q1 - iqrMultiplier * iqr;
    const double hi = q3 + iqrMultiplier * iqr;

    report.q1 = q1;
    report.q3 = q3;
    report.iqr = iqr;
    report.lowerFence = lo;
    report.upperFence = hi;

    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] < lo || values[i] > hi) {
            report.outliers.push_back(Outlier{rows[i], values[i]});
        }
    }
    std::sort(report.outliers.begin(), report.outliers.end(),
              [](const Outlier& a, const Outlier& b) { return a.row < b.row; });
    return report;
}

} // namespace OutlierDetector
