#pragma once

#include <cstddef>
#include <optional>
#include <vector>

struct Outlier {
    size_t row = 0;
    double value = 0.0;
};

/**
 * @brief Tukey fences for one numerical column.
 * @details Quartiles and fences stay empty when fewer than
 *          OutlierDetector::kMinSamples observed values exist.
 */
struct OutlierReport {
    std::optional<double> q1;
    std::optional<double> q3;
    std::optional<double> iqr;
    std::optional<double> lowerFence;
    std::optional<double> upperFence;
    std::vector<Outlier> outliers; // ascending row order

    size_t count() const noexcept { return outliers.size(); }
};

namespace OutlierDetector {

constexpr size_t kMinSamples = 4;
constexpr double kDefaultIqrMultiplier = 1.5;

/**
 * @brief Flags values strictly outside [Q1 - k*IQR, Q3 + k*IQR].
 * @pre values.size() == rows.size(); rows holds the original row index of each value.
 * @throws std::invalid_argument when the two vectors differ in length.
 */
OutlierReport detect(const std::vector<double>& values,
                     const std::vector<size_t>& rows,
                     double iqrMultiplier = kDefaultIqrMultiplier);

} // namespace OutlierDetector
