#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Descriptive statistics over the non-missing values of a numerical column.
 * @details An empty optional marks a measure the sample cannot support; it is
 *          never replaced by zero.
 */
struct NumericStats {
    size_t count = 0;
    std::optional<double> mean;      // n >= 1
    std::optional<double> variance;  // sample (n-1), n >= 2
    std::optional<double> stddev;    // n >= 2
    std::optional<double> min;       // n >= 1
    std::optional<double> q1;        // n >= 1
    std::optional<double> median;    // n >= 1
    std::optional<double> q3;        // n >= 1
    std::optional<double> max;       // n >= 1
    std::optional<double> range;     // n >= 1
    std::optional<double> iqr;       // n >= 1
    std::optional<double> skewness;  // adjusted Fisher-Pearson G1, n >= 3 and stddev > 0
    std::optional<double> kurtosis;  // excess G2, n >= 4 and stddev > 0
};

using FrequencyEntry = std::pair<std::string, size_t>;

struct CategoricalStats {
    size_t count = 0;
    size_t distinctCount = 0;
    std::optional<std::string> mostFrequent;
    std::optional<size_t> mostFrequentCount;
    // Descending count, ties in first-seen order.
    std::vector<FrequencyEntry> frequencies;

    std::vector<FrequencyEntry> top(size_t n) const;
};

namespace Statistics {

/**
 * @brief Computes NumericStats for observed (non-missing) values.
 * @pre values contains no NaN.
 * @post Percentiles use linear interpolation on the sorted sample.
 */
NumericStats describeNumeric(const std::vector<double>& values);

/**
 * @brief Builds the frequency table for observed values in row order.
 * @details Matching is exact: case-sensitive and whitespace-preserving.
 */
CategoricalStats describeCategorical(const std::vector<std::string>& values);

} // namespace Statistics
