#pragma once
#include <optional>
#include <vector>

class MathUtils {
public:
    /**
     * @brief Computes Pearson's correlation coefficient between two row-aligned vectors.
     * @pre x.size() == y.size().
     * @post Returns std::nullopt when fewer than 2 pairs exist or either side has zero variance.
     *       A returned value is clamped to [-1, 1].
     */
    static std::optional<double> calculatePearson(const std::vector<double>& x, const std::vector<double>& y);
};
