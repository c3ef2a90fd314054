#pragma once
#include "TypedDataset.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Symmetric matrix of pairwise-complete Pearson coefficients.
 * @details Cells are stored once per unordered pair; at(i, j) == at(j, i).
 */
class CorrelationMatrix {
public:
    CorrelationMatrix() = default;
    explicit CorrelationMatrix(std::vector<std::string> columnNames);

    size_t size() const noexcept { return names_.size(); }
    bool empty() const noexcept { return names_.empty(); }
    const std::vector<std::string>& columnNames() const noexcept { return names_; }

    std::optional<double> at(size_t i, size_t j) const;

    /**
     * @throws Datalens::DatasetException when either name is not a numerical column of the matrix.
     */
    std::optional<double> at(const std::string& a, const std::string& b) const;

    // Rows where both columns were observed.
    size_t jointCount(size_t i, size_t j) const;

    void set(size_t i, size_t j, std::optional<double> coefficient, size_t jointRows);

private:
    size_t slot(size_t i, size_t j) const;
    size_t indexOf(const std::string& name) const;

    std::vector<std::string> names_;
    std::vector<std::optional<double>> cells_;
    std::vector<size_t> joint_;
};

namespace CorrelationEngine {

/**
 * @brief Computes the matrix over the given numerical columns of data.
 * @pre every index in numericColumns refers to a NUMERIC column.
 * @post The diagonal is 1.0 where the column has >= 2 observed values; a pair
 *       with fewer than 2 jointly observed rows or zero variance is undefined.
 */
CorrelationMatrix compute(const TypedDataset& data,
                          const std::vector<size_t>& numericColumns,
                          bool parallel = false);

} // namespace CorrelationEngine
