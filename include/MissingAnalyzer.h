#pragma once
#include "TypedDataset.h"

#include <string>
#include <vector>

struct ColumnMissing {
    std::string column;
    size_t count = 0;
    double percentage = 0.0;
};

struct MissingReport {
    std::vector<ColumnMissing> columns; // table order
    size_t totalCount = 0;
    size_t totalCells = 0;
    double totalPercentage = 0.0;
};

namespace MissingAnalyzer {

/**
 * @brief count / total * 100, defined as 0 when total is 0.
 */
double percentage(size_t count, size_t total) noexcept;

/**
 * @brief Per-column and dataset-wide missing counts.
 * @details Column percentages are relative to the row count; the dataset-wide
 *          percentage is relative to rows * columns.
 */
MissingReport analyze(const TypedDataset& data);

} // namespace MissingAnalyzer
