#pragma once
#include "Table.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;

const char* toString(ColumnType type);

/**
 * @brief One column resolved to a single type.
 * @details Storage is row-aligned with the missing mask. Missing slots hold NaN
 *          (numeric) or an empty string (categorical) and must be skipped via the mask.
 */
struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    size_t rowCount() const noexcept { return missing.size(); }
    size_t missingCount() const noexcept;
    size_t observedCount() const noexcept { return rowCount() - missingCount(); }

    const std::vector<double>& numeric() const;
    const std::vector<std::string>& text() const;

    // Non-missing entries in row order.
    std::vector<double> observedValues() const;
    std::vector<std::string> observedText() const;
    std::vector<size_t> observedRows() const;
};

class TypedDataset {
public:
    /**
     * @brief Classifies and resolves every column of the table once.
     * @pre table is well-formed (guaranteed by Table's constructor).
     * @post columns() is index-aligned with table.columns().
     */
    TypedDataset(const Table& table, const MissingPolicy& policy, bool parallel = false);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }

    std::vector<size_t> numericColumnIndices() const;
    std::vector<size_t> categoricalColumnIndices() const;

    int findColumnIndex(const std::string& name) const;

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
