#pragma once
#include "Table.h"
#include "TypedDataset.h"

#include <string_view>

namespace TypeClassifier {

/**
 * @brief Parses a cell as a finite real number.
 * @details Accepts surrounding whitespace, an optional sign, decimals and
 *          scientific notation. Rejects inf/nan, hex, thousands separators and
 *          any trailing characters.
 */
bool parseNumber(std::string_view raw, double& out);

/**
 * @brief NUMERIC iff every non-missing cell parses; an all-missing column is CATEGORICAL.
 */
ColumnType classify(const RawColumn& column, const MissingPolicy& policy);

/**
 * @brief Classifies the column and converts it to typed storage in the same pass.
 * @post result.missing.size() == column.cells.size().
 */
TypedColumn resolveColumn(const RawColumn& column, const MissingPolicy& policy);

} // namespace TypeClassifier
