#pragma once
#include "Table.h"

#include <cstdint>

namespace DemoData {

/**
 * @brief Synthetic business dataset for trying the profiler without a file.
 * @details Columns: Sales ~ N(1000, 200), Marketing_Spend ~ N(500, 100),
 *          Customer_Satisfaction ~ U(1, 5) with 10 cells missing (fewer when
 *          rows < 10), Region in {North, South, East, West},
 *          Product_Category in {A, B, C}. Same seed, same table.
 */
Table makeSalesTable(uint32_t seed = 42, size_t rows = 100);

} // namespace DemoData
