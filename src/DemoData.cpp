#include "DemoData.h"

#include <algorithm>
#include <limits>
#include <locale>
#include <numeric>
#include <random>
#include <sstream>

namespace {
constexpr size_t kMissingSatisfactionCells = 10;

std::string formatCell(double value) {
    std::ostringstream os;
    os.imbue(std::locale::classic());
    os.precision(std::numeric_limits<double>::max_digits10);
    os << value;
    return os.str();
}
} // namespace

namespace DemoData {

Table makeSalesTable(uint32_t seed, size_t rows) {
    static const char* kRegions[] = {"North", "South", "East", "West"};
    static const char* kCategories[] = {"A", "B", "C"};

    std::mt19937 rng(seed);
    std::normal_distribution<double> sales(1000.0, 200.0);
    std::normal_distribution<double> marketing(500.0, 100.0);
    std::uniform_real_distribution<double> satisfaction(1.0, 5.0);
    std::uniform_int_distribution<size_t> region(0, 3);
    std::uniform_int_distribution<size_t> category(0, 2);

    std::vector<RawColumn> columns(5);
    columns[0].name = "Sales";
    columns[1].name = "Marketing_Spend";
    columns[2].name = "Customer_Satisfaction";
    columns[3].name = "Region";
    columns[4].name = "Product_Category";
    for (auto& col : columns) col.cells.reserve(rows);

    for (size_t r = 0; r < rows; ++r) {
        columns[0].cells.emplace_back(formatCell(sales(rng)));
        columns[1].cells.emplace_back(formatCell(marketing(rng)));
        columns[2].cells.emplace_back(formatCell(satisfaction(rng)));
        columns[3].cells.emplace_back(kRegions[region(rng)]);
        columns[4].cells.emplace_back(kCategories[category(rng)]);
    }

    std::vector<size_t> order(rows);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);
    const size_t holes = std::min(kMissingSatisfactionCells, rows);
    for (size_t i = 0; i < holes; ++i) {
        columns[2].cells[order[i]] = std::nullopt;
    }

    return Table(std::move(columns));
}

} // namespace DemoData
