#include "MissingAnalyzer.h"

namespace MissingAnalyzer {

double percentage(size_t count, size_t total) noexcept {
    if (total == 0) return 0.0;
    return static_cast<double>(count) / static_cast<double>(total) * 100.0;
}

MissingReport analyze(const TypedDataset& data) {
    MissingReport report;
    report.columns.reserve(data.colCount());
    report.totalCells = data.rowCount() * data.colCount();

    for (const auto& col : data.columns()) {
        ColumnMissing entry;
        entry.column = col.name;
        entry.count = col.missingCount();
        entry.percentage = percentage(entry.count, data.rowCount());
        report.totalCount += entry.count;
        report.columns.push_back(std::move(entry));
    }
    report.totalPercentage = percentage(report.totalCount, report.totalCells);
    return report;
}

} // namespace MissingAnalyzer
