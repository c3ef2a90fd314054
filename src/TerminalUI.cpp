#include "TerminalUI.h"
#include "CommonUtils.h"

#include <algorithm>
#include <iomanip>

namespace {
std::string cell(const std::optional<double>& v) {
    return CommonUtils::formatOptional(v, 2);
}
} // namespace

void TerminalUI::printProfileSummary(const Profile& profile, std::ostream& out) {
    const auto& missing = profile.missing();
    out << "\n============================================== PROFILE OVERVIEW ==============================================\n";
    out << "Rows: " << profile.rowCount()
        << " | Columns: " << profile.colCount()
        << " (numerical " << profile.numericColumns().size()
        << ", categorical " << profile.categoricalColumns().size() << ")"
        << " | Missing cells: " << missing.totalCount
        << " (" << CommonUtils::formatDouble(missing.totalPercentage, 2) << "%)\n";

    size_t maxNameLen = 15;
    for (const auto& name : profile.columnNames()) maxNameLen = std::max(maxNameLen, name.length());
    const int w = static_cast<int>(maxNameLen) + 2;

    out << "\n" << std::left
        << std::setw(w) << "Feature"
        << std::setw(13) << "Type"
        << std::setw(10) << "Missing%"
        << std::setw(12) << "Mean"
        << std::setw(12) << "StdDev"
        << std::setw(12) << "Median"
        << std::setw(12) << "Skewness"
        << std::setw(12) << "Kurtosis"
        << "Outliers\n";
    out << std::string(static_cast<size_t>(w) + 13 + 10 + 12 * 5 + 8, '-') << "\n";

    for (size_t i = 0; i < profile.columns().size(); ++i) {
        const auto& col = profile.columns()[i];
        out << std::left << std::setw(w) << col.name
            << std::setw(13) << toString(col.type)
            << std::setw(10) << CommonUtils::formatDouble(missing.columns[i].percentage, 2);
        if (col.numeric) {
            const auto& s = *col.numeric;
            out << std::setw(12) << cell(s.mean)
                << std::setw(12) << cell(s.stddev)
                << std::setw(12) << cell(s.median)
                << std::setw(12) << cell(s.skewness)
                << std::setw(12) << cell(s.kurtosis)
                << (col.outliers && col.outliers->lowerFence ? std::to_string(col.outliers->count()) : "n/a");
        } else {
            out << std::setw(12 * 5) << "-" << "-";
        }
        out << "\n";
    }
    out << "==============================================================================================================\n";
}

void TerminalUI::printCategoricalSummary(const Profile& profile, size_t topCategories, std::ostream& out) {
    const auto names = profile.categoricalColumns();
    if (names.empty()) return;

    out << "\n============================================ CATEGORICAL SUMMARY =============================================\n";
    for (const auto& name : names) {
        const auto& s = *profile.column(name).categorical;
        out << name << ": " << s.count << " values, " << s.distinctCount << " distinct";
        if (s.mostFrequent) out << ", top '" << *s.mostFrequent << "' x" << *s.mostFrequentCount;
        out << "\n";
        for (const auto& entry : s.top(topCategories)) {
            out << "        " << std::left << std::setw(24) << entry.first << std::right << std::setw(8) << entry.second << "\n";
        }
    }
    out << "==============================================================================================================\n";
}

void TerminalUI::printCorrelationMatrix(const CorrelationMatrix& matrix, std::ostream& out) {
    if (matrix.empty()) return;

    out << "\n============================================ CORRELATION MATRIX ============================================\n";
    out << std::setw(16) << " ";
    for (const auto& name : matrix.columnNames()) {
        out << std::right << std::setw(12) << name.substr(0, 11);
    }
    out << "\n";
    for (size_t i = 0; i < matrix.size(); ++i) {
        out << std::left << std::setw(16) << matrix.columnNames()[i].substr(0, 15) << std::right;
        for (size_t j = 0; j < matrix.size(); ++j) {
            out << std::setw(12) << cell(matrix.at(i, j));
        }
        out << "\n";
    }
    out << "============================================================================================================\n";
}
