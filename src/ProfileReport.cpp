#include "ProfileReport.h"
#include "CommonUtils.h"
#include "DatalensExceptions.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <locale>
#include <sstream>

namespace {
std::string jsonNumber(double value) {
    if (!std::isfinite(value)) return "null";
    std::ostringstream os;
    os.imbue(std::locale::classic());
    os.precision(std::numeric_limits<double>::max_digits10);
    os << value;
    return os.str();
}

std::string jsonNumber(const std::optional<double>& value) {
    return value ? jsonNumber(*value) : "null";
}

std::string jsonString(const std::string& s) {
    return "\"" + ProfileReport::escapeJsonString(s) + "\"";
}

std::string countCell(size_t count, double percentage) {
    return std::to_string(count) + " (" + CommonUtils::formatDouble(percentage, 2) + "%)";
}

void writeNumericJson(std::ostream& out, const NumericStats& s) {
    out << "{\"count\": " << s.count
        << ", \"mean\": " << jsonNumber(s.mean)
        << ", \"std\": " << jsonNumber(s.stddev)
        << ", \"variance\": " << jsonNumber(s.variance)
        << ", \"min\": " << jsonNumber(s.min)
        << ", \"q25\": " << jsonNumber(s.q1)
        << ", \"median\": " << jsonNumber(s.median)
        << ", \"q75\": " << jsonNumber(s.q3)
        << ", \"max\": " << jsonNumber(s.max)
        << ", \"range\": " << jsonNumber(s.range)
        << ", \"iqr\": " << jsonNumber(s.iqr)
        << ", \"skewness\": " << jsonNumber(s.skewness)
        << ", \"kurtosis\": " << jsonNumber(s.kurtosis) << "}";
}

void writeCategoricalJson(std::ostream& out, const CategoricalStats& s, size_t topCategories) {
    out << "{\"count\": " << s.count
        << ", \"unique_values\": " << s.distinctCount
        << ", \"most_frequent\": " << (s.mostFrequent ? jsonString(*s.mostFrequent) : "null")
        << ", \"most_frequent_count\": "
        << (s.mostFrequentCount ? std::to_string(*s.mostFrequentCount) : "null")
        << ", \"value_counts\": [";
    const auto top = s.top(topCategories);
    for (size_t i = 0; i < top.size(); ++i) {
        out << (i ? ", " : "") << "{\"value\": " << jsonString(top[i].first) << ", \"count\": " << top[i].second << "}";
    }
    out << "]}";
}

void writeOutlierJson(std::ostream& out, const OutlierReport& o) {
    out << "{\"q1\": " << jsonNumber(o.q1)
        << ", \"q3\": " << jsonNumber(o.q3)
        << ", \"iqr\": " << jsonNumber(o.iqr)
        << ", \"lower_fence\": " << jsonNumber(o.lowerFence)
        << ", \"upper_fence\": " << jsonNumber(o.upperFence)
        << ", \"count\": " << o.count()
        << ", \"points\": [";
    for (size_t i = 0; i < o.outliers.size(); ++i) {
        out << (i ? ", " : "") << "{\"row\": " << o.outliers[i].row << ", \"value\": " << jsonNumber(o.outliers[i].value) << "}";
    }
    out << "]}";
}
} // namespace

namespace ProfileReport {

std::string escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    escaped += buf;
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

void writeJson(const Profile& profile, std::ostream& out, size_t topCategories) {
    const auto& columns = profile.columns();
    const auto& missing = profile.missing();

    out << "{\n";
    out << "  \"row_count\": " << profile.rowCount() << ",\n";
    out << "  \"column_count\": " << profile.colCount() << ",\n";

    out << "  \"columns\": [";
    for (size_t i = 0; i < columns.size(); ++i) {
        out << (i ? ", " : "") << "{\"name\": " << jsonString(columns[i].name)
            << ", \"type\": \"" << toString(columns[i].type) << "\"}";
    }
    out << "],\n";

    out << "  \"missing\": {\"total_count\": " << missing.totalCount
        << ", \"total_cells\": " << missing.totalCells
        << ", \"total_percentage\": " << jsonNumber(missing.totalPercentage)
        << ", \"columns\": {";
    for (size_t i = 0; i < missing.columns.size(); ++i) {
        const auto& m = missing.columns[i];
        out << (i ? ", " : "") << jsonString(m.column) << ": {\"count\": " << m.count
            << ", \"percentage\": " << jsonNumber(m.percentage) << "}";
    }
    out << "}},\n";

    bool first = true;
    out << "  \"numerical_stats\": {";
    for (const auto& col : columns) {
        if (!col.numeric) continue;
        out << (first ? "\n    " : ",\n    ") << jsonString(col.name) << ": ";
        writeNumericJson(out, *col.numeric);
        first = false;
    }
    out << (first ? "" : "\n  ") << "},\n";

    first = true;
    out << "  \"categorical_stats\": {";
    for (const auto& col : columns) {
        if (!col.categorical) continue;
        out << (first ? "\n    " : ",\n    ") << jsonString(col.name) << ": ";
        writeCategoricalJson(out, *col.categorical, topCategories);
        first = false;
    }
    out << (first ? "" : "\n  ") << "},\n";

    first = true;
    out << "  \"outliers\": {";
    for (const auto& col : columns) {
        if (!col.outliers) continue;
        out << (first ? "\n    " : ",\n    ") << jsonString(col.name) << ": ";
        writeOutlierJson(out, *col.outliers);
        first = false;
    }
    out << (first ? "" : "\n  ") << "},\n";

    const auto& corr = profile.correlations();
    out << "  \"correlation\": {\"columns\": [";
    for (size_t i = 0; i < corr.size(); ++i) {
        out << (i ? ", " : "") << jsonString(corr.columnNames()[i]);
    }
    out << "], \"matrix\": [";
    for (size_t i = 0; i < corr.size(); ++i) {
        out << (i ? ", " : "") << "[";
        for (size_t j = 0; j < corr.size(); ++j) {
            out << (j ? ", " : "") << jsonNumber(corr.at(i, j));
        }
        out << "]";
    }
    out << "]}\n";
    out << "}\n";
}

void saveJson(const Profile& profile, const std::string& path, size_t topCategories) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw Datalens::IOException("could not open '" + path + "' for writing");
    writeJson(profile, out, topCategories);
    if (!out.good()) throw Datalens::IOException("failed while writing '" + path + "'");
}

ReportEngine build(const Profile& profile, size_t topCategories, const std::string& sourceName) {
    ReportEngine report;
    report.addTitle(sourceName.empty() ? "Data Profile" : "Data Profile: " + ReportEngine::escapeMarkdown(sourceName));

    const auto& missing = profile.missing();
    report.addSection("Overview");
    report.addTable("", {"Rows", "Columns", "Numerical", "Categorical", "Missing cells"},
                    {{std::to_string(profile.rowCount()),
                      std::to_string(profile.colCount()),
                      std::to_string(profile.numericColumns().size()),
                      std::to_string(profile.categoricalColumns().size()),
                      countCell(missing.totalCount, missing.totalPercentage)}});

    report.addSection("Column Types");
    std::vector<std::vector<std::string>> typeRows;
    for (const auto& col : profile.columns()) {
        typeRows.push_back({col.name, toString(col.type)});
    }
    report.addTable("", {"Column", "Type"}, typeRows);

    report.addSection("Missing Data");
    std::vector<std::vector<std::string>> missingRows;
    for (const auto& m : missing.columns) {
        missingRows.push_back({m.column, std::to_string(m.count), CommonUtils::formatDouble(m.percentage, 2)});
    }
    report.addTable("", {"Column", "Missing", "Missing %"}, missingRows);

    using CommonUtils::formatOptional;
    std::vector<std::vector<std::string>> numericRows;
    std::vector<std::vector<std::string>> outlierRows;
    for (const auto& col : profile.columns()) {
        if (col.numeric) {
            const auto& s = *col.numeric;
            numericRows.push_back({col.name, std::to_string(s.count),
                                   formatOptional(s.mean), formatOptional(s.stddev),
                                   formatOptional(s.min), formatOptional(s.q1),
                                   formatOptional(s.median), formatOptional(s.q3),
                                   formatOptional(s.max), formatOptional(s.skewness),
                                   formatOptional(s.kurtosis)});
        }
        if (col.outliers) {
            const auto& o = *col.outliers;
            std::string rows;
            for (size_t i = 0; i < o.outliers.size() && i < topCategories; ++i) {
                rows += (i ? ", " : "") + std::to_string(o.outliers[i].row) + ":" +
                        CommonUtils::formatDouble(o.outliers[i].value);
            }
            if (o.outliers.size() > topCategories) rows += ", ...";
            outlierRows.push_back({col.name, formatOptional(o.lowerFence), formatOptional(o.upperFence),
                                   std::to_string(o.count()), rows});
        }
    }

    report.addSection("Numerical Statistics");
    if (numericRows.empty()) {
        report.addParagraph("No numerical columns.");
    } else {
        report.addTable("", {"Column", "Count", "Mean", "Std", "Min", "25%", "50%", "75%", "Max", "Skewness", "Kurtosis"},
                        numericRows);
    }

    report.addSection("Categorical Statistics");
    bool anyCategorical = false;
    for (const auto& col : profile.columns()) {
        if (!col.categorical) continue;
        anyCategorical = true;
        const auto& s = *col.categorical;
        report.addParagraph("**" + ReportEngine::escapeMarkdown(col.name) + "**: " + std::to_string(s.count) +
                            " values, " + std::to_string(s.distinctCount) + " distinct" +
                            (s.mostFrequent ? ", most frequent '" + ReportEngine::escapeMarkdown(*s.mostFrequent) + "' (" +
                                                  std::to_string(*s.mostFrequentCount) + ")"
                                            : std::string()));
        std::vector<std::vector<std::string>> freqRows;
        for (const auto& entry : s.top(topCategories)) {
            freqRows.push_back({entry.first, std::to_string(entry.second)});
        }
        if (!freqRows.empty()) report.addTable("", {"Value", "Count"}, freqRows);
    }
    if (!anyCategorical) report.addParagraph("No categorical columns.");

    report.addSection("Outliers");
    if (outlierRows.empty()) {
        report.addParagraph("No numerical columns.");
    } else {
        report.addParagraph("Tukey fences: values below Q1 - k x IQR or above Q3 + k x IQR. Fences need at least 4 values.");
        report.addTable("", {"Column", "Lower fence", "Upper fence", "Outliers", "Rows (row:value)"}, outlierRows);
    }

    report.addSection("Correlation Matrix");
    const auto& corr = profile.correlations();
    if (corr.size() < 2) {
        report.addParagraph("Fewer than two numerical columns; no pairwise correlation.");
    } else {
        std::vector<std::string> headers = {""};
        headers.insert(headers.end(), corr.columnNames().begin(), corr.columnNames().end());
        std::vector<std::vector<std::string>> rows;
        for (size_t i = 0; i < corr.size(); ++i) {
            std::vector<std::string> row = {corr.columnNames()[i]};
            for (size_t j = 0; j < corr.size(); ++j) row.push_back(formatOptional(corr.at(i, j), 3));
            rows.push_back(std::move(row));
        }
        report.addTable("", headers, rows);
    }
    return report;
}

} // namespace ProfileReport
