#include "Table.h"
#include "CommonUtils.h"
#include "DatalensExceptions.h"

#include <algorithm>
#include <unordered_set>

std::vector<std::string> MissingPolicy::defaultTokens() {
    return {"", "NA", "N/A", "null", "NULL", "None", "NaN", "nan", "missing"};
}

bool MissingPolicy::isMissing(const RawCell& cell) const {
    if (!cell) return true;
    const std::string t = CommonUtils::trim(*cell);
    return std::find(tokens.begin(), tokens.end(), t) != tokens.end();
}

Table::Table(std::vector<RawColumn> columns) : columns_(std::move(columns)) {
    std::unordered_set<std::string> seen;
    seen.reserve(columns_.size());
    for (const auto& col : columns_) {
        if (!seen.insert(col.name).second) {
            throw Datalens::DatasetException("duplicate column name '" + col.name + "'");
        }
    }

    rowCount_ = columns_.empty() ? 0 : columns_.front().cells.size();
    for (const auto& col : columns_) {
        if (col.cells.size() != rowCount_) {
            throw Datalens::DatasetException("column '" + col.name + "' has " + std::to_string(col.cells.size()) +
                                             " rows, expected " + std::to_string(rowCount_) +
                                             " (column '" + columns_.front().name + "')");
        }
    }
}

Table Table::fromRows(const std::vector<std::string>& header,
                      const std::vector<std::vector<RawCell>>& rows) {
    std::vector<RawColumn> columns(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        columns[c].name = header[c];
        columns[c].cells.reserve(rows.size());
    }

    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != header.size()) {
            throw Datalens::DatasetException("row " + std::to_string(r) + " has " + std::to_string(rows[r].size()) +
                                             " fields, header has " + std::to_string(header.size()));
        }
        for (size_t c = 0; c < header.size(); ++c) {
            columns[c].cells.push_back(rows[r][c]);
        }
    }
    return Table(std::move(columns));
}

const RawColumn& Table::column(size_t index) const {
    if (index >= columns_.size()) {
        throw Datalens::DatasetException("column index " + std::to_string(index) + " out of range");
    }
    return columns_[index];
}

std::vector<std::string> Table::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) names.push_back(col.name);
    return names;
}

int Table::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}
