#include "Profile.h"
#include "DatalensExceptions.h"

Profile::Profile(size_t rowCount,
                 std::vector<ColumnProfile> columns,
                 MissingReport missing,
                 CorrelationMatrix correlations)
    : rowCount_(rowCount),
      columns_(std::move(columns)),
      missing_(std::move(missing)),
      correlations_(std::move(correlations)) {}

std::vector<std::string> Profile::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) out.push_back(col.name);
    return out;
}

std::vector<std::string> Profile::numericColumns() const {
    std::vector<std::string> out;
    for (const auto& col : columns_) {
        if (col.type == ColumnType::NUMERIC) out.push_back(col.name);
    }
    return out;
}

std::vector<std::string> Profile::categoricalColumns() const {
    std::vector<std::string> out;
    for (const auto& col : columns_) {
        if (col.type == ColumnType::CATEGORICAL) out.push_back(col.name);
    }
    return out;
}

const ColumnProfile* Profile::findColumn(const std::string& name) const noexcept {
    for (const auto& col : columns_) {
        if (col.name == name) return &col;
    }
    return nullptr;
}

const ColumnProfile& Profile::column(const std::string& name) const {
    const ColumnProfile* col = findColumn(name);
    if (!col) throw Datalens::DatasetException("unknown column '" + name + "'");
    return *col;
}
