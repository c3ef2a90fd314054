#include "TypedDataset.h"
#include "DatalensExceptions.h"
#include "TypeClassifier.h"

#include <algorithm>

const char* toString(ColumnType type) {
    switch (type) {
        case ColumnType::NUMERIC: return "numerical";
        case ColumnType::CATEGORICAL: return "categorical";
    }
    return "categorical";
}

size_t TypedColumn::missingCount() const noexcept {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), static_cast<uint8_t>(1)));
}

const std::vector<double>& TypedColumn::numeric() const {
    const auto* v = std::get_if<std::vector<double>>(&values);
    if (!v) throw Datalens::DatasetException("column '" + name + "' is not numerical");
    return *v;
}

const std::vector<std::string>& TypedColumn::text() const {
    const auto* v = std::get_if<std::vector<std::string>>(&values);
    if (!v) throw Datalens::DatasetException("column '" + name + "' is not categorical");
    return *v;
}

std::vector<double> TypedColumn::observedValues() const {
    const auto& all = numeric();
    std::vector<double> out;
    out.reserve(observedCount());
    for (size_t r = 0; r < all.size(); ++r) {
        if (!missing[r]) out.push_back(all[r]);
    }
    return out;
}

std::vector<std::string> TypedColumn::observedText() const {
    const auto& all = text();
    std::vector<std::string> out;
    out.reserve(observedCount());
    for (size_t r = 0; r < all.size(); ++r) {
        if (!missing[r]) out.push_back(all[r]);
    }
    return out;
}

std::vector<size_t> TypedColumn::observedRows() const {
    std::vector<size_t> out;
    out.reserve(observedCount());
    for (size_t r = 0; r < missing.size(); ++r) {
        if (!missing[r]) out.push_back(r);
    }
    return out;
}

TypedDataset::TypedDataset(const Table& table, const MissingPolicy& policy, bool parallel)
    : rowCount_(table.rowCount()), columns_(table.colCount()) {
    const auto& raw = table.columns();
    const long cols = static_cast<long>(raw.size());

    #pragma omp parallel for schedule(dynamic) if(parallel)
    for (long c = 0; c < cols; ++c) {
        columns_[static_cast<size_t>(c)] = TypeClassifier::resolveColumn(raw[static_cast<size_t>(c)], policy);
    }
}

std::vector<size_t> TypedDataset::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    }
    return out;
}

std::vector<size_t> TypedDataset::categoricalColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].type == ColumnType::CATEGORICAL) out.push_back(i);
    }
    return out;
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}
