#pragma once
#include "CorrelationEngine.h"
#include "MissingAnalyzer.h"
#include "OutlierDetector.h"
#include "Statistics.h"
#include "TypedDataset.h"

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Everything the profile knows about one column.
 * @details numeric and outliers are set iff type == NUMERIC; categorical iff CATEGORICAL.
 */
struct ColumnProfile {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    std::optional<NumericStats> numeric;
    std::optional<CategoricalStats> categorical;
    std::optional<OutlierReport> outliers;
};

/**
 * @brief Immutable result of one profiling run.
 */
class Profile {
public:
    Profile(size_t rowCount,
            std::vector<ColumnProfile> columns,
            MissingReport missing,
            CorrelationMatrix correlations);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<ColumnProfile>& columns() const noexcept { return columns_; }
    std::vector<std::string> columnNames() const;
    std::vector<std::string> numericColumns() const;
    std::vector<std::string> categoricalColumns() const;

    /**
     * @throws Datalens::DatasetException for an unknown column name.
     */
    const ColumnProfile& column(const std::string& name) const;
    const ColumnProfile* findColumn(const std::string& name) const noexcept;

    const MissingReport& missing() const noexcept { return missing_; }
    const CorrelationMatrix& correlations() const noexcept { return correlations_; }

private:
    size_t rowCount_ = 0;
    std::vector<ColumnProfile> columns_;
    MissingReport missing_;
    CorrelationMatrix correlations_;
};
