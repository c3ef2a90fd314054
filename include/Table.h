#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// A raw cell as handed over by the ingestion layer. std::nullopt is an absent
// observation; strings are kept verbatim (no trimming, no case folding).
using RawCell = std::optional<std::string>;

struct RawColumn {
    std::string name;
    std::vector<RawCell> cells;
};

/**
 * @brief Decides which raw cells count as the missing-marker.
 * @details A cell is missing when it is std::nullopt or when its trimmed text
 *          equals one of the tokens exactly. Type mismatches are never missing.
 */
struct MissingPolicy {
    std::vector<std::string> tokens = defaultTokens();

    static std::vector<std::string> defaultTokens();
    bool isMissing(const RawCell& cell) const;
};

/**
 * @brief Column-major input table, validated on construction.
 * @details The profiling engine reads a Table and never mutates it.
 */
class Table {
public:
    Table() = default;

    /**
     * @brief Builds a table from named columns.
     * @post rowCount() equals the shared column length (0 when there are no columns).
     * @throws Datalens::DatasetException on unequal column lengths or duplicate names.
     */
    explicit Table(std::vector<RawColumn> columns);

    /**
     * @brief Builds a table from a header and row-major records.
     * @throws Datalens::DatasetException when a row width differs from the header width
     *         or the header repeats a name.
     */
    static Table fromRows(const std::vector<std::string>& header,
                          const std::vector<std::vector<RawCell>>& rows);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<RawColumn>& columns() const noexcept { return columns_; }
    const RawColumn& column(size_t index) const;
    std::vector<std::string> columnNames() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

private:
    std::vector<RawColumn> columns_;
    size_t rowCount_ = 0;
};
