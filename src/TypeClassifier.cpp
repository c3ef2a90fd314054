#include "TypeClassifier.h"
#include "CommonUtils.h"
#include "DatalensExceptions.h"

#include <charconv>
#include <cmath>
#include <limits>

namespace TypeClassifier {

bool parseNumber(std::string_view raw, double& out) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;

    const char* b = s.data();
    const char* e = b + s.size();
    if (*b == '+') {
        ++b;
        if (b == e || *b == '+' || *b == '-') return false;
    }

    double parsed = 0.0;
    auto [p, ec] = std::from_chars(b, e, parsed, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(parsed)) return false;
    out = parsed;
    return true;
}

ColumnType classify(const RawColumn& column, const MissingPolicy& policy) {
    size_t observed = 0;
    double scratch = 0.0;
    for (const auto& cell : column.cells) {
        if (policy.isMissing(cell)) continue;
        ++observed;
        if (!parseNumber(*cell, scratch)) return ColumnType::CATEGORICAL;
    }
    return observed > 0 ? ColumnType::NUMERIC : ColumnType::CATEGORICAL;
}

TypedColumn resolveColumn(const RawColumn& column, const MissingPolicy& policy) {
    const size_t n = column.cells.size();

    TypedColumn out;
    out.name = column.name;
    out.type = classify(column, policy);
    out.missing.assign(n, 0);
    for (size_t r = 0; r < n; ++r) {
        if (policy.isMissing(column.cells[r])) out.missing[r] = 1;
    }

    if (out.type == ColumnType::NUMERIC) {
        std::vector<double> numbers(n, std::numeric_limits<double>::quiet_NaN());
        for (size_t r = 0; r < n; ++r) {
            if (!out.missing[r] && !parseNumber(*column.cells[r], numbers[r])) {
                throw Datalens::DatasetException("column '" + column.name + "' row " + std::to_string(r) +
                                                 " is not numerical");
            }
        }
        out.values = std::move(numbers);
        return out;
    }

    // Text is kept verbatim: frequency counting is case- and whitespace-sensitive.
    std::vector<std::string> text(n);
    for (size_t r = 0; r < n; ++r) {
        if (!out.missing[r]) text[r] = *column.cells[r];
    }
    out.values = std::move(text);
    return out;
}

} // namespace TypeClassifier
