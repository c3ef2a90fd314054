#include "CorrelationEngine.h"
#include "DatalensExceptions.h"
#include "MathUtils.h"

#include <utility>

CorrelationMatrix::CorrelationMatrix(std::vector<std::string> columnNames)
    : names_(std::move(columnNames)) {
    const size_t n = names_.size();
    cells_.assign(n * (n + 1) / 2, std::nullopt);
    joint_.assign(n * (n + 1) / 2, 0);
}

size_t CorrelationMatrix::slot(size_t i, size_t j) const {
    if (i >= names_.size() || j >= names_.size()) {
        throw Datalens::DatasetException("correlation index out of range");
    }
    if (i > j) std::swap(i, j);
    // Row-major upper triangle including the diagonal.
    return i * names_.size() - i * (i - 1) / 2 + (j - i);
}

size_t CorrelationMatrix::indexOf(const std::string& name) const {
    for (size_t i = 0; i < names_.size(); ++i) {
        if (names_[i] == name) return i;
    }
    throw Datalens::DatasetException("'" + name + "' is not a numerical column of the correlation matrix");
}

std::optional<double> CorrelationMatrix::at(size_t i, size_t j) const {
    return cells_[slot(i, j)];
}

std::optional<double> CorrelationMatrix::at(const std::string& a, const std::string& b) const {
    return at(indexOf(a), indexOf(b));
}

size_t CorrelationMatrix::jointCount(size_t i, size_t j) const {
    return joint_[slot(i, j)];
}

void CorrelationMatrix::set(size_t i, size_t j, std::optional<double> coefficient, size_t jointRows) {
    const size_t s = slot(i, j);
    cells_[s] = coefficient;
    joint_[s] = jointRows;
}

namespace {
struct PairResult {
    std::optional<double> r;
    size_t joint = 0;
};

PairResult correlatePair(const TypedColumn& a, const TypedColumn& b) {
    const auto& va = a.numeric();
    const auto& vb = b.numeric();

    std::vector<double> x;
    std::vector<double> y;
    x.reserve(va.size());
    y.reserve(vb.size());
    for (size_t r = 0; r < va.size(); ++r) {
        if (a.missing[r] || b.missing[r]) continue;
        x.push_back(va[r]);
        y.push_back(vb[r]);
    }

    PairResult out;
    out.joint = x.size();
    if (out.joint >= 2) out.r = MathUtils::calculatePearson(x, y);
    return out;
}
} // namespace

namespace CorrelationEngine {

CorrelationMatrix compute(const TypedDataset& data,
                          const std::vector<size_t>& numericColumns,
                          bool parallel) {
    std::vector<std::string> names;
    names.reserve(numericColumns.size());
    for (size_t idx : numericColumns) names.push_back(data.columns()[idx].name);
    CorrelationMatrix matrix(std::move(names));

    const size_t k = numericColumns.size();
    std::vector<std::pair<size_t, size_t>> pairs;
    if (k > 1) pairs.reserve(k * (k - 1) / 2);
    for (size_t i = 0; i < k; ++i) {
        for (size_t j = i + 1; j < k; ++j) pairs.emplace_back(i, j);
    }

    std::vector<PairResult> results(pairs.size());
    const long pairCount = static_cast<long>(pairs.size());

    #pragma omp parallel for schedule(dynamic) if(parallel)
    for (long p = 0; p < pairCount; ++p) {
        const auto& pr = pairs[static_cast<size_t>(p)];
        results[static_cast<size_t>(p)] = correlatePair(data.columns()[numericColumns[pr.first]],
                                                        data.columns()[numericColumns[pr.second]]);
    }

    for (size_t i = 0; i < k; ++i) {
        const size_t observed = data.columns()[numericColumns[i]].observedCount();
        matrix.set(i, i, observed >= 2 ? std::optional<double>(1.0) : std::nullopt, observed);
    }
    for (size_t p = 0; p < pairs.size(); ++p) {
        matrix.set(pairs[p].first, pairs[p].second, results[p].r, results[p].joint);
    }
    return matrix;
}

} // namespace CorrelationEngine
