#include "ProfileEngine.h"
#include "CorrelationEngine.h"
#include "DatalensExceptions.h"
#include "MissingAnalyzer.h"
#include "OutlierDetector.h"
#include "Statistics.h"
#include "TypedDataset.h"

#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

void ProfileOptions::validate() const {
    if (!std::isfinite(outlierIqrMultiplier) || outlierIqrMultiplier < 0.0) {
        throw Datalens::ConfigurationException("outlier IQR multiplier must be a finite value >= 0");
    }
    if (topCategories == 0) {
        throw Datalens::ConfigurationException("top categories must be >= 1");
    }
}

MissingPolicy ProfileOptions::missingPolicy() const {
    MissingPolicy policy;
    policy.tokens = missingTokens;
    return policy;
}

ColumnProfile ProfileEngine::profileColumn(const TypedColumn& column, const ProfileOptions& options) {
    ColumnProfile out;
    out.name = column.name;
    out.type = column.type;

    if (column.type == ColumnType::NUMERIC) {
        const std::vector<double> observed = column.observedValues();
        out.numeric = Statistics::describeNumeric(observed);
        out.outliers = OutlierDetector::detect(observed, column.observedRows(), options.outlierIqrMultiplier);
    } else {
        out.categorical = Statistics::describeCategorical(column.observedText());
    }
    return out;
}

Profile ProfileEngine::profile(const Table& table, const ProfileOptions& options) {
    options.validate();

    const TypedDataset data(table, options.missingPolicy(), options.parallel);

    const size_t cols = data.colCount();
    std::vector<ColumnProfile> columns(cols);
    const long colCount = static_cast<long>(cols);

    #pragma omp parallel for schedule(dynamic) if(options.parallel)
    for (long c = 0; c < colCount; ++c) {
        columns[static_cast<size_t>(c)] = profileColumn(data.columns()[static_cast<size_t>(c)], options);
    }

    MissingReport missing = MissingAnalyzer::analyze(data);
    CorrelationMatrix correlations = CorrelationEngine::compute(data, data.numericColumnIndices(), options.parallel);

    return Profile(data.rowCount(), std::move(columns), std::move(missing), std::move(correlations));
}

int ProfileEngine::workerThreads() {
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}
