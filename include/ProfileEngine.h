#pragma once
#include "Profile.h"
#include "Table.h"

#include <string>
#include <vector>

struct ProfileOptions {
    // Trimmed cell text equal to one of these is the missing-marker.
    std::vector<std::string> missingTokens = MissingPolicy::defaultTokens();
    // Tukey fence multiplier; 1.5 is the published contract.
    double outlierIqrMultiplier = OutlierDetector::kDefaultIqrMultiplier;
    bool parallel = true;
    // Renderers show this many frequency entries; the profile keeps all of them.
    size_t topCategories = 10;

    /**
     * @throws Datalens::ConfigurationException on a negative or non-finite multiplier
     *         or topCategories == 0.
     */
    void validate() const;
    MissingPolicy missingPolicy() const;
};

class ProfileEngine {
public:
    /**
     * @brief Profiles a table: classification, missing data, descriptive
     *        statistics, outliers and correlation.
     * @details Stateless and reentrant. Per-column work runs under OpenMP when
     *          options.parallel is set; results are index-addressed so the output
     *          does not depend on scheduling.
     * @throws Datalens::ConfigurationException when options are invalid.
     */
    static Profile profile(const Table& table, const ProfileOptions& options = ProfileOptions{});

    static ColumnProfile profileColumn(const TypedColumn& column, const ProfileOptions& options);

    // OpenMP worker count, 1 when built without OpenMP.
    static int workerThreads();
};
