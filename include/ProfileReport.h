#pragma once
#include "Profile.h"
#include "ReportEngine.h"

#include <ostream>
#include <string>

namespace ProfileReport {

/**
 * @brief Markdown rendering: overview, types, missing data, numerical and
 *        categorical statistics, outliers and the correlation matrix.
 */
ReportEngine build(const Profile& profile, size_t topCategories, const std::string& sourceName = "");

/**
 * @brief Writes the profile as JSON. Undefined measures are null; doubles use
 *        round-trip precision so identical profiles give identical output.
 */
void writeJson(const Profile& profile, std::ostream& out, size_t topCategories);

/**
 * @throws Datalens::IOException when the file cannot be opened or written.
 */
void saveJson(const Profile& profile, const std::string& path, size_t topCategories);

std::string escapeJsonString(const std::string& input);

} // namespace ProfileReport
