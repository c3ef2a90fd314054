#pragma once
#include "ProfileEngine.h"

#include <string>
#include <vector>

struct AutoConfig {
    std::string datasetPath;
    char delimiter = ',';
    std::string reportFile;   // Markdown report, empty => none
    std::string jsonFile;     // JSON profile, empty => none
    bool demo = false;
    bool verbose = false;
    bool showHelp = false;

    ProfileOptions profile;

    /**
     * @brief Builds config from CLI args, merging an optional --config file first.
     * @details Command-line flags take precedence over file values.
     * @post Returns a validated config object (unless showHelp is set).
     * @throws Datalens::ConfigurationException on invalid arguments or values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Datalens::ConfigurationException on parse/validation failures.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);

    /**
     * @throws Datalens::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage(const std::string& prog);
};
