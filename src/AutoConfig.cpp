#include "AutoConfig.h"
#include "CommonUtils.h"
#include "DatalensExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <functional>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Datalens::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Datalens::DatalensException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Datalens::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    if (!value.empty() && value[0] == '-') {
        throw Datalens::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed < minValue) {
        throw Datalens::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed) || parsed < minValue) {
        throw Datalens::ConfigurationException("Value for " + key + " must be a finite number >= " +
                                               CommonUtils::formatDouble(minValue, 2));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Datalens::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value) {
    if (value == "\\t" || value == "tab") return '\t';
    if (value.size() != 1) throw Datalens::ConfigurationException("delimiter expects a single character");
    return value[0];
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
        } else if (!inQuotes && line[i] == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

using Setter = std::function<void(AutoConfig&, const std::string&)>;

const std::unordered_map<std::string, Setter>& settersByKey() {
    static const std::unordered_map<std::string, Setter> setters = {
        {"dataset", [](AutoConfig& c, const std::string& v) { c.datasetPath = v; }},
        {"delimiter", [](AutoConfig& c, const std::string& v) { c.delimiter = parseDelimiter(v); }},
        {"report", [](AutoConfig& c, const std::string& v) { c.reportFile = v; }},
        {"json", [](AutoConfig& c, const std::string& v) { c.jsonFile = v; }},
        {"missing_tokens", [](AutoConfig& c, const std::string& v) {
            // Blank entries are meaningful here: "" marks empty cells as missing.
            c.profile.missingTokens = CommonUtils::splitList(v, true);
        }},
        {"outlier_iqr_multiplier", [](AutoConfig& c, const std::string& v) {
            c.profile.outlierIqrMultiplier = parseDoubleStrict(v, "outlier_iqr_multiplier", 0.0);
        }},
        {"top_categories", [](AutoConfig& c, const std::string& v) {
            c.profile.topCategories = parseSizeStrict(v, "top_categories", 1);
        }},
        {"parallel", [](AutoConfig& c, const std::string& v) { c.profile.parallel = parseBoolStrict(v, "parallel"); }},
        {"verbose", [](AutoConfig& c, const std::string& v) { c.verbose = parseBoolStrict(v, "verbose"); }},
        {"demo", [](AutoConfig& c, const std::string& v) { c.demo = parseBoolStrict(v, "demo"); }},
    };
    return setters;
}

// The outer exception adds its own "Configuration Error: " prefix.
std::string withoutErrorPrefix(const std::string& message) {
    static const std::string kPrefix = Datalens::ConfigurationException("").what();
    return message.rfind(kPrefix, 0) == 0 ? message.substr(kPrefix.size()) : message;
}

void assignKeyValue(AutoConfig& config, const std::string& key, const std::string& value) {
    const auto& setters = settersByKey();
    const auto it = setters.find(key);
    if (it == setters.end()) {
        throw Datalens::ConfigurationException("Unknown config key: " + key);
    }
    it->second(config, value);
}
} // namespace

std::string AutoConfig::usage(const std::string& prog) {
    return "Usage: " + prog + " <dataset.csv> [options]\n"
           "Options:\n"
           "  --config <file>                  Load key: value settings (flags override the file)\n"
           "  --delimiter <char>               CSV delimiter (default: ,; use \\t for tab)\n"
           "  --report <file.md>               Write a Markdown profile report\n"
           "  --json <file.json>               Write the profile as JSON\n"
           "  --missing-tokens <a,b,...>       Cell values treated as missing (default: ,NA,N/A,null,NULL,None,NaN,nan,missing)\n"
           "  --outlier-iqr-multiplier <k>     Tukey fence multiplier (default: 1.5)\n"
           "  --top-categories <n>             Frequency entries shown per categorical column (default: 10)\n"
           "  --parallel <true|false>          Per-column OpenMP parallelism (default: true)\n"
           "  --demo                           Profile the built-in demo dataset instead of a file\n"
           "  --verbose                        Enable detailed logs\n"
           "  --help                           Show this help message\n";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    AutoConfig config;

    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) throw Datalens::ConfigurationException("--config expects a file path");
            configPath = argv[++i];
        }
    }
    if (!configPath.empty()) {
        config = fromFile(configPath, config);
    }

    static const std::unordered_map<std::string, std::string> valueFlags = {
        {"--delimiter", "delimiter"},
        {"--report", "report"},
        {"--json", "json"},
        {"--missing-tokens", "missing_tokens"},
        {"--outlier-iqr-multiplier", "outlier_iqr_multiplier"},
        {"--top-categories", "top_categories"},
        {"--parallel", "parallel"},
    };

    bool positionalSeen = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
        } else if (arg == "--demo") {
            config.demo = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (valueFlags.count(arg)) {
            if (i + 1 >= argc) throw Datalens::ConfigurationException(arg + " expects a value");
            assignKeyValue(config, valueFlags.at(arg), argv[++i]);
        } else if (arg.rfind("--", 0) == 0) {
            throw Datalens::ConfigurationException("Unknown option: " + arg);
        } else if (!positionalSeen) {
            config.datasetPath = arg;
            positionalSeen = true;
        } else {
            throw Datalens::ConfigurationException("Unexpected argument: " + arg);
        }
    }

    config.validate();
    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Datalens::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Datalens::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": expected 'key: value'");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Datalens::DatalensException& ex) {
            throw Datalens::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + withoutErrorPrefix(ex.what()));
        }
    }
    return config;
}

void AutoConfig::validate() const {
    if (datasetPath.empty() && !demo) {
        throw Datalens::ConfigurationException("dataset path is required (or pass --demo)");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Datalens::ConfigurationException("delimiter cannot be a quote or line break");
    }
    profile.validate();
}
