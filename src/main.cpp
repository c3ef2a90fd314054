#include "AutoConfig.h"
#include "CSVUtils.h"
#include "DatalensExceptions.h"
#include "DemoData.h"
#include "ProfileEngine.h"
#include "ProfileReport.h"
#include "TerminalUI.h"

#include <chrono>
#include <iostream>
#include <string>

namespace {
Table loadInput(const AutoConfig& config) {
    if (config.demo) {
        std::cout << "[Datalens][Load] Using built-in demo dataset (seed 42, 100 rows)\n";
        return DemoData::makeSalesTable();
    }

    CSVUtils::LoadStats stats;
    Table table = CSVUtils::loadCSVTable(config.datasetPath, config.delimiter, &stats);
    std::cout << "[Datalens][Load] " << config.datasetPath << ": " << table.rowCount() << " rows, "
              << table.colCount() << " columns\n";
    if (stats.paddedRows > 0) {
        std::cerr << "[Datalens][Warning] " << stats.paddedRows << " short row(s) padded with missing cells\n";
    }
    if (stats.truncatedRows > 0) {
        std::cerr << "[Datalens][Warning] " << stats.truncatedRows << " long row(s) truncated to header width\n";
    }
    if (stats.malformedRows > 0) {
        std::cerr << "[Datalens][Warning] " << stats.malformedRows << " malformed row(s) skipped (unterminated quote)\n";
    }
    return table;
}

int run(const AutoConfig& config) {
    const Table table = loadInput(config);

    if (config.verbose) {
        std::cout << "[Datalens][Profile] Profiling with "
                  << (config.profile.parallel ? std::to_string(ProfileEngine::workerThreads()) + " worker thread(s)"
                                              : std::string("a single thread"))
                  << ", IQR multiplier " << config.profile.outlierIqrMultiplier << "\n";
    }
    const auto start = std::chrono::steady_clock::now();
    const Profile profile = ProfileEngine::profile(table, config.profile);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    if (config.verbose) {
        std::cout << "[Datalens][Profile] Done in " << elapsed.count() << " ms\n";
    }

    TerminalUI::printProfileSummary(profile, std::cout);
    TerminalUI::printCategoricalSummary(profile, config.profile.topCategories, std::cout);
    TerminalUI::printCorrelationMatrix(profile.correlations(), std::cout);

    const std::string source = config.demo ? std::string("demo_data.csv") : config.datasetPath;
    if (!config.reportFile.empty()) {
        ProfileReport::build(profile, config.profile.topCategories, source).save(config.reportFile);
        std::cout << "[Datalens][Report] Markdown report written to " << config.reportFile << "\n";
    }
    if (!config.jsonFile.empty()) {
        ProfileReport::saveJson(profile, config.jsonFile, config.profile.topCategories);
        std::cout << "[Datalens][Report] JSON profile written to " << config.jsonFile << "\n";
    }
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    try {
        const AutoConfig config = AutoConfig::fromArgs(argc, argv);
        if (config.showHelp) {
            std::cout << AutoConfig::usage(argv[0]);
            return 0;
        }
        return run(config);
    } catch (const Datalens::DatalensException& ex) {
        std::cerr << "[Datalens][Error] " << ex.what() << "\n";
        if (argc < 2) std::cerr << AutoConfig::usage(argv[0]);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "[Datalens][Error] Unexpected failure: " << ex.what() << "\n";
        return 2;
    }
}
