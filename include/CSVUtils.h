#pragma once

#include "Table.h"

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// CSV tokenization for the command-line host. Produces raw cells only;
// type resolution belongs to TypeClassifier.
struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
	size_t maxColumns = 20000;
	size_t maxPhysicalLinesPerRecord = 10000;
};

struct LoadStats {
	size_t records = 0;
	size_t paddedRows = 0;     // shorter than the header, filled with missing cells
	size_t truncatedRows = 0;  // longer than the header, extra fields dropped
	size_t malformedRows = 0;  // unterminated quote, skipped
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one record. Unquoted empty fields become std::nullopt; quoted
 *        fields keep their text verbatim, including "".
 * @post Returns an empty vector at end of input or for a blank line.
 * @throws Datalens::IOException when a ParseLimits bound is exceeded.
 */
std::vector<RawCell> parseCSVRecord(std::istream& is, char delimiter, bool* malformed = nullptr,
									const ParseLimits& limits = ParseLimits{});

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/**
 * @brief Loads a header row plus data rows into a Table.
 * @post Every row has exactly header-width cells.
 * @throws Datalens::IOException when the file cannot be opened or a limit is exceeded.
 */
Table loadCSVTable(std::istream& is, char delimiter, LoadStats* stats = nullptr);
Table loadCSVTable(const std::string& path, char delimiter, LoadStats* stats = nullptr);
}
