#include "CSVUtils.h"
#include "DatalensExceptions.h"

#include <fstream>
#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos start = is.tellg();
    char buf[3] = {0, 0, 0};
    is.read(buf, 3);
    const bool isBom = is.gcount() == 3 &&
                       static_cast<unsigned char>(buf[0]) == kBom[0] &&
                       static_cast<unsigned char>(buf[1]) == kBom[1] &&
                       static_cast<unsigned char>(buf[2]) == kBom[2];
    if (isBom) return;

    is.clear();
    is.seekg(start);
}

std::vector<RawCell> parseCSVRecord(std::istream& is, char delimiter, bool* malformed, const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<RawCell> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    size_t physicalLines = 1;
    char c;

    auto pushField = [&]() {
        if (fieldQuoted) {
            row.emplace_back(val);
        } else {
            std::string t = trimUnquotedField(val);
            if (t.empty()) row.emplace_back(std::nullopt);
            else row.emplace_back(std::move(t));
        }
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) {
            throw Datalens::IOException("record exceeds " + std::to_string(limits.maxColumns) + " columns");
        }
        val.clear();
        fieldQuoted = false;
    };

    auto appendChar = [&](char ch) {
        val.push_back(ch);
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) {
            throw Datalens::IOException("field exceeds " + std::to_string(limits.maxFieldBytes) + " bytes");
        }
    };

    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    appendChar('"');
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r' || c == '\n') {
                if (c == '\r' && is.peek() == '\n') is.get();
                if (limits.maxPhysicalLinesPerRecord > 0 && ++physicalLines > limits.maxPhysicalLinesPerRecord) {
                    throw Datalens::IOException("quoted record spans more than " +
                                                std::to_string(limits.maxPhysicalLinesPerRecord) + " lines");
                }
                appendChar('\n');
            } else {
                appendChar(c);
            }
            continue;
        }

        if (c == '"' && CSVUtils::trimUnquotedField(val).empty() && !fieldQuoted) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else if (fieldQuoted) {
            // Text after a closing quote is kept; whitespace before the delimiter is dropped.
            if (c != ' ' && c != '\t') appendChar(c);
        } else {
            appendChar(c);
        }
    }

    if (inQuotes && malformed) *malformed = true;

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(val).empty()) {
        return {};
    }
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        const std::string original = out[i];
        if (seen.count(out[i])) {
            size_t suffix = 2;
            while (seen.count(original + "_" + std::to_string(suffix))) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}

Table loadCSVTable(std::istream& is, char delimiter, LoadStats* stats) {
    LoadStats local;
    skipBOM(is);

    std::vector<RawCell> headerCells;
    while (headerCells.empty() && is.peek() != EOF) {
        headerCells = parseCSVRecord(is, delimiter);
    }
    if (headerCells.empty()) {
        if (stats) *stats = local;
        return Table();
    }

    std::vector<std::string> header;
    header.reserve(headerCells.size());
    for (const auto& cell : headerCells) header.push_back(cell.value_or(""));
    header = normalizeHeader(header);

    const size_t width = header.size();
    std::vector<RawColumn> columns(width);
    for (size_t c = 0; c < width; ++c) columns[c].name = header[c];

    while (is.peek() != EOF) {
        bool malformed = false;
        std::vector<RawCell> row = parseCSVRecord(is, delimiter, &malformed);
        if (malformed) {
            ++local.malformedRows;
            continue;
        }
        if (row.empty()) continue;

        if (row.size() < width) {
            ++local.paddedRows;
            row.resize(width, std::nullopt);
        } else if (row.size() > width) {
            ++local.truncatedRows;
            row.resize(width);
        }
        for (size_t c = 0; c < width; ++c) columns[c].cells.push_back(std::move(row[c]));
        ++local.records;
    }

    if (stats) *stats = local;
    return Table(std::move(columns));
}

Table loadCSVTable(const std::string& path, char delimiter, LoadStats* stats) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Datalens::IOException("could not open '" + path + "'");
    return loadCSVTable(in, delimiter, stats);
}
} // namespace CSVUtils
