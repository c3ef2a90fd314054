#include "ReportEngine.h"
#include "DatalensExceptions.h"

#include <algorithm>
#include <fstream>
#include <string_view>

namespace {
// Tables taller than this get a preview plus a collapsible full copy.
constexpr size_t kPreviewRows = 120;
// Correlation matrices reach this width quickly; HTML lets them scroll.
constexpr size_t kHtmlMinColumns = 10;

enum class CellFormat { Markdown, Html };

std::string escapeCell(const std::string& value, CellFormat format) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            out += "<br>";
        } else if (format == CellFormat::Markdown) {
            if (std::string_view("\\`*_[]<>|").find(ch) != std::string_view::npos) out += '\\';
            out += ch;
        } else if (ch == '&') {
            out += "&amp;";
        } else if (ch == '<') {
            out += "&lt;";
        } else if (ch == '>') {
            out += "&gt;";
        } else if (ch == '"') {
            out += "&quot;";
        } else {
            out += ch;
        }
    }
    return out;
}

const std::string& cellAt(const std::vector<std::string>& row, size_t i) {
    static const std::string kEmpty;
    return i < row.size() ? row[i] : kEmpty;
}

std::string renderMarkdown(const std::vector<std::string>& headers,
                           const std::vector<std::vector<std::string>>& rows,
                           size_t limit) {
    std::string out = "|";
    std::string rule = "|";
    for (const auto& h : headers) {
        out += " " + escapeCell(h, CellFormat::Markdown) + " |";
        rule += " --- |";
    }
    out += "\n" + rule + "\n";

    const size_t shown = std::min(limit, rows.size());
    for (size_t r = 0; r < shown; ++r) {
        out += "|";
        for (size_t c = 0; c < headers.size(); ++c) {
            out += " " + escapeCell(cellAt(rows[r], c), CellFormat::Markdown) + " |";
        }
        out += "\n";
    }
    return out + "\n";
}

std::string renderHtml(const std::vector<std::string>& headers,
                       const std::vector<std::vector<std::string>>& rows,
                       size_t limit) {
    std::string out = "<div style=\"overflow-x:auto; max-width:100%;\">\n<table>\n<thead><tr>";
    for (const auto& h : headers) out += "<th>" + escapeCell(h, CellFormat::Html) + "</th>";
    out += "</tr></thead>\n<tbody>\n";

    const size_t shown = std::min(limit, rows.size());
    for (size_t r = 0; r < shown; ++r) {
        out += "<tr>";
        for (size_t c = 0; c < headers.size(); ++c) {
            out += "<td>" + escapeCell(cellAt(rows[r], c), CellFormat::Html) + "</td>";
        }
        out += "</tr>\n";
    }
    return out + "</tbody>\n</table>\n</div>\n\n";
}
} // namespace

std::string ReportEngine::escapeMarkdown(const std::string& text) {
    return escapeCell(text, CellFormat::Markdown);
}

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addSection(const std::string& heading) {
    body_ += "## " + heading + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addTable(const std::string& title,
                            const std::vector<std::string>& headers,
                            const std::vector<std::vector<std::string>>& rows) {
    if (!title.empty()) body_ += "### " + title + "\n\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }

    const auto render = headers.size() >= kHtmlMinColumns ? renderHtml : renderMarkdown;
    if (rows.size() <= kPreviewRows) {
        body_ += render(headers, rows, rows.size());
        return;
    }

    const std::string total = std::to_string(rows.size());
    body_ += "_Showing " + std::to_string(kPreviewRows) + " of " + total + " rows._\n\n";
    body_ += render(headers, rows, kPreviewRows);
    body_ += "<details>\n<summary>All " + total + " rows</summary>\n\n";
    body_ += render(headers, rows, rows.size());
    body_ += "</details>\n\n";
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath, std::ios::binary);
    if (!out) throw Datalens::IOException("could not open '" + filePath + "' for writing");
    out << body_;
    if (!out.good()) throw Datalens::IOException("failed while writing '" + filePath + "'");
}
