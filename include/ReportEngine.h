#pragma once
#include <string>
#include <vector>

// Markdown document builder for profile reports.
class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addSection(const std::string& heading);
    void addParagraph(const std::string& text);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);

    // Backslash-escapes inline Markdown syntax in data values; newlines become <br>.
    static std::string escapeMarkdown(const std::string& text);

    const std::string& str() const noexcept { return body_; }

    /**
     * @throws Datalens::IOException when the file cannot be opened or written.
     */
    void save(const std::string& filePath) const;

private:
    std::string body_;
};
