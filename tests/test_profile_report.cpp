#include "test_helpers.h"
#include "ProfileEngine.h"
#include "ProfileReport.h"
#include "ReportEngine.h"
#include "TerminalUI.h"

#include <memory>
#include <sstream>

namespace Datalens::Test {

class ProfileReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        const Table table({column("x", {"1", "2", "3", "4", "100"}),
                           column("y", {"2", "4", "6", "8", std::nullopt}),
                           column("solo", {"7", std::nullopt, std::nullopt, std::nullopt, std::nullopt}),
                           column("tag", {"a", "b", "a", "say \"hi\"", "NA"})});
        ProfileOptions options;
        options.parallel = false;
        profile_ = std::make_unique<Profile>(ProfileEngine::profile(table, options));
    }

    std::string json(size_t topCategories = 10) const {
        std::ostringstream os;
        ProfileReport::writeJson(*profile_, os, topCategories);
        return os.str();
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    std::unique_ptr<Profile> profile_;
};

TEST_F(ProfileReportTest, JsonCarriesEverySection)
{
    const std::string out = json();
    for (const char* key : {"\"row_count\": 5", "\"column_count\": 4", "\"columns\"", "\"missing\"",
                            "\"numerical_stats\"", "\"categorical_stats\"", "\"outliers\"", "\"correlation\""}) {
        EXPECT_TRUE(contains(out, key)) << key;
    }
    EXPECT_TRUE(contains(out, "{\"name\": \"tag\", \"type\": \"categorical\"}"));
    EXPECT_TRUE(contains(out, "{\"name\": \"x\", \"type\": \"numerical\"}"));
    EXPECT_TRUE(contains(out, "\"points\": [{\"row\": 4, \"value\": 100}]"));
}

TEST_F(ProfileReportTest, UndefinedMeasuresAreNull)
{
    const std::string out = json();
    EXPECT_TRUE(contains(out, "\"solo\": {\"count\": 1, \"mean\": 7, \"std\": null"));
    EXPECT_TRUE(contains(out, "\"skewness\": null"));
    EXPECT_TRUE(contains(out, "\"lower_fence\": null"));
    EXPECT_FALSE(contains(out, "nan"));
    EXPECT_FALSE(contains(out, "inf"));
}

TEST_F(ProfileReportTest, JsonEscapesCategoryText)
{
    EXPECT_TRUE(contains(json(), "{\"value\": \"say \\\"hi\\\"\", \"count\": 1}"));
}

TEST_F(ProfileReportTest, ValueCountsAreLimitedToTopN)
{
    const std::string out = json(1);
    EXPECT_TRUE(contains(out, "\"value_counts\": [{\"value\": \"a\", \"count\": 2}]"));
    EXPECT_TRUE(contains(out, "\"unique_values\": 3"));
}

TEST_F(ProfileReportTest, MarkdownHasAllSections)
{
    const std::string md = ProfileReport::build(*profile_, 10, "people.csv").str();
    EXPECT_EQ(md.rfind("# Data Profile: people.csv", 0), 0u);
    for (const char* section : {"## Overview", "## Column Types", "## Missing Data", "## Numerical Statistics",
                                "## Categorical Statistics", "## Outliers", "## Correlation Matrix"}) {
        EXPECT_TRUE(contains(md, section)) << section;
    }
    EXPECT_TRUE(contains(md, "n/a"));
    EXPECT_TRUE(contains(md, "4:100.0000"));
}

TEST_F(ProfileReportTest, SaveToUnwritablePathThrows)
{
    EXPECT_THROW(ProfileReport::saveJson(*profile_, "/nonexistent/dir/profile.json", 10), IOException);
    EXPECT_THROW(ProfileReport::build(*profile_, 10).save("/nonexistent/dir/profile.md"), IOException);
}

TEST_F(ProfileReportTest, TerminalSummaryListsEveryColumn)
{
    std::ostringstream os;
    TerminalUI::printProfileSummary(*profile_, os);
    TerminalUI::printCategoricalSummary(*profile_, 10, os);
    TerminalUI::printCorrelationMatrix(profile_->correlations(), os);
    const std::string text = os.str();
    for (const char* name : {"x", "y", "solo", "tag"}) EXPECT_TRUE(contains(text, name)) << name;
    EXPECT_TRUE(contains(text, "PROFILE OVERVIEW"));
    EXPECT_TRUE(contains(text, "CATEGORICAL SUMMARY"));
    EXPECT_TRUE(contains(text, "CORRELATION MATRIX"));
    EXPECT_TRUE(contains(text, "n/a"));
}

TEST(EscapeJsonStringTest, EscapesControlCharacters)
{
    EXPECT_EQ(ProfileReport::escapeJsonString("a\\b"), "a\\\\b");
    EXPECT_EQ(ProfileReport::escapeJsonString("line\nnext\ttab"), "line\\nnext\\ttab");
    EXPECT_EQ(ProfileReport::escapeJsonString(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(ProfileReport::escapeJsonString("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(ReportEngineTest, MarkdownTableEscapesPipes)
{
    ReportEngine report;
    report.addTable("T", {"a", "b"}, {{"x|y", "z"}});
    EXPECT_NE(report.str().find("### T"), std::string::npos);
    EXPECT_NE(report.str().find("| x\\|y | z |"), std::string::npos);
}

TEST(ReportEngineTest, EscapesInlineMarkdownInValues)
{
    EXPECT_EQ(ReportEngine::escapeMarkdown("a*b_c|d"), "a\\*b\\_c\\|d");
    EXPECT_EQ(ReportEngine::escapeMarkdown("[x]`y`"), "\\[x\\]\\`y\\`");
    EXPECT_EQ(ReportEngine::escapeMarkdown("plain text"), "plain text");
}

TEST(CategoricalParagraphTest, ValuesWithMarkdownSyntaxAreEscaped)
{
    const Table table({column("my_col", {"**bold**", "**bold**", "a|b"})});
    const Profile p = ProfileEngine::profile(table);
    const std::string md = ProfileReport::build(p, 10).str();
    EXPECT_NE(md.find("**my\\_col**: 3 values, 2 distinct, most frequent '\\*\\*bold\\*\\*' (2)"), std::string::npos) << md;
    EXPECT_EQ(md.find("'**bold**'"), std::string::npos);
    EXPECT_NE(md.find("| a\\|b | 1 |"), std::string::npos);
}

TEST(ReportEngineTest, TallTableGetsPreviewAndDetails)
{
    std::vector<std::vector<std::string>> rows(150, {"v"});
    ReportEngine report;
    report.addTable("", {"col"}, rows);
    EXPECT_NE(report.str().find("120 of 150 rows"), std::string::npos);
    EXPECT_NE(report.str().find("<details>"), std::string::npos);
}

TEST(ReportEngineTest, WideTableRendersAsHtml)
{
    const std::vector<std::string> headers(12, "h");
    ReportEngine report;
    report.addTable("", headers, {std::vector<std::string>(12, "<1>")});
    EXPECT_NE(report.str().find("<table>"), std::string::npos);
    EXPECT_NE(report.str().find("&lt;1&gt;"), std::string::npos);
}

} // namespace Datalens::Test
