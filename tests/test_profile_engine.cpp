#include "test_helpers.h"
#include "ProfileEngine.h"
#include "ProfileReport.h"

#include <cmath>
#include <sstream>

namespace Datalens::Test {

class ProfileEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        table_ = Table({column("age", {"34", "29", std::nullopt, "41", "NA", "38", "250"}),
                        column("income", {"52000", "48000", "61000", std::nullopt, "57000", "50500", "59000"}),
                        column("city", {"Oslo", "Bergen", "Oslo", "", "Oslo", "Bergen", "Trondheim"}),
                        column("code", {"1", "2", "x3", "4", "5", "6", "7"})});
    }

    static std::string json(const Profile& profile) {
        std::ostringstream os;
        ProfileReport::writeJson(profile, os, 10);
        return os.str();
    }

    ProfileOptions serial() const {
        ProfileOptions o;
        o.parallel = false;
        return o;
    }

    Table table_;
};

TEST_F(ProfileEngineTest, ClassifiesEveryColumnOnce)
{
    const Profile p = ProfileEngine::profile(table_, serial());
    EXPECT_EQ(p.rowCount(), 7u);
    EXPECT_EQ(p.colCount(), 4u);
    EXPECT_EQ(p.columnNames(), (std::vector<std::string>{"age", "income", "city", "code"}));
    EXPECT_EQ(p.numericColumns(), (std::vector<std::string>{"age", "income"}));
    EXPECT_EQ(p.categoricalColumns(), (std::vector<std::string>{"city", "code"}));
}

TEST_F(ProfileEngineTest, ObservedPlusMissingEqualsRowCount)
{
    const Profile p = ProfileEngine::profile(table_, serial());
    for (size_t c = 0; c < p.colCount(); ++c) {
        const ColumnProfile& col = p.columns()[c];
        const size_t observed = col.numeric ? col.numeric->count : col.categorical->count;
        EXPECT_EQ(observed + p.missing().columns[c].count, p.rowCount()) << col.name;
    }
    EXPECT_EQ(p.column("age").numeric->count, 5u);
    EXPECT_EQ(p.missing().columns[2].count, 1u);
}

TEST_F(ProfileEngineTest, StatisticsFollowColumnType)
{
    const Profile p = ProfileEngine::profile(table_, serial());
    const ColumnProfile& age = p.column("age");
    EXPECT_TRUE(age.numeric);
    EXPECT_TRUE(age.outliers);
    EXPECT_FALSE(age.categorical);

    const ColumnProfile& city = p.column("city");
    EXPECT_FALSE(city.numeric);
    EXPECT_FALSE(city.outliers);
    ASSERT_TRUE(city.categorical);
    EXPECT_EQ(*city.categorical->mostFrequent, "Oslo");
    EXPECT_EQ(*city.categorical->mostFrequentCount, 3u);
    EXPECT_EQ(city.categorical->distinctCount, 3u);
}

TEST_F(ProfileEngineTest, OutliersCarrySourceRows)
{
    const Profile p = ProfileEngine::profile(table_, serial());
    const OutlierReport& o = *p.column("age").outliers;
    ASSERT_EQ(o.count(), 1u);
    EXPECT_EQ(o.outliers[0].row, 6u);
    EXPECT_DOUBLE_EQ(o.outliers[0].value, 250.0);
}

TEST_F(ProfileEngineTest, CorrelationCoversNumericColumnsOnly)
{
    const Profile p = ProfileEngine::profile(table_, serial());
    const CorrelationMatrix& m = p.correlations();
    EXPECT_EQ(m.columnNames(), p.numericColumns());
    EXPECT_EQ(m.jointCount(0, 1), 4u);
    EXPECT_EQ(m.at("age", "income"), m.at("income", "age"));
    EXPECT_THROW(m.at("age", "city"), DatasetException);
}

TEST_F(ProfileEngineTest, RepeatedRunsAreIdentical)
{
    EXPECT_EQ(json(ProfileEngine::profile(table_, serial())), json(ProfileEngine::profile(table_, serial())));
}

TEST_F(ProfileEngineTest, ParallelRunMatchesSerial)
{
    ProfileOptions parallel;
    parallel.parallel = true;
    EXPECT_EQ(json(ProfileEngine::profile(table_, serial())), json(ProfileEngine::profile(table_, parallel)));
    EXPECT_GE(ProfileEngine::workerThreads(), 1);
}

TEST_F(ProfileEngineTest, UnknownColumnLookup)
{
    const Profile p = ProfileEngine::profile(table_, serial());
    EXPECT_EQ(p.findColumn("nope"), nullptr);
    EXPECT_NE(p.findColumn("age"), nullptr);
    EXPECT_THROW(p.column("nope"), DatasetException);
}

TEST_F(ProfileEngineTest, CustomMissingTokens)
{
    ProfileOptions o = serial();
    o.missingTokens = {"x3"};
    const Profile p = ProfileEngine::profile(table_, o);
    // "x3" is now missing, so "code" resolves as numerical.
    EXPECT_EQ(p.column("code").type, ColumnType::NUMERIC);
    EXPECT_EQ(p.missing().columns[3].count, 1u);
    // "NA" and "" are ordinary text under this policy.
    EXPECT_EQ(p.column("age").type, ColumnType::CATEGORICAL);
    EXPECT_EQ(p.column("city").categorical->distinctCount, 4u);
}

TEST(ProfileEngineEdgeTest, ZeroRowTable)
{
    const Table table({column("a", {}), column("b", {})});
    const Profile p = ProfileEngine::profile(table);
    EXPECT_EQ(p.rowCount(), 0u);
    EXPECT_EQ(p.categoricalColumns().size(), 2u);
    EXPECT_DOUBLE_EQ(p.missing().totalPercentage, 0.0);
    EXPECT_TRUE(p.correlations().empty());
    EXPECT_EQ(p.column("a").categorical->count, 0u);
}

TEST(ProfileEngineEdgeTest, NoColumns)
{
    const Profile p = ProfileEngine::profile(Table{});
    EXPECT_EQ(p.colCount(), 0u);
    EXPECT_EQ(p.missing().totalCells, 0u);
}

TEST(ProfileEngineEdgeTest, AllMissingColumnIsCategoricalWithNoMode)
{
    const Table table({column("empty", {std::nullopt, "NA", ""}), column("x", {"1", "2", "3"})});
    const Profile p = ProfileEngine::profile(table);
    const ColumnProfile& col = p.column("empty");
    EXPECT_EQ(col.type, ColumnType::CATEGORICAL);
    EXPECT_EQ(col.categorical->count, 0u);
    EXPECT_FALSE(col.categorical->mostFrequent);
    EXPECT_DOUBLE_EQ(p.missing().columns[0].percentage, 100.0);
}

TEST(ProfileEngineEdgeTest, SingleObservationColumn)
{
    const Table table({column("x", {"5", std::nullopt, std::nullopt, std::nullopt})});
    const Profile p = ProfileEngine::profile(table);
    const NumericStats& s = *p.column("x").numeric;
    EXPECT_DOUBLE_EQ(*s.mean, 5.0);
    EXPECT_FALSE(s.stddev);
    EXPECT_EQ(p.column("x").outliers->count(), 0u);
    EXPECT_FALSE(p.column("x").outliers->q1);
    EXPECT_FALSE(p.correlations().at("x", "x"));
}

TEST(ProfileEngineEdgeTest, InvalidOptionsAreRejected)
{
    const Table table({column("x", {"1"})});
    ProfileOptions negative;
    negative.outlierIqrMultiplier = -1.0;
    EXPECT_THROW(ProfileEngine::profile(table, negative), ConfigurationException);

    ProfileOptions notFinite;
    notFinite.outlierIqrMultiplier = std::nan("");
    EXPECT_THROW(ProfileEngine::profile(table, notFinite), ConfigurationException);

    ProfileOptions noTop;
    noTop.topCategories = 0;
    EXPECT_THROW(noTop.validate(), ConfigurationException);
}

TEST(ProfileEngineEdgeTest, MalformedTableNeverReachesEngine)
{
    EXPECT_THROW(ProfileEngine::profile(Table({column("a", {"1", "2"}), column("b", {"1"})})), DatasetException);
}

} // namespace Datalens::Test
