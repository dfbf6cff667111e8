#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "dataset.h"
#include "dataset_builders.h"
#include "errors.h"
#include "profiler.h"

namespace datalens {
namespace {

TEST(ProfilerTest, CountsNumericColumns) {
    Dataset ds = DatasetFromJsonRows(testing::MakeMixedRows());
    auto profile = ProfileDataset(ds);

    EXPECT_EQ(profile.row_count, 10u);
    EXPECT_EQ(profile.column_count, 5u);
    EXPECT_EQ(profile.numeric_column_count, 2u);
    EXPECT_DOUBLE_EQ(profile.numeric_column_ratio, 0.4);
    ASSERT_EQ(profile.numeric_columns.size(), 2u);
    EXPECT_EQ(profile.numeric_columns[0], "age");
    EXPECT_EQ(profile.numeric_columns[1], "score");
}

TEST(ProfilerTest, SingleNonNumericValueDisqualifiesColumn) {
    auto rows = nlohmann::json::parse(R"([{"x": 1}, {"x": "2.5"}, {"x": "n/a"}])");
    Dataset ds = DatasetFromJsonRows(rows);
    EXPECT_FALSE(IsNumericColumn(ds, 0));
    EXPECT_EQ(InferColumnType(ds, 0), ColumnType::Text);
}

TEST(ProfilerTest, NumericTextCounts) {
    auto rows = nlohmann::json::parse(R"([{"x": "1"}, {"x": " 2.5 "}, {"x": null}, {"x": ""}])");
    Dataset ds = DatasetFromJsonRows(rows);
    EXPECT_TRUE(IsNumericColumn(ds, 0));
}

TEST(ProfilerTest, BooleansAreNotNumeric) {
    auto rows = nlohmann::json::parse(R"([{"flag": true}, {"flag": false}, {"flag": null}])");
    Dataset ds = DatasetFromJsonRows(rows);
    EXPECT_FALSE(IsNumericColumn(ds, 0));
    EXPECT_EQ(InferColumnType(ds, 0), ColumnType::Boolean);
}

TEST(ProfilerTest, AllMissingColumnIsText) {
    auto rows = nlohmann::json::parse(R"([{"x": null, "y": 1}, {"x": "  ", "y": 2}])");
    Dataset ds = DatasetFromJsonRows(rows);
    EXPECT_FALSE(IsNumericColumn(ds, 0));
    EXPECT_EQ(InferColumnType(ds, 0), ColumnType::Text);

    auto profile = ProfileDataset(ds);
    EXPECT_DOUBLE_EQ(profile.numeric_column_ratio, 0.5);
}

TEST(ProfilerTest, EmptyDatasetRejected) {
    Dataset no_rows;
    no_rows.columns = {"a"};
    EXPECT_THROW(ProfileDataset(no_rows), EmptyDatasetError);

    Dataset no_columns;
    no_columns.rows.push_back(Row{});
    EXPECT_THROW(ProfileDataset(no_columns), EmptyDatasetError);
}

TEST(ProfilerTest, Deterministic) {
    Dataset ds = DatasetFromJsonRows(testing::MakeNumericRows(50, 3));
    auto a = ProfileDataset(ds);
    auto b = ProfileDataset(ds);
    EXPECT_EQ(a.numeric_columns, b.numeric_columns);
    EXPECT_DOUBLE_EQ(a.numeric_column_ratio, 0.75);
}

} // namespace
} // namespace datalens
