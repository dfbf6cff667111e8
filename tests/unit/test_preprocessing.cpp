#include <gtest/gtest.h>

#include <cmath>

#include <nlohmann/json.hpp>

#include "dataset.h"
#include "preprocessing.h"

using namespace datalens::ml;
using datalens::linalg::Matrix;

TEST(PreprocessingTest, ExtractsCompleteRowsOnly) {
    auto rows = nlohmann::json::parse(R"([
        {"a": 1, "b": "2", "c": "x"},
        {"a": null, "b": 3, "c": "y"},
        {"a": 4, "b": " ", "c": "z"},
        {"a": 5, "b": 6, "c": null}
    ])");
    auto ds = datalens::DatasetFromJsonRows(rows);
    auto table = ExtractNumericTable(ds, {"a", "b"});

    EXPECT_EQ(table.values.rows, 2u);
    EXPECT_EQ(table.values.cols, 2u);
    EXPECT_EQ(table.excluded_rows, 2u);
    ASSERT_EQ(table.source_rows.size(), 2u);
    EXPECT_EQ(table.source_rows[0], 0u);
    EXPECT_EQ(table.source_rows[1], 3u);
    EXPECT_DOUBLE_EQ(table.values(0, 1), 2.0);
    EXPECT_DOUBLE_EQ(table.values(1, 0), 5.0);
}

TEST(PreprocessingTest, UnknownColumnRejected) {
    auto ds = datalens::DatasetFromJsonRows(nlohmann::json::parse(R"([{"a": 1}])"));
    EXPECT_THROW(ExtractNumericTable(ds, {"missing"}), std::invalid_argument);
}

TEST(PreprocessingTest, ScalerStandardizes) {
    Matrix x(4, 1);
    x(0, 0) = 1.0;
    x(1, 0) = 2.0;
    x(2, 0) = 3.0;
    x(3, 0) = 4.0;

    StandardScaler scaler;
    auto z = scaler.FitTransform(x);

    EXPECT_DOUBLE_EQ(scaler.mean()[0], 2.5);
    EXPECT_NEAR(scaler.scale()[0], std::sqrt(1.25), 1e-12);
    double sum = 0.0;
    double sq = 0.0;
    for (size_t r = 0; r < z.rows; ++r) {
        sum += z(r, 0);
        sq += z(r, 0) * z(r, 0);
    }
    EXPECT_NEAR(sum, 0.0, 1e-12);
    EXPECT_NEAR(sq / 4.0, 1.0, 1e-12);
}

TEST(PreprocessingTest, ConstantColumnKeepsUnitScale) {
    Matrix x(3, 2);
    for (size_t r = 0; r < 3; ++r) {
        x(r, 0) = 5.0;
        x(r, 1) = static_cast<double>(r);
    }
    StandardScaler scaler;
    auto z = scaler.FitTransform(x);
    EXPECT_DOUBLE_EQ(scaler.scale()[0], 1.0);
    for (size_t r = 0; r < 3; ++r) {
        EXPECT_DOUBLE_EQ(z(r, 0), 0.0);
    }
}

TEST(PreprocessingTest, TransformChecksDimensions) {
    Matrix x(2, 2);
    StandardScaler scaler;
    scaler.Fit(x);
    EXPECT_THROW(scaler.Transform(Matrix(2, 3)), std::runtime_error);
    EXPECT_THROW(StandardScaler().Fit(Matrix()), std::invalid_argument);
}
