#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "ml/isolation_forest.h"

using namespace datalens::ml;
using datalens::linalg::Matrix;

namespace {

// 200 points near the origin plus 5 far away (the last rows).
auto MakeClusterWithOutliers() -> Matrix {
    std::mt19937_64 rng(3);
    std::normal_distribution<double> noise(0.0, 1.0);
    Matrix x(205, 2);
    for (size_t r = 0; r < 200; ++r) {
        x(r, 0) = noise(rng);
        x(r, 1) = noise(rng);
    }
    for (size_t r = 200; r < 205; ++r) {
        x(r, 0) = 15.0 + static_cast<double>(r - 200);
        x(r, 1) = -15.0;
    }
    return x;
}

} // namespace

TEST(IsolationForestTest, AveragePathLength) {
    EXPECT_DOUBLE_EQ(AveragePathLength(0), 0.0);
    EXPECT_DOUBLE_EQ(AveragePathLength(1), 0.0);
    EXPECT_DOUBLE_EQ(AveragePathLength(2), 1.0);
    EXPECT_NEAR(AveragePathLength(256), 10.2448, 1e-3);
}

TEST(IsolationForestTest, FarPointsScoreHighest) {
    Matrix x = MakeClusterWithOutliers();
    IsolationForest forest(IsolationForestParams{});
    forest.Fit(x);
    EXPECT_EQ(forest.tree_count(), 100u);
    EXPECT_EQ(forest.sample_size(), 205u);

    auto scores = forest.Score(x);
    ASSERT_EQ(scores.size(), 205u);
    auto flagged = SelectOutliers(scores, 5.0 / 205.0);
    ASSERT_EQ(flagged.size(), 5u);
    for (size_t idx : flagged) {
        EXPECT_GE(idx, 200u);
    }
    for (double s : scores) {
        EXPECT_GT(s, 0.0);
        EXPECT_LE(s, 1.0);
    }
}

TEST(IsolationForestTest, SameSeedSameScores) {
    Matrix x = MakeClusterWithOutliers();
    IsolationForestParams params;
    params.n_estimators = 20;
    params.max_samples = 64;

    IsolationForest a(params);
    IsolationForest b(params);
    a.Fit(x);
    b.Fit(x);
    EXPECT_EQ(a.Score(x), b.Score(x));
}

TEST(IsolationForestTest, SelectOutliersCountIsRounded) {
    std::vector<double> scores(1000, 0.4);
    EXPECT_EQ(SelectOutliers(scores, 0.1).size(), 100u);
    EXPECT_EQ(SelectOutliers(std::vector<double>(7, 0.5), 0.1).size(), 1u);
    EXPECT_EQ(SelectOutliers(std::vector<double>(4, 0.5), 0.1).size(), 0u);
    EXPECT_THROW(SelectOutliers(scores, 1.5), std::invalid_argument);
}

TEST(IsolationForestTest, ConstantDataScoresEvenly) {
    Matrix x(10, 2);
    IsolationForest forest(IsolationForestParams{});
    forest.Fit(x);
    auto scores = forest.Score(x);
    EXPECT_TRUE(std::all_of(scores.begin(), scores.end(), [&](double s) { return s == scores[0]; }));
}

TEST(IsolationForestTest, ScoreBeforeFitThrows) {
    IsolationForest forest(IsolationForestParams{});
    EXPECT_THROW(forest.Score(Matrix(1, 1)), std::runtime_error);
    EXPECT_THROW(forest.Fit(Matrix()), std::invalid_argument);
}
