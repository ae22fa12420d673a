#include <gtest/gtest.h>

#include "IsolationForest.h"
#include "OutlierEngine.h"
#include "QualityConfig.h"
#include "TypedDataset.h"
#include "VeritasExceptions.h"

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace {
TypedDataset clusterWithOneOutlier() {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 40; ++i) {
        rows.push_back({std::to_string(10 + (i % 5)), std::to_string(100 + (i % 7))});
    }
    rows.push_back({"500", "-300"});
    return TypedDataset::fromRecords({"x", "y"}, rows);
}
} // namespace

TEST(StatisticalOutlierTest, TukeyFenceFlagsOnlyTheExtremeValue) {
    EXPECT_EQ(OutlierEngine::iqrOutlierPositions({1, 2, 3, 4, 100}, 1.5, 1e-12), (std::vector<size_t>{4}));
}

TEST(StatisticalOutlierTest, ConstantColumnHasNoOutliers) {
    EXPECT_TRUE(OutlierEngine::iqrOutlierPositions({5, 5, 5, 5, 5, 5}, 1.5, 1e-12).empty());
}

TEST(StatisticalOutlierTest, DetectorMapsPositionsBackToRows) {
    const TypedDataset data = TypedDataset::fromRecords(
        {"v"}, {{"1"}, {""}, {"2"}, {"3"}, {"4"}, {"100"}});
    const DetectorOutcome outcome = OutlierEngine::detectStatistical(data, QualityTuningConfig{});
    EXPECT_EQ(outcome.status, AnalysisStatus::OK);
    EXPECT_EQ(outcome.rows, (std::vector<size_t>{5}));
}

TEST(StatisticalOutlierTest, NoNumericColumnIsNotApplicable) {
    const TypedDataset data = TypedDataset::fromRecords({"s"}, {{"a"}, {"b"}, {"c"}, {"d"}});
    const DetectorOutcome outcome = OutlierEngine::detectStatistical(data, QualityTuningConfig{});
    EXPECT_EQ(outcome.status, AnalysisStatus::NOT_APPLICABLE);
    EXPECT_FALSE(outcome.note.empty());
    EXPECT_TRUE(outcome.rows.empty());
}

TEST(StructuralOutlierTest, FlagsInvalidCellsAndRaggedRows) {
    const TypedDataset data = TypedDataset::fromRecords(
        {"amount", "city"},
        {{"1", "Paris"}, {"2", "Lyon"}, {"3", "Nice"}, {"4", "Lille"}, {"abc", "Metz"}, {"6"}});
    const DetectorOutcome outcome = OutlierEngine::detectStructural(data, QualityTuningConfig{});
    EXPECT_EQ(outcome.rows, (std::vector<size_t>{4, 5}));
}

TEST(StructuralOutlierTest, FlagsTokenKindMinorityInTextColumn) {
    std::vector<std::vector<std::string>> rows;
    const char* cities[] = {"Paris", "Lyon", "Nice", "Lille", "Metz", "Brest", "Caen", "Dijon", "Tours"};
    for (const char* city : cities) rows.push_back({city, "x"});
    rows.push_back({"12345", "x"});
    const TypedDataset data = TypedDataset::fromRecords({"city", "tag"}, rows);
    ASSERT_EQ(data.column(0).type, ColumnType::CATEGORICAL);

    const DetectorOutcome outcome = OutlierEngine::detectStructural(data, QualityTuningConfig{});
    EXPECT_EQ(outcome.rows, (std::vector<size_t>{9}));
}

TEST(StructuralOutlierTest, FlagsSparselyPopulatedRow) {
    const TypedDataset data = TypedDataset::fromRecords(
        {"a", "b", "c", "d"},
        {{"1", "2", "3", "4"}, {"5", "6", "7", "8"}, {"9", "", "", ""}, {"2", "3", "4", "5"}});
    const DetectorOutcome outcome = OutlierEngine::detectStructural(data, QualityTuningConfig{});
    EXPECT_EQ(outcome.rows, (std::vector<size_t>{2}));
}

TEST(SemanticOutlierTest, IsolatesTheFarPoint) {
    const TypedDataset data = clusterWithOneOutlier();
    const DetectorOutcome outcome = OutlierEngine::detectSemantic(data, QualityTuningConfig{}, 1337);
    EXPECT_EQ(outcome.status, AnalysisStatus::OK);
    ASSERT_FALSE(outcome.rows.empty());
    EXPECT_NE(std::find(outcome.rows.begin(), outcome.rows.end(), 40u), outcome.rows.end());
    EXPECT_LE(outcome.rows.size(), 5u);
}

TEST(SemanticOutlierTest, DeterministicForFixedSeed) {
    const TypedDataset data = clusterWithOneOutlier();
    const DetectorOutcome first = OutlierEngine::detectSemantic(data, QualityTuningConfig{}, 42);
    const DetectorOutcome second = OutlierEngine::detectSemantic(data, QualityTuningConfig{}, 42);
    EXPECT_EQ(first.rows, second.rows);
}

TEST(SemanticOutlierTest, TooFewRowsIsNotApplicable) {
    const TypedDataset data = TypedDataset::fromRecords({"x"}, {{"1"}, {"2"}, {"3"}});
    const DetectorOutcome outcome = OutlierEngine::detectSemantic(data, QualityTuningConfig{}, 1337);
    EXPECT_EQ(outcome.status, AnalysisStatus::NOT_APPLICABLE);
    EXPECT_TRUE(outcome.rows.empty());
}

TEST(SemanticOutlierTest, ConstantColumnsAreNotApplicable) {
    std::vector<std::vector<std::string>> rows(12, std::vector<std::string>{"7", "same"});
    const TypedDataset data = TypedDataset::fromRecords({"x", "s"}, rows);
    const DetectorOutcome outcome = OutlierEngine::detectSemantic(data, QualityTuningConfig{}, 1337);
    EXPECT_EQ(outcome.status, AnalysisStatus::NOT_APPLICABLE);
    EXPECT_EQ(outcome.note, "no column with spread for semantic detection");
}

TEST(SemanticOutlierTest, FlagsUnusualCombinationOfOrdinaryValues) {
    // x tracks y everywhere except the last row, whose values are each in range.
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 200; ++i) rows.push_back({std::to_string(i), std::to_string(i)});
    rows.push_back({"10", "190"});
    const TypedDataset data = TypedDataset::fromRecords({"x", "y"}, rows);

    const DetectorOutcome statistical = OutlierEngine::detectStatistical(data, QualityTuningConfig{});
    EXPECT_TRUE(statistical.rows.empty());

    const DetectorOutcome semantic = OutlierEngine::detectSemantic(data, QualityTuningConfig{}, 1337);
    EXPECT_EQ(semantic.status, AnalysisStatus::OK);
    EXPECT_NE(std::find(semantic.rows.begin(), semantic.rows.end(), 200u), semantic.rows.end());
}

TEST(SemanticOutlierTest, RaisedCancellationAbortsDetection) {
    auto cancel = std::make_shared<std::atomic<bool>>(true);
    EXPECT_THROW(OutlierEngine::detectSemantic(clusterWithOneOutlier(), QualityTuningConfig{}, 1337, cancel),
                 Veritas::CancelledException);
}

TEST(OutlierEngineTest, GuardConvertsExceptionsToFailedOutcome) {
    const DetectorOutcome outcome = OutlierEngine::guarded("Semantic", []() -> DetectorOutcome {
        throw std::runtime_error("boom");
    });
    EXPECT_EQ(outcome.status, AnalysisStatus::FAILED);
    EXPECT_EQ(outcome.note, "Semantic detection failed: boom");
    EXPECT_TRUE(outcome.rows.empty());
}

TEST(OutlierEngineTest, UniqueTotalNeverExceedsPerMethodSum) {
    QualityConfig config;
    const TypedDataset data = clusterWithOneOutlier();
    const OutlierIndexSets sets = OutlierEngine::analyze(data, config);
    const size_t sum = sets.structural.rows.size() + sets.statistical.rows.size() + sets.semantic.rows.size();
    EXPECT_LE(sets.totalUnique(), sum);
    EXPECT_GE(sets.totalUnique(), sets.statistical.rows.size());
}

TEST(IsolationForestTest, RejectsDegenerateInput) {
    IsolationForest forest(IsolationForest::Options{});
    EXPECT_THROW(forest.fit({{1.0}}), Veritas::DatasetException);
    EXPECT_THROW(forest.fit({{1.0, 2.0}, {3.0}}), Veritas::DatasetException);
}

TEST(IsolationForestTest, CancelledFitKeepsNoTrees) {
    IsolationForest::Options options;
    options.trees = 50;
    options.cancel = std::make_shared<std::atomic<bool>>(true);
    IsolationForest forest(options);
    EXPECT_THROW(forest.fit({{1.0}, {2.0}, {3.0}, {40.0}}), Veritas::CancelledException);
    EXPECT_EQ(forest.treeCount(), 0u);

    IsolationForest::Options idle;
    idle.trees = 5;
    idle.cancel = std::make_shared<std::atomic<bool>>(false);
    IsolationForest running(idle);
    running.fit({{1.0}, {2.0}, {3.0}, {40.0}});
    EXPECT_EQ(running.treeCount(), 5u);
}

TEST(IsolationForestTest, AveragePathLengthMatchesKnownValues) {
    EXPECT_DOUBLE_EQ(IsolationForest::averagePathLength(1), 0.0);
    EXPECT_DOUBLE_EQ(IsolationForest::averagePathLength(2), 1.0);
    EXPECT_GT(IsolationForest::averagePathLength(256), IsolationForest::averagePathLength(16));
}
