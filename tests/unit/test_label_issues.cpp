#include <gtest/gtest.h>

#include "LabelIssueDetector.h"
#include "TypedDataset.h"
#include "VeritasExceptions.h"

#include <algorithm>
#include <atomic>
#include <memory>
#include <cstdio>
#include <string>

namespace {
std::string fixed1(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", v);
    return buf;
}

// Two well separated groups along x plus one "dog" sitting inside the "cat" group.
TypedDataset mislabelledAnimals() {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 20; ++i) rows.push_back({fixed1(0.1 * i), "cat"});
    for (int i = 0; i < 20; ++i) rows.push_back({fixed1(10.0 + 0.1 * i), "dog"});
    rows.push_back({"-0.5", "dog"});
    return TypedDataset::fromRecords({"x", "label"}, rows);
}
} // namespace

TEST(LabelIssueDetectorTest, FindsTheMislabelledRow) {
    const LabelIssueReport report = LabelIssueDetector::detect(mislabelledAnimals(), "label", LabelIssueDetector::Options{});
    EXPECT_EQ(report.status, AnalysisStatus::OK);
    EXPECT_TRUE(report.note.empty());
    EXPECT_EQ(report.classes, (std::vector<std::string>{"cat", "dog"}));
    ASSERT_GE(report.issueCount, 1u);

    const auto it = std::find_if(report.preview.begin(), report.preview.end(), [](const LabelIssue& issue) {
        return issue.rowIndex == 40;
    });
    ASSERT_NE(it, report.preview.end());
    EXPECT_EQ(it->givenLabel, "dog");
    EXPECT_EQ(it->suggestedLabel, "cat");
    EXPECT_LT(it->givenConfidence, it->suggestedConfidence);
}

TEST(LabelIssueDetectorTest, SeedMakesResultsReproducible) {
    const TypedDataset data = mislabelledAnimals();
    const LabelIssueReport a = LabelIssueDetector::detect(data, "label", LabelIssueDetector::Options{});
    const LabelIssueReport b = LabelIssueDetector::detect(data, "label", LabelIssueDetector::Options{});
    ASSERT_EQ(a.preview.size(), b.preview.size());
    for (size_t i = 0; i < a.preview.size(); ++i) {
        EXPECT_EQ(a.preview[i].rowIndex, b.preview[i].rowIndex);
        EXPECT_DOUBLE_EQ(a.preview[i].givenConfidence, b.preview[i].givenConfidence);
    }
}

TEST(LabelIssueDetectorTest, SingleClassIsInsufficient) {
    const TypedDataset data = TypedDataset::fromRecords(
        {"x", "label"}, {{"1", "a"}, {"2", "a"}, {"3", "a"}, {"4", "a"}, {"5", "a"}, {"6", "a"}});
    const LabelIssueReport report = LabelIssueDetector::detect(data, "label", LabelIssueDetector::Options{});
    EXPECT_EQ(report.issueCount, 0u);
    EXPECT_EQ(report.status, AnalysisStatus::NOT_APPLICABLE);
    EXPECT_EQ(report.note, LabelIssueDetector::kInsufficientData);
}

TEST(LabelIssueDetectorTest, ContinuousTargetIsNotCategorical) {
    const TypedDataset data = TypedDataset::fromRecords(
        {"x", "price"}, {{"1", "1.25"}, {"2", "2.5"}, {"3", "3.75"}, {"4", "4.5"}, {"5", "5.5"}});
    const LabelIssueReport report = LabelIssueDetector::detect(data, "price", LabelIssueDetector::Options{});
    EXPECT_EQ(report.issueCount, 0u);
    EXPECT_EQ(report.note, LabelIssueDetector::kTargetNotCategorical);
}

TEST(LabelIssueDetectorTest, IdentifierLikeTargetIsNotCategorical) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 20; ++i) rows.push_back({fixed1(1.5 * i), std::to_string(i)});
    const TypedDataset data = TypedDataset::fromRecords({"x", "code"}, rows);

    const LabelIssueReport report = LabelIssueDetector::detect(data, "code", LabelIssueDetector::Options{});
    EXPECT_EQ(report.status, AnalysisStatus::NOT_APPLICABLE);
    EXPECT_EQ(report.issueCount, 0u);
    EXPECT_EQ(report.note, LabelIssueDetector::kTargetNotCategorical);

    LabelIssueDetector::Options loose;
    loose.maxUniqueRatio = 1.0;
    const LabelIssueReport allowed = LabelIssueDetector::detect(data, "code", loose);
    EXPECT_NE(allowed.note, LabelIssueDetector::kTargetNotCategorical);
}

TEST(LabelIssueDetectorTest, RaisedCancellationStopsTraining) {
    LabelIssueDetector::Options options;
    options.cancel = std::make_shared<std::atomic<bool>>(true);
    EXPECT_THROW(LabelIssueDetector::detect(mislabelledAnimals(), "label", options), Veritas::CancelledException);
}

TEST(LabelIssueDetectorTest, MissingTargetColumn) {
    const LabelIssueReport report = LabelIssueDetector::detect(mislabelledAnimals(), "species", LabelIssueDetector::Options{});
    EXPECT_EQ(report.note, LabelIssueDetector::kTargetNotFound);
    const LabelIssueReport none = LabelIssueDetector::detect(mislabelledAnimals(), "", LabelIssueDetector::Options{});
    EXPECT_EQ(none.note, LabelIssueDetector::kTargetNotFound);
}

TEST(LabelIssueDetectorTest, TooFewRowsIsInsufficient) {
    const TypedDataset data = TypedDataset::fromRecords({"x", "label"}, {{"1", "a"}, {"2", "b"}, {"3", "a"}});
    const LabelIssueReport report = LabelIssueDetector::detect(data, "label", LabelIssueDetector::Options{});
    EXPECT_EQ(report.note, LabelIssueDetector::kInsufficientData);
}

TEST(LabelIssueDetectorTest, NoUsableFeatures) {
    const TypedDataset data = TypedDataset::fromRecords(
        {"constant", "label"}, {{"1", "a"}, {"1", "b"}, {"1", "a"}, {"1", "b"}, {"1", "a"}, {"1", "b"}});
    const LabelIssueReport report = LabelIssueDetector::detect(data, "label", LabelIssueDetector::Options{});
    EXPECT_EQ(report.note, LabelIssueDetector::kNoFeatures);
}

TEST(LabelIssueDetectorTest, ConfidentSelectionOverGivenProbabilities) {
    const LabelIssueDetector::Matrix probabilities = {
        {0.9, 0.1}, {0.8, 0.2}, {0.1, 0.9},
        {0.1, 0.9}, {0.2, 0.8}, {0.3, 0.7}};
    const std::vector<int> labels = {0, 0, 0, 1, 1, 1};
    EXPECT_EQ(LabelIssueDetector::findIssues(probabilities, labels, 2, 0.1), (std::vector<size_t>{2}));
}

TEST(LabelIssueDetectorTest, OutOfFoldRowsSumToOne) {
    LabelIssueDetector::Matrix features;
    std::vector<int> labels;
    for (int i = 0; i < 12; ++i) {
        features.push_back({static_cast<double>(i)});
        labels.push_back(i < 6 ? 0 : 1);
    }
    const auto oof = LabelIssueDetector::outOfFoldProbabilities(features, labels, 2, LabelIssueDetector::Options{});
    ASSERT_EQ(oof.size(), features.size());
    for (const auto& row : oof) {
        ASSERT_EQ(row.size(), 2u);
        EXPECT_NEAR(row[0] + row[1], 1.0, 1e-9);
    }
}
