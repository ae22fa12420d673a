#include <gtest/gtest.h>

#include "ProfileOverviewExtractor.h"
#include "TestSupport.h"

namespace {
const char* kOverviewWithoutDuplicates =
    "<html><body><table class=\"table table-condensed stats\">"
    "<tr><th>Number of variables</th><td>5</td></tr>"
    "<tr><th>Missing cells</th><td>1,234</td></tr>"
    "<tr><th>Missing cells (%)</th><td>12.5%</td></tr>"
    "</table></body></html>";
} // namespace

TEST(ProfileOverviewTest, MissingMetricIsUnavailableWhileOthersAreRead) {
    const ExternalProfileStats stats = ProfileOverviewExtractor::extractHtml(kOverviewWithoutDuplicates);
    ASSERT_TRUE(stats.missingCells.has_value());
    EXPECT_EQ(*stats.missingCells, 1234);
    ASSERT_TRUE(stats.missingCellsPercent.has_value());
    EXPECT_DOUBLE_EQ(*stats.missingCellsPercent, 12.5);
    EXPECT_FALSE(stats.duplicateRows.has_value());
    EXPECT_FALSE(stats.duplicateRowsPercent.has_value());
    EXPECT_EQ(stats.status, AnalysisStatus::OK);
}

TEST(ProfileOverviewTest, ReadsAllFourMetricsFromFile) {
    ScopedTempFile file("overview.html",
                        "<table>"
                        "<tr><th>Missing cells</th><td>0</td></tr>"
                        "<tr><th>Missing cells (%)</th><td>0.0%</td></tr>"
                        "<tr><th>Duplicate rows</th><td><b>7</b></td></tr>"
                        "<tr><th>Duplicate&nbsp;rows (%)</th><td> 0.7% </td></tr>"
                        "</table>");
    const ExternalProfileStats stats = ProfileOverviewExtractor::extractFile(file.path());
    EXPECT_EQ(stats.missingCells, 0);
    EXPECT_EQ(stats.duplicateRows, 7);
    ASSERT_TRUE(stats.duplicateRowsPercent.has_value());
    EXPECT_DOUBLE_EQ(*stats.duplicateRowsPercent, 0.7);
}

TEST(ProfileOverviewTest, DocumentWithoutMetricsIsNotApplicable) {
    const ExternalProfileStats stats = ProfileOverviewExtractor::extractHtml("<p>nothing here</p>");
    EXPECT_FALSE(stats.anyAvailable());
    EXPECT_EQ(stats.status, AnalysisStatus::NOT_APPLICABLE);
}

TEST(ProfileOverviewTest, UnreadableFileYieldsUnavailableMetrics) {
    const ExternalProfileStats stats = ProfileOverviewExtractor::extractFile("/nonexistent/veritas/profile.html");
    EXPECT_FALSE(stats.anyAvailable());
    EXPECT_EQ(stats.status, AnalysisStatus::FAILED);
    EXPECT_FALSE(stats.note.empty());
}

TEST(ProfileOverviewTest, AbsentPathMeansNotGenerated) {
    const ExternalProfileStats stats = ProfileOverviewExtractor::extract(std::nullopt);
    EXPECT_FALSE(stats.anyAvailable());
    EXPECT_EQ(stats.status, AnalysisStatus::NOT_APPLICABLE);
    EXPECT_EQ(stats.note, "profile not generated");
}

TEST(ProfileOverviewTest, CountParsingRejectsText) {
    EXPECT_EQ(ProfileOverviewExtractor::parseCount("1'024"), 1024);
    EXPECT_FALSE(ProfileOverviewExtractor::parseCount("n/a").has_value());
    EXPECT_FALSE(ProfileOverviewExtractor::parsePercent("").has_value());
}
