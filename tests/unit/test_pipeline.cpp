#include <gtest/gtest.h>

#include "DatasetLoader.h"
#include "QualityPipeline.h"
#include "QualityService.h"
#include "ReportJson.h"
#include "TestSupport.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace {
const char* kAgesCsv = "age,label\n25,0\n26,0\n24,1\n27,0\n1000,1\n";

QualityConfig quietConfig() {
    QualityConfig config;
    config.verbose = false;
    return config;
}

QualityConfig serviceConfig(const std::filesystem::path& uploadRoot) {
    QualityConfig config = quietConfig();
    config.uploadRoot = uploadRoot.string();
    return config;
}

std::shared_ptr<const TypedDataset> agesDataset() {
    return std::make_shared<const TypedDataset>(
        TypedDataset::fromRecords({"age", "label"}, {{"25", "0"}, {"26", "0"}, {"24", "1"}, {"27", "0"}, {"1000", "1"}}));
}

std::shared_ptr<const TypedDataset> mixedDataset() {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 30; ++i) {
        rows.push_back({std::to_string(20 + i % 9), i % 3 == 0 ? "gold" : "silver", i % 2 == 0 ? "yes" : "no"});
    }
    rows.push_back({"400", "gold", "yes"});
    rows.push_back({"abc", "silver", "no"});
    rows.push_back({"21", "silver", "no"});
    return std::make_shared<const TypedDataset>(TypedDataset::fromRecords({"age", "tier", "churned"}, rows));
}
} // namespace

TEST(QualityPipelineTest, EndToEndOnSmallTable) {
    const QualityPipeline pipeline(quietConfig());
    const QualityReport report = pipeline.run(agesDataset(), QualityRequest{});

    ASSERT_NE(report.missing, nullptr);
    EXPECT_TRUE(report.missing->flagged().empty());
    ASSERT_NE(report.duplicates, nullptr);
    EXPECT_EQ(report.duplicates->duplicateCount, 0u);
    ASSERT_NE(report.outliers, nullptr);
    EXPECT_EQ(report.outliers->statistical.rows, (std::vector<size_t>{4}));
    ASSERT_TRUE(report.target.column.has_value());
    EXPECT_EQ(*report.target.column, "label");
    EXPECT_EQ(report.target.source, TargetSource::INFERRED);
    ASSERT_NE(report.labelIssues, nullptr);
    EXPECT_TRUE(report.labelIssues->note.empty()) << report.labelIssues->note;
    EXPECT_EQ(report.labelIssues->status, AnalysisStatus::OK);
    ASSERT_NE(report.profile, nullptr);
    EXPECT_EQ(report.profile->status, AnalysisStatus::NOT_APPLICABLE);
    EXPECT_FALSE(report.profile->anyAvailable());
}

TEST(QualityPipelineTest, LoadsFromDiskAndRendersJson) {
    ScopedTempFile file("ages.csv", kAgesCsv);
    auto data = DatasetLoader::load(file.path(), "", LoadOptions{});
    QualityRequest request;
    request.datasetName = "ages.csv";
    const QualityReport report = QualityPipeline(quietConfig()).run(data, request);

    const std::string json = ReportJson::toJson(report, OutlierFilter::ALL);
    EXPECT_NE(json.find("\"dataset\": \"ages.csv\""), std::string::npos);
    EXPECT_NE(json.find("\"target_column\": \"label\""), std::string::npos);
    EXPECT_NE(json.find("\"duplicate_rows_count\": 0"), std::string::npos);
    EXPECT_NE(json.find("\"statistical_count\": 1"), std::string::npos);
    EXPECT_NE(json.find("\"missing_cells\": null"), std::string::npos);
    EXPECT_NE(json.find("\"columns\": [\"age\", \"label\"]"), std::string::npos);
}

TEST(QualityPipelineTest, ParallelRunMatchesSequentialRun) {
    QualityConfig sequential = quietConfig();
    QualityConfig parallel = quietConfig();
    parallel.parallelAnalyzers = true;

    const auto data = mixedDataset();
    const QualityReport a = QualityPipeline(sequential).run(data, QualityRequest{});
    const QualityReport b = QualityPipeline(parallel).run(data, QualityRequest{});
    EXPECT_EQ(ReportJson::toJson(a, OutlierFilter::ALL), ReportJson::toJson(b, OutlierFilter::ALL));
}

TEST(QualityPipelineTest, GenerousTimeoutDoesNotChangeResults) {
    QualityConfig bounded = quietConfig();
    bounded.analysisTimeoutMs = 60000;

    const auto data = mixedDataset();
    const QualityReport a = QualityPipeline(quietConfig()).run(data, QualityRequest{});
    const QualityReport b = QualityPipeline(bounded).run(data, QualityRequest{});
    EXPECT_EQ(a.outliers->semantic.rows, b.outliers->semantic.rows);
    EXPECT_EQ(a.labelIssues->issueCount, b.labelIssues->issueCount);
    EXPECT_EQ(b.outliers->semantic.status, AnalysisStatus::OK);
}

TEST(QualityPipelineTest, OverrunningStepsReportTimedOut) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 600; ++i) {
        rows.push_back({std::to_string(i % 97), std::to_string((i * 7) % 53), i % 2 == 0 ? "yes" : "no"});
    }
    const auto data = std::make_shared<const TypedDataset>(TypedDataset::fromRecords({"a", "b", "churned"}, rows));

    QualityConfig config = quietConfig();
    config.analysisTimeoutMs = 1;
    config.tuning.semanticTrees = 20000;
    config.tuning.labelEpochs = 100000;
    QualityRequest request;
    request.manualTarget = "churned";
    const QualityReport report = QualityPipeline(config).run(data, request);

    EXPECT_EQ(report.outliers->semantic.status, AnalysisStatus::TIMED_OUT);
    EXPECT_EQ(report.outliers->semantic.note, "semantic detection timed out");
    EXPECT_TRUE(report.outliers->semantic.rows.empty());
    EXPECT_EQ(report.labelIssues->status, AnalysisStatus::TIMED_OUT);
    EXPECT_EQ(report.labelIssues->note, "label-issue detection timed out");
    EXPECT_EQ(report.labelIssues->issueCount, 0u);

    // Untimed analyzers still complete.
    EXPECT_EQ(report.outliers->structural.status, AnalysisStatus::OK);
    EXPECT_EQ(report.missing->totalMissing, 0u);
}

TEST(QualityPipelineTest, ManualOverrideAndRejection) {
    const auto data = mixedDataset();
    QualityRequest manual;
    manual.manualTarget = "tier";
    const QualityReport chosen = QualityPipeline(quietConfig()).run(data, manual);
    ASSERT_TRUE(chosen.target.column.has_value());
    EXPECT_EQ(*chosen.target.column, "tier");
    EXPECT_EQ(chosen.target.source, TargetSource::MANUAL);
    EXPECT_EQ(chosen.labelIssues->targetColumn, "tier");

    QualityRequest unknown;
    unknown.manualTarget = "missing_column";
    const QualityReport fallback = QualityPipeline(quietConfig()).run(data, unknown);
    EXPECT_TRUE(fallback.target.overrideRejected);
    EXPECT_EQ(fallback.target.rejectedOverride, "missing_column");
    EXPECT_NE(fallback.target.source, TargetSource::MANUAL);
}

TEST(QualityPipelineTest, StructuralAndStatisticalFindingsAreTagged) {
    const QualityReport report = QualityPipeline(quietConfig()).run(mixedDataset(), QualityRequest{});
    const auto structural = report.outlierView->filter(OutlierFilter::STRUCTURAL);
    ASSERT_EQ(structural.size(), 1u);
    EXPECT_EQ(structural[0].rowIndex, 31u);
    EXPECT_EQ(structural[0].values[0], "abc");

    const auto statistical = report.outlierView->filter(OutlierFilter::STATISTICAL);
    ASSERT_FALSE(statistical.empty());
    EXPECT_EQ(statistical.back().rowIndex, 30u);
}

TEST(QualityEndpointsTest, QualityReportAndOverrides) {
    ScopedTempFile file("service.csv", kAgesCsv);
    TargetOverrideStore overrides;
    QualityEndpoints endpoints(serviceConfig(std::filesystem::temp_directory_path()), overrides);

    const EndpointResponse inferred = endpoints.quality(file.path(), "", "", "", "");
    EXPECT_EQ(inferred.status, 200);
    EXPECT_NE(inferred.body.find("\"target_source\": \"inferred\""), std::string::npos);

    EXPECT_EQ(endpoints.setTarget(file.path(), "age").status, 200);
    EXPECT_EQ(overrides.get(file.path()), std::optional<std::string>("age"));
    const EndpointResponse stored = endpoints.quality(file.path(), "", "", "", "statistical");
    EXPECT_NE(stored.body.find("\"target_column\": \"age\""), std::string::npos);
    EXPECT_NE(stored.body.find("\"target_source\": \"manual\""), std::string::npos);
    EXPECT_NE(stored.body.find("\"selected_filter\": \"statistical\""), std::string::npos);

    const EndpointResponse explicitTarget = endpoints.quality(file.path(), "", "label", "", "");
    EXPECT_NE(explicitTarget.body.find("\"target_column\": \"label\""), std::string::npos);

    EXPECT_EQ(endpoints.clearTarget(file.path()).status, 200);
    EXPECT_FALSE(overrides.get(file.path()).has_value());
}

TEST(QualityEndpointsTest, LoadFailuresAreBadRequests) {
    TargetOverrideStore overrides;
    QualityEndpoints endpoints(serviceConfig(std::filesystem::temp_directory_path()), overrides);

    const EndpointResponse missing = endpoints.quality("", "", "", "", "");
    EXPECT_EQ(missing.status, 400);
    EXPECT_NE(missing.body.find("\"error\""), std::string::npos);

    ScopedTempFile text("notes.txt", "a,b\n1,2\n");
    const EndpointResponse unsupported = endpoints.quality(text.path(), "", "", "", "");
    EXPECT_EQ(unsupported.status, 400);
    EXPECT_NE(unsupported.body.find("Unsupported file format"), std::string::npos);

    EXPECT_EQ(endpoints.setTarget("", "x").status, 400);
    EXPECT_EQ(endpoints.health().status, 200);
}

TEST(QualityEndpointsTest, PathsOutsideUploadRootAreRejected) {
    ScopedTempDir root("uploads");
    ScopedTempFile inside("inside.csv", kAgesCsv, root.path());
    ScopedTempFile secret("secret.csv", "token\nTOP-SECRET-VALUE\n");
    ScopedTempFile overview("overview.html", "<table><tr><th>Missing cells</th><td>0</td></tr></table>");
    TargetOverrideStore overrides;
    QualityEndpoints endpoints(serviceConfig(root.path()), overrides);

    const EndpointResponse absolute = endpoints.quality(secret.path(), "", "", "", "");
    EXPECT_EQ(absolute.status, 400);
    EXPECT_EQ(absolute.body.find("TOP-SECRET-VALUE"), std::string::npos);

    const EndpointResponse traversal = endpoints.quality("../" + secret.filename(), "", "", "", "");
    EXPECT_EQ(traversal.status, 400);
    EXPECT_EQ(traversal.body.find("TOP-SECRET-VALUE"), std::string::npos);

    EXPECT_EQ(endpoints.quality(inside.filename(), "", "", "", "").status, 200);
    EXPECT_EQ(endpoints.quality(inside.path(), "", "", "", "").status, 200);
    EXPECT_EQ(endpoints.quality(inside.path(), "", "", overview.path(), "").status, 400);
}

TEST(QualityEndpointsTest, RejectedStoredOverrideIsDropped) {
    ScopedTempFile file("stale.csv", kAgesCsv);
    TargetOverrideStore overrides;
    QualityEndpoints endpoints(serviceConfig(std::filesystem::temp_directory_path()), overrides);

    ASSERT_EQ(endpoints.setTarget(file.path(), "nope").status, 200);
    const EndpointResponse first = endpoints.quality(file.path(), "", "", "", "");
    EXPECT_EQ(first.status, 200);
    EXPECT_NE(first.body.find("\"rejected_target_override\": \"nope\""), std::string::npos);
    EXPECT_FALSE(overrides.get(file.path()).has_value());
    EXPECT_EQ(overrides.size(), 0u);

    // A bad explicit target leaves the stored override alone.
    ASSERT_EQ(endpoints.setTarget(file.path(), "age").status, 200);
    const EndpointResponse explicitTarget = endpoints.quality(file.path(), "", "nope", "", "");
    EXPECT_EQ(explicitTarget.status, 200);
    EXPECT_EQ(overrides.get(file.path()), std::optional<std::string>("age"));
}

TEST(QualityEndpointsTest, ResolvesRelativePathsBelowTheRoot) {
    const std::filesystem::path root = std::filesystem::path("/srv/uploads");
    EXPECT_EQ(QualityEndpoints::resolveBelow(root, "a.csv"), std::optional<std::string>("/srv/uploads/a.csv"));
    EXPECT_EQ(QualityEndpoints::resolveBelow(root, "sub/../b.csv"), std::optional<std::string>("/srv/uploads/b.csv"));
    EXPECT_FALSE(QualityEndpoints::resolveBelow(root, "../etc/passwd").has_value());
    EXPECT_FALSE(QualityEndpoints::resolveBelow(root, "/srv/uploads-other/a.csv").has_value());
    EXPECT_FALSE(QualityEndpoints::resolveBelow(root, "/srv/uploads").has_value());
}
