#include <gtest/gtest.h>

#include "QualityConfig.h"
#include "VeritasExceptions.h"
#include "TestSupport.h"

#include <string>
#include <vector>

namespace {
QualityConfig parseArgs(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    return QualityConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}
} // namespace

TEST(QualityConfigTest, DefaultsAreValid) {
    QualityConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.outlierFilter, "all");
    EXPECT_EQ(config.analysisTimeoutMs, 0u);
    EXPECT_DOUBLE_EQ(config.tuning.outlierIqrMultiplier, 1.5);
}

TEST(QualityConfigTest, ParsesCommandLineFlags) {
    const QualityConfig config = parseArgs({"veritas", "data.csv", "--target", "label", "--filter", "AI",
                                            "--parallel", "true", "--timeout-ms", "250",
                                            "--outlier-iqr-multiplier", "3", "--delimiter", ";"});
    EXPECT_EQ(config.datasetPath, "data.csv");
    EXPECT_EQ(config.targetColumn, "label");
    EXPECT_EQ(config.outlierFilter, "ai");
    EXPECT_TRUE(config.parallelAnalyzers);
    EXPECT_EQ(config.analysisTimeoutMs, 250u);
    EXPECT_DOUBLE_EQ(config.tuning.outlierIqrMultiplier, 3.0);
    EXPECT_EQ(config.delimiter, ';');
}

TEST(QualityConfigTest, RejectsMissingDatasetAndUnknownFlags) {
    EXPECT_THROW(parseArgs({"veritas"}), Veritas::ConfigurationException);
    EXPECT_THROW(parseArgs({"veritas", "data.csv", "--bogus", "1"}), Veritas::ConfigurationException);
    EXPECT_THROW(parseArgs({"veritas", "data.csv", "--target"}), Veritas::ConfigurationException);
}

TEST(QualityConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(parseArgs({"veritas", "data.csv", "--semantic-contamination", "0.9"}), Veritas::ConfigurationException);
    EXPECT_THROW(parseArgs({"veritas", "data.csv", "--label-kfold", "1"}), Veritas::ConfigurationException);
    EXPECT_THROW(parseArgs({"veritas", "data.csv", "--numeric-locale-hint", "fr"}), Veritas::ConfigurationException);
    EXPECT_THROW(parseArgs({"veritas", "data.csv", "--verbose", "maybe"}), Veritas::ConfigurationException);
}

TEST(QualityConfigTest, LoadsYamlStyleFile) {
    ScopedTempFile file("veritas.yaml",
                        "# quality settings\n"
                        "target: outcome\n"
                        "semantic_trees: 50\n"
                        "label_margin: 0.2\n"
                        "datetime_locale_hint: DMY\n");
    const QualityConfig config = QualityConfig::fromFile(file.path(), QualityConfig{});
    EXPECT_EQ(config.targetColumn, "outcome");
    EXPECT_EQ(config.tuning.semanticTrees, 50u);
    EXPECT_DOUBLE_EQ(config.tuning.labelMargin, 0.2);
    EXPECT_EQ(config.loadOptions().dateLocaleHint, TypedDataset::DateLocaleHint::DMY);
}

TEST(QualityConfigTest, LoadsJsonStyleFile) {
    ScopedTempFile file("veritas.json",
                        "{\n"
                        "  \"filter\": \"structural\",\n"
                        "  \"parallel_analyzers\": true\n"
                        "}\n");
    const QualityConfig config = QualityConfig::fromFile(file.path(), QualityConfig{});
    EXPECT_EQ(config.outlierFilter, "structural");
    EXPECT_TRUE(config.parallelAnalyzers);
}

TEST(QualityConfigTest, FileErrorsCarryTheLineNumber) {
    ScopedTempFile file("bad.yaml", "target: y\n\nsemantic_trees: many\n");
    try {
        QualityConfig::fromFile(file.path(), QualityConfig{});
        FAIL() << "expected a configuration error";
    } catch (const Veritas::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos) << e.what();
    }
}

TEST(QualityConfigTest, CommandLineOverridesConfigFile) {
    ScopedTempFile file("override.yaml", "target: from_file\nsemantic_seed: 7\n");
    const QualityConfig config = parseArgs({"veritas", "data.csv", "--config", file.path(), "--target", "from_cli"});
    EXPECT_EQ(config.targetColumn, "from_cli");
    EXPECT_EQ(config.semanticSeed, 7u);
    EXPECT_EQ(config.datasetPath, "data.csv");
}

TEST(QualityConfigTest, MissingConfigFileThrows) {
    EXPECT_THROW(QualityConfig::fromFile("/nonexistent/veritas.yaml", QualityConfig{}), Veritas::ConfigurationException);
}

TEST(QualityConfigTest, ParserLimitsReachLoadOptions) {
    ScopedTempFile file("limits.yaml", "csv_max_field_bytes: 0\ncsv_max_record_lines: 3\n");
    const QualityConfig config = parseArgs({"veritas", "data.csv", "--config", file.path(), "--csv-max-columns", "12"});
    const LoadOptions options = config.loadOptions();
    EXPECT_EQ(options.csvLimits.maxFieldBytes, 0u);
    EXPECT_EQ(options.csvLimits.maxRecordLines, 3u);
    EXPECT_EQ(options.csvLimits.maxColumns, 12u);
    EXPECT_THROW(parseArgs({"veritas", "data.csv", "--csv-max-columns", "-1"}), Veritas::ConfigurationException);
}

TEST(QualityConfigTest, UploadRootIsConfigurable) {
    EXPECT_EQ(QualityConfig{}.uploadRoot, "uploads");
    const QualityConfig config = parseArgs({"veritas", "data.csv", "--upload-root", "/srv/veritas"});
    EXPECT_EQ(config.uploadRoot, "/srv/veritas");
    EXPECT_THROW(parseArgs({"veritas", "data.csv", "--upload-root", ""}), Veritas::ConfigurationException);
}
