#pragma once
#include "DatasetLoader.h"

#include <cstdint>
#include <string>

struct QualityTuningConfig {
    // IQR multiplier for the Tukey fence (lower => more sensitive).
    double outlierIqrMultiplier = 1.5;
    // Numeric columns with fewer observed values are skipped by the IQR detector.
    size_t statisticalMinValues = 4;

    // Structural checks: a categorical column needs this many non-null values and a
    // dominant token kind covering this share before minority kinds are flagged.
    size_t structuralMinColumnValues = 5;
    double structuralDominantShare = 0.8;
    // Rows populated below this fraction of the median row fill are flagged.
    double structuralMinFillRatio = 0.5;

    double semanticContamination = 0.05;
    size_t semanticTrees = 100;
    size_t semanticSampleSize = 256;
    size_t semanticMinRows = 8;

    size_t targetMaxClasses = 20;
    double targetMaxUniqueRatio = 0.5;

    size_t labelMinRows = 5;
    size_t labelKfold = 5;
    // One-hot width cap per categorical feature (most frequent levels kept).
    size_t labelMaxLevels = 10;
    size_t labelEpochs = 300;
    double labelLearningRate = 0.5;
    double labelL2 = 1e-3;
    double labelMargin = 0.1;

    double numericEpsilon = 1e-12;

    void validate() const;
};

struct QualityConfig {
    std::string datasetPath;
    std::string originalName;
    std::string targetColumn;
    std::string profilePath;
    std::string outlierFilter = "all";      // all|statistical|ai|structural
    std::string outputPath;
    char delimiter = ',';
    std::string numericLocaleHint = "auto";  // auto|us|eu
    std::string datetimeLocaleHint = "auto"; // auto|dmy|mdy
    // CSV parser guards; 0 disables the limit.
    size_t csvMaxFieldBytes = 8 * 1024 * 1024;
    size_t csvMaxColumns = 20000;
    size_t csvMaxRecordLines = 10000;

    bool verbose = true;
    bool parallelAnalyzers = false;
    // 0 disables the bound on semantic scoring and label-issue training.
    size_t analysisTimeoutMs = 0;

    uint32_t semanticSeed = 1337;
    uint32_t labelSeed = 1337;

    size_t duplicatePreviewRows = 5;
    size_t labelPreviewRows = 10;

    std::string serviceHost = "127.0.0.1";
    int servicePort = 8090;
    // The service only opens datasets and profile documents below this directory.
    std::string uploadRoot = "uploads";

    QualityTuningConfig tuning;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argc/argv contain the dataset path in argv[1] when requireDataset is set.
     * @post Returns a validated config object.
     * @throws Veritas::ConfigurationException on invalid arguments or values.
     */
    static QualityConfig fromArgs(int argc, char* argv[], bool requireDataset = true);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Veritas::ConfigurationException on parse/validation failures.
     */
    static QualityConfig fromFile(const std::string& configPath, const QualityConfig& base);

    /**
     * @throws Veritas::ConfigurationException on invalid values.
     */
    void validate() const;

    LoadOptions loadOptions() const;

    static const char* usage() noexcept;
};
