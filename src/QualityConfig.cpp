#include "QualityConfig.h"
#include "CommonUtils.h"
#include "VeritasExceptions.h"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Veritas::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Veritas::VeritasException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Veritas::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    while (!out.empty() && out.front() == '-') out.erase(out.begin());
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Veritas::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw Veritas::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Veritas::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Veritas::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Veritas::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

void assignKeyValue(QualityConfig& config, const std::string& key, const std::string& value) {
    struct SizeSpec { size_t QualityConfig::* member; int minValue; };
    struct TuningDoubleSpec { double QualityTuningConfig::* member; double minValue; };
    struct TuningSizeSpec { size_t QualityTuningConfig::* member; int minValue; };

    static const std::unordered_map<std::string, std::string QualityConfig::*> rawStringFields = {
        {"dataset", &QualityConfig::datasetPath},
        {"name", &QualityConfig::originalName},
        {"original_name", &QualityConfig::originalName},
        {"target", &QualityConfig::targetColumn},
        {"profile", &QualityConfig::profilePath},
        {"output", &QualityConfig::outputPath},
        {"host", &QualityConfig::serviceHost},
        {"upload_root", &QualityConfig::uploadRoot}
    };
    static const std::unordered_map<std::string, std::string QualityConfig::*> lowerStringFields = {
        {"filter", &QualityConfig::outlierFilter},
        {"numeric_locale_hint", &QualityConfig::numericLocaleHint},
        {"datetime_locale_hint", &QualityConfig::datetimeLocaleHint}
    };
    static const std::unordered_map<std::string, bool QualityConfig::*> boolFields = {
        {"verbose", &QualityConfig::verbose},
        {"parallel", &QualityConfig::parallelAnalyzers},
        {"parallel_analyzers", &QualityConfig::parallelAnalyzers}
    };
    static const std::unordered_map<std::string, uint32_t QualityConfig::*> uintFields = {
        {"semantic_seed", &QualityConfig::semanticSeed},
        {"label_seed", &QualityConfig::labelSeed}
    };
    static const std::unordered_map<std::string, SizeSpec> sizeFields = {
        {"timeout_ms", {&QualityConfig::analysisTimeoutMs, 0}},
        {"analysis_timeout_ms", {&QualityConfig::analysisTimeoutMs, 0}},
        {"duplicate_preview_rows", {&QualityConfig::duplicatePreviewRows, 0}},
        {"label_preview_rows", {&QualityConfig::labelPreviewRows, 0}},
        {"csv_max_field_bytes", {&QualityConfig::csvMaxFieldBytes, 0}},
        {"csv_max_columns", {&QualityConfig::csvMaxColumns, 0}},
        {"csv_max_record_lines", {&QualityConfig::csvMaxRecordLines, 0}}
    };
    static const std::unordered_map<std::string, TuningDoubleSpec> tuningDoubleFields = {
        {"outlier_iqr_multiplier", {&QualityTuningConfig::outlierIqrMultiplier, 0.0}},
        {"structural_dominant_share", {&QualityTuningConfig::structuralDominantShare, 0.0}},
        {"structural_min_fill_ratio", {&QualityTuningConfig::structuralMinFillRatio, 0.0}},
        {"semantic_contamination", {&QualityTuningConfig::semanticContamination, 0.0}},
        {"target_max_unique_ratio", {&QualityTuningConfig::targetMaxUniqueRatio, 0.0}},
        {"label_learning_rate", {&QualityTuningConfig::labelLearningRate, 0.0}},
        {"label_l2", {&QualityTuningConfig::labelL2, 0.0}},
        {"label_margin", {&QualityTuningConfig::labelMargin, 0.0}},
        {"numeric_epsilon", {&QualityTuningConfig::numericEpsilon, 0.0}}
    };
    static const std::unordered_map<std::string, TuningSizeSpec> tuningSizeFields = {
        {"statistical_min_values", {&QualityTuningConfig::statisticalMinValues, 4}},
        {"structural_min_column_values", {&QualityTuningConfig::structuralMinColumnValues, 1}},
        {"semantic_trees", {&QualityTuningConfig::semanticTrees, 1}},
        {"semantic_sample_size", {&QualityTuningConfig::semanticSampleSize, 2}},
        {"semantic_min_rows", {&QualityTuningConfig::semanticMinRows, 2}},
        {"target_max_classes", {&QualityTuningConfig::targetMaxClasses, 2}},
        {"label_min_rows", {&QualityTuningConfig::labelMinRows, 2}},
        {"label_kfold", {&QualityTuningConfig::labelKfold, 2}},
        {"label_max_levels", {&QualityTuningConfig::labelMaxLevels, 1}},
        {"label_epochs", {&QualityTuningConfig::labelEpochs, 1}}
    };

    if (key == "delimiter") {
        if (value.size() != 1) throw Veritas::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return;
    }
    if (key == "port") {
        config.servicePort = parseIntStrict(value, key, 1);
        return;
    }

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(value);
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = uintFields.find(key); it != uintFields.end()) {
        config.*(it->second) = parseUIntStrict(value, key);
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = tuningDoubleFields.find(key); it != tuningDoubleFields.end()) {
        config.tuning.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = tuningSizeFields.find(key); it != tuningSizeFields.end()) {
        config.tuning.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }

    throw Veritas::ConfigurationException("Unknown option: " + key);
}

const char* kUsage =
    "Usage: veritas <dataset.csv|.xlsx|.xls> [--name original.csv] [--target col] [--profile overview.html] "
    "[--filter all|statistical|ai|structural] [--config path] [--output report.json] [--delimiter ,] "
    "[--numeric-locale-hint auto|us|eu] [--datetime-locale-hint auto|dmy|mdy] [--verbose true|false] "
    "[--parallel true|false] [--timeout-ms N] [--semantic-seed N] [--label-seed N] [--duplicate-preview-rows N] "
    "[--label-preview-rows N] [--csv-max-field-bytes N] [--csv-max-columns N] [--csv-max-record-lines N] [--outlier-iqr-multiplier >0] [--structural-dominant-share 0.5..1] "
    "[--structural-min-fill-ratio 0..1] [--structural-min-column-values N] [--semantic-contamination 0..0.5] "
    "[--semantic-trees N] [--semantic-sample-size N] [--semantic-min-rows N] [--target-max-classes N] "
    "[--target-max-unique-ratio 0..1] [--label-min-rows N] [--label-kfold N] [--label-max-levels N] "
    "[--label-epochs N] [--label-learning-rate >0] [--label-l2 >=0] [--label-margin 0..1] "
    "[--host addr] [--port N] [--upload-root dir]";
} // namespace

const char* QualityConfig::usage() noexcept {
    return kUsage;
}

QualityConfig QualityConfig::fromArgs(int argc, char* argv[], bool requireDataset) {
    if (requireDataset && (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0)) {
        throw Veritas::ConfigurationException(kUsage);
    }

    QualityConfig config;
    int first = 1;
    if (requireDataset) {
        config.datasetPath = argv[1];
        first = 2;
    }

    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
            throw Veritas::ConfigurationException("Unexpected argument '" + arg + "'\n" + kUsage);
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            configPath = value;
        } else {
            overrides.emplace_back(normalizeConfigKey(arg), value);
        }
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        if (requireDataset) config.datasetPath = argv[1];
    }
    // Command-line flags win over the config file.
    for (const auto& [key, value] : overrides) {
        assignKeyValue(config, key, value);
    }

    config.validate();
    return config;
}

QualityConfig QualityConfig::fromFile(const std::string& configPath, const QualityConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Veritas::ConfigurationException("Could not open config file: " + configPath);

    QualityConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Veritas::VeritasException& ex) {
            throw Veritas::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void QualityTuningConfig::validate() const {
    if (outlierIqrMultiplier <= 0.0) {
        throw Veritas::ConfigurationException("outlier_iqr_multiplier must be > 0");
    }
    if (structuralDominantShare < 0.5 || structuralDominantShare > 1.0) {
        throw Veritas::ConfigurationException("structural_dominant_share must be within [0.5,1]");
    }
    if (structuralMinFillRatio < 0.0 || structuralMinFillRatio > 1.0) {
        throw Veritas::ConfigurationException("structural_min_fill_ratio must be within [0,1]");
    }
    if (semanticContamination <= 0.0 || semanticContamination > 0.5) {
        throw Veritas::ConfigurationException("semantic_contamination must be within (0,0.5]");
    }
    if (semanticTrees == 0 || semanticSampleSize < 2) {
        throw Veritas::ConfigurationException("semantic_trees must be >= 1 and semantic_sample_size >= 2");
    }
    if (targetMaxUniqueRatio <= 0.0 || targetMaxUniqueRatio > 1.0) {
        throw Veritas::ConfigurationException("target_max_unique_ratio must be within (0,1]");
    }
    if (targetMaxClasses < 2) {
        throw Veritas::ConfigurationException("target_max_classes must be >= 2");
    }
    if (labelKfold < 2) {
        throw Veritas::ConfigurationException("label_kfold must be >= 2");
    }
    if (labelLearningRate <= 0.0) {
        throw Veritas::ConfigurationException("label_learning_rate must be > 0");
    }
    if (labelMargin < 0.0 || labelMargin > 1.0) {
        throw Veritas::ConfigurationException("label_margin must be within [0,1]");
    }
    if (numericEpsilon <= 0.0) {
        throw Veritas::ConfigurationException("numeric_epsilon must be > 0");
    }
}

void QualityConfig::validate() const {
    if (numericLocaleHint != "auto" && numericLocaleHint != "us" && numericLocaleHint != "eu") {
        throw Veritas::ConfigurationException("numeric_locale_hint must be auto, us or eu");
    }
    if (datetimeLocaleHint != "auto" && datetimeLocaleHint != "dmy" && datetimeLocaleHint != "mdy") {
        throw Veritas::ConfigurationException("datetime_locale_hint must be auto, dmy or mdy");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Veritas::ConfigurationException("delimiter cannot be a quote or newline character");
    }
    if (uploadRoot.empty()) {
        throw Veritas::ConfigurationException("upload_root cannot be empty");
    }
    if (servicePort < 1 || servicePort > 65535) {
        throw Veritas::ConfigurationException("port must be within [1,65535]");
    }
    tuning.validate();
}

LoadOptions QualityConfig::loadOptions() const {
    LoadOptions options;
    options.delimiter = delimiter;
    options.csvLimits.maxFieldBytes = csvMaxFieldBytes;
    options.csvLimits.maxColumns = csvMaxColumns;
    options.csvLimits.maxRecordLines = csvMaxRecordLines;
    if (numericLocaleHint == "us") {
        options.numericSeparatorPolicy = TypedDataset::NumericSeparatorPolicy::US_THOUSANDS;
    } else if (numericLocaleHint == "eu") {
        options.numericSeparatorPolicy = TypedDataset::NumericSeparatorPolicy::EUROPEAN;
    }
    if (datetimeLocaleHint == "dmy") {
        options.dateLocaleHint = TypedDataset::DateLocaleHint::DMY;
    } else if (datetimeLocaleHint == "mdy") {
        options.dateLocaleHint = TypedDataset::DateLocaleHint::MDY;
    }
    return options;
}
