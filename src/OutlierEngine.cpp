#include "OutlierEngine.h"
#include "CommonUtils.h"
#include "IsolationForest.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <iostream>
#include <unordered_map>

namespace {
enum class TokenKind { NUMERIC = 0, DATETIME = 1, TEXT = 2 };

TokenKind classifyToken(const TypedDataset& data, const std::string& token) {
    double dv = 0.0;
    int64_t tv = 0;
    if (data.parseDouble(token, dv)) return TokenKind::NUMERIC;
    if (data.parseDateTime(token, tv)) return TokenKind::DATETIME;
    return TokenKind::TEXT;
}

void flagKindMismatches(const TypedDataset& data,
                        const TypedColumn& col,
                        const QualityTuningConfig& tuning,
                        std::vector<uint8_t>& flags) {
    std::vector<TokenKind> kinds(data.rowCount(), TokenKind::TEXT);
    std::array<size_t, 3> counts{0, 0, 0};
    size_t observed = 0;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (col.missing[r]) continue;
        kinds[r] = classifyToken(data, col.raw[r]);
        ++counts[static_cast<size_t>(kinds[r])];
        ++observed;
    }
    if (observed < tuning.structuralMinColumnValues) return;

    const auto dominantIt = std::max_element(counts.begin(), counts.end());
    const double share = static_cast<double>(*dominantIt) / static_cast<double>(observed);
    if (share < tuning.structuralDominantShare || *dominantIt == observed) return;

    const auto dominant = static_cast<TokenKind>(std::distance(counts.begin(), dominantIt));
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (!col.missing[r] && kinds[r] != dominant) flags[r] = static_cast<uint8_t>(1);
    }
}

std::vector<size_t> flaggedRows(const std::vector<uint8_t>& flags) {
    std::vector<size_t> out;
    for (size_t r = 0; r < flags.size(); ++r) {
        if (flags[r]) out.push_back(r);
    }
    return out;
}

// Column-major feature for the forest; nulls and invalid cells are imputed with the median.
bool encodeSemanticFeature(const TypedColumn& col, size_t rows, double epsilon, std::vector<double>& out) {
    out.assign(rows, 0.0);
    std::vector<uint8_t> present(rows, static_cast<uint8_t>(0));
    std::vector<double> observed;
    observed.reserve(rows);

    if (col.type == ColumnType::CATEGORICAL) {
        const auto& values = std::get<std::vector<std::string>>(col.values);
        std::unordered_map<std::string, size_t> freq;
        size_t nonNull = 0;
        for (size_t r = 0; r < rows; ++r) {
            if (col.missing[r]) continue;
            ++freq[values[r]];
            ++nonNull;
        }
        if (nonNull == 0) return false;
        for (size_t r = 0; r < rows; ++r) {
            if (col.missing[r]) continue;
            out[r] = static_cast<double>(freq[values[r]]) / static_cast<double>(nonNull);
            present[r] = static_cast<uint8_t>(1);
            observed.push_back(out[r]);
        }
    } else {
        for (size_t r = 0; r < rows; ++r) {
            if (col.missing[r]) continue;
            double v = 0.0;
            if (col.type == ColumnType::NUMERIC) {
                v = std::get<std::vector<double>>(col.values)[r];
            } else if (col.type == ColumnType::DATETIME) {
                v = static_cast<double>(std::get<std::vector<int64_t>>(col.values)[r]);
            } else {
                v = std::get<std::vector<uint8_t>>(col.values)[r] ? 1.0 : 0.0;
            }
            if (!std::isfinite(v)) continue;
            out[r] = v;
            present[r] = static_cast<uint8_t>(1);
            observed.push_back(v);
        }
    }

    if (observed.empty()) return false;
    const auto [mnIt, mxIt] = std::minmax_element(observed.begin(), observed.end());
    if (*mxIt - *mnIt <= epsilon) return false;

    const double fill = CommonUtils::medianByNth(observed);
    for (size_t r = 0; r < rows; ++r) {
        if (!present[r]) out[r] = fill;
    }
    return true;
}

} // namespace

DetectorOutcome OutlierEngine::guarded(const char* name, const std::function<DetectorOutcome()>& detector) {
    try {
        return detector();
    } catch (const std::exception& ex) {
        std::cerr << "[Veritas][" << name << "] detector failed: " << ex.what() << "\n";
        return DetectorOutcome::degraded(AnalysisStatus::FAILED, std::string(name) + " detection failed: " + ex.what());
    }
}

std::vector<size_t> OutlierEngine::iqrOutlierPositions(const std::vector<double>& values, double iqrMultiplier, double epsilon) {
    std::vector<size_t> out;
    if (values.size() < 4) return out;

    const double q1 = CommonUtils::quantileByNth(values, 0.25);
    const double q3 = CommonUtils::quantileByNth(values, 0.75);
    const double iqr = q3 - q1;
    if (iqr <= epsilon) return out;
    const double lo = q1 - iqrMultiplier * iqr;
    const double hi = q3 + iqrMultiplier * iqr;

    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] < lo || values[i] > hi) out.push_back(i);
    }
    return out;
}

DetectorOutcome OutlierEngine::detectStructural(const TypedDataset& data, const QualityTuningConfig& tuning) {
    DetectorOutcome outcome;
    const size_t rows = data.rowCount();
    if (rows == 0 || data.colCount() == 0) return outcome;

    std::vector<uint8_t> flags(rows, static_cast<uint8_t>(0));
    const MissingMask& widthMismatch = data.rowWidthMismatch();
    for (size_t r = 0; r < rows && r < widthMismatch.size(); ++r) {
        if (widthMismatch[r]) flags[r] = static_cast<uint8_t>(1);
    }

    std::vector<double> populated(rows, 0.0);
    for (const auto& col : data.columns()) {
        for (size_t r = 0; r < rows; ++r) {
            if (col.invalid[r]) flags[r] = static_cast<uint8_t>(1);
            if (!col.isNull(r)) populated[r] += 1.0;
        }
        if (col.type == ColumnType::CATEGORICAL) {
            flagKindMismatches(data, col, tuning, flags);
        }
    }

    const double medianFill = CommonUtils::medianByNth(populated);
    if (medianFill >= 2.0) {
        const double minFill = tuning.structuralMinFillRatio * medianFill;
        for (size_t r = 0; r < rows; ++r) {
            if (populated[r] < minFill) flags[r] = static_cast<uint8_t>(1);
        }
    }

    outcome.rows = flaggedRows(flags);
    return outcome;
}

DetectorOutcome OutlierEngine::detectStatistical(const TypedDataset& data, const QualityTuningConfig& tuning) {
    DetectorOutcome outcome;
    std::vector<uint8_t> flags(data.rowCount(), static_cast<uint8_t>(0));

    size_t evaluatedColumns = 0;
    for (size_t idx : data.numericColumnIndices()) {
        const TypedColumn& col = data.column(idx);
        const auto& values = std::get<std::vector<double>>(col.values);
        std::vector<double> observed;
        std::vector<size_t> observedRows;
        observed.reserve(values.size());
        observedRows.reserve(values.size());
        for (size_t r = 0; r < values.size(); ++r) {
            if (col.missing[r] || !std::isfinite(values[r])) continue;
            observed.push_back(values[r]);
            observedRows.push_back(r);
        }
        if (observed.size() < tuning.statisticalMinValues) continue;
        ++evaluatedColumns;

        for (size_t pos : iqrOutlierPositions(observed, tuning.outlierIqrMultiplier, tuning.numericEpsilon)) {
            flags[observedRows[pos]] = static_cast<uint8_t>(1);
        }
    }

    if (evaluatedColumns == 0) {
        outcome.status = AnalysisStatus::NOT_APPLICABLE;
        outcome.note = "no numeric column with enough values for IQR detection";
    }
    outcome.rows = flaggedRows(flags);
    return outcome;
}

DetectorOutcome OutlierEngine::detectSemantic(const TypedDataset& data,
                                              const QualityTuningConfig& tuning,
                                              uint32_t seed,
                                              const CancellationFlag& cancel) {
    const size_t rows = data.rowCount();
    if (rows < tuning.semanticMinRows) {
        return DetectorOutcome::degraded(AnalysisStatus::NOT_APPLICABLE,
                                         "semantic detection needs at least " + std::to_string(tuning.semanticMinRows) + " rows");
    }

    std::vector<std::vector<double>> features;
    std::vector<double> encoded;
    for (const auto& col : data.columns()) {
        if (encodeSemanticFeature(col, rows, tuning.numericEpsilon, encoded)) {
            features.push_back(encoded);
        }
    }
    if (features.empty()) {
        return DetectorOutcome::degraded(AnalysisStatus::NOT_APPLICABLE, "no column with spread for semantic detection");
    }

    std::vector<std::vector<double>> matrix(rows, std::vector<double>(features.size(), 0.0));
    for (size_t f = 0; f < features.size(); ++f) {
        for (size_t r = 0; r < rows; ++r) matrix[r][f] = features[f][r];
    }

    IsolationForest::Options options;
    options.trees = tuning.semanticTrees;
    options.sampleSize = tuning.semanticSampleSize;
    options.seed = seed;
    options.cancel = cancel;
    IsolationForest forest(options);
    forest.fit(matrix);
    const std::vector<double> scores = forest.scoreAll(matrix);

    const double threshold = CommonUtils::quantileByNth(scores, 1.0 - tuning.semanticContamination);
    DetectorOutcome outcome;
    for (size_t r = 0; r < rows; ++r) {
        if (scores[r] >= threshold && scores[r] > 0.5) outcome.rows.push_back(r);
    }
    return outcome;
}

OutlierIndexSets OutlierEngine::analyze(const TypedDataset& data, const QualityConfig& config) {
    OutlierIndexSets sets;
    sets.structural = guarded("Structural", [&]() { return detectStructural(data, config.tuning); });
    sets.statistical = guarded("Statistical", [&]() { return detectStatistical(data, config.tuning); });
    sets.semantic = guarded("Semantic", [&]() { return detectSemantic(data, config.tuning, config.semanticSeed); });
    return sets;
}
