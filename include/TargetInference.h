#pragma once
#include "QualityConfig.h"
#include "QualityTypes.h"
#include "TypedDataset.h"

#include <optional>
#include <string>

class TargetInference {
public:
    struct ColumnProfile {
        size_t nonNull = 0;
        size_t distinct = 0;
        bool integerLike = true;
    };

    /**
     * @brief Resolves the target column for label-issue detection.
     * @details An override naming an existing column always wins. An override naming a
     *          missing column is ignored and reported through TargetSelection::overrideRejected.
     *          Otherwise columns are scored on low cardinality and label-like names; ties
     *          go to the later column, and the last column is the fallback when nothing scores.
     */
    static TargetSelection resolve(const TypedDataset& data,
                                   const std::optional<std::string>& manualOverride,
                                   const QualityTuningConfig& tuning);

    static TargetSelection infer(const TypedDataset& data, const QualityTuningConfig& tuning);

    // Score used by infer(); 0 means the column does not look like a target.
    static double scoreColumn(const TypedDataset& data, size_t idx, const QualityTuningConfig& tuning);

    static bool hasTargetLikeName(const std::string& columnName);
    static ColumnProfile profileColumn(const TypedDataset& data, size_t idx);
};
