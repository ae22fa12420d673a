#include "TargetInference.h"
#include "CommonUtils.h"

#include <cmath>
#include <unordered_set>

namespace {
const std::unordered_set<std::string>& targetVocabulary() {
    static const std::unordered_set<std::string> words = {
        "label", "target", "class", "outcome", "y", "response"
    };
    return words;
}
} // namespace

bool TargetInference::hasTargetLikeName(const std::string& columnName) {
    const auto& vocabulary = targetVocabulary();
    for (const auto& token : CommonUtils::splitWordTokens(columnName)) {
        if (vocabulary.count(token)) return true;
    }
    return false;
}

TargetInference::ColumnProfile TargetInference::profileColumn(const TypedDataset& data, size_t idx) {
    ColumnProfile profile;
    const TypedColumn& col = data.column(idx);
    std::unordered_set<std::string> seen;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (col.missing[r]) continue;
        ++profile.nonNull;
        if (col.type == ColumnType::NUMERIC) {
            const double v = std::get<std::vector<double>>(col.values)[r];
            if (std::floor(v) != v) profile.integerLike = false;
        }
        seen.insert(data.cellText(idx, r));
    }
    profile.distinct = seen.size();
    return profile;
}

double TargetInference::scoreColumn(const TypedDataset& data, size_t idx, const QualityTuningConfig& tuning) {
    const TypedColumn& col = data.column(idx);
    const ColumnProfile profile = profileColumn(data, idx);
    if (profile.nonNull == 0) return 0.0;

    double score = 0.0;
    const double uniqueRatio = static_cast<double>(profile.distinct) / static_cast<double>(profile.nonNull);
    const bool eligibleType = col.type == ColumnType::CATEGORICAL ||
                              col.type == ColumnType::BOOLEAN ||
                              (col.type == ColumnType::NUMERIC && profile.integerLike);
    if (eligibleType &&
        profile.distinct >= 2 &&
        profile.distinct <= tuning.targetMaxClasses &&
        uniqueRatio <= tuning.targetMaxUniqueRatio) {
        score += 2.0 + (1.0 - uniqueRatio);
    }
    if (hasTargetLikeName(col.name)) score += 3.0;
    return score;
}

TargetSelection TargetInference::infer(const TypedDataset& data, const QualityTuningConfig& tuning) {
    TargetSelection selection;
    if (data.colCount() == 0) return selection;

    double bestScore = 0.0;
    int bestIdx = -1;
    for (size_t c = 0; c < data.colCount(); ++c) {
        const double score = scoreColumn(data, c, tuning);
        if (score > 0.0 && score >= bestScore) {
            bestScore = score;
            bestIdx = static_cast<int>(c);
        }
    }

    if (bestIdx >= 0) {
        selection.column = data.column(static_cast<size_t>(bestIdx)).name;
        selection.source = TargetSource::INFERRED;
        selection.score = bestScore;
    } else if (data.colCount() >= 2) {
        selection.column = data.columns().back().name;
        selection.source = TargetSource::FALLBACK_LAST;
    }
    return selection;
}

TargetSelection TargetInference::resolve(const TypedDataset& data,
                                         const std::optional<std::string>& manualOverride,
                                         const QualityTuningConfig& tuning) {
    if (manualOverride && !manualOverride->empty()) {
        if (data.findColumnIndex(*manualOverride) >= 0) {
            TargetSelection selection;
            selection.column = *manualOverride;
            selection.source = TargetSource::MANUAL;
            return selection;
        }
        TargetSelection selection = infer(data, tuning);
        selection.overrideRejected = true;
        selection.rejectedOverride = *manualOverride;
        return selection;
    }
    return infer(data, tuning);
}
