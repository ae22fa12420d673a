#include "QualityTypes.h"

#include <algorithm>
#include <iterator>

const char* analysisStatusName(AnalysisStatus status) noexcept {
    switch (status) {
        case AnalysisStatus::OK: return "ok";
        case AnalysisStatus::NOT_APPLICABLE: return "not_applicable";
        case AnalysisStatus::FAILED: return "failed";
        case AnalysisStatus::TIMED_OUT: return "timed_out";
    }
    return "failed";
}

const char* targetSourceName(TargetSource source) noexcept {
    switch (source) {
        case TargetSource::MANUAL: return "manual";
        case TargetSource::INFERRED: return "inferred";
        case TargetSource::FALLBACK_LAST: return "fallback_last";
        case TargetSource::NONE: return "none";
    }
    return "none";
}

std::vector<MissingColumnStat> MissingReport::flagged() const {
    std::vector<MissingColumnStat> out;
    std::copy_if(columns.begin(), columns.end(), std::back_inserter(out), [](const MissingColumnStat& stat) {
        return stat.missingCount > 0;
    });
    return out;
}

size_t OutlierIndexSets::totalUnique() const {
    std::vector<size_t> merged;
    merged.reserve(structural.rows.size() + statistical.rows.size() + semantic.rows.size());
    merged.insert(merged.end(), structural.rows.begin(), structural.rows.end());
    merged.insert(merged.end(), statistical.rows.begin(), statistical.rows.end());
    merged.insert(merged.end(), semantic.rows.begin(), semantic.rows.end());
    std::sort(merged.begin(), merged.end());
    return static_cast<size_t>(std::distance(merged.begin(), std::unique(merged.begin(), merged.end())));
}
