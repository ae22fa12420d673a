#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class AnalysisStatus { OK, NOT_APPLICABLE, FAILED, TIMED_OUT };

const char* analysisStatusName(AnalysisStatus status) noexcept;

struct MissingColumnStat {
    std::string column;
    size_t missingCount = 0;
    double missingPercent = 0.0;
};

struct MissingReport {
    // Every column, ordered by descending missing count (ties keep column order).
    std::vector<MissingColumnStat> columns;
    size_t rowCount = 0;
    size_t totalMissing = 0;
    size_t totalCells = 0;

    std::vector<MissingColumnStat> flagged() const;
    bool empty() const noexcept { return totalMissing == 0; }
};

struct PreviewRow {
    size_t rowIndex = 0;
    std::vector<std::string> values;
};

struct DuplicateReport {
    size_t duplicateCount = 0;
    double duplicatePercent = 0.0;
    std::vector<PreviewRow> preview;
};

struct DetectorOutcome {
    std::vector<size_t> rows;
    AnalysisStatus status = AnalysisStatus::OK;
    std::string note;

    static DetectorOutcome degraded(AnalysisStatus status, std::string note) {
        DetectorOutcome out;
        out.status = status;
        out.note = std::move(note);
        return out;
    }
};

struct OutlierIndexSets {
    DetectorOutcome structural;
    DetectorOutcome statistical;
    DetectorOutcome semantic;

    // Size of the union of the three row sets.
    size_t totalUnique() const;
};

enum class TargetSource { MANUAL, INFERRED, FALLBACK_LAST, NONE };

const char* targetSourceName(TargetSource source) noexcept;

struct TargetSelection {
    std::optional<std::string> column;
    TargetSource source = TargetSource::NONE;
    double score = 0.0;
    // Set when a manual override named a column that does not exist.
    bool overrideRejected = false;
    std::string rejectedOverride;
};

struct LabelIssue {
    size_t rowIndex = 0;
    std::string givenLabel;
    std::string suggestedLabel;
    double givenConfidence = 0.0;
    double suggestedConfidence = 0.0;
};

struct LabelIssueReport {
    size_t issueCount = 0;
    AnalysisStatus status = AnalysisStatus::OK;
    // Empty only when detection fully ran.
    std::string note;
    std::string targetColumn;
    std::vector<std::string> classes;
    std::vector<LabelIssue> preview;

    static LabelIssueReport degraded(AnalysisStatus status, std::string note) {
        LabelIssueReport out;
        out.status = status;
        out.note = std::move(note);
        return out;
    }
};

struct ExternalProfileStats {
    std::optional<long long> missingCells;
    std::optional<double> missingCellsPercent;
    std::optional<long long> duplicateRows;
    std::optional<double> duplicateRowsPercent;
    AnalysisStatus status = AnalysisStatus::OK;
    std::string note;

    bool anyAvailable() const noexcept {
        return missingCells || missingCellsPercent || duplicateRows || duplicateRowsPercent;
    }
};

enum class OutlierCategory { STATISTICAL, SEMANTIC, STRUCTURAL };
enum class OutlierFilter { ALL, STATISTICAL, AI, STRUCTURAL };

const char* outlierCategoryLabel(OutlierCategory category) noexcept;
const char* outlierFilterName(OutlierFilter filter) noexcept;
// Unknown selectors map to ALL.
OutlierFilter parseOutlierFilter(const std::string& selector);

struct TaggedOutlierRow {
    size_t rowIndex = 0;
    OutlierCategory category = OutlierCategory::STATISTICAL;
    std::vector<std::string> values;
};

struct OutlierView {
    // Statistical rows, then AI-Based rows, then Structural rows; each block in row order.
    std::vector<TaggedOutlierRow> rows;
    size_t statisticalCount = 0;
    size_t semanticCount = 0;
    size_t structuralCount = 0;
    size_t totalUniqueOutliers = 0;

    size_t taggedOutlierRows() const noexcept { return rows.size(); }
    std::vector<TaggedOutlierRow> filter(OutlierFilter selector) const;
};

struct QualityReport {
    std::string dataset;
    std::vector<std::string> columns;
    size_t rowCount = 0;
    TargetSelection target;

    std::shared_ptr<const MissingReport> missing;
    std::shared_ptr<const DuplicateReport> duplicates;
    std::shared_ptr<const OutlierIndexSets> outliers;
    std::shared_ptr<const LabelIssueReport> labelIssues;
    std::shared_ptr<const ExternalProfileStats> profile;
    std::shared_ptr<const OutlierView> outlierView;
};
