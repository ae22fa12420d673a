#include "TerminalUI.h"
#include "CommonUtils.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>

namespace {
constexpr size_t kMaxPrintedOutlierRows = 20;

std::string joinValues(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += " | ";
        out += values[i].empty() ? std::string("<blank>") : values[i];
    }
    return out;
}

template <typename T>
std::string orNA(const std::optional<T>& value, const char* suffix = "") {
    if (!value) return "N/A";
    if constexpr (std::is_floating_point_v<T>) {
        return CommonUtils::formatDouble(*value) + suffix;
    } else {
        return std::to_string(*value) + suffix;
    }
}

void printDetectorLine(std::ostream& out, const char* name, size_t count, const DetectorOutcome* outcome) {
    out << "  " << std::left << std::setw(14) << name << std::right << std::setw(8) << count;
    if (outcome && !outcome->note.empty()) {
        out << "  (" << analysisStatusName(outcome->status) << ": " << outcome->note << ")";
    }
    out << "\n";
}
} // namespace

void TerminalUI::printMissingTable(std::ostream& out, const MissingReport& missing) {
    const auto flagged = missing.flagged();
    out << "\n================================ MISSING VALUES ================================\n";
    if (flagged.empty()) {
        out << "No missing values.\n";
        return;
    }
    size_t maxNameLen = 15;
    for (const auto& stat : flagged) maxNameLen = std::max(maxNameLen, stat.column.length());
    const int w = static_cast<int>(maxNameLen) + 2;
    out << std::left << std::setw(w) << "Column" << std::setw(12) << "Missing" << "Percent\n";
    out << std::string(static_cast<size_t>(w) + 20, '-') << "\n";
    for (const auto& stat : flagged) {
        out << std::left << std::setw(w) << stat.column
            << std::setw(12) << stat.missingCount
            << std::fixed << std::setprecision(2) << stat.missingPercent << "%\n";
    }
    out.unsetf(std::ios::fixed);
}

void TerminalUI::printOutlierTable(std::ostream& out, const OutlierView& view, OutlierFilter filter) {
    const auto rows = view.filter(filter);
    out << "\nTagged rows (" << outlierFilterName(filter) << "): " << rows.size()
        << " of " << view.taggedOutlierRows() << "\n";
    const size_t shown = std::min(rows.size(), kMaxPrintedOutlierRows);
    for (size_t i = 0; i < shown; ++i) {
        out << "  [" << std::left << std::setw(11) << outlierCategoryLabel(rows[i].category) << "] row "
            << rows[i].rowIndex << ": " << joinValues(rows[i].values) << "\n";
    }
    if (rows.size() > shown) {
        out << "  ... " << (rows.size() - shown) << " more\n";
    }
}

void TerminalUI::printLabelIssues(std::ostream& out, const LabelIssueReport& labels) {
    out << "\n================================= LABEL ISSUES =================================\n";
    out << "Suspected label issues: " << labels.issueCount << "\n";
    if (!labels.note.empty()) {
        out << "Note: " << labels.note << "\n";
        return;
    }
    for (const auto& issue : labels.preview) {
        out << "  row " << issue.rowIndex << ": given '" << issue.givenLabel << "' ("
            << CommonUtils::formatDouble(issue.givenConfidence) << "), suggested '" << issue.suggestedLabel
            << "' (" << CommonUtils::formatDouble(issue.suggestedConfidence) << ")\n";
    }
}

void TerminalUI::printProfileOverview(std::ostream& out, const ExternalProfileStats& profile) {
    out << "\n=============================== PROFILE OVERVIEW ===============================\n";
    out << "Missing cells:       " << orNA(profile.missingCells) << " (" << orNA(profile.missingCellsPercent, "%") << ")\n";
    out << "Duplicate rows:      " << orNA(profile.duplicateRows) << " (" << orNA(profile.duplicateRowsPercent, "%") << ")\n";
    if (!profile.note.empty()) out << "Note: " << profile.note << "\n";
}

void TerminalUI::printQualitySummary(std::ostream& out, const QualityReport& report, OutlierFilter filter) {
    out << "\n============================== DATA QUALITY REPORT =============================\n";
    out << "Dataset: " << report.dataset << "  (" << report.rowCount << " rows x " << report.columns.size() << " columns)\n";
    out << "Target:  " << (report.target.column ? *report.target.column : std::string("<none>"))
        << " [" << targetSourceName(report.target.source) << "]\n";
    if (report.target.overrideRejected) {
        out << "Ignored target override: " << report.target.rejectedOverride << " (no such column)\n";
    }

    if (report.missing) printMissingTable(out, *report.missing);

    if (report.duplicates) {
        out << "\n=================================== DUPLICATES =================================\n";
        out << "Duplicate rows: " << report.duplicates->duplicateCount << " ("
            << CommonUtils::formatDouble(report.duplicates->duplicatePercent) << "%)\n";
        for (const auto& row : report.duplicates->preview) {
            out << "  row " << row.rowIndex << ": " << joinValues(row.values) << "\n";
        }
    }

    if (report.outlierView) {
        const OutlierView& view = *report.outlierView;
        const OutlierIndexSets* sets = report.outliers.get();
        out << "\n==================================== OUTLIERS ==================================\n";
        printDetectorLine(out, "Structural", view.structuralCount, sets ? &sets->structural : nullptr);
        printDetectorLine(out, "Statistical", view.statisticalCount, sets ? &sets->statistical : nullptr);
        printDetectorLine(out, "AI-Based", view.semanticCount, sets ? &sets->semantic : nullptr);
        out << "  Unique rows: " << view.totalUniqueOutliers << "\n";
        printOutlierTable(out, view, filter);
    }

    if (report.labelIssues) printLabelIssues(out, *report.labelIssues);
    if (report.profile) printProfileOverview(out, *report.profile);
    out << "================================================================================\n";
}
