#include "ReportJson.h"
#include "CommonUtils.h"
#include "VeritasExceptions.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace {
std::string quoted(const std::string& text) {
    return "\"" + ReportJson::escapeJsonString(text) + "\"";
}

std::string number(double value) {
    if (!std::isfinite(value)) return "null";
    return CommonUtils::formatDouble(value);
}

template <typename T>
std::string optionalNumber(const std::optional<T>& value) {
    if (!value) return "null";
    if constexpr (std::is_floating_point_v<T>) {
        return number(*value);
    } else {
        return std::to_string(*value);
    }
}

std::string stringArray(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += quoted(values[i]);
    }
    out += "]";
    return out;
}

void writeMissing(std::ostringstream& out, const MissingReport* missing) {
    out << "  \"missing\": ";
    if (!missing) {
        out << "null,\n";
        return;
    }
    const auto flagged = missing->flagged();
    out << "{\n    \"total_missing_cells\": " << missing->totalMissing
        << ",\n    \"total_cells\": " << missing->totalCells
        << ",\n    \"columns\": [";
    for (size_t i = 0; i < flagged.size(); ++i) {
        out << (i == 0 ? "\n" : ",\n")
            << "      { \"column\": " << quoted(flagged[i].column)
            << ", \"missing_count\": " << flagged[i].missingCount
            << ", \"missing_percent\": " << number(flagged[i].missingPercent) << " }";
    }
    out << (flagged.empty() ? "]" : "\n    ]") << "\n  },\n";
}

void writeDuplicates(std::ostringstream& out, const DuplicateReport* dup) {
    out << "  \"duplicates\": ";
    if (!dup) {
        out << "null,\n";
        return;
    }
    out << "{\n    \"duplicate_rows_count\": " << dup->duplicateCount
        << ",\n    \"duplicate_rows_percent\": " << number(dup->duplicatePercent)
        << ",\n    \"preview\": [";
    for (size_t i = 0; i < dup->preview.size(); ++i) {
        out << (i == 0 ? "\n" : ",\n")
            << "      { \"row\": " << dup->preview[i].rowIndex
            << ", \"values\": " << stringArray(dup->preview[i].values) << " }";
    }
    out << (dup->preview.empty() ? "]" : "\n    ]") << "\n  },\n";
}

void writeOutlierNote(std::ostringstream& out, const char* name, const DetectorOutcome& outcome, bool last) {
    out << "      " << quoted(name) << ": { \"status\": " << quoted(analysisStatusName(outcome.status))
        << ", \"note\": " << quoted(outcome.note) << " }" << (last ? "\n" : ",\n");
}

void writeOutliers(std::ostringstream& out, const QualityReport& report, OutlierFilter filter) {
    const OutlierView empty;
    const OutlierView& view = report.outlierView ? *report.outlierView : empty;
    const auto rows = view.filter(filter);
    out << "  \"outliers\": {\n"
        << "    \"structural_count\": " << view.structuralCount
        << ",\n    \"statistical_count\": " << view.statisticalCount
        << ",\n    \"semantic_count\": " << view.semanticCount
        << ",\n    \"total_unique_outliers\": " << view.totalUniqueOutliers
        << ",\n    \"tagged_outlier_rows\": " << view.taggedOutlierRows()
        << ",\n    \"selected_filter\": " << quoted(outlierFilterName(filter))
        << ",\n    \"rows\": [";
    for (size_t i = 0; i < rows.size(); ++i) {
        out << (i == 0 ? "\n" : ",\n")
            << "      { \"row\": " << rows[i].rowIndex
            << ", \"category\": " << quoted(outlierCategoryLabel(rows[i].category))
            << ", \"values\": " << stringArray(rows[i].values) << " }";
    }
    out << (rows.empty() ? "]" : "\n    ]") << ",\n    \"notes\": {\n";
    if (report.outliers) {
        writeOutlierNote(out, "structural", report.outliers->structural, false);
        writeOutlierNote(out, "statistical", report.outliers->statistical, false);
        writeOutlierNote(out, "semantic", report.outliers->semantic, true);
    }
    out << "    }\n  },\n";
}

void writeLabelIssues(std::ostringstream& out, const LabelIssueReport* labels) {
    out << "  \"label_issues\": ";
    if (!labels) {
        out << "null,\n";
        return;
    }
    out << "{\n    \"label_issue_count\": " << labels->issueCount
        << ",\n    \"status\": " << quoted(analysisStatusName(labels->status))
        << ",\n    \"note\": " << quoted(labels->note)
        << ",\n    \"classes\": " << stringArray(labels->classes)
        << ",\n    \"preview\": [";
    for (size_t i = 0; i < labels->preview.size(); ++i) {
        const LabelIssue& issue = labels->preview[i];
        out << (i == 0 ? "\n" : ",\n")
            << "      { \"row\": " << issue.rowIndex
            << ", \"given_label\": " << quoted(issue.givenLabel)
            << ", \"suggested_label\": " << quoted(issue.suggestedLabel)
            << ", \"given_confidence\": " << number(issue.givenConfidence)
            << ", \"suggested_confidence\": " << number(issue.suggestedConfidence) << " }";
    }
    out << (labels->preview.empty() ? "]" : "\n    ]") << "\n  },\n";
}

void writeProfile(std::ostringstream& out, const ExternalProfileStats* profile) {
    const ExternalProfileStats none;
    const ExternalProfileStats& p = profile ? *profile : none;
    out << "  \"profile_overview\": {\n"
        << "    \"missing_cells\": " << optionalNumber(p.missingCells)
        << ",\n    \"missing_cells_percent\": " << optionalNumber(p.missingCellsPercent)
        << ",\n    \"duplicate_rows\": " << optionalNumber(p.duplicateRows)
        << ",\n    \"duplicate_rows_percent\": " << optionalNumber(p.duplicateRowsPercent)
        << ",\n    \"status\": " << quoted(analysisStatusName(p.status))
        << ",\n    \"note\": " << quoted(p.note)
        << "\n  },\n";
}
} // namespace

namespace ReportJson {

std::string escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    escaped += buf;
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

std::string toJson(const QualityReport& report, OutlierFilter filter) {
    std::ostringstream out;
    out << "{\n"
        << "  \"dataset\": " << quoted(report.dataset) << ",\n"
        << "  \"rows\": " << report.rowCount << ",\n"
        << "  \"target_column\": " << (report.target.column ? quoted(*report.target.column) : std::string("null")) << ",\n"
        << "  \"target_source\": " << quoted(targetSourceName(report.target.source)) << ",\n";
    if (report.target.overrideRejected) {
        out << "  \"rejected_target_override\": " << quoted(report.target.rejectedOverride) << ",\n";
    }
    writeMissing(out, report.missing.get());
    writeDuplicates(out, report.duplicates.get());
    writeOutliers(out, report, filter);
    writeLabelIssues(out, report.labelIssues.get());
    writeProfile(out, report.profile.get());
    out << "  \"columns\": " << stringArray(report.columns) << "\n}\n";
    return out.str();
}

std::string errorJson(const std::string& message) {
    return "{\"error\": " + quoted(message) + "}";
}

void writeFile(const std::string& path, const std::string& payload) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw Veritas::IOException("Could not open output file: " + path);
    }
    out << payload;
    if (!out.good()) {
        throw Veritas::IOException("Failed while writing output file: " + path);
    }
}

} // namespace ReportJson
