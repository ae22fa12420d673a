#pragma once
#include "QualityTypes.h"

#include <iosfwd>

class TerminalUI {
public:
    static void printQualitySummary(std::ostream& out, const QualityReport& report, OutlierFilter filter);

    static void printMissingTable(std::ostream& out, const MissingReport& missing);
    static void printOutlierTable(std::ostream& out, const OutlierView& view, OutlierFilter filter);
    static void printLabelIssues(std::ostream& out, const LabelIssueReport& labels);
    // Unavailable metrics print as N/A.
    static void printProfileOverview(std::ostream& out, const ExternalProfileStats& profile);
};
