#pragma once
#include "QualityTypes.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

class ProfileOverviewExtractor {
public:
    /**
     * @brief Reads overview numbers from a previously generated profiling report.
     * @details Looks up "Missing cells", "Missing cells (%)", "Duplicate rows" and
     *          "Duplicate rows (%)" in the document's table rows. Each metric is
     *          independently optional. An unreadable file yields all metrics unavailable
     *          and a note; nothing is thrown.
     */
    static ExternalProfileStats extractFile(const std::string& path);

    // Same lookup over HTML text already in memory.
    static ExternalProfileStats extractHtml(const std::string& html);

    // Pipeline entry: an absent path means the profile step was skipped.
    static ExternalProfileStats extract(const std::optional<std::string>& path);

    // (label, value) pairs from the first two cells of each <tr>, tags stripped.
    static std::vector<std::pair<std::string, std::string>> tableRows(const std::string& html);

    static std::optional<long long> parseCount(const std::string& text);
    static std::optional<double> parsePercent(const std::string& text);
};
