#pragma once
#include "QualityTypes.h"

#include <string>

namespace ReportJson {

std::string escapeJsonString(const std::string& input);

/**
 * @brief Renders the report with stable field names.
 * @details Unavailable profile metrics are written as null. Outlier rows are the tagged
 *          view narrowed by `filter`; the counts always describe the full view.
 */
std::string toJson(const QualityReport& report, OutlierFilter filter);

std::string errorJson(const std::string& message);

/**
 * @throws Veritas::IOException when the file cannot be written.
 */
void writeFile(const std::string& path, const std::string& payload);

} // namespace ReportJson
