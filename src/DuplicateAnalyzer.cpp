#include "DuplicateAnalyzer.h"
#include "CommonUtils.h"

#include <unordered_set>

namespace {
void appendToken(std::string& key, char tag, const std::string& token) {
    key.push_back(tag);
    key += std::to_string(token.size());
    key.push_back(':');
    key += token;
}
} // namespace

std::string DuplicateAnalyzer::rowKey(const TypedDataset& data, size_t row) {
    std::string key;
    for (const auto& col : data.columns()) {
        if (col.invalid[row]) {
            appendToken(key, 'r', col.raw[row]);
            continue;
        }
        if (col.missing[row]) {
            key.push_back('0');
            continue;
        }
        switch (col.type) {
            case ColumnType::NUMERIC:
                appendToken(key, 'n', CommonUtils::formatDouble(std::get<std::vector<double>>(col.values)[row]));
                break;
            case ColumnType::DATETIME:
                appendToken(key, 'd', std::to_string(std::get<std::vector<int64_t>>(col.values)[row]));
                break;
            case ColumnType::BOOLEAN:
                key += std::get<std::vector<uint8_t>>(col.values)[row] ? "b1" : "b0";
                break;
            case ColumnType::CATEGORICAL:
                appendToken(key, 's', std::get<std::vector<std::string>>(col.values)[row]);
                break;
        }
    }
    return key;
}

DuplicateReport DuplicateAnalyzer::analyze(const TypedDataset& data, size_t previewRows) {
    DuplicateReport report;
    if (data.rowCount() == 0 || data.colCount() == 0) return report;

    std::unordered_set<std::string> seen;
    seen.reserve(data.rowCount());
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (seen.insert(rowKey(data, r)).second) continue;
        ++report.duplicateCount;
        if (report.preview.size() < previewRows) {
            report.preview.push_back({r, data.rowValues(r)});
        }
    }
    report.duplicatePercent = CommonUtils::percentOf(report.duplicateCount, data.rowCount());
    return report;
}
