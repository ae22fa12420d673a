#include "MissingAnalyzer.h"
#include "CommonUtils.h"

#include <algorithm>

MissingReport MissingAnalyzer::analyze(const TypedDataset& data) {
    MissingReport report;
    report.rowCount = data.rowCount();
    report.totalCells = data.rowCount() * data.colCount();
    report.columns.reserve(data.colCount());

    for (const auto& col : data.columns()) {
        MissingColumnStat stat;
        stat.column = col.name;
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (col.isNull(r)) ++stat.missingCount;
        }
        stat.missingPercent = CommonUtils::percentOf(stat.missingCount, data.rowCount());
        report.totalMissing += stat.missingCount;
        report.columns.push_back(std::move(stat));
    }

    std::stable_sort(report.columns.begin(), report.columns.end(), [](const MissingColumnStat& a, const MissingColumnStat& b) {
        return a.missingCount > b.missingCount;
    });
    return report;
}
