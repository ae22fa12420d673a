#include "ReportAggregator.h"
#include "CommonUtils.h"

#include <algorithm>
#include <iterator>

const char* outlierCategoryLabel(OutlierCategory category) noexcept {
    switch (category) {
        case OutlierCategory::STATISTICAL: return "Statistical";
        case OutlierCategory::SEMANTIC: return "AI-Based";
        case OutlierCategory::STRUCTURAL: return "Structural";
    }
    return "Statistical";
}

const char* outlierFilterName(OutlierFilter filter) noexcept {
    switch (filter) {
        case OutlierFilter::ALL: return "all";
        case OutlierFilter::STATISTICAL: return "statistical";
        case OutlierFilter::AI: return "ai";
        case OutlierFilter::STRUCTURAL: return "structural";
    }
    return "all";
}

OutlierFilter parseOutlierFilter(const std::string& selector) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(selector));
    if (s == "statistical") return OutlierFilter::STATISTICAL;
    if (s == "ai" || s == "ai-based" || s == "semantic") return OutlierFilter::AI;
    if (s == "structural") return OutlierFilter::STRUCTURAL;
    return OutlierFilter::ALL;
}

std::vector<TaggedOutlierRow> OutlierView::filter(OutlierFilter selector) const {
    if (selector == OutlierFilter::ALL) return rows;

    OutlierCategory wanted = OutlierCategory::STATISTICAL;
    if (selector == OutlierFilter::AI) wanted = OutlierCategory::SEMANTIC;
    if (selector == OutlierFilter::STRUCTURAL) wanted = OutlierCategory::STRUCTURAL;

    std::vector<TaggedOutlierRow> out;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(out), [wanted](const TaggedOutlierRow& row) {
        return row.category == wanted;
    });
    return out;
}

OutlierView ReportAggregator::buildOutlierView(const TypedDataset& data, const OutlierIndexSets& sets) {
    OutlierView view;
    auto appendBlock = [&](const DetectorOutcome& outcome, OutlierCategory category) {
        std::vector<size_t> ordered = outcome.rows;
        std::sort(ordered.begin(), ordered.end());
        ordered.erase(std::unique(ordered.begin(), ordered.end()), ordered.end());
        for (size_t r : ordered) {
            if (r >= data.rowCount()) continue;
            view.rows.push_back({r, category, data.rowValues(r)});
        }
        return ordered.size();
    };

    view.statisticalCount = appendBlock(sets.statistical, OutlierCategory::STATISTICAL);
    view.semanticCount = appendBlock(sets.semantic, OutlierCategory::SEMANTIC);
    view.structuralCount = appendBlock(sets.structural, OutlierCategory::STRUCTURAL);
    view.totalUniqueOutliers = sets.totalUnique();
    return view;
}

QualityReport ReportAggregator::assemble(const TypedDataset& data, Parts parts) {
    QualityReport report;
    report.dataset = data.filename();
    report.columns = data.columnNames();
    report.rowCount = data.rowCount();
    report.target = std::move(parts.target);
    report.missing = std::move(parts.missing);
    report.duplicates = std::move(parts.duplicates);
    report.outliers = std::move(parts.outliers);
    report.labelIssues = std::move(parts.labelIssues);
    report.profile = std::move(parts.profile);
    if (report.outliers) {
        report.outlierView = std::make_shared<const OutlierView>(buildOutlierView(data, *report.outliers));
    } else {
        report.outlierView = std::make_shared<const OutlierView>();
    }
    return report;
}
