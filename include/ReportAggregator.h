#pragma once
#include "QualityTypes.h"
#include "TypedDataset.h"

#include <memory>

class ReportAggregator {
public:
    struct Parts {
        TargetSelection target;
        std::shared_ptr<const MissingReport> missing;
        std::shared_ptr<const DuplicateReport> duplicates;
        std::shared_ptr<const OutlierIndexSets> outliers;
        std::shared_ptr<const LabelIssueReport> labelIssues;
        std::shared_ptr<const ExternalProfileStats> profile;
    };

    /**
     * @brief Builds the tagged outlier sequence: Statistical, then AI-Based, then Structural,
     *        each block in ascending row order with the row's original values.
     */
    static OutlierView buildOutlierView(const TypedDataset& data, const OutlierIndexSets& sets);

    static QualityReport assemble(const TypedDataset& data, Parts parts);
};
