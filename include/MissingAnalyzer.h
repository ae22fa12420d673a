#pragma once
#include "QualityTypes.h"
#include "TypedDataset.h"

class MissingAnalyzer {
public:
    /**
     * @brief Counts null cells per column.
     * @details Cells holding an unparseable token are not counted as missing;
     *          they belong to the structural outlier detector.
     * @post Columns are ordered by descending count with ties kept in column order;
     *       percentages are rounded to two decimals and are 0 for an empty dataset.
     */
    static MissingReport analyze(const TypedDataset& data);
};
