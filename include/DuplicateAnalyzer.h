#pragma once
#include "QualityTypes.h"
#include "TypedDataset.h"

#include <string>

class DuplicateAnalyzer {
public:
    /**
     * @brief Counts rows that repeat an earlier row across every column.
     * @details Comparison is type-aware: numbers compare by value, text is case-sensitive,
     *          datetimes compare by epoch second and nulls equal nulls. The first occurrence
     *          is the original and each later copy counts once.
     */
    static DuplicateReport analyze(const TypedDataset& data, size_t previewRows = 5);

    // Canonical key used for row equality; exposed for tests.
    static std::string rowKey(const TypedDataset& data, size_t row);
};
