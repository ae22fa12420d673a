#pragma once

#include "TypedDataset.h"

#include <memory>
#include <string>

struct LoadOptions {
    char delimiter = ',';
    TypedDataset::NumericSeparatorPolicy numericSeparatorPolicy = TypedDataset::NumericSeparatorPolicy::AUTO;
    TypedDataset::DateLocaleHint dateLocaleHint = TypedDataset::DateLocaleHint::AUTO;
    CSVUtils::ParseLimits csvLimits;
};

namespace DatasetLoader {

enum class SourceFormat { CSV, XLSX, XLS };

/**
 * @brief Maps the original filename's extension (case-insensitive) to a source format.
 * @throws Veritas::UnsupportedFormatException for anything other than csv, xlsx or xls.
 */
SourceFormat detectFormat(const std::string& originalName);

/**
 * @brief Loads a dataset stored at `path` whose user-facing name is `originalName`.
 * @details The stored file may carry an opaque name; the format is taken from
 *          `originalName` (or from `path` when `originalName` is empty). Excel
 *          workbooks are converted to a temporary CSV with xlsx2csv / xls2csv.
 * @throws Veritas::UnsupportedFormatException, Veritas::IOException, Veritas::DatasetException.
 */
std::shared_ptr<const TypedDataset> load(const std::string& path,
                                         const std::string& originalName,
                                         const LoadOptions& options = LoadOptions{});

} // namespace DatasetLoader
