#pragma once
#include "CSVUtils.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL, DATETIME, BOOLEAN };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>, std::vector<uint8_t>>;
using MissingMask = std::vector<uint8_t>;

const char* columnTypeName(ColumnType type) noexcept;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    // 1 when the cell has no usable typed value (null token or parse failure).
    MissingMask missing;
    // 1 when the cell held a non-null token that did not parse as `type`.
    MissingMask invalid;
    // Trimmed source token per cell.
    std::vector<std::string> raw;

    bool isNull(size_t row) const noexcept { return missing[row] && !invalid[row]; }
};

class TypedDataset {
public:
    enum class NumericSeparatorPolicy {
        AUTO,
        US_THOUSANDS,
        EUROPEAN
    };

    enum class DateLocaleHint {
        AUTO,
        DMY,
        MDY
    };

    explicit TypedDataset(std::string filename, char delimiter = ',');

    void setNumericSeparatorPolicy(NumericSeparatorPolicy policy) noexcept { numericSeparatorPolicy_ = policy; }
    void setDateLocaleHint(DateLocaleHint hint) noexcept { dateLocaleHint_ = hint; }
    void setParseLimits(const CSVUtils::ParseLimits& limits) noexcept { parseLimits_ = limits; }

    /**
     * @brief Reads the CSV file, decodes it to UTF-8 and infers per-column types.
     * @details Bytes that are not valid UTF-8 are transcoded from Latin-1 before tokenization.
     * @pre file exists and is readable.
     * @post columns() is populated with aligned typed vectors, missing/invalid masks and raw tokens.
     * @throws Veritas::IOException / Veritas::DatasetException on IO or parse failure.
     */
    void load();

    /**
     * @brief Parses already-decoded CSV text.
     * @throws Veritas::DatasetException on a malformed or empty header.
     */
    void loadFromText(const std::string& text);

    /**
     * @brief Builds typed columns from a header and string records.
     * @details Short records are padded with blanks; extra trailing fields are dropped
     *          and the record is marked in rowWidthMismatch().
     * @throws Veritas::DatasetException when the header is empty.
     */
    void loadRecords(std::vector<std::string> header, const std::vector<std::vector<std::string>>& rows);

    static TypedDataset fromRecords(std::vector<std::string> header,
                                    const std::vector<std::vector<std::string>>& rows);

    const std::string& filename() const noexcept { return filename_; }
    bool transcodedFromLatin1() const noexcept { return transcodedFromLatin1_; }

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    const TypedColumn& column(size_t idx) const { return columns_.at(idx); }
    std::vector<std::string> columnNames() const;

    std::vector<size_t> numericColumnIndices() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    // Rows whose field count differed from the header width.
    const MissingMask& rowWidthMismatch() const noexcept { return rowWidthMismatch_; }

    // Canonical text for the typed value of a cell ("" for nulls, raw token for invalid cells).
    std::string cellText(size_t col, size_t row) const;
    std::vector<std::string> rowValues(size_t row) const;

    static bool isMissingToken(const std::string& raw);
    static bool parseBooleanToken(const std::string& raw, bool& out);

    bool parseDouble(const std::string& v, double& out) const;
    bool parseDateTime(const std::string& v, int64_t& outUnixSeconds) const;

private:
    std::string filename_;
    char delimiter_;
    NumericSeparatorPolicy numericSeparatorPolicy_ = NumericSeparatorPolicy::AUTO;
    DateLocaleHint dateLocaleHint_ = DateLocaleHint::AUTO;
    CSVUtils::ParseLimits parseLimits_;
    bool transcodedFromLatin1_ = false;
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
    MissingMask rowWidthMismatch_;

    ColumnType inferColumnType(size_t col,
                               const std::string& headerName,
                               const std::vector<std::vector<std::string>>& rows) const;
};
