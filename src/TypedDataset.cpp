#include "TypedDataset.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "VeritasExceptions.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

const char* columnTypeName(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::CATEGORICAL: return "categorical";
        case ColumnType::DATETIME: return "datetime";
        case ColumnType::BOOLEAN: return "boolean";
    }
    return "categorical";
}

TypedDataset::TypedDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

namespace {
bool parseFixedInt(const std::string& s, size_t offset, size_t len, int& out) {
    if (offset + len > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char ch = static_cast<unsigned char>(s[offset + i]);
        if (ch < '0' || ch > '9') return false;
        value = value * 10 + static_cast<int>(ch - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t days, int& year, int& month, int& day) {
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
}

std::string formatUnixSeconds(int64_t ts) {
    int64_t days = ts / 86400;
    int64_t rem = ts % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    civilFromDays(days, year, month, day);
    char buf[32];
    const int hh = static_cast<int>(rem / 3600);
    const int mm = static_cast<int>((rem % 3600) / 60);
    const int ss = static_cast<int>(rem % 60);
    if (hh == 0 && mm == 0 && ss == 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", year, month, day, hh, mm, ss);
    }
    return buf;
}

bool parseTimePart(const std::string& timePart, int& hour, int& minute, int& second) {
    if (timePart.empty()) {
        hour = minute = second = 0;
        return true;
    }
    second = 0;
    if (timePart.size() != 8 && timePart.size() != 5) return false;
    if (!parseFixedInt(timePart, 0, 2, hour) || timePart[2] != ':' ||
        !parseFixedInt(timePart, 3, 2, minute)) {
        return false;
    }
    if (timePart.size() == 8 && (timePart[5] != ':' || !parseFixedInt(timePart, 6, 2, second))) {
        return false;
    }
    return true;
}

bool parseDatePart(const std::string& datePart, TypedDataset::DateLocaleHint localeHint, int& year, int& month, int& day) {
    // ISO: YYYY-MM-DD or YYYY/MM/DD
    if (datePart.size() == 10 && (datePart[4] == '-' || datePart[4] == '/') && datePart[7] == datePart[4]) {
        return parseFixedInt(datePart, 0, 4, year) &&
               parseFixedInt(datePart, 5, 2, month) &&
               parseFixedInt(datePart, 8, 2, day);
    }

    // Slash format: dd/mm/yyyy or mm/dd/yyyy based on locale hint.
    if (datePart.size() == 10 && datePart[2] == '/' && datePart[5] == '/') {
        int a = 0;
        int b = 0;
        int y = 0;
        if (!parseFixedInt(datePart, 0, 2, a) ||
            !parseFixedInt(datePart, 3, 2, b) ||
            !parseFixedInt(datePart, 6, 4, y)) {
            return false;
        }

        if (localeHint == TypedDataset::DateLocaleHint::DMY || (localeHint == TypedDataset::DateLocaleHint::AUTO && a > 12 && b <= 12)) {
            day = a;
            month = b;
        } else {
            month = a;
            day = b;
        }
        year = y;
        return true;
    }

    // DMY: DD-MM-YYYY or DD.MM.YYYY
    if (datePart.size() == 10 && (datePart[2] == '-' || datePart[2] == '.') && datePart[5] == datePart[2]) {
        return parseFixedInt(datePart, 0, 2, day) &&
               parseFixedInt(datePart, 3, 2, month) &&
               parseFixedInt(datePart, 6, 4, year);
    }

    return false;
}

bool parseIntegerEpochSeconds(const std::string& input, int64_t& out) {
    if (input.size() < 9 || input.size() > 10) return false;
    const char* begin = input.data();
    const char* end = begin + input.size();
    auto [ptr, ec] = std::from_chars(begin, end, out, 10);
    if (ec != std::errc{} || ptr != end) return false;
    constexpr int64_t kEpochMin = 100000000;   // 1973-03-03
    constexpr int64_t kEpochMax = 2524608000;  // 2050-01-01T00:00:00Z
    return out >= kEpochMin && out <= kEpochMax;
}

std::string normalizeNumericToken(const std::string& input, TypedDataset::NumericSeparatorPolicy policy) {
    std::string cleaned;
    cleaned.reserve(input.size());
    for (char ch : input) {
        if (!std::isspace(static_cast<unsigned char>(ch)) && ch != '_') {
            cleaned.push_back(ch);
        }
    }

    const auto toUS = [](const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char ch : s) {
            if (ch != ',') out.push_back(ch);
        }
        return out;
    };

    const auto toEuropean = [](const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char ch : s) {
            if (ch == '.') continue;
            out.push_back(ch == ',' ? '.' : ch);
        }
        return out;
    };

    if (policy == TypedDataset::NumericSeparatorPolicy::US_THOUSANDS) return toUS(cleaned);
    if (policy == TypedDataset::NumericSeparatorPolicy::EUROPEAN) return toEuropean(cleaned);

    const size_t dotPos = cleaned.find('.');
    const size_t commaPos = cleaned.find(',');
    if (dotPos != std::string::npos && commaPos != std::string::npos) {
        return cleaned.find_last_of(',') > cleaned.find_last_of('.') ? toEuropean(cleaned) : toUS(cleaned);
    }

    if (commaPos != std::string::npos) {
        const size_t commaCount = static_cast<size_t>(std::count(cleaned.begin(), cleaned.end(), ','));
        const size_t digitsAfter = cleaned.size() - commaPos - 1;
        if (commaCount == 1 && digitsAfter >= 1 && digitsAfter <= 4) {
            const bool likelyThousands = (digitsAfter == 3 && commaPos > 0 && std::isdigit(static_cast<unsigned char>(cleaned[commaPos - 1])));
            if (!likelyThousands) {
                std::string out = cleaned;
                out[commaPos] = '.';
                return out;
            }
        }
        return toUS(cleaned);
    }

    return cleaned;
}

bool parseStrictDouble(std::string cleaned, double& out) {
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (!cleaned.empty() && cleaned.back() == '%') cleaned.pop_back();
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

// Accounting negatives "(12.5)" and currency prefixes "$1,200".
bool parseDecoratedNumber(const std::string& input, TypedDataset::NumericSeparatorPolicy policy, double& out) {
    std::string s = input;
    bool negative = false;
    if (s.size() >= 3 && s.front() == '(' && s.back() == ')') {
        negative = true;
        s = CommonUtils::trim(s.substr(1, s.size() - 2));
    }
    if (!s.empty() && (s.front() == '$' || s.front() == '-' || s.front() == '+')) {
        const bool minus = s.front() == '-';
        s.erase(s.begin());
        if (!s.empty() && s.front() == '$') s.erase(s.begin());
        if (minus) negative = !negative;
    }
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) return false;
    if (!parseStrictDouble(normalizeNumericToken(s, policy), out)) return false;
    if (negative) out = -out;
    return true;
}
} // namespace

bool TypedDataset::isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(std::move(s));
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

bool TypedDataset::parseBooleanToken(const std::string& raw, bool& out) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(raw));
    if (s == "true" || s == "yes") {
        out = true;
        return true;
    }
    if (s == "false" || s == "no") {
        out = false;
        return true;
    }
    return false;
}

bool TypedDataset::parseDouble(const std::string& v, double& out) const {
    const std::string sv = CommonUtils::trim(v);
    if (isMissingToken(sv)) return false;
    if (parseStrictDouble(normalizeNumericToken(sv, numericSeparatorPolicy_), out)) return true;
    return parseDecoratedNumber(sv, numericSeparatorPolicy_, out);
}

bool TypedDataset::parseDateTime(const std::string& v, int64_t& outUnixSeconds) const {
    std::string s = CommonUtils::trim(v);
    if (s.empty() || isMissingToken(s)) return false;

    if (parseIntegerEpochSeconds(s, outUnixSeconds)) {
        return true;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    std::string datePart = s;
    std::string timePart;
    size_t sep = s.find(' ');
    if (sep == std::string::npos && s.size() > 10 && s[10] == 'T') sep = 10;
    if (sep != std::string::npos) {
        datePart = s.substr(0, sep);
        timePart = CommonUtils::trim(s.substr(sep + 1));
        if (!timePart.empty() && timePart.back() == 'Z') timePart.pop_back();
    }

    if (!parseDatePart(datePart, dateLocaleHint_, year, month, day)) {
        return false;
    }
    if (!parseTimePart(timePart, hour, minute, second)) {
        return false;
    }

    if (month < 1 || month > 12) return false;
    const int dim = daysInMonth(year, month);
    if (day < 1 || day > dim) return false;
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) return false;

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    outUnixSeconds = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 + second;
    return true;
}

void TypedDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw Veritas::IOException("Could not open file: " + filename_);

    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw Veritas::IOException("Failed while reading file: " + filename_);

    bool transcoded = false;
    std::string text = CSVUtils::decodeText(bytes, &transcoded);
    loadFromText(text);
    transcodedFromLatin1_ = transcoded;
}

void TypedDataset::loadFromText(const std::string& text) {
    std::istringstream in(text);
    CSVUtils::skipBOM(in);

    CSVUtils::RecordStatus status;
    auto header = CSVUtils::readRecord(in, delimiter_, status, parseLimits_);
    if (status.limitExceeded) throw Veritas::DatasetException("CSV header exceeds parser limits");
    if (status.malformed || header.empty()) throw Veritas::DatasetException("Malformed or empty CSV header");

    std::vector<std::vector<std::string>> rows;
    while (in.peek() != EOF) {
        auto row = CSVUtils::readRecord(in, delimiter_, status, parseLimits_);
        if (status.limitExceeded) {
            throw Veritas::DatasetException("CSV record " + std::to_string(rows.size() + 1) + " exceeds parser limits");
        }
        if (status.malformed) {
            throw Veritas::DatasetException("Unterminated quoted field in CSV record " + std::to_string(rows.size() + 1));
        }
        if (row.empty()) continue;
        rows.push_back(std::move(row));
    }

    loadRecords(std::move(header), rows);
}

ColumnType TypedDataset::inferColumnType(size_t col,
                                         const std::string& headerName,
                                         const std::vector<std::vector<std::string>>& rows) const {
    const std::string lower = CommonUtils::toLower(headerName);
    const bool dateLikeHeader = lower.find("date") != std::string::npos ||
                                lower.find("time") != std::string::npos;

    size_t nonMissing = 0;
    size_t numericHits = 0;
    size_t datetimeHits = 0;
    size_t booleanHits = 0;
    for (const auto& row : rows) {
        if (col >= row.size() || isMissingToken(row[col])) continue;
        ++nonMissing;
        double dv = 0.0;
        int64_t tv = 0;
        bool bv = false;
        if (parseBooleanToken(row[col], bv)) ++booleanHits;
        if (dateLikeHeader) {
            if (parseDateTime(row[col], tv)) {
                ++datetimeHits;
            } else if (parseDouble(row[col], dv)) {
                ++numericHits;
            }
        } else {
            if (parseDouble(row[col], dv)) {
                ++numericHits;
            } else if (parseDateTime(row[col], tv)) {
                ++datetimeHits;
            }
        }
    }
    if (nonMissing == 0) return ColumnType::CATEGORICAL;

    // A column keeps its dominant type as long as at least 80% of the observed
    // tokens parse; the remainder is recorded as invalid cells.
    const size_t floorHits = std::min<size_t>(3, nonMissing);
    const size_t strong = std::max(floorHits, (nonMissing * 8 + 9) / 10);
    const size_t dateHeaderStrong = std::max(floorHits, (nonMissing * 6 + 9) / 10);

    if (dateLikeHeader && datetimeHits >= dateHeaderStrong) return ColumnType::DATETIME;
    if (booleanHits >= strong) return ColumnType::BOOLEAN;
    if (numericHits >= strong) return ColumnType::NUMERIC;
    if (datetimeHits >= strong) return ColumnType::DATETIME;
    return ColumnType::CATEGORICAL;
}

void TypedDataset::loadRecords(std::vector<std::string> header, const std::vector<std::vector<std::string>>& rows) {
    if (header.empty()) throw Veritas::DatasetException("Malformed or empty CSV header");
    header = CSVUtils::normalizeHeader(header);

    rowCount_ = rows.size();
    rowWidthMismatch_.assign(rowCount_, static_cast<uint8_t>(0));
    for (size_t r = 0; r < rowCount_; ++r) {
        if (rows[r].size() != header.size()) rowWidthMismatch_[r] = static_cast<uint8_t>(1);
    }

    columns_.clear();
    columns_.reserve(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        TypedColumn col;
        col.name = header[c];
        col.type = inferColumnType(c, header[c], rows);
        col.missing.assign(rowCount_, static_cast<uint8_t>(0));
        col.invalid.assign(rowCount_, static_cast<uint8_t>(0));
        col.raw.resize(rowCount_);

        switch (col.type) {
            case ColumnType::NUMERIC:
                col.values = std::vector<double>(rowCount_, std::numeric_limits<double>::quiet_NaN());
                break;
            case ColumnType::DATETIME:
                col.values = std::vector<int64_t>(rowCount_, 0);
                break;
            case ColumnType::BOOLEAN:
                col.values = std::vector<uint8_t>(rowCount_, static_cast<uint8_t>(0));
                break;
            case ColumnType::CATEGORICAL:
                col.values = std::vector<std::string>(rowCount_);
                break;
        }

        for (size_t r = 0; r < rowCount_; ++r) {
            const std::string s = (c < rows[r].size()) ? CommonUtils::trim(rows[r][c]) : std::string();
            col.raw[r] = s;
            if (isMissingToken(s)) {
                col.missing[r] = static_cast<uint8_t>(1);
                continue;
            }

            bool ok = true;
            if (col.type == ColumnType::NUMERIC) {
                double dv = 0.0;
                ok = parseDouble(s, dv);
                if (ok) std::get<std::vector<double>>(col.values)[r] = dv;
            } else if (col.type == ColumnType::DATETIME) {
                int64_t ts = 0;
                ok = parseDateTime(s, ts);
                if (ok) std::get<std::vector<int64_t>>(col.values)[r] = ts;
            } else if (col.type == ColumnType::BOOLEAN) {
                bool bv = false;
                ok = parseBooleanToken(s, bv);
                if (ok) std::get<std::vector<uint8_t>>(col.values)[r] = static_cast<uint8_t>(bv ? 1 : 0);
            } else {
                std::get<std::vector<std::string>>(col.values)[r] = s;
            }

            if (!ok) {
                col.missing[r] = static_cast<uint8_t>(1);
                col.invalid[r] = static_cast<uint8_t>(1);
            }
        }
        columns_.push_back(std::move(col));
    }
}

TypedDataset TypedDataset::fromRecords(std::vector<std::string> header,
                                       const std::vector<std::vector<std::string>>& rows) {
    TypedDataset data("<memory>");
    data.loadRecords(std::move(header), rows);
    return data;
}

std::vector<std::string> TypedDataset::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) out.push_back(col.name);
    return out;
}

std::vector<size_t> TypedDataset::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    return out;
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

std::string TypedDataset::cellText(size_t col, size_t row) const {
    const TypedColumn& column = columns_.at(col);
    if (column.invalid[row]) return column.raw[row];
    if (column.missing[row]) return "";
    switch (column.type) {
        case ColumnType::NUMERIC:
            return CommonUtils::formatDouble(std::get<std::vector<double>>(column.values)[row]);
        case ColumnType::DATETIME:
            return formatUnixSeconds(std::get<std::vector<int64_t>>(column.values)[row]);
        case ColumnType::BOOLEAN:
            return std::get<std::vector<uint8_t>>(column.values)[row] ? "true" : "false";
        case ColumnType::CATEGORICAL:
            break;
    }
    return std::get<std::vector<std::string>>(column.values)[row];
}

std::vector<std::string> TypedDataset::rowValues(size_t row) const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) out.push_back(col.raw.at(row));
    return out;
}
