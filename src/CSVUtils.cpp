#include "CSVUtils.h"

#include <algorithm>
#include <cstdint>
#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int next = is.get();
        if (next == EOF || static_cast<unsigned char>(next) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
    }
}

std::vector<std::string> readRecord(std::istream& is,
                                    char delimiter,
                                    RecordStatus& status,
                                    const ParseLimits& limits) {
    status = RecordStatus{};
    std::vector<std::string> fields;
    if (is.peek() == EOF) return fields;

    std::string field;
    bool quoted = false;
    bool inQuotes = false;
    size_t lines = 1;

    auto append = [&](char c) {
        field.push_back(c);
        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) status.limitExceeded = true;
    };
    auto finishField = [&]() {
        fields.push_back(quoted ? field : trimUnquotedField(field));
        field.clear();
        quoted = false;
        if (limits.maxColumns > 0 && fields.size() > limits.maxColumns) status.limitExceeded = true;
    };

    bool endOfRecord = false;
    char c;
    while (!endOfRecord && !status.limitExceeded && is.get(c)) {
        if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (!inQuotes) {
                endOfRecord = true;
            } else if (limits.maxRecordLines > 0 && ++lines > limits.maxRecordLines) {
                status.limitExceeded = true;
            } else {
                append('\n');
            }
            continue;
        }

        if (inQuotes) {
            if (c != '"') {
                append(c);
                continue;
            }
            const int next = is.peek();
            if (next == '"') {
                is.get();
                append('"');
            } else if (next == EOF || next == delimiter || next == '\n' || next == '\r') {
                inQuotes = false;
            } else {
                append(c);
            }
        } else if (c == delimiter) {
            finishField();
        } else if (c == '"' && field.empty()) {
            inQuotes = true;
            quoted = true;
        } else {
            append(c);
        }
    }

    status.malformed = inQuotes;
    if (status.limitExceeded) return fields;

    const bool lastQuoted = quoted;
    finishField();
    // A line holding nothing but whitespace is not a record.
    if (fields.size() == 1 && fields[0].empty() && !lastQuoted) return {};
    return fields;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> taken;

    for (size_t i = 0; i < header.size(); ++i) {
        const std::string base = header[i].empty() ? "column_" + std::to_string(i + 1) : header[i];
        std::string name = base;
        for (size_t suffix = 2; taken.count(name) > 0; ++suffix) {
            name = base + "_" + std::to_string(suffix);
        }
        taken.insert(name);
        out.push_back(std::move(name));
    }
    return out;
}

bool isValidUtf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Reject overlong forms, surrogates and out-of-range code points.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

std::string latin1ToUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() + bytes.size() / 4);
    for (char ch : bytes) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(ch);
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

std::string decodeText(const std::string& bytes, bool* transcoded) {
    if (transcoded) *transcoded = false;
    if (isValidUtf8(bytes)) return bytes;
    if (transcoded) *transcoded = true;
    return latin1ToUtf8(bytes);
}
} // namespace CSVUtils
