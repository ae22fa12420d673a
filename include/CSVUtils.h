#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and header normalization utilities.
// This module does not infer semantic types.

// Per-record guards against pathological input. 0 disables a limit.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;
    size_t maxColumns = 20000;
    // Physical lines a single quoted record may span.
    size_t maxRecordLines = 10000;
};

struct RecordStatus {
    bool malformed = false;      // input ended inside a quoted field
    bool limitExceeded = false;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record (quoted fields may span lines).
 * @details Returns an empty vector at end of input and for blank lines.
 *          Unquoted fields are trimmed of spaces and tabs; quoted fields are kept verbatim.
 */
std::vector<std::string> readRecord(std::istream& is,
                                    char delimiter,
                                    RecordStatus& status,
                                    const ParseLimits& limits = ParseLimits{});

// Fills empty names with column_<n> and suffixes repeats with _2, _3, ...
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

// Text decoding for raw file bytes. Input that is not valid UTF-8 is treated as Latin-1.
bool isValidUtf8(const std::string& bytes);
std::string latin1ToUtf8(const std::string& bytes);
std::string decodeText(const std::string& bytes, bool* transcoded = nullptr);
} // namespace CSVUtils
