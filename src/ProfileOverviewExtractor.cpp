#include "ProfileOverviewExtractor.h"
#include "CommonUtils.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace {
std::string decodeEntities(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') {
            out.push_back(s[i]);
            continue;
        }
        const size_t semi = s.find(';', i);
        if (semi == std::string::npos || semi - i > 10) {
            out.push_back(s[i]);
            continue;
        }
        const std::string entity = CommonUtils::toLower(s.substr(i + 1, semi - i - 1));
        if (entity == "amp") {
            out.push_back('&');
        } else if (entity == "lt") {
            out.push_back('<');
        } else if (entity == "gt") {
            out.push_back('>');
        } else if (entity == "quot") {
            out.push_back('"');
        } else if (entity == "nbsp") {
            out.push_back(' ');
        } else if (!entity.empty() && entity[0] == '#') {
            int code = 0;
            const bool hex = entity.size() > 1 && entity[1] == 'x';
            const char* b = entity.data() + (hex ? 2 : 1);
            const char* e = entity.data() + entity.size();
            auto [p, ec] = std::from_chars(b, e, code, hex ? 16 : 10);
            if (ec != std::errc{} || p != e || code <= 0 || code > 127) {
                out.append(s, i, semi - i + 1);
            } else {
                out.push_back(static_cast<char>(code));
            }
        } else {
            out.append(s, i, semi - i + 1);
        }
        i = semi;
    }
    return out;
}

std::string cellText(const std::string& inner) {
    std::string stripped;
    stripped.reserve(inner.size());
    bool inTag = false;
    for (char ch : inner) {
        if (ch == '<') {
            inTag = true;
            stripped.push_back(' ');
        } else if (ch == '>') {
            inTag = false;
        } else if (!inTag) {
            stripped.push_back(ch);
        }
    }
    const std::string decoded = decodeEntities(stripped);

    std::string collapsed;
    bool pendingSpace = false;
    for (char ch : decoded) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            pendingSpace = !collapsed.empty();
            continue;
        }
        if (pendingSpace) collapsed.push_back(' ');
        pendingSpace = false;
        collapsed.push_back(ch);
    }
    return collapsed;
}

bool isTagAt(const std::string& lower, size_t pos, const char* name) {
    const size_t len = std::char_traits<char>::length(name);
    if (lower.compare(pos, len, name) != 0) return false;
    const size_t after = pos + len;
    return after < lower.size() && (lower[after] == '>' || std::isspace(static_cast<unsigned char>(lower[after])));
}

std::vector<std::string> rowCells(const std::string& html, const std::string& lower, size_t begin, size_t end) {
    std::vector<std::string> cells;
    size_t pos = begin;
    while (cells.size() < 2) {
        pos = lower.find("<t", pos);
        if (pos == std::string::npos || pos >= end) break;
        const bool header = isTagAt(lower, pos, "<th");
        if (!header && !isTagAt(lower, pos, "<td")) {
            pos += 2;
            continue;
        }
        const size_t open = lower.find('>', pos);
        if (open == std::string::npos || open >= end) break;
        const size_t close = lower.find(header ? "</th>" : "</td>", open);
        if (close == std::string::npos || close > end) break;
        cells.push_back(cellText(html.substr(open + 1, close - open - 1)));
        pos = close + 5;
    }
    return cells;
}

std::optional<std::string> lookup(const std::vector<std::pair<std::string, std::string>>& rows, const std::string& label) {
    for (const auto& [key, value] : rows) {
        if (CommonUtils::toLower(key) == label) return value;
    }
    return std::nullopt;
}
} // namespace

std::vector<std::pair<std::string, std::string>> ProfileOverviewExtractor::tableRows(const std::string& html) {
    std::vector<std::pair<std::string, std::string>> out;
    const std::string lower = CommonUtils::toLower(html);
    size_t pos = 0;
    while (true) {
        pos = lower.find("<tr", pos);
        if (pos == std::string::npos) break;
        if (!isTagAt(lower, pos, "<tr")) {
            pos += 3;
            continue;
        }
        size_t end = lower.find("</tr>", pos);
        const size_t nextRow = lower.find("<tr", pos + 3);
        if (end == std::string::npos || (nextRow != std::string::npos && nextRow < end)) {
            end = (nextRow == std::string::npos) ? lower.size() : nextRow;
        }
        const auto cells = rowCells(html, lower, pos, end);
        if (cells.size() == 2 && !cells[0].empty()) out.emplace_back(cells[0], cells[1]);
        pos = end;
    }
    return out;
}

std::optional<long long> ProfileOverviewExtractor::parseCount(const std::string& text) {
    std::string digits;
    for (char ch : text) {
        if (ch == ',' || ch == ' ' || ch == '\'') continue;
        digits.push_back(ch);
    }
    if (digits.empty()) return std::nullopt;
    long long value = 0;
    const char* b = digits.data();
    const char* e = b + digits.size();
    auto [p, ec] = std::from_chars(b, e, value);
    if (ec != std::errc{} || p != e || value < 0) return std::nullopt;
    return value;
}

std::optional<double> ProfileOverviewExtractor::parsePercent(const std::string& text) {
    std::string cleaned = CommonUtils::trim(text);
    if (!cleaned.empty() && cleaned.back() == '%') cleaned.pop_back();
    cleaned = CommonUtils::trim(cleaned);
    std::string number;
    for (char ch : cleaned) {
        if (ch != ',') number.push_back(ch);
    }
    if (number.empty()) return std::nullopt;
    double value = 0.0;
    const char* b = number.data();
    const char* e = b + number.size();
    auto [p, ec] = std::from_chars(b, e, value);
    if (ec != std::errc{} || p != e || !std::isfinite(value)) return std::nullopt;
    return value;
}

ExternalProfileStats ProfileOverviewExtractor::extractHtml(const std::string& html) {
    ExternalProfileStats stats;
    const auto rows = tableRows(html);

    if (const auto v = lookup(rows, "missing cells")) stats.missingCells = parseCount(*v);
    if (const auto v = lookup(rows, "missing cells (%)")) stats.missingCellsPercent = parsePercent(*v);
    if (const auto v = lookup(rows, "duplicate rows")) stats.duplicateRows = parseCount(*v);
    if (const auto v = lookup(rows, "duplicate rows (%)")) stats.duplicateRowsPercent = parsePercent(*v);

    if (!stats.anyAvailable()) {
        stats.status = AnalysisStatus::NOT_APPLICABLE;
        stats.note = "profile document has no overview metrics";
    }
    return stats;
}

ExternalProfileStats ProfileOverviewExtractor::extractFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "[Veritas][Profile] cannot read profile document: " << path << "\n";
        ExternalProfileStats stats;
        stats.status = AnalysisStatus::FAILED;
        stats.note = "profile document unreadable";
        return stats;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return extractHtml(buffer.str());
}

ExternalProfileStats ProfileOverviewExtractor::extract(const std::optional<std::string>& path) {
    if (!path || path->empty()) {
        ExternalProfileStats stats;
        stats.status = AnalysisStatus::NOT_APPLICABLE;
        stats.note = "profile not generated";
        return stats;
    }
    return extractFile(*path);
}
