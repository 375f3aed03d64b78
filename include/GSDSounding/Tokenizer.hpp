#pragma once
// Tokenizer.hpp – Text-level splitting and field decoding for GSD reports.
//
// GSD text layout rules:
//   • A report is a run of non-blank lines; reports are separated by one or
//     more blank (empty or whitespace-only) lines.
//   • Within a line, fields are separated by runs of whitespace; column
//     alignment carries no meaning.
//   • The first field of a line is its one-character type code ('1'..'9').
//   • Every integer field uses 99999 for "not applicable".

#include "Types.hpp"

#include <charconv>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace gsd {

using Tokens = std::vector<std::string>;

// ─────────────────────────────────────────────────────────────────────────────
//  Lines and blocks
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline bool isSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] inline bool isDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] inline bool isBlank(std::string_view line) noexcept {
    for (char c : line)
        if (!isSpace(c)) return false;
    return true;
}

// Split text on '\n'. A trailing '\r' is stripped from each line, and a final
// newline does not produce an extra empty line.
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

// Split raw multi-report input into report blocks. Each returned view spans
// from the first character of a block's first line to the end of its last
// line. Runs of blank lines separate blocks and never appear in the output.
[[nodiscard]] inline std::vector<std::string_view> splitReports(std::string_view raw) {
    std::vector<std::string_view> blocks;
    const char* block_begin = nullptr;
    const char* block_end   = nullptr;

    for (std::string_view line : splitLines(raw)) {
        if (isBlank(line)) {
            if (block_begin) {
                blocks.emplace_back(block_begin, static_cast<size_t>(block_end - block_begin));
                block_begin = nullptr;
            }
            continue;
        }
        if (!block_begin) block_begin = line.data();
        block_end = line.data() + line.size();
    }
    if (block_begin)
        blocks.emplace_back(block_begin, static_cast<size_t>(block_end - block_begin));

    return blocks;
}

// Trim a line and split it on runs of whitespace.
// A blank line yields an empty token list.
[[nodiscard]] inline Tokens splitLine(std::string_view line) {
    Tokens tokens;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && isSpace(line[i])) ++i;
        size_t start = i;
        while (i < line.size() && !isSpace(line[i])) ++i;
        if (i > start) tokens.emplace_back(line.substr(start, i - start));
    }
    return tokens;
}

// Positional access; an index past the end is an absent field, not an error.
[[nodiscard]] inline std::optional<std::string_view> tokenAt(const Tokens& tokens, size_t idx) {
    if (idx >= tokens.size()) return std::nullopt;
    return std::string_view{tokens[idx]};
}

// ─────────────────────────────────────────────────────────────────────────────
//  Line classification
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline std::optional<LineType> lineType(std::string_view token) noexcept {
    if (token.size() != 1 || token[0] < '1' || token[0] > '9')
        return std::nullopt;
    return static_cast<LineType>(token[0]);
}

[[nodiscard]] inline std::optional<LineType> lineType(const Tokens& tokens) noexcept {
    if (tokens.empty()) return std::nullopt;
    return lineType(tokens.front());
}

// ─────────────────────────────────────────────────────────────────────────────
//  Numeric fields
// ─────────────────────────────────────────────────────────────────────────────

// Decode an integer field. Reads the leading integer prefix of the token
// ("12.5" → 12). Absent token, no leading digits, overflow and the 99999
// sentinel all come back as std::nullopt.
[[nodiscard]] inline std::optional<int> parseInteger(std::optional<std::string_view> token) {
    if (!token) return std::nullopt;

    std::string_view s = *token;
    bool negative = false;
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    if (s.empty() || !isDigit(s.front())) return std::nullopt;

    long long v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{}) return std::nullopt;
    if (negative) v = -v;

    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;
    if (v == kNotApplicable) return std::nullopt;

    return static_cast<int>(v);
}

// Decode the leading signed fixed-point prefix of a token.
// Sets `consumed` to the number of characters used (0 on failure) and
// `has_point` if the prefix contains a decimal point.
[[nodiscard]] inline std::optional<double> decimalPrefix(std::string_view token,
                                                         size_t& consumed,
                                                         bool& has_point) {
    consumed  = 0;
    has_point = false;

    std::string_view s = token;
    bool negative = false;
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }

    // Require a digit, or a point followed by a digit; this rejects "inf",
    // "nan" and a bare sign.
    const bool leading_digit = !s.empty() && isDigit(s[0]);
    const bool leading_point = s.size() > 1 && s[0] == '.' && isDigit(s[1]);
    if (!leading_digit && !leading_point) return std::nullopt;

    double v = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v,
                                     std::chars_format::fixed);
    if (ec != std::errc{}) return std::nullopt;

    const size_t used = static_cast<size_t>(ptr - s.data());
    has_point = s.substr(0, used).find('.') != std::string_view::npos;
    consumed  = used + (token.size() - s.size());
    return negative ? -v : v;
}

// True if the whole token is one signed fixed-point number.
[[nodiscard]] inline bool isNumber(std::string_view token) {
    size_t consumed   = 0;
    bool   has_point  = false;
    return decimalPrefix(token, consumed, has_point).has_value() && consumed == token.size();
}

// Decode a coordinate in degrees and hundredths. A token written without a
// decimal point carries implied hundredths ("3782" → 37.82). The 99999
// sentinel is not applied here.
[[nodiscard]] inline std::optional<double> parseDecimal(std::optional<std::string_view> token) {
    if (!token) return std::nullopt;
    size_t consumed  = 0;
    bool   has_point = false;
    auto v = decimalPrefix(*token, consumed, has_point);
    if (!v) return std::nullopt;
    return has_point ? *v : *v / 100.0;
}

} // namespace gsd
