#pragma once
// Parser.hpp – Public GSD sounding parse API.
//
// Usage example:
//   auto reports = gsd::parse(gsd_text);           // default options
//
//   gsd::Parser parser(gsd::loadOptions("gsd.xml"));
//   auto reports = parser.parse(gsd_text);
//
//   // Access fields:
//   const auto& r = reports[0];
//   std::cout << r.station_id << ' ' << gsd::toIsoString(r.date) << '\n';

#include "Decoders.hpp"
#include "Types.hpp"

#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace gsd {

// Thrown when the input is not text (null pointer).
class InputTypeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Thrown when the input yields no report at all.
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Parser {
public:
    Parser() = default;
    explicit Parser(ParseOptions options);

    [[nodiscard]] const ParseOptions& options() const noexcept { return options_; }

    // ── Batch parse ──────────────────────────────────────────────────────────
    // Split raw text into blank-line separated blocks and assemble one report
    // per block, preserving input order.
    // Throws ParseError if no block produced a report. A ReportError from a
    // malformed block propagates unless options().on_report_error is Skip.
    [[nodiscard]] std::vector<SoundingReport> parse(std::string_view raw) const;

    // ── Single report ────────────────────────────────────────────────────────
    // Assemble one report from one block. Returns std::nullopt if the block
    // has fewer than three header lines; throws ReportError on a malformed
    // header.
    [[nodiscard]] std::optional<SoundingReport> parseReport(std::string_view block) const;

private:
    ParseOptions options_;

    [[nodiscard]] bool isLevelType(LineType type) const noexcept;

    [[nodiscard]] std::vector<SoundingDatum>
    decodeLevels(const std::vector<Tokens>& lines) const;
};

// Parse with default options.
[[nodiscard]] std::vector<SoundingReport> parse(std::string_view raw);

// Throws InputTypeError for a null pointer.
[[nodiscard]] std::vector<SoundingReport> parse(const char* raw);

} // namespace gsd
