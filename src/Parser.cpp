// Parser.cpp – Report assembly and batch parsing for GSD sounding text.
//
// Block layout reminder:
//   line 1   description (only required to exist)
//   line 2   date / type
//   line 3   CAPE / CIN
//   rest     type-coded lines in any order; the first '1' and the first '3'
//            line win, data lines keep their source order

#include "GSDSounding/Parser.hpp"
#include "GSDSounding/Format.hpp"
#include "GSDSounding/Tokenizer.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <string>
#include <utility>

namespace gsd {

static constexpr const char* kNoReportsMessage =
    "Failed to parse. Ensure the input is a valid GSD formatted string.";

static std::string joinTokens(const Tokens& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out += ' ';
        out += t;
    }
    return out;
}

static const Tokens* findLine(const std::vector<Tokens>& lines, LineType type) {
    for (const auto& line : lines)
        if (lineType(line) == type) return &line;
    return nullptr;
}

Parser::Parser(ParseOptions options) : options_(std::move(options)) {}

bool Parser::isLevelType(LineType type) const noexcept {
    return std::find(options_.level_types.begin(), options_.level_types.end(), type) !=
           options_.level_types.end();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Levels
// ─────────────────────────────────────────────────────────────────────────────

std::vector<SoundingDatum> Parser::decodeLevels(const std::vector<Tokens>& lines) const {
    std::vector<SoundingDatum> data;
    for (const auto& line : lines) {
        auto type = lineType(line);
        if (!type || !isLevelType(*type)) continue;

        if (auto datum = toDatum(decodeLevelLine(line)))
            data.push_back(*datum);
        else
            VLOG(1) << "Dropping incomplete level: " << joinTokens(line);
    }
    return data;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Single report
// ─────────────────────────────────────────────────────────────────────────────

std::optional<SoundingReport> Parser::parseReport(std::string_view block) const {
    std::vector<std::string_view> lines = splitLines(block);

    if (lines.size() < 3 || isBlank(lines[0]) || isBlank(lines[1]) || isBlank(lines[2]))
        return std::nullopt;

    const DateLine date     = decodeDateLine(splitLine(lines[1]));
    const CapeCin  cape_cin = decodeCapeCinLine(splitLine(lines[2]));

    std::vector<Tokens> body;
    body.reserve(lines.size() - 3);
    for (size_t i = 3; i < lines.size(); ++i)
        body.push_back(splitLine(lines[i]));

    const Tokens* identification = findLine(body, LineType::StationIdentification);
    const Tokens* identifier     = findLine(body, LineType::StationIdentifier);
    if (!identification || !identifier)
        throw ReportError("Failed to parse station identification lines");

    const StationIdentification station = decodeStationIdentificationLine(*identification);
    const StationIdentifier     staid   = decodeStationIdentifierLine(*identifier);

    SoundingReport report;
    report.cape       = cape_cin.cape;
    report.cin        = cape_cin.cin;
    report.date       = date.date;
    report.type       = date.type;
    report.wban       = station.wban;
    report.wmo        = station.wmo;
    report.lat        = station.lat;
    report.lon        = station.lon;
    report.elev       = station.elev;
    report.rtime      = station.rtime;
    report.station_id = staid.station_id;
    report.sonde      = staid.sonde;
    report.wind_units = staid.wind_units;
    report.data       = decodeLevels(body);

    VLOG(2) << "Assembled report " << report.station_id << " @ "
            << toIsoString(report.date) << " with " << report.data.size() << " levels";
    return report;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Batch
// ─────────────────────────────────────────────────────────────────────────────

std::vector<SoundingReport> Parser::parse(std::string_view raw) const {
    std::vector<SoundingReport> reports;

    for (std::string_view block : splitReports(raw)) {
        try {
            std::optional<SoundingReport> report = parseReport(block);
            if (report)
                reports.push_back(std::move(*report));
            else
                VLOG(2) << "Block produced no report (fewer than three header lines)";
        } catch (const ReportError& ex) {
            if (options_.on_report_error == ReportErrorPolicy::Abort)
                throw;
            LOG(WARNING) << "Skipping malformed report: " << ex.what();
        }
    }

    if (reports.empty())
        throw ParseError(kNoReportsMessage);

    return reports;
}

std::vector<SoundingReport> parse(std::string_view raw) {
    return Parser{}.parse(raw);
}

std::vector<SoundingReport> parse(const char* raw) {
    if (raw == nullptr)
        throw InputTypeError("Invalid input. Expected a string.");
    return parse(std::string_view{raw});
}

} // namespace gsd
