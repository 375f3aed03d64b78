// Decoders.cpp – Positional decoders for the GSD header and data lines.
//
// Header layout (one report):
//   line 1   free-text station / model description
//   line 2   TYPE HOUR DAY MONTH YEAR
//   line 3   CAPE <n> CIN <n> Helic <n> PW <n>
//   type 1   WBAN WMO LAT LON ELEV RTIME
//   type 3   STAID SONDE WSUNITS
//   type 4/5/9 data levels; 2/6/7/8 are not decoded by default

#include "GSDSounding/Decoders.hpp"

#include <array>
#include <cctype>
#include <string>

namespace gsd {

// ─────────────────────────────────────────────────────────────────────────────
//  Code tables
// ─────────────────────────────────────────────────────────────────────────────

int monthIndex(std::string_view name) {
    static constexpr std::array<std::string_view, 12> kMonths{
        "JAN", "FEB", "MAR", "APR", "MAY", "JUN",
        "JUL", "AUG", "SEP", "OCT", "NOV", "DEC",
    };

    std::string upper(name);
    for (char& c : upper)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    for (size_t i = 0; i < kMonths.size(); ++i)
        if (kMonths[i] == upper) return static_cast<int>(i);

    throw ReportError("Invalid month: " + std::string(name));
}

std::optional<Sonde> sondeFromCode(std::optional<int> code) noexcept {
    if (!code) return std::nullopt;
    switch (*code) {
    case static_cast<int>(Sonde::TypeA):         return Sonde::TypeA;
    case static_cast<int>(Sonde::TypeB):         return Sonde::TypeB;
    case static_cast<int>(Sonde::SpaceDataCorp): return Sonde::SpaceDataCorp;
    default:                                     return std::nullopt;
    }
}

std::optional<WindUnits> windUnitsFromCode(std::optional<std::string_view> code) noexcept {
    if (!code) return std::nullopt;
    if (*code == "kt") return WindUnits::Knots;
    if (*code == "ms") return WindUnits::TenthsMetersPerSecond;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Date / type line
// ─────────────────────────────────────────────────────────────────────────────

DateLine decodeDateLine(const Tokens& tokens) {
    using namespace std::chrono;

    auto type = tokenAt(tokens, 0);
    if (!type)
        throw ReportError("Failed to parse type from date line");

    // Presence is checked independently of value: hour 00 and JAN (index 0)
    // are ordinary values.
    const auto hour_tok  = tokenAt(tokens, 1);
    const auto day_tok   = tokenAt(tokens, 2);
    const auto month_tok = tokenAt(tokens, 3);
    const auto year_tok  = tokenAt(tokens, 4);

    const std::optional<int> month = month_tok ? std::optional<int>(monthIndex(*month_tok))
                                               : std::nullopt;
    const std::optional<int> hour  = parseInteger(hour_tok);
    const std::optional<int> day   = parseInteger(day_tok);
    const std::optional<int> yr    = parseInteger(year_tok);

    if (!(hour && day && month && yr))
        throw ReportError("Failed to parse date from date line");

    const auto invalid = [&] {
        return ReportError("Failed to parse date line: invalid date " +
                           std::to_string(*yr) + "-" + std::string(*month_tok) + "-" +
                           std::to_string(*day) + " " + std::to_string(*hour) + "Z");
    };

    // Range-check before construction: chrono::day keeps only 8 bits and
    // chrono::year only 16, so larger values would wrap into valid dates.
    if (*day < 1 || *day > 31 || *hour < 0 || *hour > 23 ||
        *yr < static_cast<int>(year::min()) || *yr > static_cast<int>(year::max()))
        throw invalid();

    const year_month_day ymd{year{*yr},
                             std::chrono::month{static_cast<unsigned>(*month + 1)},
                             std::chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok())
        throw invalid();

    DateLine out;
    out.type = std::string(*type);
    out.date = sys_seconds{sys_days{ymd}} + hours{*hour};
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  CAPE / CIN line
// ─────────────────────────────────────────────────────────────────────────────

CapeCin decodeCapeCinLine(const Tokens& tokens) {
    const auto cape = parseInteger(tokenAt(tokens, 1));
    const auto cin  = parseInteger(tokenAt(tokens, 3));

    if (!cape || !cin)
        throw ReportError("Failed to parse cape/cin line");

    return CapeCin{*cape, *cin};
}

// ─────────────────────────────────────────────────────────────────────────────
//  Station identification line (type 1)
// ─────────────────────────────────────────────────────────────────────────────

void repairLatLon(Tokens& tokens) {
    if (tokens.size() < 4) return;

    const std::string& lat_lon = tokens[3];
    if (isNumber(lat_lon)) return;

    const size_t minus = lat_lon.rfind('-');
    if (minus == std::string::npos || minus == 0) return;

    std::string lat = lat_lon.substr(0, minus);
    std::string lon = lat_lon.substr(minus); // keeps the '-'

    tokens[3] = std::move(lat);
    tokens.insert(tokens.begin() + 4, std::move(lon));
}

StationIdentification decodeStationIdentificationLine(Tokens tokens) {
    if (!tokenAt(tokens, 3))
        throw ReportError("Failed to parse station identification line");

    repairLatLon(tokens);

    const auto lat = parseDecimal(tokenAt(tokens, 3));
    const auto lon = parseDecimal(tokenAt(tokens, 4));
    if (!lat || !lon)
        throw ReportError("Failed to parse lat/lon from station identification line");

    StationIdentification out;
    out.wban  = parseInteger(tokenAt(tokens, 1));
    out.wmo   = parseInteger(tokenAt(tokens, 2));
    out.lat   = *lat;
    out.lon   = *lon;
    out.elev  = parseInteger(tokenAt(tokens, 5));
    out.rtime = parseInteger(tokenAt(tokens, 6));
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Station identifier line (type 3)
// ─────────────────────────────────────────────────────────────────────────────

StationIdentifier decodeStationIdentifierLine(const Tokens& tokens) {
    const auto station_id = tokenAt(tokens, 1);
    if (!station_id || station_id->empty())
        throw ReportError("Failed to parse stationId from station identifier line");

    const auto sonde_tok = tokenAt(tokens, 2);
    const auto sonde     = sondeFromCode(parseInteger(sonde_tok));
    if (!sonde)
        throw ReportError("Unrecognized sonde type: " +
                          std::string(sonde_tok ? *sonde_tok : "<missing>"));

    const auto units_tok  = tokenAt(tokens, 3);
    const auto wind_units = windUnitsFromCode(units_tok);
    if (!wind_units)
        throw ReportError("Unrecognized wind units: " +
                          std::string(units_tok ? *units_tok : "<missing>"));

    StationIdentifier out;
    out.station_id = std::string(*station_id);
    out.sonde      = *sonde;
    out.wind_units = *wind_units;
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Data lines (types 4, 5, 9)
// ─────────────────────────────────────────────────────────────────────────────

PartialLevel decodeLevelLine(const Tokens& tokens) {
    PartialLevel lvl;
    lvl.pressure = parseInteger(tokenAt(tokens, 1));
    lvl.height   = parseInteger(tokenAt(tokens, 2));
    lvl.temp     = parseInteger(tokenAt(tokens, 3));
    lvl.dewpt    = parseInteger(tokenAt(tokens, 4));
    lvl.wind_dir = parseInteger(tokenAt(tokens, 5));
    lvl.wind_spd = parseInteger(tokenAt(tokens, 6));
    lvl.hhmm     = parseInteger(tokenAt(tokens, 7));
    lvl.bearing  = parseInteger(tokenAt(tokens, 8));
    lvl.range    = parseInteger(tokenAt(tokens, 9));
    return lvl;
}

std::optional<SoundingDatum> toDatum(const PartialLevel& level) noexcept {
    if (!(level.pressure && level.height && level.temp && level.wind_dir && level.wind_spd))
        return std::nullopt;

    SoundingDatum d;
    d.pressure = *level.pressure;
    d.height   = *level.height;
    d.temp     = *level.temp;
    d.dewpt    = level.dewpt;
    d.wind_dir = *level.wind_dir;
    d.wind_spd = *level.wind_spd;
    d.hhmm     = level.hhmm;
    d.bearing  = level.bearing;
    d.range    = level.range;
    return d;
}

} // namespace gsd
