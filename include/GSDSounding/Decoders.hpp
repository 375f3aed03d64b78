#pragma once
// Decoders.hpp – Per-line-type decoders for one GSD report.
//
// Header decoders throw ReportError: a malformed header invalidates the whole
// report. The level decoder never throws; sparse levels are routine and are
// filtered by the caller through toDatum().

#include "Tokenizer.hpp"
#include "Types.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gsd {

// Thrown when a report header is missing, malformed or carries an unknown code.
class ReportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─── Decoded header fragments ─────────────────────────────────────────────────

struct DateLine {
    std::chrono::sys_seconds date{};
    std::string              type;
};

struct CapeCin {
    int cape{0};
    int cin{0};
};

struct StationIdentification {
    std::optional<int> wban;
    std::optional<int> wmo;
    double             lat{0.0};
    double             lon{0.0};
    std::optional<int> elev;
    std::optional<int> rtime;
};

struct StationIdentifier {
    std::string station_id;
    Sonde       sonde{Sonde::TypeA};
    WindUnits   wind_units{WindUnits::Knots};
};

// A data line as decoded, before completeness filtering.
struct PartialLevel {
    std::optional<int> pressure;
    std::optional<int> height;
    std::optional<int> temp;
    std::optional<int> dewpt;
    std::optional<int> wind_dir;
    std::optional<int> wind_spd;
    std::optional<int> hhmm;
    std::optional<int> bearing;
    std::optional<int> range;
};

// ─── Code tables ──────────────────────────────────────────────────────────────

// "JAN" → 0 … "DEC" → 11, case-insensitive. Throws ReportError otherwise.
int monthIndex(std::string_view name);

std::optional<Sonde>     sondeFromCode(std::optional<int> code) noexcept;
std::optional<WindUnits> windUnitsFromCode(std::optional<std::string_view> code) noexcept;

// ─── Header lines ─────────────────────────────────────────────────────────────

// TYPE HOUR DAY MONTH YEAR  (e.g. "Op40 18 25 MAR 2024")
[[nodiscard]] DateLine decodeDateLine(const Tokens& tokens);

// CAPE <cape> CIN <cin> ...
[[nodiscard]] CapeCin decodeCapeCinLine(const Tokens& tokens);

// A negative longitude written flush against the latitude ("38.98-77.47")
// arrives as one token in slot 3. Split it on its last internal '-' and
// insert the longitude as its own token so later fields move back into
// their documented slots. No-op for well-formed lines.
void repairLatLon(Tokens& tokens);

// 1 WBAN WMO LAT LON ELEV RTIME. Applies repairLatLon() to its own copy.
[[nodiscard]] StationIdentification decodeStationIdentificationLine(Tokens tokens);

// 3 STAID SONDE WSUNITS
[[nodiscard]] StationIdentifier decodeStationIdentifierLine(const Tokens& tokens);

// ─── Data lines ───────────────────────────────────────────────────────────────

// LINTYP PRESSURE HEIGHT TEMP DEWPT WDIR WSPD [HHMM BEARING RANGE]
[[nodiscard]] PartialLevel decodeLevelLine(const Tokens& tokens);

// A level is usable only if pressure, height, temp, wind direction and wind
// speed are all present. Dewpoint may be absent.
[[nodiscard]] std::optional<SoundingDatum> toDatum(const PartialLevel& level) noexcept;

} // namespace gsd
