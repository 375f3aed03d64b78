#pragma once
// Types.hpp – Core record and option types for the GSD sounding parser.
// All decoded sounding data flows through these structures.

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace gsd {

// Sentinel the GSD format uses for "not applicable / missing".
inline constexpr int kNotApplicable = 99999;

// ─── Line type codes (first token of every line) ──────────────────────────────
// See https://rucsoundings.noaa.gov/raob_format.html
enum class LineType : char {
    StationIdentification = '1', // WBAN WMO LAT LON ELEV RTIME
    SoundingChecks        = '2', // HYDRO MXWD TROPL LINES TINDEX SOURCE
    StationIdentifier     = '3', // STAID SONDE WSUNITS
    MandatoryLevel        = '4',
    SignificantLevel      = '5',
    WindLevel             = '6',
    TropopauseLevel       = '7',
    MaxWindLevel          = '8',
    SurfaceLevel          = '9',
};

// ─── Wind speed units (STAID line) ────────────────────────────────────────────
enum class WindUnits {
    Knots,                // "kt"
    TenthsMetersPerSecond // "ms"
};

// ─── Radiosonde type code from TTBB (GTS data only) ───────────────────────────
enum class Sonde {
    TypeA         = 10, // VIZ "A" type radiosonde
    TypeB         = 11, // VIZ "B" type radiosonde
    SpaceDataCorp = 12, // Space Data Corp. (SDC) radiosonde
};

// ─── One level of a sounding ──────────────────────────────────────────────────
struct SoundingDatum {
    int pressure{0};          // whole mb (original format) or tenths of mb (new format)
    int height{0};            // m
    int temp{0};              // tenths of °C
    std::optional<int> dewpt; // tenths of °C
    int wind_dir{0};          // degrees
    int wind_spd{0};          // knots

    // Hour/minute (UTC) the level was taken; bearing and range (nm) from the
    // ground point. Rarely reported.
    std::optional<int> hhmm;
    std::optional<int> bearing;
    std::optional<int> range;

    bool operator==(const SoundingDatum&) const = default;
};

// ─── One complete sounding report (one text block) ────────────────────────────
struct SoundingReport {
    int cape{0};
    int cin{0};
    std::vector<SoundingDatum> data; // source order, not re-sorted

    std::chrono::sys_seconds date{}; // UTC
    std::string type;                // model / report type, e.g. "Op40" for RAP

    std::optional<int> elev;  // station elevation from station history, m
    double lat{0.0};          // degrees and hundredths
    double lon{0.0};          // degrees and hundredths
    std::optional<int> rtime; // actual release time from TTBB (GTS only)
    std::optional<int> wban;
    std::optional<int> wmo;

    Sonde       sonde{Sonde::TypeA};
    std::string station_id;
    WindUnits   wind_units{WindUnits::Knots};

    bool operator==(const SoundingReport&) const = default;
};

// ─── Parser configuration ─────────────────────────────────────────────────────

// What a batch parse does when one block has a malformed header.
enum class ReportErrorPolicy {
    Abort, // propagate the first ReportError out of parse()
    Skip,  // log it and continue with the next block
};

struct ParseOptions {
    ReportErrorPolicy on_report_error{ReportErrorPolicy::Abort};

    // Line types decoded as data levels.
    std::vector<LineType> level_types{
        LineType::MandatoryLevel,
        LineType::SignificantLevel,
        LineType::SurfaceLevel,
    };
};

} // namespace gsd
