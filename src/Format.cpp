// Format.cpp – Diagnostic rendering of sounding records.

#include "GSDSounding/Format.hpp"

#include <iomanip>
#include <optional>
#include <sstream>

namespace gsd {

std::string toIsoString(std::chrono::sys_seconds t) {
    using namespace std::chrono;

    const sys_days        day_point = floor<days>(t);
    const year_month_day  ymd{day_point};
    const hh_mm_ss        tod{t - day_point};

    // Years 0000..9999 print as four digits; anything else takes the
    // expanded form with an explicit sign and six digits (+010000, -000005).
    const int y = static_cast<int>(ymd.year());

    std::ostringstream os;
    os << std::setfill('0');
    if (y >= 0 && y <= 9999)
        os << std::setw(4) << y;
    else
        os << (y < 0 ? '-' : '+') << std::setw(6) << (y < 0 ? -y : y);
    os << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
       << std::setw(2) << tod.hours().count() << ':'
       << std::setw(2) << tod.minutes().count() << ':'
       << std::setw(2) << tod.seconds().count() << ".000Z";
    return os.str();
}

std::string_view toString(Sonde sonde) noexcept {
    switch (sonde) {
    case Sonde::TypeA:         return "TypeA";
    case Sonde::TypeB:         return "TypeB";
    case Sonde::SpaceDataCorp: return "SpaceDataCorp";
    }
    return "?";
}

std::string_view toString(WindUnits units) noexcept {
    switch (units) {
    case WindUnits::Knots:                 return "kt";
    case WindUnits::TenthsMetersPerSecond: return "ms";
    }
    return "?";
}

std::string_view toString(LineType type) noexcept {
    switch (type) {
    case LineType::StationIdentification: return "identification";
    case LineType::SoundingChecks:        return "checks";
    case LineType::StationIdentifier:     return "identifier";
    case LineType::MandatoryLevel:        return "mandatory";
    case LineType::SignificantLevel:      return "significant";
    case LineType::WindLevel:             return "wind";
    case LineType::TropopauseLevel:       return "tropopause";
    case LineType::MaxWindLevel:          return "maxwind";
    case LineType::SurfaceLevel:          return "surface";
    }
    return "?";
}

// ─── Record dumps ─────────────────────────────────────────────────────────────

namespace {

struct Opt {
    const std::optional<int>& v;
};

std::ostream& operator<<(std::ostream& os, Opt o) {
    if (o.v) return os << *o.v;
    return os << '-';
}

} // namespace

std::ostream& operator<<(std::ostream& os, const SoundingDatum& d) {
    return os << "p=" << d.pressure
              << " z=" << d.height
              << " t=" << d.temp
              << " td=" << Opt{d.dewpt}
              << " dir=" << d.wind_dir
              << " spd=" << d.wind_spd
              << " hhmm=" << Opt{d.hhmm}
              << " brg=" << Opt{d.bearing}
              << " rng=" << Opt{d.range};
}

std::ostream& operator<<(std::ostream& os, const SoundingReport& r) {
    os << r.type << ' ' << r.station_id << ' ' << toIsoString(r.date) << '\n'
       << "  cape=" << r.cape << " cin=" << r.cin << '\n'
       << "  wban=" << Opt{r.wban} << " wmo=" << Opt{r.wmo}
       << " lat=" << std::fixed << std::setprecision(2) << r.lat
       << " lon=" << r.lon << std::defaultfloat
       << " elev=" << Opt{r.elev} << " rtime=" << Opt{r.rtime} << '\n'
       << "  sonde=" << toString(r.sonde) << " wind=" << toString(r.wind_units)
       << " levels=" << r.data.size() << '\n';
    for (const auto& d : r.data)
        os << "    " << d << '\n';
    return os;
}

} // namespace gsd
