// test_parser.cpp – Report assembly and batch parsing against GSD fixtures.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_parser [fixtures-dir]

#include "GSDSounding/Format.hpp"
#include "GSDSounding/Parser.hpp"

#include <glog/logging.h>

#include <cmath>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace gsd;

// ─── Only text reaches parse() ───────────────────────────────────────────────

template <typename T>
constexpr bool kParsable = requires(T v) { gsd::parse(v); };

struct PlainObject {};

static_assert(kParsable<std::string>);
static_assert(kParsable<std::string_view>);
static_assert(kParsable<const char*>);
static_assert(!kParsable<int>);
static_assert(!kParsable<double>);
static_assert(!kParsable<bool>);
static_assert(!kParsable<PlainObject>);

// ─── Utility ─────────────────────────────────────────────────────────────────

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

static const std::string kNoReports =
    "Failed to parse. Ensure the input is a valid GSD formatted string.";

static std::string readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        std::cerr << "FAIL cannot open fixture " << p << '\n';
        ++failures;
        return {};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static bool near(double v, double expect) {
    return std::fabs(v - expect) < 1e-9;
}

// Assemble a single-report block from its header and body lines.
static std::string block(const std::string& date_line,
                         const std::string& staid_line,
                         const std::string& levels = "      4   8500   1526    262     38    225     10\n") {
    return "Op40 analysis valid for grid point 3.9 nm / 40 deg from SGU:\n" +
           date_line + "\n" +
           "   CAPE    120    CIN    -14  Helic  99999     PW  99999\n"
           "      1  23456  99999  37.04 -113.51    862  99999\n"
           "      2  99999  99999  99999     37  99999  99999\n" +
           staid_line + "\n" +
           levels;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: Entry-point input errors
// ─────────────────────────────────────────────────────────────────────────────
static void testInputErrors() {
    std::cout << "\n=== Test: input errors ===\n";

    try {
        (void)parse(static_cast<const char*>(nullptr));
        std::cerr << "FAIL null input: no exception\n"; ++failures;
    } catch (const InputTypeError& ex) {
        CHECK(std::string(ex.what()) == "Invalid input. Expected a string.", "null input → InputTypeError");
    }

    const std::vector<std::string> empty_inputs = {
        "",
        "   \n\n\t\n",
        "hello world\nnot a sounding",
        "\n\nA\nB\n\nC\n",
    };
    for (const auto& in : empty_inputs) {
        try {
            (void)parse(in);
            std::cerr << "FAIL no-report input: no exception\n"; ++failures;
        } catch (const ParseError& ex) {
            CHECK(ex.what() == kNoReports, "no reports → ParseError with exact message");
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: Eighteen hourly RAP soundings
// ─────────────────────────────────────────────────────────────────────────────
static void testRapFixture(const fs::path& dir) {
    std::cout << "\n=== Test: RAP fixture (18 reports) ===\n";

    const std::string text = readFile(dir / "sgu-rap-eighteen-hours.txt");
    std::vector<SoundingReport> reports;
    try {
        reports = parse(text);
    } catch (const std::exception& ex) {
        std::cerr << "FAIL parse RAP fixture: " << ex.what() << '\n'; ++failures;
        return;
    }

    CHECK(reports.size() == 18, "18 reports");

    bool order_ok = true, header_ok = true, coords_ok = true, levels_ok = true;
    for (size_t h = 0; h < reports.size(); ++h) {
        const SoundingReport& r = reports[h];
        char iso[32];
        std::snprintf(iso, sizeof(iso), "2024-06-19T%02zu:00:00.000Z", h);
        order_ok  = order_ok && toIsoString(r.date) == iso;
        header_ok = header_ok && r.type == "Op40" && r.station_id == "SGU" &&
                    r.cape == static_cast<int>(h) * 10 && r.cin == -static_cast<int>(h) &&
                    r.sonde == Sonde::SpaceDataCorp && r.wind_units == WindUnits::Knots &&
                    r.wban == 23456 && !r.wmo && r.elev == 862 && !r.rtime;
        // Odd hours carry the concatenated "37.04-113.51" token
        coords_ok = coords_ok && near(r.lat, 37.04) && near(r.lon, -113.51);
        levels_ok = levels_ok && r.data.size() == 9 &&
                    r.data.front().pressure == 9160 &&
                    r.data.front().temp == 216 + static_cast<int>(h) * 6 &&
                    r.data.back().pressure == 2500;
    }
    CHECK(order_ok,  "reports in input order, hours 00Z..17Z");
    CHECK(header_ok, "header fields on every report");
    CHECK(coords_ok, "lat/lon with and without separator");
    CHECK(levels_ok, "9 valid levels per report; below-ground levels dropped");

    if (!reports.empty() && !reports[0].data.empty()) {
        const SoundingDatum& sfc = reports[0].data[0];
        CHECK(sfc.height == 862 && sfc.dewpt == 51 && sfc.wind_dir == 220 && sfc.wind_spd == 6,
              "surface level values");
        std::cout << reports[0];
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: GTS RAOB reports (optional columns, concatenated lat/lon)
// ─────────────────────────────────────────────────────────────────────────────
static void testRaobFixture(const fs::path& dir) {
    std::cout << "\n=== Test: RAOB fixture ===\n";

    const std::string text = readFile(dir / "raob-gts.txt");
    std::vector<SoundingReport> reports;
    try {
        reports = parse(text);
    } catch (const std::exception& ex) {
        std::cerr << "FAIL parse RAOB fixture: " << ex.what() << '\n'; ++failures;
        return;
    }
    CHECK(reports.size() == 2, "2 reports");
    if (reports.size() != 2) return;

    const SoundingReport& iad = reports[0];
    CHECK(iad.type == "RAOB" && iad.station_id == "IAD",        "IAD header");
    CHECK(toIsoString(iad.date) == "2025-01-01T00:00:00.000Z",  "IAD 00Z 1 JAN");
    CHECK(near(iad.lat, 38.98) && near(iad.lon, -77.47),        "IAD lat/lon from 3898-07747");
    CHECK(iad.wban == 93734 && iad.wmo == 72403,                "IAD wban / wmo");
    CHECK(iad.elev == 88 && !iad.rtime,                         "IAD elev / rtime");
    CHECK(iad.sonde == Sonde::TypeB,                            "IAD sonde");
    CHECK(iad.wind_units == WindUnits::TenthsMetersPerSecond,   "IAD wind units");
    CHECK(iad.cape == 0 && iad.cin == 0,                        "IAD cape/cin");
    CHECK(iad.data.size() == 5,                                 "IAD: 5 valid levels of 7 data lines");
    if (iad.data.size() == 5) {
        CHECK(iad.data[0].pressure == 10140,                    "surface first");
        CHECK(iad.data[1].hhmm == 2 && !iad.data[1].bearing && !iad.data[1].range,
              "hhmm with sentinel bearing / range");
        CHECK(iad.data[2].hhmm == 4 && iad.data[2].bearing == 312 && iad.data[2].range == 1,
              "hhmm / bearing / range");
        CHECK(iad.data[4].pressure == 7000,                     "700 mb kept, 500 mb (no wind) dropped");
    }

    const SoundingReport& nkx = reports[1];
    CHECK(nkx.station_id == "NKX" && nkx.sonde == Sonde::TypeA, "NKX identifier");
    CHECK(toIsoString(nkx.date) == "2024-12-15T12:00:00.000Z",  "NKX 12Z 15 DEC");
    CHECK(nkx.wban == 3190 && nkx.rtime == 1115,                "NKX wban / rtime");
    CHECK(near(nkx.lat, 32.85) && near(nkx.lon, -117.12),       "NKX lat/lon");
    CHECK(nkx.cape == 45 && nkx.cin == -12,                     "NKX cape/cin");
    CHECK(nkx.data.size() == 5,                                 "NKX: 5 levels");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: Level set from options
// ─────────────────────────────────────────────────────────────────────────────
static void testLevelTypes(const fs::path& dir) {
    std::cout << "\n=== Test: configured level types ===\n";

    ParseOptions opts;
    opts.level_types = {LineType::SurfaceLevel, LineType::MandatoryLevel,
                        LineType::SignificantLevel, LineType::WindLevel,
                        LineType::TropopauseLevel, LineType::MaxWindLevel};
    Parser parser(opts);
    CHECK(parser.options().level_types.size() == 6, "options kept by parser");

    auto reports = parser.parse(readFile(dir / "raob-gts.txt"));
    CHECK(reports.size() == 2, "2 reports");
    if (reports.empty()) return;

    // 6 (no temp) and 8 (no temp) stay out; 7 has all required fields.
    const auto& data = reports[0].data;
    CHECK(data.size() == 6, "tropopause level added");
    if (data.size() == 6) {
        CHECK(data[5].pressure == 2000 && data[5].temp == -560 && !data[5].dewpt,
              "tropopause level in source order, no dewpoint");
    }

    ParseOptions surface_only;
    surface_only.level_types = {LineType::SurfaceLevel};
    auto sfc = Parser(surface_only).parse(readFile(dir / "raob-gts.txt"));
    CHECK(!sfc.empty() && sfc[0].data.size() == 1 && sfc[0].data[0].pressure == 10140,
          "surface-only level set");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: Report assembly edge cases
// ─────────────────────────────────────────────────────────────────────────────
static void testAssembly() {
    std::cout << "\n=== Test: report assembly ===\n";

    Parser parser;

    CHECK(!parser.parseReport("line one\nline two").has_value(),  "two lines → no report");
    CHECK(!parser.parseReport("").has_value(),                    "empty block → no report");

    // Levels keep source order even when pressure is not monotonic.
    auto r = parser.parseReport(block("Op40 12 19 JUN 2024", "3 SGU 12 kt",
                                      "4 5000 5810 -121 -253 245 27\n"
                                      "4 8500 1526 262 38 225 10\n"
                                      "4 7000 3141 128 -52 235 18\n"));
    CHECK(r && r->data.size() == 3,                               "three levels");
    CHECK(r && r->data.size() == 3 && r->data[0].pressure == 5000 &&
               r->data[1].pressure == 8500 && r->data[2].pressure == 7000,
          "level order preserved as given");

    // No data lines at all is still a report.
    auto bare = parser.parseReport(block("Op40 12 19 JUN 2024", "3 SGU 12 kt", ""));
    CHECK(bare && bare->data.empty(),                             "report with zero levels");

    // Duplicate identifier lines: the first one wins.
    auto dup = parser.parseReport(block("Op40 12 19 JUN 2024", "3 SGU 12 kt\n3 XXX 10 ms"));
    CHECK(dup && dup->station_id == "SGU" && dup->sonde == Sonde::SpaceDataCorp,
          "first station identifier line wins");

    // Header lines may appear after data lines.
    std::string late =
        "header\nOp40 3 2 MAY 2024\nCAPE 1 CIN 2\n"
        "9 9160 862 216 51 220 6\n"
        "3 SGU 12 kt\n"
        "1 23456 99999 37.04 -113.51 862 99999\n";
    auto lr = parser.parseReport(late);
    CHECK(lr && lr->station_id == "SGU" && lr->data.size() == 1,  "header lines after data lines");

    try {
        (void)parser.parseReport("header\nOp40 3 2 MAY 2024\nCAPE 1 CIN 2\n3 SGU 12 kt\n");
        std::cerr << "FAIL missing type-1 line: no exception\n"; ++failures;
    } catch (const ReportError& ex) {
        CHECK(std::string(ex.what()) == "Failed to parse station identification lines",
              "missing station identification line");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 6: Malformed report handling (abort vs. skip)
// ─────────────────────────────────────────────────────────────────────────────
static void testErrorPolicy() {
    std::cout << "\n=== Test: report error policy ===\n";

    const std::string input =
        block("Op40 12 19 JUN 2024", "3 SGU 12 kt") + "\n" +
        block("Op40 13 19 JUN 2024", "3 SGU 99 kt") + "\n" +
        block("Op40 14 19 JUN 2024", "3 SGU 12 kt");

    try {
        (void)parse(input);
        std::cerr << "FAIL abort policy: no exception\n"; ++failures;
    } catch (const ReportError& ex) {
        CHECK(std::string(ex.what()) == "Unrecognized sonde type: 99", "abort: sonde error propagates");
    }

    ParseOptions skip;
    skip.on_report_error = ReportErrorPolicy::Skip;
    Parser parser(skip);

    auto reports = parser.parse(input);
    CHECK(reports.size() == 2, "skip: two valid reports kept");
    CHECK(reports.size() == 2 &&
          toIsoString(reports[0].date) == "2024-06-19T12:00:00.000Z" &&
          toIsoString(reports[1].date) == "2024-06-19T14:00:00.000Z",
          "skip: order preserved around the bad block");

    try {
        (void)parser.parse(block("Op40 12 19 JUN 2024", "3 SGU 12 xx"));
        std::cerr << "FAIL skip with no survivors: no exception\n"; ++failures;
    } catch (const ParseError& ex) {
        CHECK(ex.what() == kNoReports, "skip: all blocks bad → ParseError");
    }

    try {
        (void)parse(block("Op40 12 31 JUN 2024", "3 SGU 12 kt"));
        std::cerr << "FAIL bad date: no exception\n"; ++failures;
    } catch (const ReportError& ex) {
        CHECK(std::string(ex.what()).find("invalid date") != std::string::npos,
              "abort: calendar error propagates");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 7: Determinism
// ─────────────────────────────────────────────────────────────────────────────
static void testDeterminism(const fs::path& dir) {
    std::cout << "\n=== Test: determinism ===\n";

    const std::string text = readFile(dir / "sgu-rap-eighteen-hours.txt");
    auto first  = parse(text);
    auto second = parse(text);
    CHECK(first == second, "same input → element-wise equal output");

    const std::string raob = readFile(dir / "raob-gts.txt");
    CHECK(parse(raob.c_str()) == parse(std::string_view{raob}), "const char* and string_view agree");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    // Allow overriding the fixtures path via command-line (handy for out-of-tree builds)
    fs::path fixtures = (argc > 1)
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path() / "fixtures";

    std::cout << "Using fixtures: " << fixtures << '\n';

    testInputErrors();
    testRapFixture(fixtures);
    testRaobFixture(fixtures);
    testLevelTypes(fixtures);
    testAssembly();
    testErrorPolicy();
    testDeterminism(fixtures);

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
