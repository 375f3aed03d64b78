// OptionsLoader.cpp – Parses the parser options XML into ParseOptions.
// Uses pugixml for XML parsing.
//
// Document shape:
//   <GSDParser>
//     <Reports onError="abort|skip"/>
//     <Levels>
//       <Level type="mandatory|significant|wind|tropopause|maxwind|surface"/>
//     </Levels>
//   </GSDParser>

#include "GSDSounding/OptionsLoader.hpp"
#include "GSDSounding/Format.hpp"

#include <pugixml.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <string>

namespace gsd {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static ReportErrorPolicy parsePolicy(const char* s) {
    if (!s || *s == '\0')             return ReportErrorPolicy::Abort;
    if (strcmp(s, "abort") == 0)      return ReportErrorPolicy::Abort;
    if (strcmp(s, "skip")  == 0)      return ReportErrorPolicy::Skip;
    throw OptionsLoadError(std::string("Unknown onError policy: '") + s + "'");
}

static LineType parseLevelType(const char* s) {
    static constexpr std::array<LineType, 6> kLevelTypes{
        LineType::MandatoryLevel,  LineType::SignificantLevel, LineType::WindLevel,
        LineType::TropopauseLevel, LineType::MaxWindLevel,     LineType::SurfaceLevel,
    };
    if (s)
        for (LineType t : kLevelTypes)
            if (toString(t) == s) return t;
    throw OptionsLoadError(std::string("Unknown level type: '") + (s ? s : "") + "'");
}

// ─── Document walk ────────────────────────────────────────────────────────────

static ParseOptions parseDocument(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("GSDParser");
    if (!root)
        throw OptionsLoadError("Root element must be <GSDParser>");

    ParseOptions opts;

    if (auto reports = root.child("Reports"); reports)
        opts.on_report_error = parsePolicy(reports.attribute("onError").as_string(""));

    if (auto levels = root.child("Levels"); levels) {
        opts.level_types.clear();
        for (auto level : levels.children("Level")) {
            LineType t = parseLevelType(level.attribute("type").as_string(nullptr));
            if (std::find(opts.level_types.begin(), opts.level_types.end(), t) ==
                opts.level_types.end())
                opts.level_types.push_back(t);
        }
    }

    return opts;
}

// ─── Public entry points ──────────────────────────────────────────────────────

ParseOptions loadOptions(const std::filesystem::path& xml_path) {
    pugi::xml_document     doc;
    pugi::xml_parse_result res = doc.load_file(xml_path.c_str());
    if (!res)
        throw OptionsLoadError("XML parse error in '" + xml_path.string() +
                               "': " + res.description());
    return parseDocument(doc);
}

ParseOptions loadOptionsFromString(std::string_view xml) {
    pugi::xml_document     doc;
    pugi::xml_parse_result res = doc.load_buffer(xml.data(), xml.size());
    if (!res)
        throw OptionsLoadError(std::string("XML parse error: ") + res.description());
    return parseDocument(doc);
}

} // namespace gsd
