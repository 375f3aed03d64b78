#pragma once
// OptionsLoader.hpp – Parses a GSD parser XML options file into ParseOptions.

#include "Types.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gsd {

// Thrown when the XML is structurally invalid or carries an unknown value.
class OptionsLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Loads parser options from the given XML file path.
// Throws OptionsLoadError on any parse or validation failure.
ParseOptions loadOptions(const std::filesystem::path& xml_path);

// Same as loadOptions(), from an in-memory XML document.
ParseOptions loadOptionsFromString(std::string_view xml);

} // namespace gsd
