#pragma once
// Format.hpp – Human-readable rendering of decoded soundings (logs, tests).
// This is a diagnostic dump, not GSD text.

#include "Types.hpp"

#include <chrono>
#include <ostream>
#include <string>
#include <string_view>

namespace gsd {

// 2024-03-25T18:00:00.000Z
[[nodiscard]] std::string toIsoString(std::chrono::sys_seconds t);

[[nodiscard]] std::string_view toString(Sonde sonde) noexcept;      // "TypeA", …
[[nodiscard]] std::string_view toString(WindUnits units) noexcept;  // "kt" / "ms"
[[nodiscard]] std::string_view toString(LineType type) noexcept;    // "mandatory", …

std::ostream& operator<<(std::ostream& os, const SoundingDatum& d);
std::ostream& operator<<(std::ostream& os, const SoundingReport& r);

} // namespace gsd
