#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace fxstack {

// Whole-second UTC time: round-trips exactly through the state file
using Timestamp = std::chrono::sys_seconds;

Timestamp now_seconds();

// "2026-10-17T13:52:00Z"
std::string to_iso(Timestamp);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and
// a trailing "Z" or "+00:00"
std::optional<Timestamp> parse_iso(std::string_view);

} // namespace fxstack
