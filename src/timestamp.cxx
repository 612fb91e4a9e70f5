#include "timestamp.h"
#include <cctype>
#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>

namespace fxstack {

Timestamp now_seconds() {
  return std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
}

std::string to_iso(Timestamp tp) { return std::format("{:%FT%TZ}", tp); }

std::optional<Timestamp> parse_iso(std::string_view iso) {
  auto tm = std::tm{};
  auto ss = std::istringstream{std::string{iso}};
  ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

  if (ss.fail())
    return std::nullopt;

  // Skip fractional seconds
  if (ss.peek() == '.') {
    ss.ignore();
    while (std::isdigit(ss.peek()))
      ss.ignore();
  }

  // Only UTC is written by us; accept an explicit zero offset too
  auto rest = std::string{};
  ss >> rest;
  if (not rest.empty() and rest != "Z" and rest != "+00:00")
    return std::nullopt;

  const auto utc = timegm(&tm);
  if (utc == -1)
    return std::nullopt;

  return std::chrono::time_point_cast<std::chrono::seconds>(
      std::chrono::system_clock::from_time_t(utc));
}

} // namespace fxstack
