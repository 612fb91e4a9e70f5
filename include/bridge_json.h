#pragma once

// Terminal bridge payloads. Kept apart from the HTTP client so a body can be
// decoded without a connection.

#include "broker.h"
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace fxstack {

// One entry of the /positions list; nullopt if a field is missing or mistyped
std::optional<PositionRecord> position_from_json(const nlohmann::json &);

// Whole /positions body. A malformed entry is logged and skipped; only a
// body that is not JSON at all is an error.
std::expected<std::vector<PositionRecord>, BrokerError>
parse_positions(std::string_view body);

} // namespace fxstack
