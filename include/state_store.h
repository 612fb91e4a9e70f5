#pragma once

// State Persistence
// One JSON document holding the tracker and the blocking flags:
//
//   {
//     "version": 1,
//     "positions": { "<ticket>": { ... } },
//     "cascade_blocks": { "EURUSD": "2026-10-17T14:00:00Z" | null },
//     "market_trending_block": { "EURUSD": true },
//     "last_block_update": "2026-10-17T13:00:00Z"
//   }
//
// Unknown fields are ignored and missing optional fields take defaults, so
// older files stay readable.

#include "position_tracker.h"
#include "recovery_policy.h"
#include <expected>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace fxstack {

constexpr auto state_version = 1;

struct StateError {
  std::string message;
};

struct PersistedState {
  std::map<Ticket, TrackedPosition> positions;
  BlockingState blocking;

  bool operator==(const PersistedState &) const = default;
};

nlohmann::json to_json(const PersistedState &);

// Any structural problem is an error, never a silently empty book
std::expected<PersistedState, StateError> from_json(const nlohmann::json &);

class StateStore {
public:
  explicit StateStore(std::filesystem::path);

  // Write <path>.tmp then rename over <path>
  std::expected<void, StateError> save(const PersistedState &) const;

  // Missing file: empty state. Malformed file: error.
  std::expected<PersistedState, StateError> load() const;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace fxstack
