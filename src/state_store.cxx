#include "state_store.h"
#include <charconv>
#include <format>
#include <fstream>
#include <print>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace fxstack {

namespace {

// Structural problems below throw; from_json turns them into StateError
struct Malformed : std::runtime_error {
  using std::runtime_error::runtime_error;
};

std::string side_name(Side side) { return side == Side::buy ? "buy" : "sell"; }

Side side_from(const json &j, const char *key) {
  const auto name = j.at(key).get<std::string>();
  if (name == "buy")
    return Side::buy;
  if (name == "sell")
    return Side::sell;
  throw Malformed{std::format("bad side '{}'", name)};
}

json time_or_null(const std::optional<Timestamp> &ts) {
  return ts ? json(to_iso(*ts)) : json(nullptr);
}

Timestamp time_from(const json &j) {
  const auto text = j.get<std::string>();
  if (auto ts = parse_iso(text))
    return *ts;
  throw Malformed{std::format("bad timestamp '{}'", text)};
}

std::optional<Timestamp> optional_time(const json &j, const char *key) {
  if (auto it = j.find(key); it != j.end() and not it->is_null())
    return time_from(*it);
  return std::nullopt;
}

Ticket ticket_from_key(const std::string &key) {
  auto ticket = Ticket{};
  auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), ticket);
  if (ec != std::errc{} or ptr != key.data() + key.size() or ticket == 0)
    throw Malformed{std::format("bad ticket key '{}'", key)};
  return ticket;
}

json levels_to_json(const std::vector<DcaLevel> &levels) {
  auto out = json::array();
  for (const auto &dca : levels)
    out.push_back({{"ticket", dca.ticket},
                   {"level_index", dca.level_index},
                   {"volume", dca.volume},
                   {"entry_price", dca.entry_price},
                   {"partial_stage", dca.partial_stage}});
  return out;
}

std::vector<DcaLevel> levels_from_json(const json &j, const char *key) {
  auto levels = std::vector<DcaLevel>{};
  if (auto it = j.find(key); it != j.end())
    for (const auto &d : *it)
      levels.push_back({.ticket = d.at("ticket").get<Ticket>(),
                        .level_index = d.at("level_index").get<int>(),
                        .volume = d.at("volume").get<double>(),
                        .entry_price = d.at("entry_price").get<double>(),
                        .partial_stage = d.value("partial_stage", 0)});
  return levels;
}

json position_to_json(const TrackedPosition &pos) {
  auto hedges = json::array();
  for (const auto &hedge : pos.hedges)
    hedges.push_back({{"ticket", hedge.ticket},
                      {"side", side_name(hedge.side)},
                      {"volume", hedge.volume},
                      {"entry_price", hedge.entry_price},
                      {"trigger_pips", hedge.trigger_pips},
                      {"partial_stage", hedge.partial_stage},
                      {"dca_levels", levels_to_json(hedge.dca_levels)}});

  const auto &flags = pos.partial_close;
  const auto &trail = pos.trailing_stop;

  return {
      {"ticket", pos.ticket},
      {"symbol", pos.symbol},
      {"side", side_name(pos.side)},
      {"entry_price", pos.entry_price},
      {"initial_volume", pos.initial_volume},
      {"current_volume", pos.current_volume},
      {"opened_at", to_iso(pos.opened_at)},
      {"role", std::string{to_string(pos.role)}},
      {"is_grid_child", pos.is_grid_child()},
      {"grid_parent", pos.grid_parent ? json(*pos.grid_parent) : json(nullptr)},
      {"grid_level", pos.grid_level},
      {"dca_levels", levels_to_json(pos.dca_levels)},
      {"hedges", std::move(hedges)},
      {"partial_close_flags",
       {{"pc1_closed", flags.pc1_closed},
        {"pc2_closed", flags.pc2_closed},
        {"pc2_trigger_time", time_or_null(flags.pc2_trigger_time)}}},
      {"trailing_stop",
       {{"active", trail.active},
        {"stop_price", trail.stop_price},
        {"distance_pips", trail.distance_pips},
        {"peak_price", trail.peak_price}}},
      {"realized_pnl", pos.realized_pnl},
      {"recovery_engaged", pos.recovery_engaged},
      {"recovery_active", pos.recovery_active()},
      {"pending_close",
       pos.pending_close ? json(*pos.pending_close) : json(nullptr)}};
}

TrackedPosition position_from_json(Ticket key, const json &j) {
  if (not j.is_object())
    throw Malformed{std::format("position {} is not an object", key)};

  auto pos = TrackedPosition{};
  pos.ticket = j.value("ticket", key);
  if (pos.ticket != key)
    throw Malformed{
        std::format("position keyed {} claims ticket {}", key, pos.ticket)};

  pos.symbol = j.at("symbol").get<std::string>();
  if (pos.symbol.empty())
    throw Malformed{std::format("position {} has no symbol", key)};

  pos.side = side_from(j, "side");
  pos.entry_price = j.at("entry_price").get<double>();
  pos.initial_volume = j.at("initial_volume").get<double>();
  pos.current_volume = j.value("current_volume", pos.initial_volume);
  pos.opened_at = time_from(j.at("opened_at"));

  // Files written before roles existed only carry the flag
  const auto role_name =
      j.value("role", std::string{j.value("is_grid_child", false)
                                      ? "grid_child"
                                      : "standalone"});
  const auto role = stack_role_from_string(role_name);
  if (not role)
    throw Malformed{std::format("position {} has bad role '{}'", key, role_name)};
  pos.role = *role;

  if (auto it = j.find("grid_parent"); it != j.end() and not it->is_null())
    pos.grid_parent = it->get<Ticket>();
  pos.grid_level = j.value("grid_level", 0);

  pos.dca_levels = levels_from_json(j, "dca_levels");

  if (auto it = j.find("hedges"); it != j.end())
    for (const auto &h : *it)
      pos.hedges.push_back(
          {.ticket = h.at("ticket").get<Ticket>(),
           .side = h.contains("side") ? side_from(h, "side") : opposite(pos.side),
           .volume = h.at("volume").get<double>(),
           .entry_price = h.at("entry_price").get<double>(),
           .trigger_pips = h.value("trigger_pips", 0.0),
           .partial_stage = h.value("partial_stage", 0),
           .dca_levels = levels_from_json(h, "dca_levels")});

  if (auto it = j.find("partial_close_flags"); it != j.end()) {
    pos.partial_close.pc1_closed = it->value("pc1_closed", false);
    pos.partial_close.pc2_closed = it->value("pc2_closed", false);
    pos.partial_close.pc2_trigger_time = optional_time(*it, "pc2_trigger_time");
  }

  if (auto it = j.find("trailing_stop"); it != j.end()) {
    pos.trailing_stop.active = it->value("active", false);
    pos.trailing_stop.stop_price = it->value("stop_price", 0.0);
    pos.trailing_stop.distance_pips = it->value("distance_pips", 0.0);
    pos.trailing_stop.peak_price = it->value("peak_price", 0.0);
  }

  pos.realized_pnl = j.value("realized_pnl", 0.0);
  pos.recovery_engaged =
      j.value("recovery_engaged", false) or pos.recovery_active();

  if (auto it = j.find("pending_close"); it != j.end() and not it->is_null())
    pos.pending_close = it->get<std::string>();

  return pos;
}

} // namespace

json to_json(const PersistedState &state) {
  auto positions = json::object();
  for (const auto &[ticket, pos] : state.positions)
    positions[std::to_string(ticket)] = position_to_json(pos);

  auto blocks = json::object();
  for (const auto &[symbol, until] : state.blocking.cascade_blocks)
    blocks[symbol] = time_or_null(until);

  auto trending = json::object();
  for (const auto &[symbol, blocked] : state.blocking.market_trending_block)
    trending[symbol] = blocked;

  return {{"version", state_version},
          {"positions", std::move(positions)},
          {"cascade_blocks", std::move(blocks)},
          {"market_trending_block", std::move(trending)},
          {"last_block_update",
           time_or_null(state.blocking.last_block_update)}};
}

std::expected<PersistedState, StateError> from_json(const json &j) {
  if (not j.is_object())
    return std::unexpected(StateError{"state root is not an object"});

  auto state = PersistedState{};

  try {
    const auto version = j.value("version", state_version);
    if (version > state_version)
      return std::unexpected(StateError{
          std::format("state version {} is newer than {}", version,
                      state_version)});

    if (auto it = j.find("positions"); it != j.end()) {
      if (not it->is_object())
        return std::unexpected(StateError{"'positions' is not an object"});
      for (const auto &[key, value] : it->items()) {
        const auto ticket = ticket_from_key(key);
        state.positions.emplace(ticket, position_from_json(ticket, value));
      }
    }

    if (auto it = j.find("cascade_blocks"); it != j.end())
      for (const auto &[symbol, until] : it->items())
        state.blocking.cascade_blocks[symbol] =
            until.is_null() ? std::nullopt
                            : std::optional<Timestamp>{time_from(until)};

    if (auto it = j.find("market_trending_block"); it != j.end())
      for (const auto &[symbol, blocked] : it->items())
        state.blocking.market_trending_block[symbol] = blocked.get<bool>();

    state.blocking.last_block_update = optional_time(j, "last_block_update");

  } catch (const json::exception &e) {
    return std::unexpected(StateError{e.what()});
  } catch (const Malformed &e) {
    return std::unexpected(StateError{e.what()});
  }

  return state;
}

StateStore::StateStore(std::filesystem::path path) : path_{std::move(path)} {}

std::expected<void, StateError>
StateStore::save(const PersistedState &state) const {
  auto ec = std::error_code{};
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec)
      return std::unexpected(StateError{std::format(
          "cannot create {}: {}", path_.parent_path().string(), ec.message())});
  }

  auto tmp = path_;
  tmp += ".tmp";

  {
    auto file = std::ofstream{tmp, std::ios::trunc};
    if (not file)
      return std::unexpected(
          StateError{std::format("cannot open {}", tmp.string())});

    try {
      file << to_json(state).dump(2) << '\n';
    } catch (const json::exception &e) {
      return std::unexpected(StateError{e.what()});
    }
    file.flush();
    if (not file)
      return std::unexpected(
          StateError{std::format("write to {} failed", tmp.string())});
  }

  std::filesystem::rename(tmp, path_, ec);
  if (ec)
    return std::unexpected(StateError{std::format(
        "cannot rename {} to {}: {}", tmp.string(), path_.string(),
        ec.message())});

  return {};
}

std::expected<PersistedState, StateError> StateStore::load() const {
  if (not std::filesystem::exists(path_))
    return PersistedState{};

  auto file = std::ifstream{path_};
  if (not file)
    return std::unexpected(
        StateError{std::format("cannot open {}", path_.string())});

  try {
    auto loaded = from_json(json::parse(file));
    if (not loaded)
      return std::unexpected(StateError{
          std::format("{}: {}", path_.string(), loaded.error().message)});
    return loaded;
  } catch (const json::parse_error &e) {
    return std::unexpected(
        StateError{std::format("{}: {}", path_.string(), e.what())});
  }
}

} // namespace fxstack
