#include "config.h"
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace fxstack {

namespace {

// Keys absent from the object keep their current value
void apply(const json &j, RecoveryConfig &c) {
  c.dca_trigger_pips = j.value("dca_trigger_pips", c.dca_trigger_pips);
  c.dca_max_levels = j.value("dca_max_levels", c.dca_max_levels);
  c.dca_volume_multiplier =
      j.value("dca_volume_multiplier", c.dca_volume_multiplier);
  c.momentum_candles = j.value("momentum_candles", c.momentum_candles);
  c.trend_adx_threshold = j.value("trend_adx_threshold", c.trend_adx_threshold);
  c.hedge_trigger_pips = j.value("hedge_trigger_pips", c.hedge_trigger_pips);
  c.hedge_volume_multiplier =
      j.value("hedge_volume_multiplier", c.hedge_volume_multiplier);
  c.max_hedges = j.value("max_hedges", c.max_hedges);
  c.hedge_dca_trigger_pips =
      j.value("hedge_dca_trigger_pips", c.hedge_dca_trigger_pips);
  c.hedge_dca_max_levels = j.value("hedge_dca_max_levels", c.hedge_dca_max_levels);
  c.hedge_dca_volume_multiplier =
      j.value("hedge_dca_volume_multiplier", c.hedge_dca_volume_multiplier);
  c.hedge_partial_stages =
      j.value("hedge_partial_stages", c.hedge_partial_stages);
  c.hedge_partial_percents =
      j.value("hedge_partial_percents", c.hedge_partial_percents);
  c.grid_enabled = j.value("grid_enabled", c.grid_enabled);
  c.grid_spacing_pips = j.value("grid_spacing_pips", c.grid_spacing_pips);
  c.grid_max_levels = j.value("grid_max_levels", c.grid_max_levels);
  c.grid_volume_multiplier =
      j.value("grid_volume_multiplier", c.grid_volume_multiplier);
  c.stack_stop_loss_usd = j.value("stack_stop_loss_usd", c.stack_stop_loss_usd);
  c.drawdown_multiple = j.value("drawdown_multiple", c.drawdown_multiple);
  c.expected_tp_pips = j.value("expected_tp_pips", c.expected_tp_pips);
  c.profit_target_percent =
      j.value("profit_target_percent", c.profit_target_percent);
  c.max_position_hours = j.value("max_position_hours", c.max_position_hours);
  c.exit_signal_max_pips = j.value("exit_signal_max_pips", c.exit_signal_max_pips);
  c.orphan_max_loss_usd = j.value("orphan_max_loss_usd", c.orphan_max_loss_usd);
}

void apply(const json &j, LadderConfig &c) {
  c.pc1_pips = j.value("pc1_pips", c.pc1_pips);
  c.pc1_percent = j.value("pc1_percent", c.pc1_percent);
  c.pc2_pips = j.value("pc2_pips", c.pc2_pips);
  c.pc2_percent = j.value("pc2_percent", c.pc2_percent);
  c.trailing_enabled = j.value("trailing_enabled", c.trailing_enabled);
  c.trailing_distance_pips =
      j.value("trailing_distance_pips", c.trailing_distance_pips);
  c.pc2_time_limit_minutes =
      j.value("pc2_time_limit_minutes", c.pc2_time_limit_minutes);
}

void apply(const json &j, CascadeConfig &c) {
  c.window_minutes = j.value("window_minutes", c.window_minutes);
  c.min_stops = j.value("min_stops", c.min_stops);
  c.adx_threshold = j.value("adx_threshold", c.adx_threshold);
  c.block_minutes = j.value("block_minutes", c.block_minutes);
  c.emergency_loss_usd = j.value("emergency_loss_usd", c.emergency_loss_usd);
  c.trend_block_on_adx = j.value("trend_block_on_adx", c.trend_block_on_adx);
  c.trend_block_off_adx = j.value("trend_block_off_adx", c.trend_block_off_adx);
  c.stale_block_hours = j.value("stale_block_hours", c.stale_block_hours);
}

void apply(const json &j, EntryConfig &c) {
  c.base_volume = j.value("base_volume", c.base_volume);
  c.max_open_stacks = j.value("max_open_stacks", c.max_open_stacks);
  c.max_stacks_per_symbol =
      j.value("max_stacks_per_symbol", c.max_stacks_per_symbol);
}

void apply(const json &j, LoopConfig &c) {
  c.tick_seconds = j.value("tick_seconds", c.tick_seconds);
  c.save_every_ticks = j.value("save_every_ticks", c.save_every_ticks);
  c.data_refresh_minutes = j.value("data_refresh_minutes", c.data_refresh_minutes);
  c.fast_bar_count = j.value("fast_bar_count", c.fast_bar_count);
  c.slow_bar_count = j.value("slow_bar_count", c.slow_bar_count);
  c.adx_period = j.value("adx_period", c.adx_period);
  c.fast_timeframe = j.value("fast_timeframe", c.fast_timeframe);
  c.slow_timeframe = j.value("slow_timeframe", c.slow_timeframe);
  c.symbols = j.value("symbols", c.symbols);
}

template <typename Section>
void apply_section(const json &root, std::string_view key, Section &section) {
  if (auto it = root.find(std::string{key}); it != root.end()) {
    if (not it->is_object())
      throw std::invalid_argument{std::format("'{}' must be an object", key)};
    apply(*it, section);
  }
}

std::expected<void, ConfigError> validate(const Config &config) {
  const auto &r = config.recovery;
  if (r.hedge_partial_stages.size() != r.hedge_partial_percents.size())
    return std::unexpected(ConfigError{
        "hedge_partial_stages and hedge_partial_percents differ in length"});
  if (r.dca_trigger_pips <= 0.0 or r.hedge_trigger_pips <= 0.0)
    return std::unexpected(ConfigError{"trigger pips must be positive"});
  if (config.loop.tick_seconds <= 0 or config.loop.save_every_ticks <= 0)
    return std::unexpected(ConfigError{"loop cadence must be positive"});
  if (config.cascade.trend_block_off_adx > config.cascade.trend_block_on_adx)
    return std::unexpected(
        ConfigError{"trend_block_off_adx must not exceed trend_block_on_adx"});
  return {};
}

} // namespace

RecoveryConfig Config::recovery_for(std::string_view symbol) const {
  auto merged = recovery;
  if (auto it = symbol_overrides.find(symbol); it != symbol_overrides.end())
    apply(it->second, merged);
  return merged;
}

LadderConfig Config::ladder_for(std::string_view symbol) const {
  auto merged = ladder;
  if (auto it = symbol_overrides.find(symbol); it != symbol_overrides.end())
    apply(it->second, merged);
  return merged;
}

std::expected<Config, ConfigError> parse_config(const json &root) {
  if (not root.is_object())
    return std::unexpected(ConfigError{"config root must be an object"});

  auto config = Config{};

  try {
    apply_section(root, "recovery", config.recovery);
    apply_section(root, "ladder", config.ladder);
    apply_section(root, "cascade", config.cascade);
    apply_section(root, "entries", config.entries);
    apply_section(root, "loop", config.loop);

    if (auto it = root.find("symbols"); it != root.end()) {
      if (not it->is_object())
        return std::unexpected(ConfigError{"'symbols' must be an object"});

      for (const auto &[symbol, overrides] : it->items()) {
        if (not overrides.is_object())
          return std::unexpected(ConfigError{
              std::format("override for {} must be an object", symbol)});

        // Surface type errors now rather than on first use
        auto probe_recovery = config.recovery;
        auto probe_ladder = config.ladder;
        apply(overrides, probe_recovery);
        apply(overrides, probe_ladder);

        config.symbol_overrides.emplace(symbol, overrides);
      }
    }
  } catch (const json::exception &e) {
    return std::unexpected(ConfigError{e.what()});
  } catch (const std::invalid_argument &e) {
    return std::unexpected(ConfigError{e.what()});
  }

  if (auto ok = validate(config); not ok)
    return std::unexpected(ok.error());

  return config;
}

std::expected<Config, ConfigError> load_config(const std::string &path) {
  if (not std::filesystem::exists(path))
    return Config{};

  auto file = std::ifstream{path};
  if (not file)
    return std::unexpected(ConfigError{std::format("cannot open {}", path)});

  try {
    return parse_config(json::parse(file));
  } catch (const json::parse_error &e) {
    return std::unexpected(
        ConfigError{std::format("{}: {}", path, e.what())});
  }
}

std::string get_env_or_default(std::string_view name,
                               std::string_view default_val) {
  if (const auto *val = std::getenv(std::string{name}.c_str()))
    return val;
  return std::string{default_val};
}

} // namespace fxstack
