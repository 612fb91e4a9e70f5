#pragma once

// Runtime configuration.
// Defaults come from defs.h; a JSON file may override any of them globally
// and per symbol:
//
//   {
//     "recovery": { "dca_trigger_pips": 15, ... },
//     "ladder":   { "pc1_pips": 10, ... },
//     "cascade":  { "window_minutes": 30, ... },
//     "entries":  { "max_open_stacks": 5, ... },
//     "loop":     { "symbols": ["EURUSD", "GBPUSD"], ... },
//     "symbols":  { "GBPUSD": { "dca_trigger_pips": 18, "pc1_pips": 12 } }
//   }

#include "defs.h"
#include <expected>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace fxstack {

struct RecoveryConfig {
  double dca_trigger_pips{fxstack::dca_trigger_pips};
  int dca_max_levels{fxstack::dca_max_levels};
  double dca_volume_multiplier{fxstack::dca_volume_multiplier};

  int momentum_candles{fxstack::momentum_candles};
  double trend_adx_threshold{fxstack::trend_adx_threshold};

  double hedge_trigger_pips{fxstack::hedge_trigger_pips};
  double hedge_volume_multiplier{fxstack::hedge_volume_multiplier};
  int max_hedges{fxstack::max_hedges};

  double hedge_dca_trigger_pips{fxstack::hedge_dca_trigger_pips};
  int hedge_dca_max_levels{fxstack::hedge_dca_max_levels};
  double hedge_dca_volume_multiplier{fxstack::hedge_dca_volume_multiplier};

  // Recovery fraction at which each stage fires, and the share closed
  std::vector<double> hedge_partial_stages{0.5, 0.75, 1.0};
  std::vector<double> hedge_partial_percents{0.5, 0.75, 1.0};

  bool grid_enabled{fxstack::grid_enabled};
  double grid_spacing_pips{fxstack::grid_spacing_pips};
  int grid_max_levels{fxstack::grid_max_levels};
  double grid_volume_multiplier{fxstack::grid_volume_multiplier};

  double stack_stop_loss_usd{fxstack::stack_stop_loss_usd};
  double drawdown_multiple{fxstack::drawdown_multiple};
  double expected_tp_pips{fxstack::expected_tp_pips};
  double profit_target_percent{fxstack::profit_target_percent};
  int max_position_hours{fxstack::max_position_hours};
  double exit_signal_max_pips{fxstack::exit_signal_max_pips};

  double orphan_max_loss_usd{fxstack::orphan_max_loss_usd};
};

struct LadderConfig {
  double pc1_pips{fxstack::pc1_pips};
  double pc1_percent{fxstack::pc1_percent};
  double pc2_pips{fxstack::pc2_pips};
  double pc2_percent{fxstack::pc2_percent};
  bool trailing_enabled{fxstack::trailing_enabled};
  double trailing_distance_pips{fxstack::trailing_distance_pips};
  int pc2_time_limit_minutes{fxstack::pc2_time_limit_minutes};
};

struct CascadeConfig {
  int window_minutes{cascade_window_minutes};
  int min_stops{cascade_min_stops};
  double adx_threshold{cascade_adx_threshold};
  int block_minutes{trend_block_minutes};
  double emergency_loss_usd{fxstack::emergency_loss_usd};
  double trend_block_on_adx{fxstack::trend_block_on_adx};
  double trend_block_off_adx{fxstack::trend_block_off_adx};
  int stale_block_hours{fxstack::stale_block_hours};
};

struct EntryConfig {
  double base_volume{fxstack::base_volume};
  int max_open_stacks{fxstack::max_open_stacks};
  int max_stacks_per_symbol{fxstack::max_stacks_per_symbol};
};

struct LoopConfig {
  int tick_seconds{fxstack::tick_seconds};
  int save_every_ticks{fxstack::save_every_ticks};
  int data_refresh_minutes{fxstack::data_refresh_minutes};
  int fast_bar_count{fxstack::fast_bar_count};
  int slow_bar_count{fxstack::slow_bar_count};
  int adx_period{fxstack::adx_period};
  std::string fast_timeframe{"M15"};
  std::string slow_timeframe{"H1"};
  std::vector<std::string> symbols{"EURUSD", "GBPUSD"};
};

struct ConfigError {
  std::string message;
};

struct Config {
  RecoveryConfig recovery;
  LadderConfig ladder;
  CascadeConfig cascade;
  EntryConfig entries;
  LoopConfig loop;

  // Raw per-symbol objects, merged over the globals on request
  std::map<std::string, nlohmann::json, std::less<>> symbol_overrides;

  RecoveryConfig recovery_for(std::string_view) const;
  LadderConfig ladder_for(std::string_view) const;
};

// Missing file: defaults. Malformed file: error.
std::expected<Config, ConfigError> load_config(const std::string &);

std::expected<Config, ConfigError> parse_config(const nlohmann::json &);

// Paths, URL and token come from the environment
std::string get_env_or_default(std::string_view name,
                               std::string_view default_val);

} // namespace fxstack
