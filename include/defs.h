#pragma once

// Default recovery, exit and protection parameters.
// Every constant here is the default of a config key (see config.h);
// per-symbol tuning lives in the config file, not in code.

namespace fxstack {

// DCA (same-direction averaging into a ranging loss)
constexpr auto dca_trigger_pips = 15.0;      // Pips underwater per DCA level
constexpr auto dca_max_levels = 3;           // Max averaging orders per stack
constexpr auto dca_volume_multiplier = 1.0;  // x initial volume

// Momentum safeguard (fast timeframe candles + ADX)
constexpr auto momentum_candles = 3;          // Consecutive same-direction M15 candles
constexpr auto trend_adx_threshold = 30.0;    // ADX at or above this = trending

// Hedge (opposite-direction offset in a trending loss)
constexpr auto hedge_trigger_pips = 40.0;
constexpr auto hedge_volume_multiplier = 2.0; // x current exposure
constexpr auto max_hedges = 1;

// Hedge DCA (original-direction order attached to an underwater hedge)
constexpr auto hedge_dca_trigger_pips = 20.0;
constexpr auto hedge_dca_max_levels = 2;
constexpr auto hedge_dca_volume_multiplier = 0.5; // x hedge volume

// Grid (pyramid into profit, disabled by default)
constexpr auto grid_enabled = false;
constexpr auto grid_spacing_pips = 20.0;
constexpr auto grid_max_levels = 2;
constexpr auto grid_volume_multiplier = 1.0;

// Stack exits
constexpr auto stack_stop_loss_usd = 20.0;    // Realised + unrealised loss limit
constexpr auto drawdown_multiple = 4.0;       // x expected take-profit value
constexpr auto expected_tp_pips = 20.0;
constexpr auto profit_target_percent = 0.5;   // % of balance
constexpr auto max_position_hours = 24;
constexpr auto exit_signal_max_pips = 10.0;

// Partial close ladder and trailing stop (non-recovery path)
constexpr auto pc1_pips = 10.0;
constexpr auto pc1_percent = 0.25;            // of current volume
constexpr auto pc2_pips = 20.0;
constexpr auto pc2_percent = 0.25;            // of initial volume
constexpr auto trailing_enabled = true;
constexpr auto trailing_distance_pips = 10.0;
constexpr auto pc2_time_limit_minutes = 60;

// Cascade protection
constexpr auto cascade_window_minutes = 30;
constexpr auto cascade_min_stops = 2;
constexpr auto cascade_adx_threshold = 25.0;
constexpr auto trend_block_minutes = 60;
constexpr auto emergency_loss_usd = 100.0;    // 0 disables
constexpr auto orphan_max_loss_usd = 75.0;

// Trend block hysteresis
constexpr auto trend_block_on_adx = 30.0;
constexpr auto trend_block_off_adx = 25.0;
constexpr auto stale_block_hours = 2;

// Entries
constexpr auto base_volume = 0.01;
constexpr auto max_open_stacks = 5;
constexpr auto max_stacks_per_symbol = 2;

// Loop timing
constexpr auto tick_seconds = 15;
constexpr auto save_every_ticks = 10;
constexpr auto data_refresh_minutes = 5;
constexpr auto fast_bar_count = 20;           // M15 bars for momentum checks
constexpr auto slow_bar_count = 100;          // H1 bars for ADX
constexpr auto adx_period = 14;

// Recovery parameter sanity checks
static_assert(dca_trigger_pips > 0.0, "DCA trigger must be positive");
static_assert(hedge_trigger_pips > dca_trigger_pips,
              "Hedge is the later line of defence - must trigger after DCA");
static_assert(dca_max_levels >= 0 and dca_max_levels <= 10,
              "DCA levels must be 0-10");
static_assert(hedge_volume_multiplier > 0.0 and hedge_volume_multiplier <= 5.0,
              "Hedge multiplier must be in (0, 5]");
static_assert(hedge_dca_max_levels >= 0 and hedge_dca_max_levels <= 5,
              "Hedge DCA levels must be 0-5");
static_assert(momentum_candles >= 2, "Momentum needs at least 2 candles");
static_assert(fast_bar_count > momentum_candles,
              "Need more fast bars than momentum candles");
static_assert(slow_bar_count > 2 * adx_period,
              "ADX needs at least two periods of history");

// Exit parameter sanity checks
static_assert(stack_stop_loss_usd > 0.0, "Stack stop loss must be positive");
static_assert(drawdown_multiple >= 1.0, "Drawdown guard must be >= 1x TP");
static_assert(profit_target_percent > 0.0 and profit_target_percent <= 10.0,
              "Profit target must be in (0, 10] percent of balance");
static_assert(max_position_hours > 0, "Time limit must be positive");
static_assert(pc2_pips > pc1_pips, "PC2 must be further than PC1");
static_assert(pc1_percent + pc2_percent < 1.0,
              "Partial closes must leave a runner");
static_assert(trailing_distance_pips > 0.0, "Trailing distance must be positive");

// Protection sanity checks
static_assert(cascade_min_stops >= 2, "A single stop-out is noise, not a cascade");
static_assert(trend_block_off_adx <= trend_block_on_adx,
              "Trend block needs on >= off for hysteresis");
static_assert(orphan_max_loss_usd > 0.0, "Orphan threshold must be positive");
static_assert(emergency_loss_usd >= 0.0, "Emergency threshold cannot be negative");

// Entry sanity checks
static_assert(base_volume > 0.0 and base_volume <= 1.0,
              "Base volume must be in (0, 1] lots");
static_assert(max_stacks_per_symbol <= max_open_stacks,
              "Per-symbol stack limit cannot exceed the global limit");
static_assert(tick_seconds > 0 and tick_seconds <= 60,
              "Tick cadence should be 1-60 seconds");

} // namespace fxstack
