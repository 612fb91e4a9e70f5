#include "recovery_policy.h"
#include "indicators.h"
#include <algorithm>
#include <format>
#include <utility>

namespace fxstack {

namespace {

constexpr CloseReason all_reasons[] = {
    CloseReason::stack_stop_loss, CloseReason::stack_drawdown,
    CloseReason::profit_target,   CloseReason::time_limit,
    CloseReason::exit_signal,     CloseReason::trailing_stop,
    CloseReason::pc2_time_limit,  CloseReason::cascade_protection,
    CloseReason::account_emergency};

// Next DCA level is one past the highest taken
int next_level(const std::vector<DcaLevel> &levels) {
  auto highest = 0;
  for (const auto &dca : levels)
    highest = std::max(highest, dca.level_index);
  return highest + 1;
}

std::string trend_reason(const MarketContext &ctx, Side side,
                         const RecoveryConfig &config) {
  const auto candles = trailing_candles(ctx.fast_bars, against(side));
  if (ctx.adx and *ctx.adx >= config.trend_adx_threshold)
    return std::format("trending: adx {:.1f} >= {:.1f}", *ctx.adx,
                       config.trend_adx_threshold);
  return std::format("momentum: {} consecutive candles against", candles);
}

} // namespace

std::string_view to_string(CloseReason reason) {
  switch (reason) {
  case CloseReason::stack_stop_loss:
    return "stack_stop_loss";
  case CloseReason::stack_drawdown:
    return "stack_drawdown";
  case CloseReason::profit_target:
    return "profit_target";
  case CloseReason::time_limit:
    return "time_limit";
  case CloseReason::exit_signal:
    return "exit_signal";
  case CloseReason::trailing_stop:
    return "trailing_stop";
  case CloseReason::pc2_time_limit:
    return "pc2_time_limit";
  case CloseReason::cascade_protection:
    return "cascade_protection";
  case CloseReason::account_emergency:
    return "account_emergency";
  }
  return "unknown";
}

std::optional<CloseReason> close_reason_from_string(std::string_view name) {
  for (auto reason : all_reasons)
    if (to_string(reason) == name)
      return reason;
  return std::nullopt;
}

bool is_trending(const MarketContext &ctx, Side side,
                 const RecoveryConfig &config) {
  if (ctx.adx and *ctx.adx >= config.trend_adx_threshold)
    return true;
  return trailing_candles(ctx.fast_bars, against(side)) >=
         config.momentum_candles;
}

double hedge_trigger_pips(const TrackedPosition &pos, const Hedge &hedge,
                          double pip_size) {
  if (hedge.trigger_pips > 0.0)
    return hedge.trigger_pips;
  return pips_against(pos.side, pos.entry_price, hedge.entry_price, pip_size);
}

RecoveryPlan evaluate_recovery(const TrackedPosition &pos,
                               const MarketContext &ctx,
                               const RecoveryConfig &config,
                               int grid_children) {
  auto plan = RecoveryPlan{};

  const auto pip = ctx.info.pip_size;
  const auto against_pips =
      pips_against(pos.side, pos.entry_price, ctx.mark(pos.side), pip);
  const auto trending = is_trending(ctx, pos.side, config);

  // Grid: pyramid into profit, originals only, never once recovery started
  if (config.grid_enabled and can_spawn_grid(pos.role) and
      pos.exit_ladder_allowed()) {
    const auto level = grid_children + 1;
    if (level <= config.grid_max_levels and
        -against_pips >= level * config.grid_spacing_pips)
      plan.actions.push_back(
          OpenGrid{.parent = pos.ticket,
                   .level = level,
                   .side = pos.side,
                   .volume = pos.initial_volume * config.grid_volume_multiplier});
  }

  // DCA: averaging belongs to ranging markets, and stops once hedged
  if (pos.hedges.empty()) {
    const auto level = next_level(pos.dca_levels);
    if (level <= config.dca_max_levels and
        against_pips >= level * config.dca_trigger_pips) {
      if (trending)
        plan.blocked.push_back({.parent = pos.ticket,
                                .kind = RecoveryKind::dca,
                                .pips_underwater = against_pips,
                                .reason = trend_reason(ctx, pos.side, config)});
      else
        plan.actions.push_back(OpenDca{
            .parent = pos.ticket,
            .level = level,
            .side = pos.side,
            .volume = pos.initial_volume * config.dca_volume_multiplier,
            .pips_underwater = against_pips});
    }
  }

  // Hedge: the trending case
  if (std::cmp_less(pos.hedges.size(), config.max_hedges) and
      against_pips >= config.hedge_trigger_pips) {
    if (trending)
      plan.actions.push_back(OpenHedge{
          .parent = pos.ticket,
          .side = opposite(pos.side),
          .volume = config.hedge_volume_multiplier * pos.exposure(),
          .trigger_pips = against_pips});
    else
      plan.blocked.push_back({.parent = pos.ticket,
                              .kind = RecoveryKind::hedge,
                              .pips_underwater = against_pips,
                              .reason = "market not trending"});
  }

  for (const auto &hedge : pos.hedges) {
    const auto stage = hedge.stage_reached();
    const auto trigger = hedge_trigger_pips(pos, hedge, pip);

    // Unwind the hedge as the original comes back
    if (trigger > 0.0 and
        std::cmp_less(stage, config.hedge_partial_stages.size()) and
        std::cmp_less(stage, config.hedge_partial_percents.size())) {
      const auto recovered = 1.0 - against_pips / trigger;
      if (recovered >= config.hedge_partial_stages[stage]) {
        plan.actions.push_back(HedgePartialClose{
            .parent = pos.ticket,
            .hedge = hedge.ticket,
            .stage = stage + 1,
            .percent = config.hedge_partial_percents[stage],
            .recovery_fraction = recovered});
        continue;
      }
    }

    // A hedge being unwound gets no more averaging
    if (hedge.unwinding())
      continue;

    const auto hedge_against = pips_against(hedge.side, hedge.entry_price,
                                            ctx.mark(hedge.side), pip);
    const auto level = next_level(hedge.dca_levels);
    if (level > config.hedge_dca_max_levels or
        hedge_against < level * config.hedge_dca_trigger_pips)
      continue;

    const auto recovering = trailing_candles(ctx.fast_bars, with(pos.side)) >=
                            config.momentum_candles;
    if (recovering)
      plan.actions.push_back(OpenHedgeDca{
          .parent = pos.ticket,
          .hedge = hedge.ticket,
          .level = level,
          .side = pos.side,
          .volume = hedge.volume * config.hedge_dca_volume_multiplier,
          .hedge_pips_underwater = hedge_against});
    else
      plan.blocked.push_back({.parent = pos.ticket,
                              .kind = RecoveryKind::hedge_dca,
                              .pips_underwater = hedge_against,
                              .reason = "original not yet recovering"});
  }

  return plan;
}

std::optional<CloseStack> evaluate_stack_exit(const TrackedPosition &pos,
                                              const StackPnl &pnl,
                                              const MarketContext &ctx,
                                              const RecoveryConfig &config,
                                              Timestamp now) {
  const auto close = [&](CloseReason reason) {
    return CloseStack{.parent = pos.ticket, .reason = reason};
  };

  const auto net = pnl.net();

  // Capital preservation first
  if (-net > config.stack_stop_loss_usd)
    return close(CloseReason::stack_stop_loss);

  const auto loss_cap = config.drawdown_multiple * config.expected_tp_pips *
                        ctx.info.pip_value * pos.initial_volume;
  if (loss_cap > 0.0 and -pnl.unrealized > loss_cap)
    return close(CloseReason::stack_drawdown);

  const auto engaged = pos.recovery_engaged or pos.recovery_active();

  if (engaged and ctx.balance > 0.0 and
      net >= ctx.balance * config.profit_target_percent / 100.0)
    return close(CloseReason::profit_target);

  if (now - pos.opened_at >= std::chrono::hours{config.max_position_hours})
    return close(CloseReason::time_limit);

  if (ctx.exit_signal and not engaged and not pos.partial_close.pc1_closed) {
    const auto profit_pips = pips_in_favour(pos.side, pos.entry_price,
                                            ctx.mark(pos.side),
                                            ctx.info.pip_size);
    if (profit_pips < config.exit_signal_max_pips)
      return close(CloseReason::exit_signal);
  }

  return std::nullopt;
}

double normalize_open_volume(double volume, const SymbolInfo &info) {
  return std::max(floor_to_step(volume, info.volume_step), info.volume_min);
}

double normalize_close_volume(double volume, double current,
                              const SymbolInfo &info) {
  if (volume >= current or near(volume, current))
    return current;

  const auto stepped = floor_to_step(volume, info.volume_step);
  if (stepped < info.volume_min and not near(stepped, info.volume_min))
    return 0.0;

  // Never leave a remainder the broker cannot hold
  const auto remainder = current - stepped;
  if (remainder < info.volume_min and not near(remainder, info.volume_min))
    return current;

  return stepped;
}

void StopOutWindow::record(StopOutEvent event) {
  events_.push_back(std::move(event));
}

void StopOutWindow::prune(Timestamp now, const CascadeConfig &config) {
  const auto cutoff = now - std::chrono::minutes{config.window_minutes};
  std::erase_if(events_,
                [&](const StopOutEvent &e) { return e.timestamp < cutoff; });
}

bool StopOutWindow::confirmed(Timestamp now, const CascadeConfig &config) {
  prune(now, config);
  if (std::cmp_less(events_.size(), config.min_stops))
    return false;

  const auto mean = mean_adx();
  return mean and *mean >= config.adx_threshold;
}

std::optional<double> StopOutWindow::mean_adx() const {
  auto sum = 0.0;
  auto known = 0;
  for (const auto &e : events_)
    if (e.adx_at_stop) {
      sum += *e.adx_at_stop;
      ++known;
    }

  if (known == 0)
    return std::nullopt;
  return sum / known;
}

std::set<std::string> StopOutWindow::symbols() const {
  auto symbols = std::set<std::string>{};
  for (const auto &e : events_)
    symbols.insert(e.symbol);
  return symbols;
}

bool evaluate_trend_block(bool blocked, std::optional<double> adx,
                          const CascadeConfig &config) {
  if (not adx)
    return blocked;
  if (*adx >= config.trend_block_on_adx)
    return true;
  if (*adx < config.trend_block_off_adx)
    return false;
  return blocked;
}

bool BlockingState::cascade_blocked(const std::string &symbol, Timestamp now) {
  auto it = cascade_blocks.find(symbol);
  if (it == cascade_blocks.end() or not it->second)
    return false;

  if (now < *it->second)
    return true;

  cascade_blocks.erase(it);
  return false;
}

void BlockingState::restore(Timestamp now, const CascadeConfig &config) {
  std::erase_if(cascade_blocks, [&](const auto &entry) {
    return not entry.second or *entry.second <= now;
  });

  const auto stale_after = std::chrono::hours{config.stale_block_hours};
  if (not last_block_update or now - *last_block_update > stale_after)
    market_trending_block.clear();
}

} // namespace fxstack
