#include "stack_coordinator.h"
#include "indicators.h"
#include "order_comment.h"
#include <algorithm>
#include <format>
#include <print>
#include <ranges>
#include <utility>

using json = nlohmann::json;

namespace fxstack {

namespace {

std::string_view side_name(Side side) {
  return side == Side::buy ? "BUY" : "SELL";
}

std::string ticket_list(const std::vector<Ticket> &tickets) {
  auto out = std::string{};
  for (auto t : tickets)
    out += std::format("{}{}", out.empty() ? "" : ", ", t);
  return out;
}

} // namespace

StackCoordinator::StackCoordinator(PositionTracker &tracker, MarketData &market,
                                   OrderGateway &gateway, EventLog &events,
                                   Config config)
    : tracker_{tracker}, market_{market}, gateway_{gateway}, events_{events},
      config_{std::move(config)} {}

// ---------------------------------------------------------------------------
// Tick

void StackCoordinator::run_tick(Timestamp now) {
  const auto live = open_positions();
  if (not live) {
    std::println("[TICK] Broker unavailable, skipping tick");
    return;
  }

  const auto report = tracker_.reconcile_with_broker(*live, now);
  if (report.changed())
    std::println("[RECONCILE] +{} -{} ~{} ({} validated)", report.added,
                 report.removed, report.resized, report.validated);

  // A ticket in two stacks means double-managed money: stop here
  tracker_.verify();

  if (auto balance = gateway_.get_account_balance())
    balance_ = *balance;
  else
    std::println("\033[33m[TICK] Balance unavailable: {}\033[0m",
                 to_string(balance.error()));

  if (check_account_emergency(*live, now))
    return;

  retry_pending_closes(now);

  auto symbols = std::set<std::string>{config_.loop.symbols.begin(),
                                       config_.loop.symbols.end()};
  for (const auto &[ticket, row] : tracker_.positions())
    symbols.insert(row.symbol);

  for (const auto &symbol : symbols) {
    const auto ctx = market_context(symbol, now);
    if (not ctx) {
      std::println("\033[33m[{}] No market data, skipping symbol\033[0m",
                   symbol);
      continue;
    }

    for (auto ticket : tracker_.tickets_for(symbol))
      manage_position(ticket, *ctx, now);
  }

  if (auto after = open_positions())
    sweep_orphans(*after, now);
}

void StackCoordinator::manage_position(Ticket ticket, const MarketContext &ctx,
                                       Timestamp now) {
  auto *pos = tracker_.find(ticket);
  if (pos == nullptr or pos->pending_close)
    return;

  const auto recovery = config_.recovery_for(ctx.symbol);

  // 1. Recovery triggers
  const auto plan =
      evaluate_recovery(*pos, ctx, recovery, grid_children(ticket));

  for (const auto &blocked : plan.blocked)
    log_blocked(*pos, blocked, ctx, now);

  auto acted = false;
  for (const auto &action : plan.actions)
    acted = execute_action(action, ctx, now) or acted;

  // 2. Stack exits see the volumes the broker now holds
  if (acted and not refresh_index())
    return;

  pos = tracker_.find(ticket);
  if (pos == nullptr)
    return;

  const auto pnl = tracker_.stack_pnl(ticket, index_);
  if (const auto exit = evaluate_stack_exit(*pos, pnl, ctx, recovery, now)) {
    close_stack(ticket, exit->reason, now);
    if (is_stop_out(exit->reason))
      handle_stop_out(ctx.symbol, ctx.adx, now);
    return;
  }

  // 3. Partial-close ladder, only for positions that never entered recovery
  if (not pos->exit_ladder_allowed())
    return;

  if (const auto step =
          evaluate_ladder(*pos, ctx, config_.ladder_for(ctx.symbol), now))
    apply_ladder(*pos, *step, ctx, now);
}

// ---------------------------------------------------------------------------
// Actions

bool StackCoordinator::execute_action(const RecoveryAction &action,
                                      const MarketContext &ctx, Timestamp now) {

  const auto decision = [&](const TrackedPosition &pos, std::string_view type,
                            double pips, bool placed) {
    events_.recovery_decision({.ticket = pos.ticket,
                               .symbol = pos.symbol,
                               .recovery_type = std::string{type},
                               .price_at_trigger = ctx.mark(pos.side),
                               .pips_underwater = pips,
                               .unrealized_pnl = unrealized(pos.ticket),
                               .adx_at_trigger = ctx.adx,
                               .recovery_placed = placed},
                              now);
  };

  if (const auto *a = std::get_if<OpenDca>(&action)) {
    const auto *pos = tracker_.find(a->parent);
    if (pos == nullptr)
      return false;

    const auto volume = normalize_open_volume(a->volume, ctx.info);
    const auto fill = gateway_.open(
        pos->symbol, a->side, volume,
        format_comment({RecoveryKind::dca, a->level, a->parent}));

    decision(*pos, "dca", a->pips_underwater, fill.has_value());
    if (not fill) {
      std::println("\033[31m[DCA] {} L{} for {} rejected: {}\033[0m",
                   pos->symbol, a->level, a->parent, to_string(fill.error()));
      return false;
    }

    if (auto linked = tracker_.link_recovery(
            a->parent, RecoveryKind::dca,
            {.ticket = fill->ticket,
             .side = a->side,
             .volume = volume,
             .entry_price = fill->price,
             .level = a->level});
        not linked) {
      std::println("\033[31m[DCA] Filled {} but cannot link to {}: {}\033[0m",
                   fill->ticket, a->parent, to_string(linked.error()));
      return false;
    }

    std::println("[DCA] {} L{} {} {} {:.2f} @ {:.5f} -> {} ({:.1f} pips under)",
                 ctx.symbol, a->level, fill->ticket, side_name(a->side), volume,
                 fill->price, a->parent, a->pips_underwater);
    return true;
  }

  if (const auto *a = std::get_if<OpenHedge>(&action)) {
    const auto *pos = tracker_.find(a->parent);
    if (pos == nullptr)
      return false;

    const auto volume = normalize_open_volume(a->volume, ctx.info);
    const auto fill =
        gateway_.open(pos->symbol, a->side, volume,
                      format_comment({RecoveryKind::hedge, 0, a->parent}));

    decision(*pos, "hedge", a->trigger_pips, fill.has_value());
    if (not fill) {
      std::println("\033[31m[HEDGE] {} for {} rejected: {}\033[0m", pos->symbol,
                   a->parent, to_string(fill.error()));
      return false;
    }

    if (auto linked = tracker_.link_recovery(
            a->parent, RecoveryKind::hedge,
            {.ticket = fill->ticket,
             .side = a->side,
             .volume = volume,
             .entry_price = fill->price,
             .trigger_pips = a->trigger_pips});
        not linked) {
      std::println("\033[31m[HEDGE] Filled {} but cannot link to {}: {}\033[0m",
                   fill->ticket, a->parent, to_string(linked.error()));
      return false;
    }

    std::println("[HEDGE] {} {} {} {:.2f} @ {:.5f} -> {} at {:.1f} pips",
                 ctx.symbol, fill->ticket, side_name(a->side), volume,
                 fill->price, a->parent, a->trigger_pips);
    events_.hedge_event("hedge_opened",
                        {{"ticket", fill->ticket},
                         {"parent", a->parent},
                         {"symbol", ctx.symbol},
                         {"volume", volume},
                         {"entry_price", fill->price},
                         {"trigger_pips", a->trigger_pips},
                         {"adx", ctx.adx ? json(*ctx.adx) : json(nullptr)}},
                        now);
    return true;
  }

  if (const auto *a = std::get_if<OpenHedgeDca>(&action)) {
    const auto *pos = tracker_.find(a->parent);
    if (pos == nullptr or pos->find_hedge(a->hedge) == nullptr)
      return false;

    const auto volume = normalize_open_volume(a->volume, ctx.info);
    const auto fill = gateway_.open(
        pos->symbol, a->side, volume,
        format_comment({RecoveryKind::hedge_dca, a->level, a->hedge}));

    decision(*pos, "hedge_dca", a->hedge_pips_underwater, fill.has_value());
    if (not fill) {
      std::println("\033[31m[HEDGE] DCA L{} on {} rejected: {}\033[0m",
                   a->level, a->hedge, to_string(fill.error()));
      return false;
    }

    if (auto linked = tracker_.link_hedge_dca(a->parent, a->hedge,
                                              {.ticket = fill->ticket,
                                               .side = a->side,
                                               .volume = volume,
                                               .entry_price = fill->price,
                                               .level = a->level});
        not linked) {
      std::println("\033[31m[HEDGE] Filled {} but cannot link to hedge {}: "
                   "{}\033[0m",
                   fill->ticket, a->hedge, to_string(linked.error()));
      return false;
    }

    std::println("[HEDGE] DCA L{} {} {:.2f} @ {:.5f} -> hedge {}", a->level,
                 fill->ticket, volume, fill->price, a->hedge);
    events_.hedge_event("hedge_dca_opened",
                        {{"ticket", fill->ticket},
                         {"hedge", a->hedge},
                         {"parent", a->parent},
                         {"symbol", ctx.symbol},
                         {"level", a->level},
                         {"volume", volume},
                         {"entry_price", fill->price},
                         {"hedge_pips_underwater", a->hedge_pips_underwater}},
                        now);
    return true;
  }

  if (const auto *a = std::get_if<OpenGrid>(&action)) {
    const auto *pos = tracker_.find(a->parent);
    if (pos == nullptr)
      return false;

    const auto volume = normalize_open_volume(a->volume, ctx.info);
    const auto fill = gateway_.open(
        pos->symbol, a->side, volume,
        format_comment({RecoveryKind::grid, a->level, a->parent}));

    const auto in_favour = pips_in_favour(pos->side, pos->entry_price,
                                          ctx.mark(pos->side),
                                          ctx.info.pip_size);
    decision(*pos, "grid", -in_favour, fill.has_value());
    if (not fill) {
      std::println("\033[31m[GRID] {} L{} for {} rejected: {}\033[0m",
                   pos->symbol, a->level, a->parent, to_string(fill.error()));
      return false;
    }

    const auto symbol = pos->symbol;
    tracker_.track_grid_child(fill->ticket, symbol, fill->price, a->side,
                              volume, now, a->parent, a->level);
    std::println("[GRID] {} L{} {} {:.2f} @ {:.5f} -> {}", symbol, a->level,
                 fill->ticket, volume, fill->price, a->parent);
    return true;
  }

  if (const auto *a = std::get_if<HedgePartialClose>(&action)) {
    if (not close_hedge_partial(a->hedge, a->percent, a->stage, now))
      return false;

    std::println("[HEDGE] {} stage {} closed {:.0f}% at {:.0f}% recovery",
                 a->hedge, a->stage, a->percent * 100.0,
                 a->recovery_fraction * 100.0);
    return true;
  }

  if (const auto *a = std::get_if<CloseStack>(&action))
    return close_stack(a->parent, a->reason, now).complete();

  return false;
}

CloseResult StackCoordinator::close_stack(Ticket ticket, CloseReason reason,
                                          Timestamp now) {
  auto result = CloseResult{};

  auto *pos = tracker_.find(ticket);
  if (pos == nullptr)
    return result;

  const auto symbol = pos->symbol;
  const auto tickets = tracker_.get_stack_tickets(ticket);
  result.tickets_total = static_cast<int>(tickets.size());

  // Without a fresh view every ticket is attempted
  const auto fresh = refresh_index();
  result.final_pnl = tracker_.stack_pnl(ticket, index_).net();

  std::println("[STACK] Closing {} {} ({}): {} tickets, net {:.2f}", symbol,
               ticket, to_string(reason), tickets.size(), result.final_pnl);

  for (auto t : tickets) {
    if (fresh and not index_.contains(t)) {
      ++result.tickets_closed;
      continue;
    }

    if (gateway_.close(t)) {
      ++result.tickets_closed;
    } else {
      std::println("\033[31m[STACK] Failed to close {} of stack {}\033[0m", t,
                   ticket);
      result.failed.push_back(t);
    }
  }

  if (result.complete()) {
    tracker_.untrack(ticket);
    std::erase_if(last_blocked_,
                  [&](const auto &entry) { return entry.first.first == ticket; });
    std::println("\033[32m[STACK] Closed {} {} ({}) net {:.2f}\033[0m", symbol,
                 ticket, to_string(reason), result.final_pnl);
  } else {
    pos->pending_close = std::string{to_string(reason)};
    std::println("\033[31m[STACK] INCOMPLETE close of {} {}: {} of {} closed, "
                 "still open: {}. Retrying next tick.\033[0m",
                 symbol, ticket, result.tickets_closed, result.tickets_total,
                 ticket_list(result.failed));
  }

  events_.stack_close({.ticket = ticket,
                       .symbol = symbol,
                       .reason = std::string{to_string(reason)},
                       .final_pnl = result.final_pnl,
                       .tickets_total = result.tickets_total,
                       .tickets_closed = result.tickets_closed,
                       .complete = result.complete()},
                      now);
  return result;
}

bool StackCoordinator::close_hedge_partial(Ticket hedge_ticket, double percent,
                                           int stage, Timestamp now) {
  const auto owner = tracker_.owner_of(hedge_ticket);
  if (not owner or owner->role != StackRole::hedge) {
    std::println("\033[33m[HEDGE] {} is not a tracked hedge\033[0m",
                 hedge_ticket);
    return false;
  }

  auto *pos = tracker_.find(owner->root);
  const auto symbol = pos->symbol;
  const auto info = symbol_info(symbol);
  if (not info or not refresh_index())
    return false;

  auto *hedge = pos->find_hedge(hedge_ticket);
  const auto full = percent >= 1.0 or near(percent, 1.0);
  auto all_ok = true;
  auto realized = 0.0;

  // Trims one constituent and marks it done with this stage. A rejected
  // close leaves volume and stage untouched for the next tick.
  const auto trim = [&](Ticket ticket, double &volume, int &taken) {
    if (taken >= stage)
      return;

    const auto rec = index_.find(ticket);
    if (rec == index_.end()) {
      volume = 0.0;
      taken = stage;
      return;
    }

    const auto close_volume =
        full ? volume : normalize_close_volume(volume * percent, volume, *info);
    if (close_volume <= 0.0) {
      taken = stage;
      return;
    }

    const auto whole = close_volume >= volume;
    const auto ok = whole ? gateway_.close(ticket)
                          : gateway_.close_partial(ticket, close_volume);
    events_.partial_close("hedge", ticket, symbol, close_volume, 0.0, ok, now);

    if (not ok) {
      std::println("\033[31m[HEDGE] Failed to close {:.2f} of {}, stage {} "
                   "retried next tick\033[0m",
                   close_volume, ticket, stage);
      all_ok = false;
      return;
    }

    if (volume > 0.0)
      realized += rec->second.profit * close_volume / volume;
    volume = whole ? 0.0 : volume - close_volume;
    taken = stage;
  };

  trim(hedge->ticket, hedge->volume, hedge->partial_stage);
  for (auto &dca : hedge->dca_levels)
    trim(dca.ticket, dca.volume, dca.partial_stage);

  std::erase_if(hedge->dca_levels,
                [](const DcaLevel &dca) { return dca.volume <= 0.0; });

  pos->realized_pnl += realized;

  events_.hedge_event("hedge_partial_close",
                      {{"hedge", hedge_ticket},
                       {"parent", owner->root},
                       {"symbol", symbol},
                       {"percent", percent},
                       {"stage", stage},
                       {"realized", realized},
                       {"remaining_volume", hedge->volume},
                       {"complete", all_ok}},
                      now);

  if (hedge->volume <= 0.0 and hedge->dca_levels.empty())
    std::erase_if(pos->hedges,
                  [&](const Hedge &h) { return h.ticket == hedge_ticket; });

  return all_ok;
}

// ---------------------------------------------------------------------------
// Exit ladder

void StackCoordinator::apply_ladder(TrackedPosition &pos,
                                    const LadderAction &action,
                                    const MarketContext &ctx, Timestamp now) {
  const auto price = ctx.mark(pos.side);

  if (const auto *take = std::get_if<TakePartial>(&action)) {
    const auto stage = take->stage == LadderStage::pc1 ? "pc1" : "pc2";

    auto ok = true;
    if (take->volume > 0.0)
      ok = gateway_.close_partial(pos.ticket, take->volume);

    events_.partial_close(stage, pos.ticket, pos.symbol, take->volume,
                          take->profit_pips, ok, now);
    if (not ok) {
      std::println("\033[31m[{}] Partial close of {} failed\033[0m", stage,
                   pos.ticket);
      return;
    }

    if (take->volume > 0.0) {
      if (auto rec = index_.find(pos.ticket);
          rec != index_.end() and pos.current_volume > 0.0)
        pos.realized_pnl +=
            rec->second.profit * take->volume / pos.current_volume;
      pos.current_volume -= take->volume;
    }

    std::println("[{}] {} {} closed {:.2f} at +{:.1f} pips", stage, pos.symbol,
                 pos.ticket, take->volume, take->profit_pips);

    if (take->stage == LadderStage::pc1) {
      pos.partial_close.pc1_closed = true;
      return;
    }

    pos.partial_close.pc2_closed = true;
    pos.partial_close.pc2_trigger_time = now;

    if (not gateway_.modify_stop_loss(pos.ticket, pos.entry_price))
      std::println("\033[33m[PC2] Could not move {} stop to breakeven\033[0m",
                   pos.ticket);

    const auto ladder = config_.ladder_for(pos.symbol);
    if (ladder.trailing_enabled) {
      const auto trail = trailing_stop_price(
          pos.side, price, ladder.trailing_distance_pips, ctx.info.pip_size);
      pos.trailing_stop = {
          .active = true,
          .stop_price = pos.side == Side::buy ? std::max(trail, pos.entry_price)
                                              : std::min(trail, pos.entry_price),
          .distance_pips = ladder.trailing_distance_pips,
          .peak_price = price};
      events_.trailing_event("trailing_activated", pos.ticket, pos.symbol,
                             pos.trailing_stop.stop_price, price, price, now);
    }
    return;
  }

  if (const auto *move = std::get_if<MoveStop>(&action)) {
    auto &trail = pos.trailing_stop;
    const auto stop_moved = not near(move->stop_price, trail.stop_price);

    if (stop_moved and not gateway_.modify_stop_loss(pos.ticket, move->stop_price)) {
      std::println("\033[33m[TRAIL] Could not move {} stop to {:.5f}\033[0m",
                   pos.ticket, move->stop_price);
      return;
    }

    trail.stop_price = move->stop_price;
    trail.peak_price = move->peak_price;
    if (stop_moved)
      events_.trailing_event("trailing_update", pos.ticket, pos.symbol,
                             trail.stop_price, trail.peak_price, price, now);
    return;
  }

  if (const auto *close = std::get_if<CloseStack>(&action)) {
    if (close->reason == CloseReason::trailing_stop)
      events_.trailing_event("trailing_hit", pos.ticket, pos.symbol,
                             pos.trailing_stop.stop_price,
                             pos.trailing_stop.peak_price, price, now);
    close_stack(close->parent, close->reason, now);
  }
}

// ---------------------------------------------------------------------------
// Protection

void StackCoordinator::handle_stop_out(const std::string &symbol,
                                       std::optional<double> adx,
                                       Timestamp now) {
  stop_outs_.record({.symbol = symbol, .timestamp = now, .adx_at_stop = adx});
  std::println("[CASCADE] Stop-out on {} (adx {}), {} in window", symbol,
               adx ? std::format("{:.1f}", *adx) : "n/a", stop_outs_.size());

  if (not stop_outs_.confirmed(now, config_.cascade))
    return;

  const auto symbols = stop_outs_.symbols();
  const auto stops = stop_outs_.size();
  const auto mean = stop_outs_.mean_adx().value_or(0.0);

  std::println("\033[31m[CASCADE] Confirmed: {} stops, mean ADX {:.1f}. "
               "Closing underwater stacks.\033[0m",
               stops, mean);

  auto closed = std::vector<Ticket>{};
  if (refresh_index()) {
    auto tickets = std::vector<Ticket>{};
    for (const auto &[ticket, row] : tracker_.positions())
      if (not row.pending_close)
        tickets.push_back(ticket);

    for (auto ticket : tickets) {
      if (tracker_.find(ticket) == nullptr)
        continue;
      if (tracker_.stack_pnl(ticket, index_).net() < 0.0) {
        close_stack(ticket, CloseReason::cascade_protection, now);
        closed.push_back(ticket);
      }
    }
  }

  block_symbols(symbols, now);

  events_.cascade({{"trigger", "stop_out_cluster"},
                   {"stops", stops},
                   {"mean_adx", mean},
                   {"symbols", symbols},
                   {"closed_stacks", closed},
                   {"block_until",
                    to_iso(now + std::chrono::minutes{
                                     config_.cascade.block_minutes})}},
                  now);
  stop_outs_.clear();
}

void StackCoordinator::block_symbols(const std::set<std::string> &symbols,
                                     Timestamp now) {
  const auto until = now + std::chrono::minutes{config_.cascade.block_minutes};
  for (const auto &symbol : symbols) {
    blocking_.cascade_blocks[symbol] = until;
    std::println("\033[31m[CASCADE] {} blocked until {}\033[0m", symbol,
                 to_iso(until));
  }
  blocking_.last_block_update = now;
  dirty_ = true;
}

bool StackCoordinator::check_account_emergency(
    std::span<const PositionRecord> live, Timestamp now) {
  const auto limit = config_.cascade.emergency_loss_usd;
  if (limit <= 0.0 or tracker_.empty())
    return false;

  auto total = 0.0;
  for (const auto &rec : live)
    total += rec.profit;

  if (total > -limit)
    return false;

  std::println("\033[31m[EMERGENCY] Account P&L {:.2f} <= -{:.2f}, closing "
               "every stack\033[0m",
               total, limit);

  auto symbols = std::set<std::string>{};
  auto tickets = std::vector<Ticket>{};
  for (const auto &[ticket, row] : tracker_.positions()) {
    symbols.insert(row.symbol);
    tickets.push_back(ticket);
  }

  for (auto ticket : tickets)
    close_stack(ticket, CloseReason::account_emergency, now);

  block_symbols(symbols, now);
  events_.cascade({{"trigger", "account_emergency"},
                   {"total_profit", total},
                   {"symbols", symbols},
                   {"closed_stacks", tickets}},
                  now);
  return true;
}

void StackCoordinator::retry_pending_closes(Timestamp now) {
  auto pending = std::vector<std::pair<Ticket, CloseReason>>{};
  for (const auto &[ticket, row] : tracker_.positions())
    if (row.pending_close)
      pending.emplace_back(ticket,
                           close_reason_from_string(*row.pending_close)
                               .value_or(CloseReason::stack_stop_loss));

  for (const auto &[ticket, reason] : pending) {
    std::println("[STACK] Retrying close of {} ({})", ticket, to_string(reason));
    close_stack(ticket, reason, now);
  }
}

int StackCoordinator::sweep_orphans(std::span<const PositionRecord> live,
                                    Timestamp now) {
  auto open = std::set<Ticket>{};
  for (const auto &rec : live)
    open.insert(rec.ticket);

  auto closes = 0;
  for (const auto &rec : live) {
    const auto tag = parse_comment(rec.comment);
    if (not tag or not tag->has_value())
      continue;

    const auto &parent = **tag;
    if (tracker_.is_tracked(rec.ticket) or open.contains(parent.parent))
      continue;

    const auto limit = config_.recovery_for(rec.symbol).orphan_max_loss_usd;
    if (rec.profit >= -limit)
      continue;

    const auto ok = gateway_.close(rec.ticket);
    if (ok) {
      ++closes;
      std::println("\033[32m[ORPHAN] Closed {} {} {} (parent {} gone) at "
                   "{:.2f}\033[0m",
                   rec.symbol, to_string(parent.kind), rec.ticket,
                   parent.parent, rec.profit);
    } else {
      std::println("\033[31m[ORPHAN] Failed to close {} {} at {:.2f}\033[0m",
                   to_string(parent.kind), rec.ticket, rec.profit);
    }
    events_.orphan(rec, to_string(parent.kind), parent.parent, ok, now);
  }
  return closes;
}

// ---------------------------------------------------------------------------
// Entries, reconciliation, state

ReconcileReport StackCoordinator::reconcile(Timestamp now) {
  const auto live = open_positions();
  if (not live)
    return {};

  const auto report = tracker_.reconcile_with_broker(*live, now);
  std::println("[RECONCILE] {} tracked: +{} -{} ~{} ({} validated)",
               tracker_.size(), report.added, report.removed, report.resized,
               report.validated);
  return report;
}

std::expected<Ticket, std::string>
StackCoordinator::open_entry(const EntrySignal &signal, Timestamp now) {
  const auto reject = [&](std::string reason) {
    std::println("[ENTRY] {} {} skipped: {}", signal.symbol,
                 side_name(signal.side), reason);
    events_.trade_entry({{"event", "entry_rejected"},
                         {"symbol", signal.symbol},
                         {"direction", signal.side == Side::buy ? "buy" : "sell"},
                         {"price", signal.price},
                         {"confluence_score", signal.confluence_score},
                         {"strategy", signal.strategy},
                         {"block_reason", reason}},
                        now);
    return std::unexpected(std::move(reason));
  };

  const auto had_block = blocking_.cascade_blocks.contains(signal.symbol);
  const auto blocked = blocking_.cascade_blocked(signal.symbol, now);
  if (had_block and not blocking_.cascade_blocks.contains(signal.symbol))
    dirty_ = true;

  if (blocked)
    return reject("cascade_block");
  if (blocking_.trend_blocked(signal.symbol))
    return reject("trend_block");
  if (std::cmp_greater_equal(tracker_.size(), config_.entries.max_open_stacks))
    return reject("max_open_stacks");
  if (std::cmp_greater_equal(tracker_.tickets_for(signal.symbol).size(),
                             config_.entries.max_stacks_per_symbol))
    return reject("max_stacks_per_symbol");

  const auto info = symbol_info(signal.symbol);
  if (not info)
    return reject("no_symbol_info");

  const auto volume = normalize_open_volume(
      signal.volume.value_or(config_.entries.base_volume), *info);
  const auto fill =
      gateway_.open(signal.symbol, signal.side, volume,
                    format_entry_comment(signal.strategy, signal.confluence_score));
  if (not fill)
    return reject(std::format("broker: {}", to_string(fill.error())));

  tracker_.track(fill->ticket, signal.symbol, fill->price, signal.side, volume,
                 now);

  std::println("\033[32m[ENTRY] {} {} {} {:.2f} @ {:.5f} ({} C{})\033[0m",
               signal.symbol, fill->ticket, side_name(signal.side), volume,
               fill->price, signal.strategy, signal.confluence_score);
  events_.trade_entry({{"event", "entry_opened"},
                       {"ticket", fill->ticket},
                       {"symbol", signal.symbol},
                       {"direction", signal.side == Side::buy ? "buy" : "sell"},
                       {"price", fill->price},
                       {"signal_price", signal.price},
                       {"volume", volume},
                       {"confluence_score", signal.confluence_score},
                       {"strategy", signal.strategy}},
                      now);
  return fill->ticket;
}

void StackCoordinator::restore(PersistedState state, Timestamp now) {
  tracker_.restore(std::move(state.positions));
  blocking_ = std::move(state.blocking);
  blocking_.restore(now, config_.cascade);
  tracker_.verify();

  std::println("[STATE] Restored {} stacks, {} cascade blocks, {} trend blocks",
               tracker_.size(), blocking_.cascade_blocks.size(),
               std::ranges::count(blocking_.market_trending_block |
                                      std::views::values,
                                  true));
}

PersistedState StackCoordinator::snapshot() const {
  return {.positions = tracker_.positions(), .blocking = blocking_};
}

void StackCoordinator::set_exit_signal(const std::string &symbol, bool on) {
  exit_signals_[symbol] = on;
}

bool StackCoordinator::take_dirty() { return std::exchange(dirty_, false); }

// ---------------------------------------------------------------------------
// Market data

std::optional<MarketContext>
StackCoordinator::market_context(const std::string &symbol, Timestamp now) {
  const auto it = data_.find(symbol);
  const auto stale =
      it == data_.end() or
      now - it->second.refreshed >=
          std::chrono::minutes{config_.loop.data_refresh_minutes};

  if (stale and not refresh(symbol, now))
    return std::nullopt;

  const auto quote = market_.get_bid_ask(symbol);
  if (not quote) {
    std::println("\033[33m[{}] Quote unavailable: {}\033[0m", symbol,
                 to_string(quote.error()));
    return std::nullopt;
  }

  const auto &data = data_.at(symbol);
  const auto signal = exit_signals_.find(symbol);
  return MarketContext{
      .symbol = symbol,
      .info = data.info,
      .quote = *quote,
      .adx = data.adx,
      .fast_bars = data.fast_bars,
      .exit_signal = signal != exit_signals_.end() and signal->second,
      .balance = balance_};
}

bool StackCoordinator::refresh(const std::string &symbol, Timestamp now) {
  const auto &loop = config_.loop;

  const auto info = market_.get_symbol_info(symbol);
  const auto fast = market_.get_bars(symbol, loop.fast_timeframe,
                                     loop.fast_bar_count);
  const auto slow = market_.get_bars(symbol, loop.slow_timeframe,
                                     loop.slow_bar_count);

  if (not info or not fast or not slow) {
    std::println("\033[33m[{}] Market data refresh failed\033[0m", symbol);
    return false;
  }

  auto &data = data_[symbol];
  data.refreshed = now;
  data.info = *info;
  const auto fast_closed = closed_bars(*fast, loop.fast_timeframe, now);
  data.fast_bars.assign(fast_closed.begin(), fast_closed.end());
  data.adx = adx(closed_bars(*slow, loop.slow_timeframe, now), loop.adx_period);

  // Trend block, with hysteresis
  const auto was = blocking_.trend_blocked(symbol);
  const auto blocked = evaluate_trend_block(was, data.adx, config_.cascade);
  blocking_.last_block_update = now;

  if (blocked != was) {
    blocking_.market_trending_block[symbol] = blocked;
    dirty_ = true;
    std::println("[TREND] {} {} (adx {:.1f})", symbol,
                 blocked ? "blocked: strong trend" : "unblocked",
                 data.adx.value_or(0.0));
  }
  return true;
}

std::optional<SymbolInfo>
StackCoordinator::symbol_info(const std::string &symbol) {
  if (auto it = data_.find(symbol); it != data_.end())
    return it->second.info;

  auto info = market_.get_symbol_info(symbol);
  if (not info) {
    std::println("\033[33m[{}] Symbol info unavailable: {}\033[0m", symbol,
                 to_string(info.error()));
    return std::nullopt;
  }
  return *info;
}

// ---------------------------------------------------------------------------
// Helpers

std::optional<std::vector<PositionRecord>> StackCoordinator::open_positions() {
  auto live = gateway_.get_open_positions();
  if (not live) {
    std::println("\033[33m[BROKER] Positions unavailable: {}\033[0m",
                 to_string(live.error()));
    return std::nullopt;
  }

  index_ = index_positions(*live);
  return std::move(*live);
}

bool StackCoordinator::refresh_index() { return open_positions().has_value(); }

int StackCoordinator::grid_children(Ticket parent) const {
  return static_cast<int>(std::ranges::count_if(
      tracker_.positions() | std::views::values,
      [&](const TrackedPosition &row) { return row.grid_parent == parent; }));
}

double StackCoordinator::unrealized(Ticket ticket) const {
  return tracker_.stack_pnl(ticket, index_).unrealized;
}

void StackCoordinator::log_blocked(const TrackedPosition &pos,
                                   const BlockedTrigger &blocked,
                                   const MarketContext &ctx, Timestamp now) {
  // Only report when the reason changes, not every tick it persists
  auto &last = last_blocked_[{pos.ticket, blocked.kind}];
  if (last == blocked.reason)
    return;
  last = blocked.reason;

  std::println("\033[33m[{}] {} {} blocked at {:.1f} pips: {}\033[0m",
               to_string(blocked.kind), pos.symbol, pos.ticket,
               blocked.pips_underwater, blocked.reason);
  events_.recovery_decision({.ticket = pos.ticket,
                             .symbol = pos.symbol,
                             .recovery_type = std::string{to_string(blocked.kind)},
                             .price_at_trigger = ctx.mark(pos.side),
                             .pips_underwater = blocked.pips_underwater,
                             .unrealized_pnl = unrealized(pos.ticket),
                             .adx_at_trigger = ctx.adx,
                             .was_blocked = true,
                             .block_reason = blocked.reason,
                             .recovery_placed = false},
                            now);
}

} // namespace fxstack
