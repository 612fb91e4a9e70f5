#pragma once

// Recovery Policy Engine
// Pure decisions: (tracked position, live price, market context, config)
// -> actions. Nothing here talks to the broker or mutates the tracker.

#include "broker.h"
#include "config.h"
#include "position_tracker.h"
#include "timestamp.h"
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fxstack {

// Everything the rules know about one symbol this tick
struct MarketContext {
  std::string symbol;
  SymbolInfo info;
  Quote quote;
  std::optional<double> adx;     // Trend strength, unknown if history is short
  std::vector<Bar> fast_bars;    // M15, oldest first
  bool exit_signal{};            // Reversion signal from the detector
  double balance{};              // Account balance, 0 if unavailable

  // Price the position would close at
  double mark(Side side) const {
    return side == Side::buy ? quote.bid : quote.ask;
  }
};

enum class CloseReason {
  stack_stop_loss,
  stack_drawdown,
  profit_target,
  time_limit,
  exit_signal,
  trailing_stop,
  pc2_time_limit,
  cascade_protection,
  account_emergency
};

std::string_view to_string(CloseReason);
std::optional<CloseReason> close_reason_from_string(std::string_view);

// Stop-outs feed cascade detection
constexpr bool is_stop_out(CloseReason reason) {
  return reason == CloseReason::stack_stop_loss or
         reason == CloseReason::stack_drawdown;
}

struct OpenDca {
  Ticket parent{};
  int level{};
  Side side{Side::buy};
  double volume{};
  double pips_underwater{};
};

struct OpenHedge {
  Ticket parent{};
  Side side{Side::sell};
  double volume{};
  double trigger_pips{};
};

struct OpenHedgeDca {
  Ticket parent{};
  Ticket hedge{};
  int level{};
  Side side{Side::buy};
  double volume{};
  double hedge_pips_underwater{};
};

struct HedgePartialClose {
  Ticket parent{};
  Ticket hedge{};
  int stage{};            // 1-based
  double percent{};       // Of each constituent's current volume
  double recovery_fraction{};
};

struct OpenGrid {
  Ticket parent{};
  int level{};
  Side side{Side::buy};
  double volume{};
};

struct CloseStack {
  Ticket parent{};
  CloseReason reason{CloseReason::stack_stop_loss};
};

using RecoveryAction = std::variant<OpenDca, OpenHedge, OpenHedgeDca,
                                    HedgePartialClose, OpenGrid, CloseStack>;

// A trigger whose threshold was met but a safeguard said no
struct BlockedTrigger {
  Ticket parent{};
  RecoveryKind kind{RecoveryKind::dca};
  double pips_underwater{};
  std::string reason;
};

struct RecoveryPlan {
  std::vector<RecoveryAction> actions;
  std::vector<BlockedTrigger> blocked;
};

// ADX at or above threshold, or the last N fast candles all moved against
bool is_trending(const MarketContext &, Side, const RecoveryConfig &);

// Drawdown of the original when its hedge opened; derived from the fill
// prices when the hedge was rebuilt from comments
double hedge_trigger_pips(const TrackedPosition &, const Hedge &, double);

// Grid, DCA, hedge, hedge DCA and hedge partial-close triggers
RecoveryPlan evaluate_recovery(const TrackedPosition &, const MarketContext &,
                               const RecoveryConfig &, int grid_children = 0);

// First hit of: stop-loss, drawdown guard, profit target, time limit,
// exit signal
std::optional<CloseStack> evaluate_stack_exit(const TrackedPosition &,
                                              const StackPnl &,
                                              const MarketContext &,
                                              const RecoveryConfig &,
                                              Timestamp now);

// Volume for a new order, on the broker's step and at least its minimum
double normalize_open_volume(double, const SymbolInfo &);

// Volume to close out of `current`; 0 when below the broker minimum
double normalize_close_volume(double volume, double current,
                              const SymbolInfo &);

struct StopOutEvent {
  std::string symbol;
  Timestamp timestamp{};
  std::optional<double> adx_at_stop;
};

// Rolling window of recent stop-outs across all symbols
class StopOutWindow {
public:
  void record(StopOutEvent);

  // Forget events older than the window
  void prune(Timestamp now, const CascadeConfig &);

  // Enough stops within the window with elevated mean ADX
  bool confirmed(Timestamp now, const CascadeConfig &);

  std::optional<double> mean_adx() const;
  std::set<std::string> symbols() const;

  std::size_t size() const { return events_.size(); }
  void clear() { events_.clear(); }

private:
  std::deque<StopOutEvent> events_;
};

// Trend block with hysteresis: on at/above `on`, off below `off`
bool evaluate_trend_block(bool blocked, std::optional<double> adx,
                          const CascadeConfig &);

// Process-wide entry blocks, persisted alongside the tracker
struct BlockingState {
  std::map<std::string, std::optional<Timestamp>> cascade_blocks;
  std::map<std::string, bool> market_trending_block;
  std::optional<Timestamp> last_block_update;

  // Active block; an expired one is removed
  bool cascade_blocked(const std::string &, Timestamp now);

  bool trend_blocked(const std::string &symbol) const {
    auto it = market_trending_block.find(symbol);
    return it != market_trending_block.end() and it->second;
  }

  // Startup hygiene: expired cascade blocks go, stale trend blocks are
  // re-derived from fresh data
  void restore(Timestamp now, const CascadeConfig &);

  bool operator==(const BlockingState &) const = default;
};

} // namespace fxstack
