#pragma once

// Stack Lifecycle Coordinator
// Turns policy decisions into broker calls and tracker updates, one tick at
// a time. Broker failures are logged and dropped; the next tick re-evaluates
// and naturally retries.

#include "broker.h"
#include "config.h"
#include "event_log.h"
#include "exit_ladder.h"
#include "position_tracker.h"
#include "recovery_policy.h"
#include "state_store.h"
#include <expected>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace fxstack {

// One entry signal from the external detector
struct EntrySignal {
  std::string symbol;
  Side side{Side::buy};
  double price{};
  int confluence_score{};
  std::string strategy;
  std::optional<double> volume;
};

struct CloseResult {
  int tickets_total{};
  int tickets_closed{};
  double final_pnl{};
  std::vector<Ticket> failed;

  bool complete() const { return failed.empty(); }
};

class StackCoordinator {
public:
  StackCoordinator(PositionTracker &, MarketData &, OrderGateway &, EventLog &,
                   Config);

  // Reconcile, then for each symbol: refresh data, trend block, recovery,
  // stack exits, ladder; then the orphan sweep
  void run_tick(Timestamp now);

  // Dispatch one decision; false if the broker refused or the tracker
  // could not record it. Never retries.
  bool execute_action(const RecoveryAction &, const MarketContext &,
                      Timestamp now);

  // Attempt every stack ticket; untrack only if all closed
  CloseResult close_stack(Ticket, CloseReason, Timestamp now);

  // Close `percent` of a hedge and its DCAs as unwind `stage`; 1.0 closes
  // them outright. Constituents that already took the stage are left alone,
  // so a failed ticket is retried without trimming the others twice.
  bool close_hedge_partial(Ticket hedge, double percent, int stage,
                           Timestamp now);

  // Tagged broker positions whose parent is gone; returns closes made
  int sweep_orphans(std::span<const PositionRecord>, Timestamp now);

  ReconcileReport reconcile(Timestamp now);

  std::expected<Ticket, std::string> open_entry(const EntrySignal &,
                                                Timestamp now);

  // Adopt persisted state, dropping expired and stale blocks
  void restore(PersistedState, Timestamp now);
  PersistedState snapshot() const;

  BlockingState &blocking() { return blocking_; }
  const BlockingState &blocking() const { return blocking_; }
  StopOutWindow &stop_outs() { return stop_outs_; }

  // Externally supplied reversion signal for a symbol
  void set_exit_signal(const std::string &, bool);

  // Blocking flags changed since the last call
  bool take_dirty();

  // Market context, refreshing cached bars when stale
  std::optional<MarketContext> market_context(const std::string &,
                                              Timestamp now);

private:
  struct SymbolData {
    Timestamp refreshed{};
    SymbolInfo info;
    std::vector<Bar> fast_bars;
    std::optional<double> adx;
  };

  bool refresh(const std::string &, Timestamp now);
  std::optional<SymbolInfo> symbol_info(const std::string &);

  void manage_position(Ticket, const MarketContext &, Timestamp now);
  void apply_ladder(TrackedPosition &, const LadderAction &,
                    const MarketContext &, Timestamp now);
  void log_blocked(const TrackedPosition &, const BlockedTrigger &,
                   const MarketContext &, Timestamp now);
  void handle_stop_out(const std::string &, std::optional<double>,
                       Timestamp now);
  void block_symbols(const std::set<std::string> &, Timestamp now);
  bool check_account_emergency(std::span<const PositionRecord>, Timestamp now);
  void retry_pending_closes(Timestamp now);
  std::optional<std::vector<PositionRecord>> open_positions();
  bool refresh_index();
  int grid_children(Ticket) const;
  double unrealized(Ticket) const;

  PositionTracker &tracker_;
  MarketData &market_;
  OrderGateway &gateway_;
  EventLog &events_;
  Config config_;

  BlockingState blocking_;
  StopOutWindow stop_outs_;
  std::map<std::string, SymbolData> data_;
  std::map<std::string, bool> exit_signals_;
  PositionIndex index_;  // Broker view as of the last fetch
  std::map<std::pair<Ticket, RecoveryKind>, std::string> last_blocked_;
  double balance_{};
  bool dirty_{};
};

} // namespace fxstack
