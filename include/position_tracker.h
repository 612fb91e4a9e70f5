#pragma once

// Position Tracker
// Single source of truth for which broker tickets belong to which stack.
// Top-level rows are originals (standalone or grid children); DCA orders,
// hedges and hedge DCAs live nested under their row.

#include "broker.h"
#include "order_comment.h"
#include "timestamp.h"
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fxstack {

enum class StackRole { standalone, grid_child, dca, hedge, hedge_dca };

std::string_view to_string(StackRole);
std::optional<StackRole> stack_role_from_string(std::string_view);

// Only an original entry may pyramid; grid children never recurse
constexpr bool can_spawn_grid(StackRole role) {
  return role == StackRole::standalone;
}

static_assert(can_spawn_grid(StackRole::standalone));
static_assert(not can_spawn_grid(StackRole::grid_child));

struct DcaLevel {
  Ticket ticket{};
  int level_index{};
  double volume{};
  double entry_price{};
  int partial_stage{};  // Hedge DCA only: hedge unwind stages taken

  bool operator==(const DcaLevel &) const = default;
};

struct Hedge {
  Ticket ticket{};
  Side side{Side::sell};
  double volume{};
  double entry_price{};
  double trigger_pips{};  // Original's drawdown when the hedge opened
  int partial_stage{};    // Unwind stages taken by the hedge ticket itself
  std::vector<DcaLevel> dca_levels;

  // Stages every constituent has taken; a lagging ticket holds it back
  int stage_reached() const;

  // Some constituent has taken a stage
  bool unwinding() const;

  bool operator==(const Hedge &) const = default;
};

struct PartialCloseFlags {
  bool pc1_closed{};
  bool pc2_closed{};
  std::optional<Timestamp> pc2_trigger_time;

  bool operator==(const PartialCloseFlags &) const = default;
};

struct TrailingStop {
  bool active{};
  double stop_price{};
  double distance_pips{};
  double peak_price{};

  bool operator==(const TrailingStop &) const = default;
};

struct TrackedPosition {
  Ticket ticket{};
  std::string symbol;
  Side side{Side::buy};
  double entry_price{};
  double initial_volume{};
  double current_volume{};
  Timestamp opened_at{};

  StackRole role{StackRole::standalone};
  std::optional<Ticket> grid_parent;
  int grid_level{};

  std::vector<DcaLevel> dca_levels;
  std::vector<Hedge> hedges;

  PartialCloseFlags partial_close;
  TrailingStop trailing_stop;

  double realized_pnl{};       // Booked by partial closes inside the stack
  bool recovery_engaged{};     // Latched on the first DCA or hedge link

  // Reason of a stack close that left tickets open; retried every tick
  std::optional<std::string> pending_close;

  bool is_grid_child() const { return role == StackRole::grid_child; }

  bool recovery_active() const {
    return not dca_levels.empty() or not hedges.empty();
  }

  // PC1/PC2/trailing may only run while this is true
  bool exit_ladder_allowed() const {
    return not recovery_engaged and not recovery_active();
  }

  // Original plus same-direction averaging volume
  double exposure() const;

  Hedge *find_hedge(Ticket);
  const Hedge *find_hedge(Ticket) const;

  bool operator==(const TrackedPosition &) const = default;
};

// A ticket found in two slots, or a row in an impossible shape
class InvariantViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

enum class TrackerError { UnknownParent, UnknownHedge, DuplicateTicket };

std::string_view to_string(TrackerError);

// Broker-side facts about a newly filled recovery order
struct ChildOrder {
  Ticket ticket{};
  Side side{Side::buy};
  double volume{};
  double entry_price{};
  int level{};            // 1-based, ignored for hedges
  double trigger_pips{};  // Hedges only
};

// Where a ticket lives in the tracker
struct Owner {
  Ticket root{};                // Top-level row
  StackRole role{StackRole::standalone};
  std::optional<Ticket> hedge;  // Set for hedge_dca slots
};

struct ReconcileReport {
  int added{};
  int removed{};
  int resized{};
  int validated{};

  bool changed() const { return added + removed + resized > 0; }
};

using PositionIndex = std::map<Ticket, PositionRecord>;

PositionIndex index_positions(std::span<const PositionRecord>);

// Stack P&L from broker-reported profits
struct StackPnl {
  double unrealized{};
  double realized{};
  int missing{};          // Stack tickets the broker did not report

  double net() const { return realized + unrealized; }
};

class PositionTracker {
public:
  // Register an original; false (with a warning) if already tracked
  bool track(Ticket, std::string_view, double, Side, double, Timestamp,
             bool is_grid_child = false);

  bool track_grid_child(Ticket, std::string_view, double, Side, double,
                        Timestamp, Ticket parent, int level);

  // Forget a row and everything nested under it; never touches the broker
  bool untrack(Ticket);

  std::expected<void, TrackerError> link_recovery(Ticket, RecoveryKind,
                                                  const ChildOrder &);

  std::expected<void, TrackerError> link_hedge_dca(Ticket parent, Ticket hedge,
                                                   const ChildOrder &);

  // Original first, then DCA, then each hedge followed by its DCAs
  std::vector<Ticket> get_stack_tickets(Ticket) const;

  ReconcileReport reconcile_with_broker(std::span<const PositionRecord>,
                                        Timestamp now);

  // Number of links made from comment tags
  int reconstruct_recovery_stacks(std::span<const PositionRecord>,
                                  Timestamp now = now_seconds());

  std::optional<Owner> owner_of(Ticket) const;
  bool is_tracked(Ticket ticket) const { return owner_of(ticket).has_value(); }

  TrackedPosition *find(Ticket);
  const TrackedPosition *find(Ticket) const;

  StackPnl stack_pnl(Ticket, const PositionIndex &) const;

  // Total broker volume across a stack's tickets
  double stack_volume(Ticket) const;

  std::vector<Ticket> tickets_for(std::string_view) const;

  const std::map<Ticket, TrackedPosition> &positions() const {
    return positions_;
  }

  std::size_t size() const { return positions_.size(); }
  bool empty() const { return positions_.empty(); }

  // Replace the whole book, e.g. from the state file
  void restore(std::map<Ticket, TrackedPosition>);

  // Throws InvariantViolation
  void verify() const;

private:
  std::map<Ticket, TrackedPosition> positions_;
};

} // namespace fxstack
