#include "position_tracker.h"
#include <algorithm>
#include <format>
#include <numeric>
#include <print>
#include <set>

namespace fxstack {

namespace {

// Broker records we can act on; anything else is logged and skipped
bool usable(const PositionRecord &rec) {
  if (rec.ticket == 0 or rec.symbol.empty() or not(rec.volume > 0.0)) {
    std::println("\033[33m[RECONCILE] Skipping malformed record: ticket={} "
                 "symbol='{}' volume={}\033[0m",
                 rec.ticket, rec.symbol, rec.volume);
    return false;
  }
  return true;
}

void sort_levels(std::vector<DcaLevel> &levels) {
  std::ranges::sort(levels, {}, &DcaLevel::level_index);
}

// Drop closed child slots and sync the volumes of the rest
template <typename Slots>
void sync_slots(Slots &slots, const PositionIndex &open, ReconcileReport &report,
                std::string_view label, Ticket parent) {
  std::erase_if(slots, [&](const auto &slot) {
    if (open.contains(slot.ticket))
      return false;
    std::println("[RECONCILE] {} {} of {} no longer open", label, slot.ticket,
                 parent);
    ++report.removed;
    return true;
  });

  for (auto &slot : slots) {
    const auto &rec = open.at(slot.ticket);
    if (not near(slot.volume, rec.volume)) {
      slot.volume = rec.volume;
      ++report.resized;
    }
    ++report.validated;
  }
}

} // namespace

std::string_view to_string(StackRole role) {
  switch (role) {
  case StackRole::standalone:
    return "standalone";
  case StackRole::grid_child:
    return "grid_child";
  case StackRole::dca:
    return "dca";
  case StackRole::hedge:
    return "hedge";
  case StackRole::hedge_dca:
    return "hedge_dca";
  }
  return "unknown";
}

std::optional<StackRole> stack_role_from_string(std::string_view name) {
  for (auto role : {StackRole::standalone, StackRole::grid_child, StackRole::dca,
                    StackRole::hedge, StackRole::hedge_dca})
    if (to_string(role) == name)
      return role;
  return std::nullopt;
}

std::string_view to_string(TrackerError error) {
  switch (error) {
  case TrackerError::UnknownParent:
    return "unknown parent";
  case TrackerError::UnknownHedge:
    return "unknown hedge";
  case TrackerError::DuplicateTicket:
    return "duplicate ticket";
  }
  return "unknown";
}

double TrackedPosition::exposure() const {
  return std::accumulate(
      dca_levels.begin(), dca_levels.end(), current_volume,
      [](double sum, const DcaLevel &dca) { return sum + dca.volume; });
}

int Hedge::stage_reached() const {
  auto stage = partial_stage;
  for (const auto &dca : dca_levels)
    stage = std::min(stage, dca.partial_stage);
  return stage;
}

bool Hedge::unwinding() const {
  return partial_stage > 0 or
         std::ranges::any_of(dca_levels,
                             [](const DcaLevel &dca) { return dca.partial_stage > 0; });
}

Hedge *TrackedPosition::find_hedge(Ticket ticket) {
  auto it = std::ranges::find(hedges, ticket, &Hedge::ticket);
  return it == hedges.end() ? nullptr : &*it;
}

const Hedge *TrackedPosition::find_hedge(Ticket ticket) const {
  auto it = std::ranges::find(hedges, ticket, &Hedge::ticket);
  return it == hedges.end() ? nullptr : &*it;
}

PositionIndex index_positions(std::span<const PositionRecord> records) {
  auto index = PositionIndex{};
  for (const auto &rec : records)
    index.emplace(rec.ticket, rec);
  return index;
}

bool PositionTracker::track(Ticket ticket, std::string_view symbol,
                            double entry_price, Side side, double volume,
                            Timestamp opened_at, bool is_grid_child) {
  if (is_tracked(ticket)) {
    std::println("\033[33m[TRACK] Ticket {} already tracked, ignoring\033[0m",
                 ticket);
    return false;
  }

  auto pos = TrackedPosition{};
  pos.ticket = ticket;
  pos.symbol = std::string{symbol};
  pos.side = side;
  pos.entry_price = entry_price;
  pos.initial_volume = volume;
  pos.current_volume = volume;
  pos.opened_at = opened_at;
  pos.role = is_grid_child ? StackRole::grid_child : StackRole::standalone;

  positions_.emplace(ticket, std::move(pos));
  return true;
}

bool PositionTracker::track_grid_child(Ticket ticket, std::string_view symbol,
                                       double entry_price, Side side,
                                       double volume, Timestamp opened_at,
                                       Ticket parent, int level) {
  if (not track(ticket, symbol, entry_price, side, volume, opened_at, true))
    return false;

  auto &pos = positions_.at(ticket);
  pos.grid_parent = parent;
  pos.grid_level = level;
  return true;
}

bool PositionTracker::untrack(Ticket ticket) {
  return positions_.erase(ticket) > 0;
}

std::expected<void, TrackerError>
PositionTracker::link_recovery(Ticket parent, RecoveryKind kind,
                               const ChildOrder &child) {
  auto *row = find(parent);
  if (row == nullptr)
    return std::unexpected(TrackerError::UnknownParent);

  if (is_tracked(child.ticket))
    return std::unexpected(TrackerError::DuplicateTicket);

  switch (kind) {
  case RecoveryKind::dca:
    row->dca_levels.push_back({.ticket = child.ticket,
                               .level_index = child.level,
                               .volume = child.volume,
                               .entry_price = child.entry_price});
    sort_levels(row->dca_levels);
    break;

  case RecoveryKind::hedge:
    row->hedges.push_back({.ticket = child.ticket,
                           .side = child.side,
                           .volume = child.volume,
                           .entry_price = child.entry_price,
                           .trigger_pips = child.trigger_pips});
    break;

  // Grid children are rows of their own and hedge DCAs attach to a hedge
  case RecoveryKind::grid:
  case RecoveryKind::hedge_dca:
    return std::unexpected(TrackerError::UnknownParent);
  }

  row->recovery_engaged = true;
  return {};
}

std::expected<void, TrackerError>
PositionTracker::link_hedge_dca(Ticket parent, Ticket hedge,
                                const ChildOrder &child) {
  auto *row = find(parent);
  if (row == nullptr)
    return std::unexpected(TrackerError::UnknownParent);

  auto *h = row->find_hedge(hedge);
  if (h == nullptr)
    return std::unexpected(TrackerError::UnknownHedge);

  if (is_tracked(child.ticket))
    return std::unexpected(TrackerError::DuplicateTicket);

  h->dca_levels.push_back({.ticket = child.ticket,
                           .level_index = child.level,
                           .volume = child.volume,
                           .entry_price = child.entry_price});
  sort_levels(h->dca_levels);
  return {};
}

std::vector<Ticket> PositionTracker::get_stack_tickets(Ticket ticket) const {
  const auto *row = find(ticket);
  if (row == nullptr)
    return {};

  auto tickets = std::vector<Ticket>{row->ticket};
  for (const auto &dca : row->dca_levels)
    tickets.push_back(dca.ticket);
  for (const auto &hedge : row->hedges) {
    tickets.push_back(hedge.ticket);
    for (const auto &dca : hedge.dca_levels)
      tickets.push_back(dca.ticket);
  }
  return tickets;
}

ReconcileReport
PositionTracker::reconcile_with_broker(std::span<const PositionRecord> live,
                                       Timestamp now) {
  auto report = ReconcileReport{};

  auto records = std::vector<PositionRecord>{};
  for (const auto &rec : live)
    if (usable(rec))
      records.push_back(rec);

  const auto open = index_positions(records);

  // Drop what the broker no longer holds, sync what it still does
  for (auto it = positions_.begin(); it != positions_.end();) {
    auto &row = it->second;
    const auto rec = open.find(row.ticket);

    if (rec == open.end()) {
      const auto tickets = get_stack_tickets(row.ticket);
      const auto children_open =
          std::ranges::any_of(tickets, [&](Ticket t) { return open.contains(t); });

      // A half-closed stack stays so the close can be retried
      if (not row.pending_close or not children_open) {
        std::println("[RECONCILE] {} {} no longer open, untracking stack",
                     row.symbol, row.ticket);
        report.removed += static_cast<int>(tickets.size());
        it = positions_.erase(it);
        continue;
      }

      if (row.current_volume > 0.0) {
        row.current_volume = 0.0;
        ++report.resized;
      }
    } else if (not near(row.current_volume, rec->second.volume)) {
      std::println("[RECONCILE] {} {} volume {} -> {}", row.symbol, row.ticket,
                   row.current_volume, rec->second.volume);
      row.current_volume = rec->second.volume;
      ++report.resized;
    }
    ++report.validated;

    sync_slots(row.dca_levels, open, report, "DCA", row.ticket);

    // A vanished hedge takes its DCA slots with it; survivors become orphans
    std::erase_if(row.hedges, [&](const Hedge &hedge) {
      if (open.contains(hedge.ticket))
        return false;
      // Keep it while a close or an unwind stage still has DCAs to retry
      if ((row.pending_close or hedge.unwinding()) and
          std::ranges::any_of(hedge.dca_levels, [&](const DcaLevel &dca) {
            return open.contains(dca.ticket);
          }))
        return false;
      std::println("[RECONCILE] Hedge {} of {} no longer open", hedge.ticket,
                   row.ticket);
      report.removed += 1 + static_cast<int>(hedge.dca_levels.size());
      return true;
    });

    for (auto &hedge : row.hedges) {
      const auto hrec = open.find(hedge.ticket);
      const auto volume = hrec == open.end() ? 0.0 : hrec->second.volume;
      if (not near(hedge.volume, volume)) {
        hedge.volume = volume;
        ++report.resized;
      }
      ++report.validated;
      sync_slots(hedge.dca_levels, open, report, "Hedge DCA", hedge.ticket);
    }

    ++it;
  }

  // Adopt untagged positions as originals; tagged ones are reconstructed
  for (const auto &rec : records) {
    if (is_tracked(rec.ticket))
      continue;

    const auto tag = parse_comment(rec.comment);
    if (not tag or tag->has_value())
      continue;

    std::println("[RECONCILE] Adopting {} {} {} @ {} ('{}')", rec.symbol,
                 rec.ticket, rec.side == Side::buy ? "BUY" : "SELL",
                 rec.price_open, rec.comment);
    track(rec.ticket, rec.symbol, rec.price_open, rec.side, rec.volume,
          rec.opened_at.value_or(now));
    ++report.added;
  }

  report.added += reconstruct_recovery_stacks(records, now);
  return report;
}

int PositionTracker::reconstruct_recovery_stacks(
    std::span<const PositionRecord> live, Timestamp now) {

  struct Tagged {
    const PositionRecord *rec;
    RecoveryTag tag;
  };

  auto tagged = std::vector<Tagged>{};
  auto open = std::set<Ticket>{};

  for (const auto &rec : live) {
    if (not usable(rec))
      continue;
    open.insert(rec.ticket);

    const auto tag = parse_comment(rec.comment);
    if (not tag) {
      std::println("\033[33m[RECONCILE] Skipping {} with malformed tag '{}'"
                   "\033[0m",
                   rec.ticket, rec.comment);
      continue;
    }
    if (tag->has_value())
      tagged.push_back({&rec, **tag});
  }

  auto links = 0;

  const auto child_of = [](const PositionRecord &rec, const RecoveryTag &tag) {
    return ChildOrder{.ticket = rec.ticket,
                      .side = rec.side,
                      .volume = rec.volume,
                      .entry_price = rec.price_open,
                      .level = tag.level};
  };

  const auto report_link = [&](const Tagged &t) {
    std::println("[RECONCILE] Linked {} {} L{} -> {}", to_string(t.tag.kind),
                 t.rec->ticket, t.tag.level, t.tag.parent);
    ++links;
  };

  // Grid children first: they are rows that DCA and hedges may attach to
  for (const auto &t : tagged) {
    if (t.tag.kind != RecoveryKind::grid or is_tracked(t.rec->ticket))
      continue;
    if (find(t.tag.parent) == nullptr and not open.contains(t.tag.parent))
      continue;

    const auto &rec = *t.rec;
    if (track_grid_child(rec.ticket, rec.symbol, rec.price_open, rec.side,
                         rec.volume, rec.opened_at.value_or(now), t.tag.parent,
                         t.tag.level))
      report_link(t);
  }

  for (const auto &t : tagged) {
    if ((t.tag.kind != RecoveryKind::dca and t.tag.kind != RecoveryKind::hedge)
        or is_tracked(t.rec->ticket) or find(t.tag.parent) == nullptr)
      continue;

    if (link_recovery(t.tag.parent, t.tag.kind, child_of(*t.rec, t.tag)))
      report_link(t);
  }

  for (const auto &t : tagged) {
    if (t.tag.kind != RecoveryKind::hedge_dca or is_tracked(t.rec->ticket))
      continue;

    const auto owner = owner_of(t.tag.parent);
    if (not owner or owner->role != StackRole::hedge)
      continue;

    if (link_hedge_dca(owner->root, t.tag.parent, child_of(*t.rec, t.tag)))
      report_link(t);
  }

  return links;
}

std::optional<Owner> PositionTracker::owner_of(Ticket ticket) const {
  for (const auto &[root, row] : positions_) {
    if (root == ticket)
      return Owner{.root = root, .role = row.role};

    for (const auto &dca : row.dca_levels)
      if (dca.ticket == ticket)
        return Owner{.root = root, .role = StackRole::dca};

    for (const auto &hedge : row.hedges) {
      if (hedge.ticket == ticket)
        return Owner{.root = root, .role = StackRole::hedge};
      for (const auto &dca : hedge.dca_levels)
        if (dca.ticket == ticket)
          return Owner{.root = root,
                       .role = StackRole::hedge_dca,
                       .hedge = hedge.ticket};
    }
  }
  return std::nullopt;
}

TrackedPosition *PositionTracker::find(Ticket ticket) {
  auto it = positions_.find(ticket);
  return it == positions_.end() ? nullptr : &it->second;
}

const TrackedPosition *PositionTracker::find(Ticket ticket) const {
  auto it = positions_.find(ticket);
  return it == positions_.end() ? nullptr : &it->second;
}

StackPnl PositionTracker::stack_pnl(Ticket ticket,
                                   const PositionIndex &open) const {
  auto pnl = StackPnl{};
  const auto *row = find(ticket);
  if (row == nullptr)
    return pnl;

  pnl.realized = row->realized_pnl;
  for (auto t : get_stack_tickets(ticket)) {
    if (auto it = open.find(t); it != open.end())
      pnl.unrealized += it->second.profit;
    else
      ++pnl.missing;
  }
  return pnl;
}

double PositionTracker::stack_volume(Ticket ticket) const {
  const auto *row = find(ticket);
  if (row == nullptr)
    return 0.0;

  auto volume = row->exposure();
  for (const auto &hedge : row->hedges) {
    volume += hedge.volume;
    for (const auto &dca : hedge.dca_levels)
      volume += dca.volume;
  }
  return volume;
}

std::vector<Ticket> PositionTracker::tickets_for(std::string_view symbol) const {
  auto tickets = std::vector<Ticket>{};
  for (const auto &[ticket, row] : positions_)
    if (row.symbol == symbol)
      tickets.push_back(ticket);
  return tickets;
}

void PositionTracker::restore(std::map<Ticket, TrackedPosition> positions) {
  positions_ = std::move(positions);
}

void PositionTracker::verify() const {
  auto seen = std::map<Ticket, Ticket>{};

  const auto claim = [&](Ticket ticket, Ticket root) {
    if (auto [it, inserted] = seen.emplace(ticket, root); not inserted)
      throw InvariantViolation{
          std::format("ticket {} is in stack {} and stack {}", ticket,
                      it->second, root)};
  };

  for (const auto &[key, row] : positions_) {
    if (key != row.ticket)
      throw InvariantViolation{
          std::format("row keyed {} holds ticket {}", key, row.ticket)};

    if (row.role != StackRole::standalone and
        row.role != StackRole::grid_child)
      throw InvariantViolation{std::format("row {} has child role {}", key,
                                           to_string(row.role))};

    if (row.is_grid_child() and not row.grid_parent)
      throw InvariantViolation{
          std::format("grid child {} has no parent", key)};

    if (row.recovery_active() and not row.recovery_engaged)
      throw InvariantViolation{
          std::format("row {} has recovery orders but no latch", key)};

    for (auto ticket : get_stack_tickets(key))
      claim(ticket, key);
  }
}

} // namespace fxstack
