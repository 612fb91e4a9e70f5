#pragma once

// Event Log / ML telemetry sink.
// Append-only JSON records, one stream per concern. Write-only and best
// effort: a failed write prints a warning and never blocks a decision.

#include "broker.h"
#include "timestamp.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace fxstack {

namespace streams {
constexpr auto recovery_decisions = std::string_view{"recovery_decisions"};
constexpr auto trailing_events = std::string_view{"trailing_events"};
constexpr auto partial_closes = std::string_view{"partial_closes"};
constexpr auto hedge_events = std::string_view{"hedge_events"};
constexpr auto stack_closes = std::string_view{"stack_closes"};
constexpr auto cascade_events = std::string_view{"cascade_events"};
constexpr auto orphan_events = std::string_view{"orphan_events"};
constexpr auto trade_entries = std::string_view{"trade_entries"};
} // namespace streams

struct RecoveryDecision {
  Ticket ticket{};
  std::string symbol;
  std::string recovery_type;  // grid, dca, hedge, hedge_dca
  double price_at_trigger{};
  double pips_underwater{};
  double unrealized_pnl{};
  std::optional<double> adx_at_trigger;
  bool was_blocked{};
  std::string block_reason;
  bool recovery_placed{};
};

struct StackCloseRecord {
  Ticket ticket{};
  std::string symbol;
  std::string reason;
  double final_pnl{};
  int tickets_total{};
  int tickets_closed{};
  bool complete{};
};

class EventLog {
public:
  virtual ~EventLog() = default;

  // `record` gains "timestamp" and "event" if it lacks them
  virtual void append(std::string_view stream, nlohmann::json record,
                      Timestamp) = 0;

  void recovery_decision(const RecoveryDecision &, Timestamp);
  void stack_close(const StackCloseRecord &, Timestamp);
  void trailing_event(std::string_view event, Ticket, std::string_view symbol,
                      double stop_price, double peak_price, double price,
                      Timestamp);
  void partial_close(std::string_view stage, Ticket, std::string_view symbol,
                     double volume, double profit_pips, bool closed, Timestamp);
  void hedge_event(std::string_view event, nlohmann::json details, Timestamp);
  void cascade(nlohmann::json details, Timestamp);
  void orphan(const PositionRecord &, std::string_view kind, Ticket parent,
              bool closed, Timestamp);
  void trade_entry(nlohmann::json details, Timestamp);
};

// One <stream>.jsonl file per stream under a directory
class JsonlEventLog : public EventLog {
public:
  explicit JsonlEventLog(std::filesystem::path);

  void append(std::string_view, nlohmann::json, Timestamp) override;

  const std::filesystem::path &directory() const { return dir_; }

private:
  std::filesystem::path dir_;
};

// Discards everything
class NullEventLog : public EventLog {
public:
  void append(std::string_view, nlohmann::json, Timestamp) override {}
};

} // namespace fxstack
