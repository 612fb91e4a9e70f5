#include "event_log.h"
#include <format>
#include <fstream>
#include <print>
#include <system_error>

using json = nlohmann::json;

namespace fxstack {

void EventLog::recovery_decision(const RecoveryDecision &d, Timestamp ts) {
  auto j = json{{"event", "recovery_decision"},
                {"ticket", d.ticket},
                {"symbol", d.symbol},
                {"recovery_type", d.recovery_type},
                {"price_at_trigger", d.price_at_trigger},
                {"pips_underwater", d.pips_underwater},
                {"unrealized_pnl", d.unrealized_pnl},
                {"was_blocked", d.was_blocked},
                {"block_reason", d.block_reason},
                {"recovery_placed", d.recovery_placed}};
  j["adx_at_trigger"] = d.adx_at_trigger ? json(*d.adx_at_trigger) : json(nullptr);
  append(streams::recovery_decisions, std::move(j), ts);
}

void EventLog::stack_close(const StackCloseRecord &r, Timestamp ts) {
  append(streams::stack_closes,
         {{"event", "stack_close"},
          {"ticket", r.ticket},
          {"symbol", r.symbol},
          {"reason", r.reason},
          {"final_pnl", r.final_pnl},
          {"tickets_total", r.tickets_total},
          {"tickets_closed", r.tickets_closed},
          {"complete", r.complete}},
         ts);
}

void EventLog::trailing_event(std::string_view event, Ticket ticket,
                              std::string_view symbol, double stop_price,
                              double peak_price, double price, Timestamp ts) {
  append(streams::trailing_events,
         {{"event", std::string{event}},
          {"ticket", ticket},
          {"symbol", std::string{symbol}},
          {"stop_price", stop_price},
          {"peak_price", peak_price},
          {"price", price}},
         ts);
}

void EventLog::partial_close(std::string_view stage, Ticket ticket,
                             std::string_view symbol, double volume,
                             double profit_pips, bool closed, Timestamp ts) {
  append(streams::partial_closes,
         {{"event", "partial_close"},
          {"stage", std::string{stage}},
          {"ticket", ticket},
          {"symbol", std::string{symbol}},
          {"volume", volume},
          {"profit_pips", profit_pips},
          {"closed", closed}},
         ts);
}

void EventLog::hedge_event(std::string_view event, json details, Timestamp ts) {
  details["event"] = std::string{event};
  append(streams::hedge_events, std::move(details), ts);
}

void EventLog::cascade(json details, Timestamp ts) {
  details["event"] = "cascade";
  append(streams::cascade_events, std::move(details), ts);
}

void EventLog::orphan(const PositionRecord &rec, std::string_view kind,
                      Ticket parent, bool closed, Timestamp ts) {
  append(streams::orphan_events,
         {{"event", "orphan_close"},
          {"ticket", rec.ticket},
          {"symbol", rec.symbol},
          {"kind", std::string{kind}},
          {"parent", parent},
          {"profit", rec.profit},
          {"volume", rec.volume},
          {"closed", closed}},
         ts);
}

void EventLog::trade_entry(json details, Timestamp ts) {
  if (not details.contains("event"))
    details["event"] = "trade_entry";
  append(streams::trade_entries, std::move(details), ts);
}

JsonlEventLog::JsonlEventLog(std::filesystem::path dir) : dir_{std::move(dir)} {}

void JsonlEventLog::append(std::string_view stream, json record, Timestamp ts) {
  if (not record.contains("timestamp"))
    record["timestamp"] = to_iso(ts);
  if (not record.contains("event"))
    record["event"] = std::string{stream};

  auto ec = std::error_code{};
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    std::println("\033[33m[EVENTS] Cannot create {}: {}\033[0m", dir_.string(),
                 ec.message());
    return;
  }

  const auto path = dir_ / std::format("{}.jsonl", stream);
  auto file = std::ofstream{path, std::ios::app};
  if (not file) {
    std::println("\033[33m[EVENTS] Cannot open {}\033[0m", path.string());
    return;
  }

  try {
    file << record.dump() << '\n';
  } catch (const json::exception &e) {
    std::println("\033[33m[EVENTS] Cannot encode {} record: {}\033[0m",
                 stream, e.what());
    return;
  }

  if (not file)
    std::println("\033[33m[EVENTS] Write to {} failed\033[0m", path.string());
}

} // namespace fxstack
