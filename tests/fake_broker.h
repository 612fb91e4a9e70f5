#pragma once

// Scripted in-memory terminal for tests: both gateway interfaces, P&L from
// the current price, call recording and injectable failures.

#include "broker.h"
#include "event_log.h"
#include <algorithm>
#include <chrono>
#include <format>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fxstack::testing {

inline Timestamp at(int minutes) {
  using namespace std::chrono;
  return sys_days{year{2026} / 3 / 2} + hours{9} + std::chrono::minutes{minutes};
}

// One candle from open to close
inline Bar candle(double open, double close) {
  return {.timestamp = "",
          .open = open,
          .high = std::max(open, close) + 0.0002,
          .low = std::min(open, close) - 0.0002,
          .close = close,
          .volume = 100};
}

// Steady one-way move: ADX close to 100
inline std::vector<Bar> trending_bars(int count, double start, bool up) {
  auto bars = std::vector<Bar>{};
  auto price = start;
  for (auto i = 0; i < count; ++i) {
    const auto next = up ? price + 0.0010 : price - 0.0010;
    bars.push_back(candle(price, next));
    price = next;
  }
  return bars;
}

// Alternating colours: no momentum either way
inline std::vector<Bar> mixed_bars(int count, double price) {
  auto bars = std::vector<Bar>{};
  for (auto i = 0; i < count; ++i)
    bars.push_back(i % 2 == 0 ? candle(price, price + 0.0003)
                              : candle(price + 0.0003, price));
  return bars;
}

class FakeBroker : public MarketData, public OrderGateway {
public:
  FakeBroker() {
    add_symbol("EURUSD", 0.0001);
    add_symbol("GBPUSD", 0.0001);
    add_symbol("USDJPY", 0.01);
  }

  // Market

  void add_symbol(const std::string &symbol, double pip_size,
                  double pip_value = 10.0) {
    infos[symbol] = {.symbol = symbol,
                     .pip_size = pip_size,
                     .pip_value = pip_value,
                     .volume_step = 0.01,
                     .volume_min = 0.01};
  }

  void set_price(const std::string &symbol, double price) {
    quotes[symbol] = {.symbol = symbol, .bid = price, .ask = price};
  }

  void set_bars(const std::string &symbol, const std::string &timeframe,
                std::vector<Bar> bars) {
    bars_[{symbol, timeframe}] = std::move(bars);
  }

  std::expected<Quote, BrokerError> get_bid_ask(std::string_view symbol) override {
    auto it = quotes.find(std::string{symbol});
    if (it == quotes.end())
      return std::unexpected(BrokerError::NotFound);
    return it->second;
  }

  std::expected<std::vector<Bar>, BrokerError>
  get_bars(std::string_view symbol, std::string_view timeframe,
           int count) override {
    auto it = bars_.find({std::string{symbol}, std::string{timeframe}});
    if (it == bars_.end())
      return std::vector<Bar>{};

    const auto &all = it->second;
    const auto n = std::min<std::size_t>(all.size(), static_cast<std::size_t>(count));
    return std::vector<Bar>(all.end() - static_cast<std::ptrdiff_t>(n), all.end());
  }

  std::expected<SymbolInfo, BrokerError>
  get_symbol_info(std::string_view symbol) override {
    auto it = infos.find(std::string{symbol});
    if (it == infos.end())
      return std::unexpected(BrokerError::NotFound);
    return it->second;
  }

  // Orders

  Ticket add_position(const std::string &symbol, Side side, double volume,
                      double price_open, std::string comment = "VWAP:C5",
                      std::optional<Ticket> ticket = std::nullopt) {
    const auto t = ticket.value_or(next_ticket++);
    positions[t] = {.ticket = t,
                    .symbol = symbol,
                    .side = side,
                    .volume = volume,
                    .price_open = price_open,
                    .price_current = price_open,
                    .profit = 0.0,
                    .comment = std::move(comment),
                    .opened_at = clock};
    return t;
  }

  std::expected<Fill, BrokerError> open(std::string_view symbol, Side side,
                                        double volume,
                                        std::string_view comment) override {
    calls.push_back(std::format("open {} {} {:.2f} '{}'", symbol,
                                side == Side::buy ? "buy" : "sell", volume,
                                comment));
    if (reject_opens)
      return std::unexpected(BrokerError::RejectedError);

    const auto quote = get_bid_ask(symbol);
    if (not quote)
      return std::unexpected(quote.error());

    const auto price = side == Side::buy ? quote->ask : quote->bid;
    const auto ticket = add_position(std::string{symbol}, side, volume, price,
                                     std::string{comment});
    return Fill{.ticket = ticket, .price = price};
  }

  bool close(Ticket ticket) override {
    calls.push_back(std::format("close {}", ticket));
    if (reject_closes.contains(ticket) or not positions.contains(ticket))
      return false;
    booked += profit_of(positions.at(ticket));
    positions.erase(ticket);
    return true;
  }

  bool close_partial(Ticket ticket, double volume) override {
    calls.push_back(std::format("close_partial {} {:.2f}", ticket, volume));
    if (reject_closes.contains(ticket) or not positions.contains(ticket))
      return false;

    auto &pos = positions.at(ticket);
    booked += profit_of(pos) * volume / pos.volume;
    pos.volume -= volume;
    if (pos.volume <= 1e-9)
      positions.erase(ticket);
    return true;
  }

  bool modify_stop_loss(Ticket ticket, double stop) override {
    calls.push_back(std::format("modify {} {:.5f}", ticket, stop));
    if (not positions.contains(ticket))
      return false;
    stop_losses[ticket] = stop;
    return true;
  }

  std::expected<std::vector<PositionRecord>, BrokerError>
  get_open_positions(std::optional<std::string_view> symbol) override {
    if (positions_unavailable)
      return std::unexpected(BrokerError::NetworkError);

    auto out = std::vector<PositionRecord>{};
    for (auto &[ticket, pos] : positions) {
      if (symbol and pos.symbol != *symbol)
        continue;
      if (auto q = quotes.find(pos.symbol); q != quotes.end())
        pos.price_current = pos.side == Side::buy ? q->second.bid : q->second.ask;
      pos.profit = profit_of(pos);
      out.push_back(pos);
    }
    return out;
  }

  std::expected<double, BrokerError> get_account_balance() override {
    return balance;
  }

  double profit_of(const PositionRecord &pos) const {
    auto q = quotes.find(pos.symbol);
    if (q == quotes.end())
      return 0.0;
    const auto &info = infos.at(pos.symbol);
    const auto mark = pos.side == Side::buy ? q->second.bid : q->second.ask;
    return pips_in_favour(pos.side, pos.price_open, mark, info.pip_size) *
           info.pip_value * pos.volume;
  }

  int count_calls(std::string_view prefix) const {
    auto n = 0;
    for (const auto &call : calls)
      if (call.starts_with(prefix))
        ++n;
    return n;
  }

  std::map<std::string, Quote> quotes;
  std::map<std::string, SymbolInfo> infos;
  std::map<Ticket, PositionRecord> positions;
  std::map<Ticket, double> stop_losses;
  std::vector<std::string> calls;
  std::set<Ticket> reject_closes;
  bool reject_opens{};
  bool positions_unavailable{};
  double balance{1000.0};
  double booked{};
  Ticket next_ticket{1001};
  Timestamp clock{at(0)};

private:
  std::map<std::pair<std::string, std::string>, std::vector<Bar>> bars_;
};

// Keeps every record in memory
class RecordingEventLog : public EventLog {
public:
  void append(std::string_view stream, nlohmann::json record,
              Timestamp ts) override {
    if (not record.contains("timestamp"))
      record["timestamp"] = to_iso(ts);
    records.emplace_back(std::string{stream}, std::move(record));
  }

  std::vector<nlohmann::json> stream(std::string_view name) const {
    auto out = std::vector<nlohmann::json>{};
    for (const auto &[s, record] : records)
      if (s == name)
        out.push_back(record);
    return out;
  }

  std::vector<std::pair<std::string, nlohmann::json>> records;
};

} // namespace fxstack::testing
