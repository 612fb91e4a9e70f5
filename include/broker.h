#pragma once

// Service boundary to the brokerage terminal.
// MarketData and OrderGateway are implemented by BridgeClient for live
// trading and by a scripted fake in the tests.

#include "pip_utils.h"
#include "timestamp.h"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fxstack {

using Ticket = std::uint64_t;

struct Quote {
  std::string symbol;
  double bid{};
  double ask{};
};

struct Bar {
  std::string timestamp; // ISO 8601 (lexicographically comparable)
  double open{};
  double high{};
  double low{};
  double close{};
  long volume{};
};

struct SymbolInfo {
  std::string symbol;
  double pip_size{0.0001};
  double pip_value{10.0};  // Account currency per pip for 1.0 lot
  double volume_step{0.01};
  double volume_min{0.01};
};

// One open position as the broker reports it
struct PositionRecord {
  Ticket ticket{};
  std::string symbol;
  Side side{Side::buy};
  double volume{};
  double price_open{};
  double price_current{};
  double profit{};         // Unrealised, account currency
  std::string comment;
  std::optional<Timestamp> opened_at; // Not every bridge reports it
};

struct Fill {
  Ticket ticket{};
  double price{};
};

enum class BrokerError {
  NetworkError,
  RejectedError,
  NotFound,
  ParseError,
  UnknownError
};

std::string_view to_string(BrokerError);

class MarketData {
public:
  virtual ~MarketData() = default;

  virtual std::expected<Quote, BrokerError> get_bid_ask(std::string_view) = 0;

  // Most recent `count` bars, oldest first (timeframe: "M15", "H1", ...)
  virtual std::expected<std::vector<Bar>, BrokerError>
  get_bars(std::string_view, std::string_view, int) = 0;

  virtual std::expected<SymbolInfo, BrokerError>
  get_symbol_info(std::string_view) = 0;
};

class OrderGateway {
public:
  virtual ~OrderGateway() = default;

  // Market order; comment carries the recovery tag
  virtual std::expected<Fill, BrokerError>
  open(std::string_view, Side, double, std::string_view) = 0;

  virtual bool close(Ticket) = 0;
  virtual bool close_partial(Ticket, double) = 0;
  virtual bool modify_stop_loss(Ticket, double) = 0;

  // All open positions, or only those for one symbol
  virtual std::expected<std::vector<PositionRecord>, BrokerError>
  get_open_positions(std::optional<std::string_view> = std::nullopt) = 0;

  virtual std::expected<double, BrokerError> get_account_balance() = 0;
};

} // namespace fxstack
