#pragma once

// HTTP/JSON client for the local terminal bridge.
//
//   GET    /quote/{symbol}                      {"bid": , "ask": }
//   GET    /bars/{symbol}?timeframe=&count=     {"bars": [{"t","o","h","l","c","v"}]}
//   GET    /symbols/{symbol}                    {"pip_size", "pip_value", "volume_step", "volume_min"}
//   POST   /orders                              {"symbol","side","volume","comment"} -> {"ticket","price"}
//   DELETE /positions/{ticket}                  close outright
//   POST   /positions/{ticket}/close            {"volume"} partial close
//   PATCH  /positions/{ticket}                  {"stop_loss"}
//   GET    /positions[?symbol=]                 {"positions": [...]}
//   GET    /account                             {"balance": }

#include "broker.h"
#include <string>
#include <string_view>

namespace fxstack {

class BridgeClient : public MarketData, public OrderGateway {
public:
  BridgeClient();

  bool is_valid() const { return not base_url_.empty(); }
  const std::string &base_url() const { return base_url_; }

  std::expected<Quote, BrokerError> get_bid_ask(std::string_view) override;

  std::expected<std::vector<Bar>, BrokerError>
  get_bars(std::string_view, std::string_view, int) override;

  std::expected<SymbolInfo, BrokerError>
  get_symbol_info(std::string_view) override;

  std::expected<Fill, BrokerError> open(std::string_view, Side, double,
                                        std::string_view) override;

  bool close(Ticket) override;
  bool close_partial(Ticket, double) override;
  bool modify_stop_loss(Ticket, double) override;

  std::expected<std::vector<PositionRecord>, BrokerError>
  get_open_positions(std::optional<std::string_view> = std::nullopt) override;

  std::expected<double, BrokerError> get_account_balance() override;

private:
  std::string base_url_;
  std::string token_;
};

} // namespace fxstack
