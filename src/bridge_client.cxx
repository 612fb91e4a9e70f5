#include "bridge_client.h"
#include "bridge_json.h"
#include "config.h"
#include <format>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace fxstack {

namespace {

// Connection per call; the bridge is local and the loop is slow
httplib::Client make_client(const std::string &url, int read_timeout) {
  auto client = httplib::Client{url};
  client.set_connection_timeout(10);
  client.set_read_timeout(read_timeout);
  return client;
}

// Map transport and status failures; nullopt means a 200 with a body
std::optional<BrokerError> check(const httplib::Result &res,
                                 std::string_view what) {
  if (not res) {
    std::println(stderr, "  Network error - no response ({})", what);
    return BrokerError::NetworkError;
  }

  if (res->status == 404)
    return BrokerError::NotFound;

  if (res->status == 400 or res->status == 409 or res->status == 422) {
    std::println(stderr, "{} rejected: status={}, body={}", what, res->status,
                 res->body);
    return BrokerError::RejectedError;
  }

  if (res->status != 200) {
    std::println(stderr, "{} error: status={}, body={}", what, res->status,
                 res->body);
    return BrokerError::UnknownError;
  }

  return std::nullopt;
}

} // namespace

BridgeClient::BridgeClient()
    : base_url_{get_env_or_default("FXSTACK_BRIDGE_URL",
                                   "http://127.0.0.1:8228")},
      token_{get_env_or_default("FXSTACK_BRIDGE_TOKEN", "")} {}

std::expected<Quote, BrokerError>
BridgeClient::get_bid_ask(std::string_view symbol) {
  auto client = make_client(base_url_, 10);
  httplib::Headers headers = {{"X-Bridge-Token", token_}};

  auto res = client.Get(std::format("/quote/{}", symbol), headers);
  if (auto error = check(res, "Quote"))
    return std::unexpected(*error);

  try {
    auto j = json::parse(res->body);
    return Quote{.symbol = std::string{symbol},
                 .bid = j.at("bid").get<double>(),
                 .ask = j.at("ask").get<double>()};
  } catch (const json::exception &) {
    return std::unexpected(BrokerError::ParseError);
  }
}

std::expected<std::vector<Bar>, BrokerError>
BridgeClient::get_bars(std::string_view symbol, std::string_view timeframe,
                       int count) {
  auto client = make_client(base_url_, 30);
  httplib::Headers headers = {{"X-Bridge-Token", token_}};

  auto path =
      std::format("/bars/{}?timeframe={}&count={}", symbol, timeframe, count);
  auto res = client.Get(path, headers);
  if (auto error = check(res, "Bars"))
    return std::unexpected(*error);

  auto data = json::parse(res->body, nullptr, false);
  if (data.is_discarded())
    return std::unexpected(BrokerError::ParseError);

  auto bars = std::vector<Bar>{};
  if (not data.contains("bars"))
    return bars;

  try {
    for (const auto &bar_json : data["bars"]) {
      auto bar = Bar{};
      bar.timestamp = bar_json["t"].get<std::string>();
      bar.open = bar_json["o"].get<double>();
      bar.high = bar_json["h"].get<double>();
      bar.low = bar_json["l"].get<double>();
      bar.close = bar_json["c"].get<double>();
      bar.volume = bar_json.value("v", 0L);
      bars.push_back(bar);
    }
  } catch (const json::exception &) {
    return std::unexpected(BrokerError::ParseError);
  }

  return bars;
}

std::expected<SymbolInfo, BrokerError>
BridgeClient::get_symbol_info(std::string_view symbol) {
  auto client = make_client(base_url_, 10);
  httplib::Headers headers = {{"X-Bridge-Token", token_}};

  auto res = client.Get(std::format("/symbols/{}", symbol), headers);
  if (auto error = check(res, "Symbol info"))
    return std::unexpected(*error);

  try {
    auto j = json::parse(res->body);
    return SymbolInfo{.symbol = std::string{symbol},
                      .pip_size = j.at("pip_size").get<double>(),
                      .pip_value = j.at("pip_value").get<double>(),
                      .volume_step = j.value("volume_step", 0.01),
                      .volume_min = j.value("volume_min", 0.01)};
  } catch (const json::exception &) {
    return std::unexpected(BrokerError::ParseError);
  }
}

std::expected<Fill, BrokerError> BridgeClient::open(std::string_view symbol,
                                                    Side side, double volume,
                                                    std::string_view comment) {
  auto client = make_client(base_url_, 15); // Fail fast for order placement
  httplib::Headers headers = {{"X-Bridge-Token", token_}};

  auto order = json{{"symbol", std::string{symbol}},
                    {"side", side == Side::buy ? "buy" : "sell"},
                    {"type", "market"},
                    {"volume", volume},
                    {"comment", std::string{comment}}};

  auto res = client.Post("/orders", headers, order.dump(), "application/json");
  if (auto error = check(res, "Order"))
    return std::unexpected(*error);

  try {
    auto j = json::parse(res->body);
    return Fill{.ticket = j.at("ticket").get<Ticket>(),
                .price = j.at("price").get<double>()};
  } catch (const json::exception &) {
    return std::unexpected(BrokerError::ParseError);
  }
}

bool BridgeClient::close(Ticket ticket) {
  auto client = make_client(base_url_, 15); // Fail fast for position closing
  httplib::Headers headers = {{"X-Bridge-Token", token_}};

  auto res = client.Delete(std::format("/positions/{}", ticket), headers);
  return not check(res, "Close position");
}

bool BridgeClient::close_partial(Ticket ticket, double volume) {
  auto client = make_client(base_url_, 15);
  httplib::Headers headers = {{"X-Bridge-Token", token_}};

  auto body = json{{"volume", volume}};
  auto res = client.Post(std::format("/positions/{}/close", ticket), headers,
                         body.dump(), "application/json");
  return not check(res, "Partial close");
}

bool BridgeClient::modify_stop_loss(Ticket ticket, double stop_loss) {
  auto client = make_client(base_url_, 15);
  httplib::Headers headers = {{"X-Bridge-Token", token_}};

  auto body = json{{"stop_loss", stop_loss}};
  auto res = client.Patch(std::format("/positions/{}", ticket), headers,
                          body.dump(), "application/json");
  return not check(res, "Modify stop");
}

std::expected<std::vector<PositionRecord>, BrokerError>
BridgeClient::get_open_positions(std::optional<std::string_view> symbol) {
  auto client = make_client(base_url_, 30);
  httplib::Headers headers = {{"X-Bridge-Token", token_}};

  auto path = symbol ? std::format("/positions?symbol={}", *symbol)
                     : std::string{"/positions"};
  auto res = client.Get(path, headers);
  if (auto error = check(res, "Positions"))
    return std::unexpected(*error);

  return parse_positions(res->body);
}

std::expected<double, BrokerError> BridgeClient::get_account_balance() {
  auto client = make_client(base_url_, 10);
  httplib::Headers headers = {{"X-Bridge-Token", token_}};

  auto res = client.Get("/account", headers);
  if (auto error = check(res, "Account"))
    return std::unexpected(*error);

  try {
    return json::parse(res->body).at("balance").get<double>();
  } catch (const json::exception &) {
    return std::unexpected(BrokerError::ParseError);
  }
}

} // namespace fxstack
