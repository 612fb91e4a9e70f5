#include "bridge_json.h"
#include <print>
#include <string>

using json = nlohmann::json;

namespace fxstack {

std::optional<PositionRecord> position_from_json(const json &item) {
  try {
    const auto side = item.at("side").get<std::string>();
    if (side != "buy" and side != "sell")
      return std::nullopt;

    auto pos = PositionRecord{};
    pos.ticket = item.at("ticket").get<Ticket>();
    pos.symbol = item.at("symbol").get<std::string>();
    pos.side = side == "sell" ? Side::sell : Side::buy;
    pos.volume = item.at("volume").get<double>();
    pos.price_open = item.at("price_open").get<double>();
    pos.price_current = item.value("price_current", pos.price_open);
    pos.profit = item.value("profit", 0.0);
    pos.comment = item.value("comment", "");

    if (auto it = item.find("time"); it != item.end() and it->is_string())
      pos.opened_at = parse_iso(it->get<std::string>());

    return pos;
  } catch (const json::exception &) {
    return std::nullopt;
  }
}

std::expected<std::vector<PositionRecord>, BrokerError>
parse_positions(std::string_view body) {
  auto data = json::parse(body, nullptr, false);
  if (data.is_discarded() or not data.is_object())
    return std::unexpected(BrokerError::ParseError);

  auto positions = std::vector<PositionRecord>{};
  const auto it = data.find("positions");
  if (it == data.end())
    return positions;
  if (not it->is_array())
    return std::unexpected(BrokerError::ParseError);

  for (const auto &item : *it) {
    if (auto pos = position_from_json(item)) {
      positions.push_back(std::move(*pos));
      continue;
    }
    std::println("\033[33m[BROKER] Skipping malformed position: {}\033[0m",
                 item.dump());
  }

  return positions;
}

} // namespace fxstack
