#include "signal_inbox.h"
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <system_error>

using json = nlohmann::json;

namespace fxstack {

std::optional<EntrySignal> parse_signal(std::string_view line) {
  auto j = json::parse(line, nullptr, false);
  if (j.is_discarded() or not j.is_object())
    return std::nullopt;

  try {
    auto signal = EntrySignal{};
    signal.symbol = j.at("symbol").get<std::string>();

    const auto direction = j.at("direction").get<std::string>();
    if (direction == "buy")
      signal.side = Side::buy;
    else if (direction == "sell")
      signal.side = Side::sell;
    else
      return std::nullopt;

    signal.price = j.value("price", 0.0);
    signal.confluence_score = j.value("confluence_score", 0);
    signal.strategy = j.value("strategy", "SIGNAL");

    if (auto it = j.find("volume"); it != j.end() and it->is_number()) {
      signal.volume = it->get<double>();
      if (*signal.volume <= 0.0)
        return std::nullopt;
    }

    if (signal.symbol.empty())
      return std::nullopt;

    return signal;
  } catch (const json::exception &) {
    return std::nullopt;
  }
}

SignalInbox::SignalInbox(std::filesystem::path path) : path_{std::move(path)} {}

std::vector<EntrySignal> SignalInbox::drain() {
  auto signals = std::vector<EntrySignal>{};

  auto ec = std::error_code{};
  if (not std::filesystem::exists(path_, ec))
    return signals;

  // Move the file aside so the detector starts a fresh one
  auto taken = path_;
  taken += ".draining";
  std::filesystem::rename(path_, taken, ec);
  if (ec) {
    std::println("\033[33m[SIGNALS] Cannot take {}: {}\033[0m",
                 path_.string(), ec.message());
    return signals;
  }

  {
    auto file = std::ifstream{taken};
    auto line = std::string{};
    auto line_number = 0;

    while (std::getline(file, line)) {
      ++line_number;
      if (line.empty())
        continue;

      if (auto signal = parse_signal(line))
        signals.push_back(std::move(*signal));
      else
        std::println("\033[33m[SIGNALS] Skipping malformed line {}: {}\033[0m",
                     line_number, line);
    }
  }

  std::filesystem::remove(taken, ec);
  if (ec)
    std::println("\033[33m[SIGNALS] Cannot remove {}: {}\033[0m",
                 taken.string(), ec.message());

  return signals;
}

} // namespace fxstack
