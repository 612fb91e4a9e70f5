#pragma once

// Entry signals handed over by the external signal detector, one JSON object
// per line:
//   {"symbol": "EURUSD", "direction": "sell", "price": 1.105,
//    "confluence_score": 4, "strategy": "VWAP", "volume": 0.02}

#include "stack_coordinator.h"
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace fxstack {

// nullopt for anything that is not a well-formed signal
std::optional<EntrySignal> parse_signal(std::string_view line);

class SignalInbox {
public:
  explicit SignalInbox(std::filesystem::path);

  // Take every pending signal; the file is consumed
  std::vector<EntrySignal> drain();

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace fxstack
