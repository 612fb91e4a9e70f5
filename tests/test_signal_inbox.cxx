// Entry signals from the detector
#include "signal_inbox.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <filesystem>
#include <fstream>

using namespace fxstack;
using Catch::Matchers::WithinRel;

TEST_CASE("Signal lines", "[signals]") {
  SECTION("Complete signal") {
    const auto signal = parse_signal(
        R"({"symbol": "EURUSD", "direction": "sell", "price": 1.105,
            "confluence_score": 4, "strategy": "VWAP", "volume": 0.02})");
    REQUIRE(signal.has_value());
    CHECK(signal->symbol == "EURUSD");
    CHECK(signal->side == Side::sell);
    CHECK_THAT(signal->price, WithinRel(1.105));
    CHECK(signal->confluence_score == 4);
    CHECK(signal->strategy == "VWAP");
    REQUIRE(signal->volume.has_value());
    CHECK_THAT(*signal->volume, WithinRel(0.02));
  }

  SECTION("Optional fields default") {
    const auto signal = parse_signal(R"({"symbol": "GBPUSD", "direction": "buy"})");
    REQUIRE(signal.has_value());
    CHECK(signal->side == Side::buy);
    CHECK(signal->strategy == "SIGNAL");
    CHECK_FALSE(signal->volume.has_value());
  }

  SECTION("Rejected") {
    CHECK_FALSE(parse_signal("not json"));
    CHECK_FALSE(parse_signal("[1, 2]"));
    CHECK_FALSE(parse_signal(R"({"direction": "buy"})"));
    CHECK_FALSE(parse_signal(R"({"symbol": "", "direction": "buy"})"));
    CHECK_FALSE(parse_signal(R"({"symbol": "EURUSD", "direction": "long"})"));
    CHECK_FALSE(parse_signal(R"({"symbol": "EURUSD", "direction": 1})"));
    CHECK_FALSE(
        parse_signal(R"({"symbol": "EURUSD", "direction": "buy", "volume": 0})"));
  }
}

TEST_CASE("Inbox is consumed on drain", "[signals]") {
  const auto path =
      std::filesystem::temp_directory_path() / "fxstack_signals_test.jsonl";
  std::filesystem::remove(path);

  auto inbox = SignalInbox{path};
  CHECK(inbox.drain().empty());

  {
    auto file = std::ofstream{path};
    file << R"({"symbol": "EURUSD", "direction": "sell", "strategy": "VWAP"})"
         << '\n'
         << "garbage\n"
         << '\n'
         << R"({"symbol": "GBPUSD", "direction": "buy"})" << '\n';
  }

  const auto signals = inbox.drain();
  REQUIRE(signals.size() == 2);
  CHECK(signals[0].symbol == "EURUSD");
  CHECK(signals[1].symbol == "GBPUSD");

  CHECK_FALSE(std::filesystem::exists(path));
  CHECK_FALSE(std::filesystem::exists(path.string() + ".draining"));
  CHECK(inbox.drain().empty());
}
