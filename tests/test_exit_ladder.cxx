// Partial-close ladder and trailing stop
#include "exit_ladder.h"
#include "fake_broker.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace fxstack;
using namespace fxstack::testing;
using Catch::Matchers::WithinAbs;

namespace {

MarketContext quote_at(double price) {
  return {.symbol = "EURUSD",
          .info = {.symbol = "EURUSD",
                   .pip_size = 0.0001,
                   .pip_value = 10.0,
                   .volume_step = 0.01,
                   .volume_min = 0.01},
          .quote = {.symbol = "EURUSD", .bid = price, .ask = price}};
}

TrackedPosition position(Side side, double volume = 0.1) {
  auto pos = TrackedPosition{};
  pos.ticket = 100;
  pos.symbol = "EURUSD";
  pos.side = side;
  pos.entry_price = 1.1000;
  pos.initial_volume = volume;
  pos.current_volume = volume;
  pos.opened_at = at(0);
  return pos;
}

} // namespace

TEST_CASE("Stop sits behind the price", "[ladder]") {
  CHECK_THAT(trailing_stop_price(Side::buy, 1.1020, 10.0, 0.0001),
             WithinAbs(1.1010, 1e-9));
  CHECK_THAT(trailing_stop_price(Side::sell, 1.0980, 10.0, 0.0001),
             WithinAbs(1.0990, 1e-9));
  CHECK_THAT(trailing_stop_price(Side::buy, 150.20, 10.0, 0.01),
             WithinAbs(150.10, 1e-9));
}

TEST_CASE("PC1 then PC2", "[ladder]") {
  const auto config = LadderConfig{};
  auto pos = position(Side::buy);

  CHECK_FALSE(evaluate_ladder(pos, quote_at(1.1009), config, at(5)));

  SECTION("PC1 takes a quarter of current volume on the broker step") {
    const auto action = evaluate_ladder(pos, quote_at(1.1012), config, at(5));
    REQUIRE(action);
    const auto *take = std::get_if<TakePartial>(&*action);
    REQUIRE(take);
    CHECK(take->stage == LadderStage::pc1);
    CHECK_THAT(take->volume, WithinAbs(0.02, 1e-9));
    CHECK_THAT(take->profit_pips, WithinAbs(12.0, 1e-6));
  }

  SECTION("PC2 takes a quarter of initial volume") {
    pos.partial_close.pc1_closed = true;
    pos.current_volume = 0.08;

    CHECK_FALSE(evaluate_ladder(pos, quote_at(1.1015), config, at(5)));

    const auto action = evaluate_ladder(pos, quote_at(1.1021), config, at(5));
    REQUIRE(action);
    const auto *take = std::get_if<TakePartial>(&*action);
    REQUIRE(take);
    CHECK(take->stage == LadderStage::pc2);
    CHECK_THAT(take->volume, WithinAbs(0.02, 1e-9));
  }

  SECTION("Short side mirrors") {
    auto short_pos = position(Side::sell);
    const auto action =
        evaluate_ladder(short_pos, quote_at(1.0988), config, at(5));
    REQUIRE(action);
    CHECK(std::holds_alternative<TakePartial>(*action));
    CHECK_FALSE(evaluate_ladder(short_pos, quote_at(1.1010), config, at(5)));
  }

  SECTION("Below the broker minimum only the flag moves") {
    auto small = position(Side::buy, 0.01);
    const auto action = evaluate_ladder(small, quote_at(1.1012), config, at(5));
    REQUIRE(action);
    const auto *take = std::get_if<TakePartial>(&*action);
    REQUIRE(take);
    CHECK_THAT(take->volume, WithinAbs(0.0, 1e-12));
  }

  SECTION("Both stages done: nothing more") {
    pos.partial_close.pc1_closed = true;
    pos.partial_close.pc2_closed = true;
    CHECK_FALSE(evaluate_ladder(pos, quote_at(1.1050), config, at(5)));
  }
}

TEST_CASE("Recovery latch keeps the ladder off", "[ladder]") {
  const auto config = LadderConfig{};
  auto pos = position(Side::buy);
  pos.recovery_engaged = true;

  CHECK_FALSE(evaluate_ladder(pos, quote_at(1.1050), config, at(5)));

  pos.recovery_engaged = false;
  pos.dca_levels.push_back({.ticket = 101, .level_index = 1, .volume = 0.1});
  CHECK_FALSE(evaluate_ladder(pos, quote_at(1.1050), config, at(5)));
}

TEST_CASE("Trailing stop ratchets and never loosens", "[ladder][trailing]") {
  const auto config = LadderConfig{};
  auto pos = position(Side::buy);
  pos.partial_close = {.pc1_closed = true,
                       .pc2_closed = true,
                       .pc2_trigger_time = at(0)};
  pos.trailing_stop = {.active = true,
                       .stop_price = 1.1010,
                       .distance_pips = 10.0,
                       .peak_price = 1.1020};

  SECTION("New peak pulls the stop up") {
    const auto action = evaluate_ladder(pos, quote_at(1.1030), config, at(5));
    REQUIRE(action);
    const auto *move = std::get_if<MoveStop>(&*action);
    REQUIRE(move);
    CHECK_THAT(move->stop_price, WithinAbs(1.1020, 1e-9));
    CHECK_THAT(move->peak_price, WithinAbs(1.1030, 1e-9));
    CHECK_FALSE(move->activate);
  }

  SECTION("Pullback above the stop holds") {
    CHECK_FALSE(evaluate_ladder(pos, quote_at(1.1015), config, at(5)));
  }

  SECTION("Cross closes the stack") {
    const auto action = evaluate_ladder(pos, quote_at(1.1010), config, at(5));
    REQUIRE(action);
    const auto *close = std::get_if<CloseStack>(&*action);
    REQUIRE(close);
    CHECK(close->reason == CloseReason::trailing_stop);
  }

  SECTION("A tighter stop is kept") {
    pos.trailing_stop.stop_price = 1.1025;
    const auto action = evaluate_ladder(pos, quote_at(1.1028), config, at(5));
    REQUIRE(action);
    const auto *move = std::get_if<MoveStop>(&*action);
    REQUIRE(move);
    CHECK_THAT(move->stop_price, WithinAbs(1.1025, 1e-9));
    CHECK_THAT(move->peak_price, WithinAbs(1.1028, 1e-9));
  }

  SECTION("Short trail moves down") {
    auto short_pos = position(Side::sell);
    short_pos.partial_close = pos.partial_close;
    short_pos.trailing_stop = {.active = true,
                               .stop_price = 1.0990,
                               .distance_pips = 10.0,
                               .peak_price = 1.0980};

    const auto action =
        evaluate_ladder(short_pos, quote_at(1.0970), config, at(5));
    REQUIRE(action);
    const auto *move = std::get_if<MoveStop>(&*action);
    REQUIRE(move);
    CHECK_THAT(move->stop_price, WithinAbs(1.0980, 1e-9));

    const auto hit = evaluate_ladder(short_pos, quote_at(1.0991), config, at(5));
    REQUIRE(hit);
    CHECK(std::holds_alternative<CloseStack>(*hit));
  }
}

TEST_CASE("PC2 runner has a time limit", "[ladder]") {
  const auto config = LadderConfig{};
  auto pos = position(Side::buy);
  pos.partial_close = {.pc1_closed = true,
                       .pc2_closed = true,
                       .pc2_trigger_time = at(0)};

  CHECK_FALSE(evaluate_ladder(pos, quote_at(1.1015), config, at(59)));

  const auto action = evaluate_ladder(pos, quote_at(1.1015), config, at(60));
  REQUIRE(action);
  const auto *close = std::get_if<CloseStack>(&*action);
  REQUIRE(close);
  CHECK(close->reason == CloseReason::pc2_time_limit);
  CHECK(close->parent == 100);
}
