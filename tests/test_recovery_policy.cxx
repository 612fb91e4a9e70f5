// Recovery policy: triggers, safeguards, stack exits and protection
#include "fake_broker.h"
#include "recovery_policy.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace fxstack;
using namespace fxstack::testing;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

MarketContext context(double price, std::optional<double> adx = std::nullopt,
                      std::vector<Bar> fast = mixed_bars(10, 1.1)) {
  return {.symbol = "EURUSD",
          .info = {.symbol = "EURUSD",
                   .pip_size = 0.0001,
                   .pip_value = 10.0,
                   .volume_step = 0.01,
                   .volume_min = 0.01},
          .quote = {.symbol = "EURUSD", .bid = price, .ask = price},
          .adx = adx,
          .fast_bars = std::move(fast),
          .exit_signal = false,
          .balance = 1000.0};
}

// Three bullish candles after a bearish one
std::vector<Bar> rising() {
  return {candle(1.1, 1.099), candle(1.099, 1.1), candle(1.1, 1.101),
          candle(1.101, 1.102)};
}

std::vector<Bar> falling() {
  return {candle(1.1, 1.101), candle(1.101, 1.1), candle(1.1, 1.099),
          candle(1.099, 1.098)};
}

TrackedPosition short_position(double volume = 0.1) {
  auto pos = TrackedPosition{};
  pos.ticket = 100;
  pos.symbol = "EURUSD";
  pos.side = Side::sell;
  pos.entry_price = 1.10500;
  pos.initial_volume = volume;
  pos.current_volume = volume;
  pos.opened_at = at(0);
  return pos;
}

template <typename T> std::vector<T> actions_of(const RecoveryPlan &plan) {
  auto out = std::vector<T>{};
  for (const auto &action : plan.actions)
    if (const auto *a = std::get_if<T>(&action))
      out.push_back(*a);
  return out;
}

} // namespace

TEST_CASE("Trend test uses ADX or candle momentum", "[policy]") {
  const auto config = RecoveryConfig{};

  CHECK_FALSE(is_trending(context(1.1), Side::sell, config));
  CHECK(is_trending(context(1.1, 30.0), Side::sell, config));
  CHECK_FALSE(is_trending(context(1.1, 29.9), Side::sell, config));

  // Rising candles are against a short, with a long
  CHECK(is_trending(context(1.1, std::nullopt, rising()), Side::sell, config));
  CHECK_FALSE(is_trending(context(1.1, std::nullopt, rising()), Side::buy, config));
  CHECK(is_trending(context(1.1, std::nullopt, falling()), Side::buy, config));
}

TEST_CASE("DCA in a ranging loss", "[policy][dca]") {
  const auto config = RecoveryConfig{};
  auto pos = short_position();

  SECTION("Below the first trigger nothing happens") {
    const auto plan = evaluate_recovery(pos, context(1.10640), config);
    CHECK(plan.actions.empty());
    CHECK(plan.blocked.empty());
  }

  SECTION("Level 1 at 15 pips against") {
    const auto plan = evaluate_recovery(pos, context(1.10660), config);
    const auto dca = actions_of<OpenDca>(plan);
    REQUIRE(dca.size() == 1);
    CHECK(dca[0].level == 1);
    CHECK(dca[0].side == Side::sell);
    CHECK_THAT(dca[0].volume, WithinRel(0.1));
    CHECK_THAT(dca[0].pips_underwater, WithinAbs(16.0, 1e-6));
  }

  SECTION("One level per tick, next after the highest taken") {
    pos.dca_levels.push_back({.ticket = 101, .level_index = 1, .volume = 0.1});
    pos.recovery_engaged = true;

    // 50 pips against qualifies for levels 2 and 3; only 2 fires
    const auto plan = evaluate_recovery(pos, context(1.11000), config);
    const auto dca = actions_of<OpenDca>(plan);
    REQUIRE(dca.size() == 1);
    CHECK(dca[0].level == 2);
  }

  SECTION("No level past the maximum") {
    for (auto level = 1; level <= 3; ++level)
      pos.dca_levels.push_back(
          {.ticket = Ticket(100 + level), .level_index = level, .volume = 0.1});
    pos.recovery_engaged = true;

    const auto plan = evaluate_recovery(pos, context(1.10900), config);
    CHECK(actions_of<OpenDca>(plan).empty());
  }

  SECTION("Blocked while trending, with the reason recorded") {
    const auto plan = evaluate_recovery(pos, context(1.10660, 35.0), config);
    CHECK(actions_of<OpenDca>(plan).empty());
    REQUIRE(plan.blocked.size() == 1);
    CHECK(plan.blocked[0].kind == RecoveryKind::dca);
    CHECK(plan.blocked[0].reason.starts_with("trending"));
  }

  SECTION("Blocked by candle momentum") {
    const auto plan =
        evaluate_recovery(pos, context(1.10660, std::nullopt, rising()), config);
    CHECK(actions_of<OpenDca>(plan).empty());
    REQUIRE(plan.blocked.size() == 1);
    CHECK(plan.blocked[0].reason.starts_with("momentum"));
  }

  SECTION("Stops once hedged") {
    pos.hedges.push_back({.ticket = 103,
                          .side = Side::buy,
                          .volume = 0.2,
                          .entry_price = 1.1095,
                          .trigger_pips = 45.0});
    pos.recovery_engaged = true;
    const auto plan = evaluate_recovery(pos, context(1.10700), config);
    CHECK(actions_of<OpenDca>(plan).empty());
  }
}

TEST_CASE("Hedge in a trending loss", "[policy][hedge]") {
  const auto config = RecoveryConfig{};
  auto pos = short_position();
  pos.dca_levels.push_back({.ticket = 101, .level_index = 1, .volume = 0.1});
  pos.recovery_engaged = true;

  SECTION("Opposite side, sized on exposure") {
    const auto plan = evaluate_recovery(pos, context(1.10950, 35.0), config);
    const auto hedges = actions_of<OpenHedge>(plan);
    REQUIRE(hedges.size() == 1);
    CHECK(hedges[0].side == Side::buy);
    CHECK_THAT(hedges[0].volume, WithinRel(0.4));
    CHECK_THAT(hedges[0].trigger_pips, WithinAbs(45.0, 1e-6));
  }

  SECTION("Not trending: blocked") {
    const auto plan = evaluate_recovery(pos, context(1.10950), config);
    CHECK(actions_of<OpenHedge>(plan).empty());

    auto hedge_blocks = 0;
    for (const auto &blocked : plan.blocked)
      if (blocked.kind == RecoveryKind::hedge) {
        ++hedge_blocks;
        CHECK(blocked.reason == "market not trending");
      }
    CHECK(hedge_blocks == 1);

    // The DCA still fires in the ranging case
    CHECK(actions_of<OpenDca>(plan).size() == 1);
  }

  SECTION("No second hedge") {
    pos.hedges.push_back({.ticket = 103,
                          .side = Side::buy,
                          .volume = 0.4,
                          .entry_price = 1.1095,
                          .trigger_pips = 45.0});
    const auto plan = evaluate_recovery(pos, context(1.11200, 40.0), config);
    CHECK(actions_of<OpenHedge>(plan).empty());
  }
}

TEST_CASE("Hedge DCA and the hedge unwind", "[policy][hedge]") {
  const auto config = RecoveryConfig{};
  auto pos = short_position();
  pos.recovery_engaged = true;
  pos.hedges.push_back({.ticket = 103,
                        .side = Side::buy,
                        .volume = 0.4,
                        .entry_price = 1.10950,
                        .trigger_pips = 45.0});

  SECTION("Hedge underwater while the original recovers") {
    // Original 24 pips against (r = 0.47), hedge 21 pips down
    const auto plan =
        evaluate_recovery(pos, context(1.10740, std::nullopt, falling()), config);
    const auto hdca = actions_of<OpenHedgeDca>(plan);
    REQUIRE(hdca.size() == 1);
    CHECK(hdca[0].hedge == 103);
    CHECK(hdca[0].level == 1);
    CHECK(hdca[0].side == Side::sell);
    CHECK_THAT(hdca[0].volume, WithinRel(0.2));
  }

  SECTION("Without recovery momentum the hedge DCA waits") {
    const auto plan = evaluate_recovery(pos, context(1.10740), config);
    CHECK(actions_of<OpenHedgeDca>(plan).empty());
    REQUIRE(plan.blocked.size() == 1);
    CHECK(plan.blocked[0].kind == RecoveryKind::hedge_dca);
  }

  SECTION("Partial stages fire one per tick as the original recovers") {
    // 20 pips against of 45: r = 0.56
    auto plan = evaluate_recovery(pos, context(1.10700), config);
    auto partial = actions_of<HedgePartialClose>(plan);
    REQUIRE(partial.size() == 1);
    CHECK(partial[0].stage == 1);
    CHECK_THAT(partial[0].percent, WithinRel(0.5));
    CHECK(actions_of<OpenHedgeDca>(plan).empty());

    // Back to breakeven: r = 1, but stage 2 is next
    pos.hedges[0].partial_stage = 1;
    plan = evaluate_recovery(pos, context(1.10500), config);
    partial = actions_of<HedgePartialClose>(plan);
    REQUIRE(partial.size() == 1);
    CHECK(partial[0].stage == 2);
    CHECK_THAT(partial[0].percent, WithinRel(0.75));

    pos.hedges[0].partial_stage = 3;
    plan = evaluate_recovery(pos, context(1.10500), config);
    CHECK(actions_of<HedgePartialClose>(plan).empty());
  }

  SECTION("A lagging hedge DCA holds the stage back") {
    pos.hedges[0].partial_stage = 1;
    pos.hedges[0].dca_levels = {{.ticket = 104,
                                 .level_index = 1,
                                 .volume = 0.2,
                                 .entry_price = 1.10750}};
    CHECK(pos.hedges[0].stage_reached() == 0);
    CHECK(pos.hedges[0].unwinding());

    auto plan = evaluate_recovery(pos, context(1.10700), config);
    auto partial = actions_of<HedgePartialClose>(plan);
    REQUIRE(partial.size() == 1);
    CHECK(partial[0].stage == 1);
    CHECK(actions_of<OpenHedgeDca>(plan).empty());

    pos.hedges[0].dca_levels[0].partial_stage = 1;
    plan = evaluate_recovery(pos, context(1.10700), config);
    CHECK(actions_of<HedgePartialClose>(plan).empty());
  }

  SECTION("An unwinding hedge gets no more averaging") {
    pos.hedges[0].partial_stage = 1;
    // r = 0.47 is below stage 2, hedge 21 pips down with momentum
    const auto plan =
        evaluate_recovery(pos, context(1.10740, std::nullopt, falling()), config);
    CHECK(actions_of<OpenHedgeDca>(plan).empty());
    CHECK(actions_of<HedgePartialClose>(plan).empty());
  }

  SECTION("Trigger is rebuilt from fill prices when unknown") {
    pos.hedges[0].trigger_pips = 0.0;
    CHECK_THAT(hedge_trigger_pips(pos, pos.hedges[0], 0.0001),
               WithinAbs(45.0, 1e-6));
  }
}

TEST_CASE("Grid pyramids into profit", "[policy][grid]") {
  auto config = RecoveryConfig{};
  auto pos = short_position();

  SECTION("Disabled by default") {
    CHECK(actions_of<OpenGrid>(evaluate_recovery(pos, context(1.10250), config))
              .empty());
  }

  config.grid_enabled = true;

  SECTION("Level by spacing") {
    auto grid = actions_of<OpenGrid>(evaluate_recovery(pos, context(1.10290), config));
    REQUIRE(grid.size() == 1);
    CHECK(grid[0].level == 1);
    CHECK(grid[0].side == Side::sell);

    CHECK(actions_of<OpenGrid>(evaluate_recovery(pos, context(1.10290), config, 1))
              .empty());
    CHECK(actions_of<OpenGrid>(evaluate_recovery(pos, context(1.10090), config, 1))
              .size() == 1);
    CHECK(actions_of<OpenGrid>(evaluate_recovery(pos, context(1.09000), config, 2))
              .empty());
  }

  SECTION("Grid children never pyramid") {
    pos.role = StackRole::grid_child;
    pos.grid_parent = 99;
    CHECK(actions_of<OpenGrid>(evaluate_recovery(pos, context(1.10250), config))
              .empty());
  }

  SECTION("Not once recovery has been engaged") {
    pos.recovery_engaged = true;
    CHECK(actions_of<OpenGrid>(evaluate_recovery(pos, context(1.10250), config))
              .empty());
  }
}

TEST_CASE("Stack exits in priority order", "[policy][exit]") {
  const auto config = RecoveryConfig{};
  auto pos = short_position();
  const auto ctx = context(1.10500);

  const auto reason = [&](StackPnl pnl, Timestamp now = at(60)) {
    auto exit = evaluate_stack_exit(pos, pnl, ctx, config, now);
    return exit ? std::optional{exit->reason} : std::nullopt;
  };

  CHECK_FALSE(reason({.unrealized = -5.0}).has_value());

  SECTION("Stop-loss on net including realized") {
    CHECK(reason({.unrealized = -15.0, .realized = -6.0}) ==
          CloseReason::stack_stop_loss);
    CHECK_FALSE(reason({.unrealized = -15.0, .realized = -5.0}).has_value());
  }

  SECTION("Drawdown guard on unrealized") {
    // Net inside the stop-loss, unrealized past 4 x 20 pips x $10 x 0.1 lots
    CHECK(reason({.unrealized = -85.0, .realized = 70.0}) ==
          CloseReason::stack_drawdown);
  }

  SECTION("Profit target only once recovery engaged") {
    // 0.5% of 1000 = 5
    CHECK_FALSE(reason({.unrealized = 6.0}).has_value());
    pos.recovery_engaged = true;
    CHECK(reason({.unrealized = 6.0}) == CloseReason::profit_target);
    CHECK_FALSE(reason({.unrealized = 4.0}).has_value());
  }

  SECTION("Time limit") {
    CHECK(reason({}, at(24 * 60)) == CloseReason::time_limit);
    CHECK_FALSE(reason({}, at(24 * 60 - 1)).has_value());
  }

  SECTION("Stop-loss outranks the time limit") {
    CHECK(reason({.unrealized = -30.0}, at(48 * 60)) ==
          CloseReason::stack_stop_loss);
  }

  SECTION("Exit signal only on the plain path below the pip cap") {
    auto signalled = ctx;
    signalled.exit_signal = true;

    const auto exit_for = [&](const MarketContext &c) {
      auto exit = evaluate_stack_exit(pos, {}, c, config, at(60));
      return exit ? std::optional{exit->reason} : std::nullopt;
    };

    CHECK(exit_for(signalled) == CloseReason::exit_signal);

    auto far = context(1.10300);
    far.exit_signal = true;
    CHECK_FALSE(exit_for(far).has_value());

    pos.partial_close.pc1_closed = true;
    CHECK_FALSE(exit_for(signalled).has_value());

    pos.partial_close.pc1_closed = false;
    pos.recovery_engaged = true;
    CHECK_FALSE(exit_for(signalled).has_value());
  }

  CHECK(is_stop_out(CloseReason::stack_stop_loss));
  CHECK(is_stop_out(CloseReason::stack_drawdown));
  CHECK_FALSE(is_stop_out(CloseReason::cascade_protection));
  CHECK_FALSE(is_stop_out(CloseReason::time_limit));
}

TEST_CASE("Close reasons read back from their names", "[policy]") {
  for (auto reason : {CloseReason::stack_stop_loss, CloseReason::profit_target,
                      CloseReason::trailing_stop, CloseReason::account_emergency})
    CHECK(close_reason_from_string(to_string(reason)) == reason);
  CHECK_FALSE(close_reason_from_string("bogus").has_value());
}

TEST_CASE("Volumes respect the broker's step and minimum", "[policy]") {
  const auto info = SymbolInfo{.volume_step = 0.01, .volume_min = 0.01};

  CHECK_THAT(normalize_open_volume(0.237, info), WithinAbs(0.23, 1e-9));
  CHECK_THAT(normalize_open_volume(0.004, info), WithinAbs(0.01, 1e-9));

  CHECK_THAT(normalize_close_volume(0.05, 0.1, info), WithinAbs(0.05, 1e-9));
  CHECK_THAT(normalize_close_volume(0.025, 0.1, info), WithinAbs(0.02, 1e-9));
  CHECK_THAT(normalize_close_volume(0.004, 0.1, info), WithinAbs(0.0, 1e-12));
  CHECK_THAT(normalize_close_volume(0.2, 0.1, info), WithinAbs(0.1, 1e-9));
  // Remainder below the minimum: close it all
  CHECK_THAT(normalize_close_volume(0.01, 0.015, info), WithinAbs(0.015, 1e-9));
}

TEST_CASE("Cascade window confirms clustered stop-outs", "[policy][cascade]") {
  const auto config = CascadeConfig{};
  auto window = StopOutWindow{};

  window.record({.symbol = "EURUSD", .timestamp = at(0), .adx_at_stop = 35.0});
  CHECK_FALSE(window.confirmed(at(1), config));

  SECTION("Two stops with elevated ADX") {
    window.record({.symbol = "GBPUSD", .timestamp = at(20), .adx_at_stop = 35.0});
    CHECK(window.confirmed(at(20), config));
    CHECK_THAT(*window.mean_adx(), WithinRel(35.0));
    CHECK(window.symbols() == std::set<std::string>{"EURUSD", "GBPUSD"});
  }

  SECTION("Calm market is noise") {
    window.record({.symbol = "GBPUSD", .timestamp = at(20), .adx_at_stop = 10.0});
    CHECK_FALSE(window.confirmed(at(20), config));
  }

  SECTION("Unknown ADX is not averaged") {
    window.record({.symbol = "GBPUSD", .timestamp = at(20)});
    CHECK(window.confirmed(at(20), config));
    CHECK_THAT(*window.mean_adx(), WithinRel(35.0));
  }

  SECTION("No known ADX at all is not a cascade") {
    auto blind = StopOutWindow{};
    blind.record({.symbol = "EURUSD", .timestamp = at(0)});
    blind.record({.symbol = "GBPUSD", .timestamp = at(5)});
    CHECK_FALSE(blind.confirmed(at(5), config));
  }

  SECTION("Old stops fall out of the window") {
    window.record({.symbol = "GBPUSD", .timestamp = at(40), .adx_at_stop = 35.0});
    CHECK_FALSE(window.confirmed(at(40), config));
    CHECK(window.size() == 1);
  }
}

TEST_CASE("Trend block has hysteresis", "[policy][block]") {
  const auto config = CascadeConfig{};

  CHECK(evaluate_trend_block(false, 30.0, config));
  CHECK_FALSE(evaluate_trend_block(false, 27.0, config));
  CHECK(evaluate_trend_block(true, 27.0, config));
  CHECK_FALSE(evaluate_trend_block(true, 24.9, config));
  CHECK(evaluate_trend_block(true, std::nullopt, config));
  CHECK_FALSE(evaluate_trend_block(false, std::nullopt, config));
}

TEST_CASE("Blocking state", "[policy][block]") {
  auto state = BlockingState{};
  state.cascade_blocks["EURUSD"] = at(60);
  state.cascade_blocks["GBPUSD"] = at(10);
  state.market_trending_block["EURUSD"] = true;
  state.last_block_update = at(0);

  SECTION("Cascade blocks expire and are removed") {
    CHECK(state.cascade_blocked("EURUSD", at(30)));
    CHECK_FALSE(state.cascade_blocked("GBPUSD", at(30)));
    CHECK_FALSE(state.cascade_blocks.contains("GBPUSD"));
    CHECK_FALSE(state.cascade_blocked("USDJPY", at(30)));
  }

  SECTION("Restore drops expired blocks and keeps fresh trend blocks") {
    state.restore(at(30), CascadeConfig{});
    CHECK(state.cascade_blocks.size() == 1);
    CHECK(state.trend_blocked("EURUSD"));
  }

  SECTION("Restore forgets stale trend blocks") {
    state.restore(at(3 * 60), CascadeConfig{});
    CHECK(state.cascade_blocks.empty());
    CHECK_FALSE(state.trend_blocked("EURUSD"));
  }
}
