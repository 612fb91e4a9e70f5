#pragma once

// The two market inputs recovery decisions need: trend strength (ADX) and
// fast-timeframe candle direction. Bars are oldest first.

#include "broker.h"
#include <chrono>
#include <optional>
#include <span>
#include <string_view>

namespace fxstack {

// Wilder's ADX; nullopt until there are at least 2 * period bars
std::optional<double> adx(std::span<const Bar>, int period);

enum class CandleDirection { bullish, bearish };

constexpr CandleDirection against(Side side) {
  return side == Side::buy ? CandleDirection::bearish : CandleDirection::bullish;
}

constexpr CandleDirection with(Side side) {
  return side == Side::buy ? CandleDirection::bullish : CandleDirection::bearish;
}

// How many of the most recent bars in a row closed in this direction
int trailing_candles(std::span<const Bar>, CandleDirection);

// Bar length for a timeframe code: "M15", "H1", "D1"
std::optional<std::chrono::minutes> timeframe_length(std::string_view);

// Drops the newest bar if it is still forming at `now`. Bars without a
// readable start time are kept.
std::span<const Bar> closed_bars(std::span<const Bar>, std::string_view timeframe,
                                 Timestamp now);

} // namespace fxstack
