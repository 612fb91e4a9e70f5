#include "indicators.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <system_error>
#include <vector>

namespace fxstack {

std::optional<double> adx(std::span<const Bar> bars, int period) {
  if (period < 1 or bars.size() < 2uz * static_cast<std::size_t>(period))
    return std::nullopt;

  const auto p = static_cast<double>(period);

  auto tr_sum = 0.0;
  auto plus_sum = 0.0;
  auto minus_sum = 0.0;
  auto dx = std::vector<double>{};

  for (auto i = 1uz; i < bars.size(); ++i) {
    const auto &bar = bars[i];
    const auto &prev = bars[i - 1];

    const auto up = bar.high - prev.high;
    const auto down = prev.low - bar.low;
    const auto plus_dm = (up > down and up > 0.0) ? up : 0.0;
    const auto minus_dm = (down > up and down > 0.0) ? down : 0.0;
    const auto tr = std::max({bar.high - bar.low, std::abs(bar.high - prev.close),
                              std::abs(bar.low - prev.close)});

    // First window is a plain sum, then Wilder smoothing
    if (i <= static_cast<std::size_t>(period)) {
      tr_sum += tr;
      plus_sum += plus_dm;
      minus_sum += minus_dm;
      if (i < static_cast<std::size_t>(period))
        continue;
    } else {
      tr_sum = tr_sum - tr_sum / p + tr;
      plus_sum = plus_sum - plus_sum / p + plus_dm;
      minus_sum = minus_sum - minus_sum / p + minus_dm;
    }

    if (tr_sum <= 0.0) {
      dx.push_back(0.0);
      continue;
    }

    const auto plus_di = 100.0 * plus_sum / tr_sum;
    const auto minus_di = 100.0 * minus_sum / tr_sum;
    const auto di_sum = plus_di + minus_di;
    dx.push_back(di_sum > 0.0 ? 100.0 * std::abs(plus_di - minus_di) / di_sum
                              : 0.0);
  }

  if (dx.size() < static_cast<std::size_t>(period))
    return std::nullopt;

  auto value = 0.0;
  for (auto i = 0uz; i < static_cast<std::size_t>(period); ++i)
    value += dx[i];
  value /= p;

  for (auto i = static_cast<std::size_t>(period); i < dx.size(); ++i)
    value = (value * (p - 1.0) + dx[i]) / p;

  return value;
}

int trailing_candles(std::span<const Bar> bars, CandleDirection direction) {
  auto count = 0;
  for (auto it = bars.rbegin(); it != bars.rend(); ++it) {
    const auto moved = direction == CandleDirection::bullish
                           ? it->close > it->open
                           : it->close < it->open;
    if (not moved)
      break;
    ++count;
  }
  return count;
}

std::optional<std::chrono::minutes> timeframe_length(std::string_view code) {
  if (code.size() < 2)
    return std::nullopt;

  auto n = 0;
  const auto digits = code.substr(1);
  const auto [end, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), n);
  if (ec != std::errc{} or end != digits.data() + digits.size() or n <= 0)
    return std::nullopt;

  switch (code.front()) {
  case 'M':
    return std::chrono::minutes{n};
  case 'H':
    return std::chrono::hours{n};
  case 'D':
    return std::chrono::days{n};
  case 'W':
    return std::chrono::weeks{n};
  }
  return std::nullopt;
}

std::span<const Bar> closed_bars(std::span<const Bar> bars,
                                 std::string_view timeframe, Timestamp now) {
  if (bars.empty())
    return bars;

  const auto length = timeframe_length(timeframe);
  const auto start = parse_iso(bars.back().timestamp);
  if (length and start and *start + *length > now)
    return bars.first(bars.size() - 1);

  return bars;
}

} // namespace fxstack
