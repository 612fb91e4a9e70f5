#pragma once

// Pip arithmetic for FX positions
// 1 pip = pip_size in price terms (0.0001 for EURUSD, 0.01 for USDJPY)

namespace fxstack {

enum class Side { buy, sell };

constexpr Side opposite(Side side) {
  return side == Side::buy ? Side::sell : Side::buy;
}

// Constexpr tolerance helper for floating-point comparisons
constexpr bool near(double a, double b, double eps = 1e-9) {
  return (a > b ? a - b : b - a) <= eps;
}

// Convert a price delta to pips
constexpr double price_to_pips(double delta, double pip_size) {
  return delta / pip_size;
}

// Convert pips to a price delta
constexpr double pips_to_price(double pips, double pip_size) {
  return pips * pip_size;
}

// Pips the position is losing (positive) or winning (negative)
constexpr double pips_against(Side side, double entry, double price,
                              double pip_size) {
  return side == Side::buy ? price_to_pips(entry - price, pip_size)
                           : price_to_pips(price - entry, pip_size);
}

// Pips the position is winning (positive) or losing (negative)
constexpr double pips_in_favour(Side side, double entry, double price,
                                double pip_size) {
  return -pips_against(side, entry, price, pip_size);
}

// Round a volume down to the broker's volume step
constexpr double floor_to_step(double volume, double step) {
  if (step <= 0.0)
    return volume;
  auto steps = static_cast<long long>(volume / step + 1e-9);
  return static_cast<double>(steps) * step;
}

// Compile-time tests
static_assert(opposite(Side::buy) == Side::sell);
static_assert(opposite(Side::sell) == Side::buy);

static_assert(near(price_to_pips(0.0015, 0.0001), 15.0), "15 pips on EURUSD");
static_assert(near(price_to_pips(0.15, 0.01), 15.0), "15 pips on USDJPY");
static_assert(near(pips_to_price(45.0, 0.0001), 0.0045), "45 pips = 0.0045");

static_assert(near(pips_against(Side::sell, 1.10500, 1.10650, 0.0001), 15.0),
              "Short loses when price rises");
static_assert(near(pips_against(Side::buy, 1.10500, 1.10650, 0.0001), -15.0),
              "Long wins when price rises");
static_assert(near(pips_in_favour(Side::buy, 1.10500, 1.10300, 0.0001), -20.0),
              "Long loses when price falls");
static_assert(near(pips_against(Side::sell, 1.10500, 1.10500, 0.0001), 0.0),
              "Breakeven is zero pips");

static_assert(near(floor_to_step(0.237, 0.01), 0.23), "Rounds down to step");
static_assert(near(floor_to_step(0.2, 0.01), 0.2), "Exact step kept");
static_assert(near(floor_to_step(0.05, 0.0), 0.05), "Zero step is a no-op");

} // namespace fxstack
