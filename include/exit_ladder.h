#pragma once

// Partial-close ladder and trailing stop for positions without recovery.
//
//   PC1: +10 pips, close 25% of current volume
//   PC2: +20 pips, close 25% of initial volume, stop to breakeven, trail
//   Trail: peak ratchets, stop = peak -/+ distance, never loosens
//
// Positions with the recovery latch set never reach this code.

#include "config.h"
#include "position_tracker.h"
#include "recovery_policy.h"
#include <optional>
#include <variant>

namespace fxstack {

enum class LadderStage { pc1, pc2 };

struct TakePartial {
  LadderStage stage{LadderStage::pc1};
  double volume{};       // 0 when below the broker minimum: flag only
  double profit_pips{};
};

// Move the broker stop; `activate` is set on the PC2 hand-off
struct MoveStop {
  double stop_price{};
  double peak_price{};
  bool activate{};
};

using LadderAction = std::variant<TakePartial, MoveStop, CloseStack>;

// At most one step per tick; nothing for positions in recovery
std::optional<LadderAction> evaluate_ladder(const TrackedPosition &,
                                            const MarketContext &,
                                            const LadderConfig &,
                                            Timestamp now);

// Stop `distance` pips behind `price`
double trailing_stop_price(Side, double price, double distance_pips,
                           double pip_size);

} // namespace fxstack
