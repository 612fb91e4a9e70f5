#include "exit_ladder.h"
#include <algorithm>

namespace fxstack {

namespace {

// Further in the position's favour
double better(Side side, double a, double b) {
  return side == Side::buy ? std::max(a, b) : std::min(a, b);
}

bool stop_crossed(Side side, double price, double stop) {
  return side == Side::buy ? price <= stop : price >= stop;
}

} // namespace

double trailing_stop_price(Side side, double price, double distance_pips,
                           double pip_size) {
  const auto distance = pips_to_price(distance_pips, pip_size);
  return side == Side::buy ? price - distance : price + distance;
}

std::optional<LadderAction> evaluate_ladder(const TrackedPosition &pos,
                                            const MarketContext &ctx,
                                            const LadderConfig &config,
                                            Timestamp now) {
  if (not pos.exit_ladder_allowed())
    return std::nullopt;

  // The ladder trims; it never closes the whole position
  const auto partial = [&](double volume) {
    const auto v = normalize_close_volume(volume, pos.current_volume, ctx.info);
    return v >= pos.current_volume ? 0.0 : v;
  };

  const auto &flags = pos.partial_close;
  const auto pip = ctx.info.pip_size;
  const auto price = ctx.mark(pos.side);
  const auto profit_pips = pips_in_favour(pos.side, pos.entry_price, price, pip);

  if (flags.pc2_closed and flags.pc2_trigger_time and
      now - *flags.pc2_trigger_time >=
          std::chrono::minutes{config.pc2_time_limit_minutes})
    return CloseStack{.parent = pos.ticket, .reason = CloseReason::pc2_time_limit};

  const auto &trail = pos.trailing_stop;
  if (trail.active) {
    const auto peak = better(pos.side, trail.peak_price, price);
    const auto stop = better(
        pos.side, trail.stop_price,
        trailing_stop_price(pos.side, peak, trail.distance_pips, pip));

    if (stop_crossed(pos.side, price, stop))
      return CloseStack{.parent = pos.ticket,
                        .reason = CloseReason::trailing_stop};

    if (not near(stop, trail.stop_price) or not near(peak, trail.peak_price))
      return MoveStop{.stop_price = stop, .peak_price = peak};
  }

  if (not flags.pc1_closed and profit_pips >= config.pc1_pips)
    return TakePartial{
        .stage = LadderStage::pc1,
        .volume = partial(pos.current_volume * config.pc1_percent),
        .profit_pips = profit_pips};

  if (flags.pc1_closed and not flags.pc2_closed and
      profit_pips >= config.pc2_pips)
    return TakePartial{
        .stage = LadderStage::pc2,
        .volume = partial(pos.initial_volume * config.pc2_percent),
        .profit_pips = profit_pips};

  return std::nullopt;
}

} // namespace fxstack
