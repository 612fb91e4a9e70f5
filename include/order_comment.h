#pragma once

// Order comment wire format.
// Brokers only give us a free-text comment, so stack membership is encoded
// there and parsed into a RecoveryTag as soon as a record crosses the
// boundary:
//
//   Grid L{n} - {parent}   grid child of an original
//   DCA L{n} - {parent}    averaging order of an original
//   Hedge - {parent}       hedge of an original
//   HDCA L{n} - {hedge}    averaging order attached to a hedge
//
// Anything else is an original entry ("VWAP:C7", "BREAKOUT:C5 #2", ...).

#include "broker.h"
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace fxstack {

enum class RecoveryKind { grid, dca, hedge, hedge_dca };

std::string_view to_string(RecoveryKind);

struct RecoveryTag {
  RecoveryKind kind{RecoveryKind::dca};
  int level{};       // 1-based; 0 for hedges
  Ticket parent{};   // Original ticket, or hedge ticket for hedge_dca

  bool operator==(const RecoveryTag &) const = default;
};

enum class CommentError {
  BadLevel,
  BadParent
};

// nullopt: not a recovery order. Error: looks like a tag but is corrupt.
std::expected<std::optional<RecoveryTag>, CommentError>
parse_comment(std::string_view);

std::string format_comment(const RecoveryTag &);

// Entry comment: "{STRATEGY}:C{score}"
std::string format_entry_comment(std::string_view strategy, int score);

} // namespace fxstack
