#include "order_comment.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace fxstack {

namespace {

struct Prefix {
  std::string_view text;
  RecoveryKind kind;
  bool has_level;
};

// Order matters: "HDCA" must be tried before "DCA"
constexpr Prefix prefixes[] = {
    {"HDCA L", RecoveryKind::hedge_dca, true},
    {"Grid L", RecoveryKind::grid, true},
    {"DCA L", RecoveryKind::dca, true},
    {"Hedge", RecoveryKind::hedge, false},
};

constexpr auto separator = std::string_view{" - "};

std::string_view trim(std::string_view s) {
  while (not s.empty() and std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (not s.empty() and std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return s;
}

template <typename T> std::optional<T> parse_number(std::string_view s) {
  auto value = T{};
  const auto *end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, value);
  if (ec != std::errc{} or ptr != end)
    return std::nullopt;
  return value;
}

} // namespace

std::string_view to_string(RecoveryKind kind) {
  switch (kind) {
  case RecoveryKind::grid:
    return "grid";
  case RecoveryKind::dca:
    return "dca";
  case RecoveryKind::hedge:
    return "hedge";
  case RecoveryKind::hedge_dca:
    return "hedge_dca";
  }
  return "unknown";
}

std::expected<std::optional<RecoveryTag>, CommentError>
parse_comment(std::string_view comment) {
  comment = trim(comment);

  const auto *match = std::ranges::find_if(prefixes, [&](const Prefix &p) {
    return comment.starts_with(p.text);
  });
  if (match == std::end(prefixes))
    return std::optional<RecoveryTag>{};

  auto rest = comment.substr(match->text.size());
  const auto sep = rest.find(separator);

  if (sep == std::string_view::npos) {
    // "Hedge" followed by something other than " - " is not our tag
    if (not match->has_level)
      return std::optional<RecoveryTag>{};
    return std::unexpected(CommentError::BadParent);
  }

  auto tag = RecoveryTag{.kind = match->kind};

  if (match->has_level) {
    const auto level = parse_number<int>(rest.substr(0, sep));
    if (not level or *level < 1)
      return std::unexpected(CommentError::BadLevel);
    tag.level = *level;
  } else if (not trim(rest.substr(0, sep)).empty()) {
    return std::optional<RecoveryTag>{};
  }

  const auto parent = parse_number<Ticket>(trim(rest.substr(sep + separator.size())));
  if (not parent or *parent == 0)
    return std::unexpected(CommentError::BadParent);
  tag.parent = *parent;

  return std::optional<RecoveryTag>{tag};
}

std::string format_comment(const RecoveryTag &tag) {
  switch (tag.kind) {
  case RecoveryKind::grid:
    return std::format("Grid L{} - {}", tag.level, tag.parent);
  case RecoveryKind::dca:
    return std::format("DCA L{} - {}", tag.level, tag.parent);
  case RecoveryKind::hedge:
    return std::format("Hedge - {}", tag.parent);
  case RecoveryKind::hedge_dca:
    return std::format("HDCA L{} - {}", tag.level, tag.parent);
  }
  return {};
}

std::string format_entry_comment(std::string_view strategy, int score) {
  auto label = std::string{strategy};
  std::ranges::transform(label, label.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return std::format("{}:C{}", label, score);
}

} // namespace fxstack
