#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tally::schema {

namespace detail {

constexpr char fold_ascii(const char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

/// ASCII case-insensitive equality. Mapping names are lower-case; inputs
/// arriving from producers may be "REVENUE", "Revenue" or "revenue".
constexpr bool equals_folded(const std::string_view lhs,
                             const std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (fold_ascii(lhs[i]) != fold_ascii(rhs[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace detail

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (detail::equals_folded(name, value)) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Decode a raw stored discriminant, rejecting values outside the mapping.
template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_underlying(
    const std::underlying_type_t<Enum> raw,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& mapping : mappings) {
    if (static_cast<std::underlying_type_t<Enum>>(mapping.second) == raw) {
      return mapping.second;
    }
  }
  return std::nullopt;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace tally::schema
