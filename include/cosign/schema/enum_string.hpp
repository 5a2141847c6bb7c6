#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Wire names of schema enums. Every enum carries a kXMappings table; the
// names are what the remote authority and the CLI print and accept.
namespace cosign::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> lookup_enum(
    const std::string_view name,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, name,
                              &std::pair<std::string_view, Enum>::first);
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->second;
}

/// "unknown" for values outside the table, e.g. a corrupt byte.
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::ranges::find(mappings, value,
                              &std::pair<std::string_view, Enum>::second);
  return it == std::end(mappings) ? std::string_view{"unknown"} : it->first;
}

/// Specialized next to each enum; there is no generic parse.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace cosign::schema
