#pragma once
#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace cosign::schema::key {

inline constexpr char kSeparator{'|'};

struct builder final {
  cosign::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  // Writes the component followed by the separator.
  builder& component(const std::string_view& str);

  // Big-endian so that iteration order follows numeric order.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (auto i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace cosign::schema::key
