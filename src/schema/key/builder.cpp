#include <algorithm>
#include <cosign/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace cosign::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::component(const std::string_view& str) {
  write(str);
  data.push_back(static_cast<uint8_t>(kSeparator));
  return *this;
}
