#include <algorithm>
#include <cctype>
#include <cosign/common/critical.hpp>
#include <cosign/schema/primitives.hpp>
#include <iterator>
#include <string>
#include <string_view>

namespace cosign::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base64_sextet(const char c) {
  auto position = kBase64Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

hash32_t make_hash32(const bytes_view_t& bytes) {
  if (bytes.size() != 32) {
    cosign::common::critical(cosign::common::critical_area::schema,
                             "hash32 needs exactly 32 bytes",
                             std::to_string(bytes.size()));
  }
  auto hash = hash32_t{};
  std::ranges::copy(bytes, std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::ranges::copy(*decoded, std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[(byte >> 4u) & 0x0Fu]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (auto i = std::size_t{0}; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (auto i = std::size_t{0}; i < bytes.size(); i += 3) {
    auto remaining = std::min<std::size_t>(3, bytes.size() - i);
    auto group = static_cast<uint32_t>(bytes[i]) << 16u;
    if (remaining > 1) {
      group |= static_cast<uint32_t>(bytes[i + 1]) << 8u;
    }
    if (remaining > 2) {
      group |= static_cast<uint32_t>(bytes[i + 2]);
    }
    out.push_back(kBase64Alphabet[(group >> 18u) & 0x3Fu]);
    out.push_back(kBase64Alphabet[(group >> 12u) & 0x3Fu]);
    out.push_back(remaining > 1 ? kBase64Alphabet[(group >> 6u) & 0x3Fu]
                                : '=');
    out.push_back(remaining > 2 ? kBase64Alphabet[group & 0x3Fu] : '=');
  }
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(make_bytes_view(bytes));
}

std::optional<bytes_t> try_from_base64(std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::ranges::copy_if(encoded, std::back_inserter(compact), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) == 0;
  });
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (auto i = std::size_t{0}; i < compact.size(); i += 4) {
    auto last = (i + 4) == compact.size();
    auto padding = std::size_t{0};
    auto group = uint32_t{0};
    for (auto j = std::size_t{0}; j < 4; ++j) {
      auto c = compact[i + j];
      if (c == '=') {
        // Padding only in the final quantum, and only in the last two places.
        if (!last || j < 2) {
          return std::nullopt;
        }
        ++padding;
        group <<= 6u;
        continue;
      }
      if (padding > 0) {
        return std::nullopt;
      }
      auto sextet = base64_sextet(c);
      if (!sextet) {
        return std::nullopt;
      }
      group = (group << 6u) | *sextet;
    }
    out.push_back(static_cast<uint8_t>((group >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((group >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(group & 0xFFu));
    }
  }
  return out;
}

}  // namespace cosign::schema
