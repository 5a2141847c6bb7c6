#pragma once
#include <cosign/schema/primitives.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace cosign::storage {

using key_value_entry_t =
    std::pair<cosign::schema::bytes_t, cosign::schema::bytes_t>;

/// One mutation of an atomic write batch. An empty value erases the key.
struct batch_entry final {
  cosign::schema::bytes_t key;
  std::optional<cosign::schema::bytes_t> value;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing or
  /// undecodable.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cosign::schema::bytes_view_t& key) const;

  /// Encode and persist value at key. Returns once the write is durable.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cosign::schema::bytes_view_t& key,
           const T& value) const;

  /// Remove key if present.
  void erase(const cosign::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const cosign::schema::bytes_view_t& prefix) const;

  /// Apply all entries atomically.
  void write_batch(const std::vector<batch_entry>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace cosign::storage
