#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <cosign/common/critical.hpp>
#include <cosign/schema/encoding/scale/encoder.hpp>
#include <cosign/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace cosign::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const cosign::schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline cosign::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  auto view = cosign::schema::make_bytes_view(slice.ToStringView());
  return {std::begin(view), std::end(view)};
}

// Every write is fsynced: a recorded signature must survive a crash that
// follows the call.
inline const ROCKSDB_NAMESPACE::WriteOptions& durable() {
  static const auto options = [] {
    auto o = ROCKSDB_NAMESPACE::WriteOptions{};
    o.sync = true;
    return o;
  }();
  return options;
}

inline void check_status(const ROCKSDB_NAMESPACE::Status& status,
                         const std::string_view operation) {
  if (!status.ok()) {
    cosign::common::critical(cosign::common::critical_area::store, operation,
                             status.ToString());
  }
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cosign::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cosign::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const cosign::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const cosign::schema::bytes_view_t& prefix) const;
  void write_batch(const std::vector<batch_entry>& entries) const;

 private:
  ROCKSDB_NAMESPACE::DB& opened() const {
    if (!database) {
      cosign::common::critical(cosign::common::critical_area::store,
                               "local store is not open");
    }
    return *database;
  }
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const cosign::schema::bytes_view_t& key) const {
  auto stored = std::string{};
  auto status = opened().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                             detail::to_slice(key), &stored);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::check_status(status, "read");

  auto decoded = encoder.template try_decode<T>(
      cosign::schema::make_bytes_view(std::string_view{stored}));
  if (!decoded) {
    spdlog::warn("Discarding undecodable value ({} bytes)", stored.size());
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const cosign::schema::bytes_view_t& key,
                                       const T& value) const {
  auto encoded = encoder.encode(value);
  detail::check_status(
      opened().Put(detail::durable(), detail::to_slice(key),
                   detail::to_slice(cosign::schema::make_bytes_view(encoded))),
      "write");
}

}  // namespace cosign::storage
