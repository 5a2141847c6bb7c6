#include <cosign/storage/rocksdb/storage.hpp>

namespace cosign::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* raw{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &raw);
  if (!status.ok()) {
    spdlog::error("Cannot open local store at {}", path);
  }
  detail::check_status(status, "open");
  spdlog::info("Opened local store at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(raw);
  return store;
}

void storage<rocksdb_storage_tag>::erase(
    const cosign::schema::bytes_view_t& key) const {
  detail::check_status(opened().Delete(detail::durable(), detail::to_slice(key)),
                       "erase");
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const cosign::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto wanted = detail::to_slice(prefix);
  auto cursor = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      opened().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (cursor->Seek(wanted); cursor->Valid() && cursor->key().starts_with(wanted);
       cursor->Next()) {
    entries.emplace_back(detail::to_bytes(cursor->key()),
                         detail::to_bytes(cursor->value()));
  }
  detail::check_status(cursor->status(), "scan");
  return entries;
}

void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<batch_entry>& entries) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    detail::check_status(
        value ? batch.Put(detail::to_slice(key), detail::to_slice(*value))
              : batch.Delete(detail::to_slice(key)),
        "stage batch");
  }
  detail::check_status(opened().Write(detail::durable(), &batch), "commit batch");
}

}  // namespace cosign::storage
