#include <verity/common/critical.hpp>
#include <verity/storage/rocksdb/storage.hpp>

namespace verity::storage {

template <>
std::optional<storage<rocksdb_storage_tag>>
try_make_storage<rocksdb_storage_tag>(const std::string_view& path,
                                      std::string& error) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    error = status.ToString();
    return std::nullopt;
  }
  spdlog::info("Opened secure store at {}", path);
  store.database.reset(database);

  return store;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto error = std::string{};
  auto store = try_make_storage<rocksdb_storage_tag>(path, error);
  if (!store) {
    verity::common::critical("Failed to open RocksDB at {}: {}", path, error);
  }
  return std::move(*store);
}

}  // namespace verity::storage
