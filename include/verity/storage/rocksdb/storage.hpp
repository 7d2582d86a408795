#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <verity/common/critical.hpp>
#include <verity/storage/storage.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace verity::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(const std::string_view& value) {
  return ROCKSDB_NAMESPACE::Slice{value.data(), value.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  std::shared_ptr<std::mutex> guard{std::make_shared<std::mutex>()};

  bool get(const std::string_view& key,
           std::optional<std::string>& value,
           std::string& error) const;
  bool put(const std::string_view& key,
           const std::string_view& value,
           std::string& error) const;
  bool remove(const std::string_view& key, std::string& error) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
std::optional<storage<rocksdb_storage_tag>>
try_make_storage<rocksdb_storage_tag>(const std::string_view& path,
                                      std::string& error);

inline bool storage<rocksdb_storage_tag>::get(
    const std::string_view& key,
    std::optional<std::string>& value,
    std::string& error) const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &raw);
  if (status.IsNotFound()) {
    value.reset();
    return true;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    error = status.ToString();
    return false;
  }
  value = std::move(raw);
  return true;
}

inline bool storage<rocksdb_storage_tag>::put(const std::string_view& key,
                                              const std::string_view& value,
                                              std::string& error) const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  // The device key must survive a crash right after it is handed out.
  write_options.sync = true;
  auto status = database->Put(write_options, detail::to_slice(key),
                              detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    error = status.ToString();
    return false;
  }
  return true;
}

inline bool storage<rocksdb_storage_tag>::remove(const std::string_view& key,
                                                 std::string& error) const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Delete(write_options, detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete value from RocksDB: {}",
                  status.ToString());
    error = status.ToString();
    return false;
  }
  return true;
}

}  // namespace verity::storage
