#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace verity::storage {

/// String key/value backend selected by tag.
///
/// Every operation reports failure through its return value and `error`;
/// nothing is retried here.
template <typename Library>
struct storage {
  /// Shared by every handle onto the same data; held across read-then-write
  /// sequences that must not interleave.
  std::shared_ptr<std::mutex> guard;

  /// Load the value at key. Returns false only when the backend failed;
  /// a missing key is success with `value` left as std::nullopt.
  bool get(const std::string_view& key,
           std::optional<std::string>& value,
           std::string& error) const;

  /// Persist value at key, replacing any previous value.
  bool put(const std::string_view& key,
           const std::string_view& value,
           std::string& error) const;

  /// Delete key. Deleting a missing key succeeds.
  bool remove(const std::string_view& key, std::string& error) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// As make_storage, but an open failure is returned instead of being fatal.
template <typename Library>
std::optional<storage<Library>> try_make_storage(const std::string_view& path,
                                                 std::string& error);

}  // namespace verity::storage
