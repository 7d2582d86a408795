#pragma once
#include <verity/storage/storage.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace verity::storage {

struct memory_storage_tag {};

/// Process-local backend. Copies share the same underlying map and guard, so
/// a copy handed to a second signer sees what the first one wrote and waits
/// for it to finish.
template <>
struct storage<memory_storage_tag> final {
  struct state_t final {
    std::mutex mutex;
    std::map<std::string, std::string, std::less<>> entries;
  };

  std::shared_ptr<state_t> state{std::make_shared<state_t>()};
  std::shared_ptr<std::mutex> guard{std::make_shared<std::mutex>()};

  bool get(const std::string_view& key,
           std::optional<std::string>& value,
           std::string& error) const {
    static_cast<void>(error);
    auto lock = std::scoped_lock{state->mutex};
    auto found = state->entries.find(key);
    if (found == std::end(state->entries)) {
      value.reset();
    } else {
      value = found->second;
    }
    return true;
  }

  bool put(const std::string_view& key,
           const std::string_view& value,
           std::string& error) const {
    static_cast<void>(error);
    auto lock = std::scoped_lock{state->mutex};
    state->entries.insert_or_assign(std::string{key}, std::string{value});
    return true;
  }

  bool remove(const std::string_view& key, std::string& error) const {
    static_cast<void>(error);
    auto lock = std::scoped_lock{state->mutex};
    if (auto found = state->entries.find(key);
        found != std::end(state->entries)) {
      state->entries.erase(found);
    }
    return true;
  }
};

/// `path` is ignored; every call returns a fresh, empty store.
template <>
inline storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  static_cast<void>(path);
  return storage<memory_storage_tag>{};
}

}  // namespace verity::storage
