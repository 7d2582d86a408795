#pragma once

#include <verity/storage/storage.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace verity::storage {

/// get/set/delete-by-key capability supplied by the host. The signer only
/// ever sees this, never a concrete backend.
///
/// `mutex` serializes read-then-create sequences against the underlying
/// store. Every capability over the same store must carry the same mutex;
/// copies share it, and make_secure_store takes it from the backend.
struct secure_store_t final {
  std::function<bool(std::string_view key,
                     std::optional<std::string>& value,
                     std::string& error)>
      get;
  std::function<bool(std::string_view key,
                     std::string_view value,
                     std::string& error)>
      set;
  std::function<bool(std::string_view key, std::string& error)> remove;
  std::shared_ptr<std::mutex> mutex;

  explicit operator bool() const {
    return static_cast<bool>(get) && static_cast<bool>(set) &&
           static_cast<bool>(remove);
  }
};

/// Adapt a backend to the capability. `backend` must outlive the result.
template <typename Library>
secure_store_t make_secure_store(const storage<Library>& backend) {
  return secure_store_t{
      .get =
          [&backend](std::string_view key, std::optional<std::string>& value,
                     std::string& error) {
            return backend.get(key, value, error);
          },
      .set =
          [&backend](std::string_view key, std::string_view value,
                     std::string& error) {
            return backend.put(key, value, error);
          },
      .remove =
          [&backend](std::string_view key, std::string& error) {
            return backend.remove(key, error);
          },
      .mutex = backend.guard};
}

}  // namespace verity::storage
