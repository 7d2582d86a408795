#pragma once
#include <verity/schema/primitives.hpp>
#include <optional>
#include <span>

namespace verity::schema::encoding {

// Wire codec selected at build time by tag. The attestation payload and any
// other persisted record go through this so the codec can be swapped in one
// place.
template <typename Library>
struct encoder {
  template <typename T>
  verity::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const verity::schema::bytes_view_t& bytes);
};

}  // namespace verity::schema::encoding
