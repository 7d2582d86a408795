#pragma once

#include <verity/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Schema type: liveness result.
// Challenges are kept in the order the user completed them.
namespace verity::schema {

template <uint16_t Version>
struct liveness_result;

template <>
struct liveness_result<1> final {
  uint16_t version{1};
  bool passed{};
  std::vector<std::string> challenges;
  duration_milliseconds_t duration{};
};

using liveness_result_t = liveness_result<1>;

}  // namespace verity::schema
