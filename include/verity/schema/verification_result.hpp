#pragma once

#include <verity/schema/face_match_result.hpp>
#include <verity/schema/liveness_result.hpp>
#include <verity/schema/name_match_result.hpp>
#include <verity/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: verification result.
// One verification attempt. Optional checks that were never attempted are
// std::nullopt; an attempted check is present even when it failed.
namespace verity::schema {

template <uint16_t Version>
struct verification_result;

template <>
struct verification_result<1> final {
  uint16_t version{1};
  name_match_result_t name_match;
  std::optional<face_match_result_t> face_match;
  std::optional<liveness_result_t> liveness_check;
  timestamp_milliseconds_t timestamp{};
  // e.g. "PASSPORT", "ID_CARD"
  std::string document_type;
  // ISO 3166-1 alpha-3
  std::string issuing_country;
};

using verification_result_t = verification_result<1>;

}  // namespace verity::schema
