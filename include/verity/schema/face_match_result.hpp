#pragma once

#include <cstdint>

// Schema type: face match result.
// Supplied by the biometric collaborator; the three flags record which of the
// compared images actually contained a detectable face.
namespace verity::schema {

template <uint16_t Version>
struct face_match_result;

template <>
struct face_match_result<1> final {
  uint16_t version{1};
  double score{};
  bool passed{};
  bool document_face_detected{};
  bool profile_face_detected{};
  bool selfie_face_detected{};
};

using face_match_result_t = face_match_result<1>;

}  // namespace verity::schema
