#pragma once

#include <verity/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: failure reason.
// Stable codes for why a verification record did not pass; the mapped text is
// what gets surfaced to the caller.
namespace verity::schema {

enum class failure_reason_t : uint8_t {
  name_mismatch = 1,
  first_name_mismatch = 2,
  last_name_mismatch = 3,
  document_face_not_detected = 4,
  profile_face_not_detected = 5,
  face_mismatch = 6,
  liveness_failed = 7,
};

inline constexpr auto kFailureReasonMappings = std::array{
    std::pair<std::string_view, failure_reason_t>{
        "Name does not match profile", failure_reason_t::name_mismatch},
    std::pair<std::string_view, failure_reason_t>{
        "First name does not match", failure_reason_t::first_name_mismatch},
    std::pair<std::string_view, failure_reason_t>{
        "Last name does not match", failure_reason_t::last_name_mismatch},
    std::pair<std::string_view, failure_reason_t>{
        "Could not detect face in document photo",
        failure_reason_t::document_face_not_detected},
    std::pair<std::string_view, failure_reason_t>{
        "Could not detect face in profile photo",
        failure_reason_t::profile_face_not_detected},
    std::pair<std::string_view, failure_reason_t>{
        "Face does not match profile photo", failure_reason_t::face_mismatch},
    std::pair<std::string_view, failure_reason_t>{
        "Liveness check failed", failure_reason_t::liveness_failed}};

template <>
inline std::optional<failure_reason_t> try_from_string<failure_reason_t>(
    const std::string_view value) {
  return from_string(value, kFailureReasonMappings);
}

inline constexpr std::string_view to_string(const failure_reason_t value) {
  return to_string(value, kFailureReasonMappings).value_or("unknown");
}

}  // namespace verity::schema
