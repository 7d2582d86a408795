#pragma once

#include <verity/schema/face_match_result.hpp>
#include <verity/schema/failure_reason.hpp>
#include <verity/schema/liveness_result.hpp>
#include <verity/schema/name_match_result.hpp>
#include <verity/schema/primitives.hpp>
#include <verity/schema/verification_level.hpp>
#include <verity/schema/verification_result.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace verity::verification {

/// Minimum biometric similarity for a face match to pass.
inline constexpr auto kFaceMatchThreshold = 0.70;

/// Assemble a verification record stamped with the current wall-clock time.
verity::schema::verification_result_t create_verification_result(
    verity::schema::name_match_result_t name_match,
    std::string document_type,
    std::string issuing_country,
    std::optional<verity::schema::face_match_result_t> face_match =
        std::nullopt,
    std::optional<verity::schema::liveness_result_t> liveness_check =
        std::nullopt);

/// none without a name match; enhanced when face and liveness were both
/// attempted and passed; basic otherwise.
verity::schema::verification_level_t get_verification_level(
    const verity::schema::verification_result_t& result);

/// The name match must pass, and every optional check that was attempted
/// must pass too. Checks that were never attempted are ignored.
bool is_verification_passed(
    const verity::schema::verification_result_t& result);

/// Every applicable reason, in name, face, liveness order. Empty exactly when
/// is_verification_passed() is true.
std::vector<verity::schema::failure_reason_t> get_verification_failure_codes(
    const verity::schema::verification_result_t& result);

/// Text of get_verification_failure_codes().
std::vector<std::string> get_verification_failure_reasons(
    const verity::schema::verification_result_t& result);

/// Build a face match record from a raw similarity score. The score is clamped
/// to [0, 1] (non-finite becomes 0) and forced to 0 when any of the three
/// faces was not detected.
verity::schema::face_match_result_t make_face_match_result(
    double score,
    bool document_face_detected,
    bool profile_face_detected,
    bool selfie_face_detected);

/// Passed when at least one challenge was required and all of them appear in
/// `completed`. Completion order is kept as given.
verity::schema::liveness_result_t make_liveness_result(
    std::span<const std::string> required,
    std::vector<std::string> completed,
    verity::schema::duration_milliseconds_t duration);

}  // namespace verity::verification
