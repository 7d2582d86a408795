#include <verity/verification/aggregator.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

using namespace verity::schema;

namespace verity::verification {

verification_result_t create_verification_result(
    name_match_result_t name_match,
    std::string document_type,
    std::string issuing_country,
    std::optional<face_match_result_t> face_match,
    std::optional<liveness_result_t> liveness_check) {
  auto result = verification_result_t{};
  result.name_match = std::move(name_match);
  result.face_match = std::move(face_match);
  result.liveness_check = std::move(liveness_check);
  result.timestamp = now_milliseconds();
  result.document_type = std::move(document_type);
  result.issuing_country = std::move(issuing_country);
  return result;
}

verification_level_t get_verification_level(
    const verification_result_t& result) {
  if (!result.name_match.passed) {
    return verification_level_t::none;
  }
  auto face_passed = result.face_match.has_value() && result.face_match->passed;
  auto liveness_passed =
      result.liveness_check.has_value() && result.liveness_check->passed;
  if (face_passed && liveness_passed) {
    return verification_level_t::enhanced;
  }
  return verification_level_t::basic;
}

bool is_verification_passed(const verification_result_t& result) {
  if (!result.name_match.passed) {
    return false;
  }
  if (result.face_match && !result.face_match->passed) {
    return false;
  }
  if (result.liveness_check && !result.liveness_check->passed) {
    return false;
  }
  return true;
}

std::vector<failure_reason_t> get_verification_failure_codes(
    const verification_result_t& result) {
  auto codes = std::vector<failure_reason_t>{};

  if (const auto& name = result.name_match; !name.passed) {
    auto first = name.first_name.matched;
    auto last = name.last_name.matched;
    if (first == last) {
      // Neither matched, or both did but the aggregate stayed under the bar.
      codes.push_back(failure_reason_t::name_mismatch);
    } else if (!first) {
      codes.push_back(failure_reason_t::first_name_mismatch);
    } else {
      codes.push_back(failure_reason_t::last_name_mismatch);
    }
  }

  if (const auto& face = result.face_match; face && !face->passed) {
    if (!face->document_face_detected) {
      codes.push_back(failure_reason_t::document_face_not_detected);
    }
    if (!face->profile_face_detected) {
      codes.push_back(failure_reason_t::profile_face_not_detected);
    }
    if (face->document_face_detected && face->profile_face_detected) {
      codes.push_back(failure_reason_t::face_mismatch);
    }
  }

  if (result.liveness_check && !result.liveness_check->passed) {
    codes.push_back(failure_reason_t::liveness_failed);
  }

  return codes;
}

std::vector<std::string> get_verification_failure_reasons(
    const verification_result_t& result) {
  auto reasons = std::vector<std::string>{};
  for (const auto code : get_verification_failure_codes(result)) {
    reasons.emplace_back(to_string(code));
  }
  return reasons;
}

face_match_result_t make_face_match_result(const double score,
                                           const bool document_face_detected,
                                           const bool profile_face_detected,
                                           const bool selfie_face_detected) {
  auto result = face_match_result_t{};
  result.document_face_detected = document_face_detected;
  result.profile_face_detected = profile_face_detected;
  result.selfie_face_detected = selfie_face_detected;

  auto all_detected =
      document_face_detected && profile_face_detected && selfie_face_detected;
  if (all_detected && std::isfinite(score)) {
    result.score = std::clamp(score, 0.0, 1.0);
  }
  result.passed = all_detected && result.score >= kFaceMatchThreshold;
  return result;
}

liveness_result_t make_liveness_result(const std::span<const std::string> required,
                                       std::vector<std::string> completed,
                                       const duration_milliseconds_t duration) {
  auto result = liveness_result_t{};
  result.passed =
      !required.empty() &&
      std::ranges::all_of(required, [&](const std::string& challenge) {
        return std::ranges::find(completed, challenge) != std::end(completed);
      });
  result.challenges = std::move(completed);
  result.duration = duration;
  return result;
}

}  // namespace verity::verification
