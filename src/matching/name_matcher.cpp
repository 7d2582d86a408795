#include <verity/matching/name_matcher.hpp>
#include <verity/matching/normalizer.hpp>
#include <verity/matching/similarity.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace verity::matching {

namespace {

std::string_view to_string(const name_orientation_t orientation) {
  return orientation == name_orientation_t::swapped ? "swapped" : "natural";
}

}  // namespace

orientation_score_t score_orientation(const name_orientation_t orientation,
                                      const std::string_view document_given,
                                      const std::string_view document_family,
                                      const parsed_name_t& profile) {
  auto score = orientation_score_t{.orientation = orientation};
  switch (orientation) {
    case name_orientation_t::natural:
      score.given_counterpart = profile.given;
      score.family_counterpart = profile.family;
      break;
    case name_orientation_t::swapped:
      score.given_counterpart = profile.family;
      score.family_counterpart = profile.given;
      break;
  }
  score.given_score = similarity(document_given, score.given_counterpart);
  score.family_score = similarity(document_family, score.family_counterpart);
  return score;
}

std::array<orientation_score_t, kNameOrientations.size()> score_orientations(
    const std::string_view document_given,
    const std::string_view document_family,
    const parsed_name_t& profile) {
  auto scores = std::array<orientation_score_t, kNameOrientations.size()>{};
  std::ranges::transform(
      kNameOrientations, std::begin(scores),
      [&](const name_orientation_t orientation) {
        return score_orientation(orientation, document_given, document_family,
                                 profile);
      });
  return scores;
}

const orientation_score_t& select_orientation(
    const std::array<orientation_score_t, kNameOrientations.size()>& scores) {
  const auto* best = &scores.front();
  for (const auto& candidate : scores) {
    if (candidate.aggregate() > best->aggregate()) {
      best = &candidate;
    }
  }
  return *best;
}

verity::schema::name_match_result_t match_names(
    const std::string_view document_given,
    const std::string_view document_family,
    const std::string_view profile_display_name) {
  const auto profile = parse_display_name(profile_display_name);

  // A document with no usable letters cannot vouch for any profile.
  if (normalize(document_given).empty() && normalize(document_family).empty()) {
    auto result = verity::schema::name_match_result_t{};
    result.first_name = verity::schema::name_component_t{
        .document = std::string{document_given}, .profile = profile.given};
    result.last_name = verity::schema::name_component_t{
        .document = std::string{document_family}, .profile = profile.family};
    spdlog::debug("name match: document names are empty after normalization");
    return result;
  }

  const auto scores =
      score_orientations(document_given, document_family, profile);
  const auto& best = select_orientation(scores);

  auto result = verity::schema::name_match_result_t{};
  result.score = best.aggregate();
  result.first_name = verity::schema::name_component_t{
      .document = std::string{document_given},
      .profile = best.given_counterpart,
      .matched = best.given_score >= kComponentMatchThreshold,
      .score = best.given_score};
  result.last_name = verity::schema::name_component_t{
      .document = std::string{document_family},
      .profile = best.family_counterpart,
      .matched = best.family_score >= kComponentMatchThreshold,
      .score = best.family_score};
  result.passed = result.score >= kNameMatchThreshold &&
                  (result.first_name.matched || result.last_name.matched);

  spdlog::debug(
      "name match: orientation={} given={:.4f} family={:.4f} "
      "aggregate={:.4f} passed={}",
      to_string(best.orientation), best.given_score, best.family_score,
      result.score, result.passed);
  return result;
}

}  // namespace verity::matching
