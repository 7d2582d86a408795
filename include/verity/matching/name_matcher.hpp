#pragma once

#include <verity/matching/parser.hpp>
#include <verity/schema/name_match_result.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace verity::matching {

/// A document component must reach this on its own to count as matched.
inline constexpr auto kComponentMatchThreshold = 0.8;
/// The aggregate of the selected orientation must reach this to pass.
inline constexpr auto kNameMatchThreshold = 0.85;

/// How the document's given/family fields line up with the parsed profile.
/// `swapped` covers documents or profiles that put the family name first.
enum class name_orientation_t : uint8_t { natural = 0, swapped = 1 };

inline constexpr auto kNameOrientations =
    std::array{name_orientation_t::natural, name_orientation_t::swapped};

/// Both component scores for one orientation, plus the profile value each
/// document field was compared against.
struct orientation_score_t final {
  name_orientation_t orientation{name_orientation_t::natural};
  double given_score{};
  double family_score{};
  std::string given_counterpart;
  std::string family_counterpart;

  double aggregate() const { return (given_score + family_score) / 2.0; }
};

orientation_score_t score_orientation(name_orientation_t orientation,
                                      std::string_view document_given,
                                      std::string_view document_family,
                                      const parsed_name_t& profile);

/// Scores for every entry of kNameOrientations, in that order.
std::array<orientation_score_t, kNameOrientations.size()> score_orientations(
    std::string_view document_given,
    std::string_view document_family,
    const parsed_name_t& profile);

/// Highest aggregate wins; a tie keeps the natural orientation.
const orientation_score_t& select_orientation(
    const std::array<orientation_score_t, kNameOrientations.size()>& scores);

/// Compare a document's given/family names with a profile display name.
///
/// Passes when the selected orientation's aggregate reaches
/// kNameMatchThreshold and at least one component reaches
/// kComponentMatchThreshold. Any input, including empty strings, yields a
/// well-formed result; when both document names normalize to nothing the
/// result has zero scores and does not pass.
verity::schema::name_match_result_t match_names(
    std::string_view document_given,
    std::string_view document_family,
    std::string_view profile_display_name);

}  // namespace verity::matching
