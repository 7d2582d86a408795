#pragma once

#include <cstdint>
#include <string>

// Schema type: name match result.
// Outcome of comparing the document's given/family names against the profile
// display name, resolved to whichever orientation scored higher.
namespace verity::schema {

struct name_component_t final {
  // Value exactly as read from the document.
  std::string document;
  // Profile value this document field was compared against.
  std::string profile;
  bool matched{};
  double score{};
};

template <uint16_t Version>
struct name_match_result;

template <>
struct name_match_result<1> final {
  uint16_t version{1};
  double score{};
  bool passed{};
  name_component_t first_name;
  name_component_t last_name;
};

using name_match_result_t = name_match_result<1>;

}  // namespace verity::schema
