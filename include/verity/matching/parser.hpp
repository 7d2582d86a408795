#pragma once

#include <string>
#include <string_view>

namespace verity::matching {

struct parsed_name_t final {
  std::string given;
  std::string family;
};

/// Split a free-form profile display name.
///
/// "Family, Given ..." when a comma is present (text before the first comma is
/// the family name); otherwise the last whitespace token is the family name
/// and the rest, single-space joined, is the given name. One token yields
/// {token, ""}; empty input yields {"", ""}. Any Unicode whitespace separates
/// tokens; invalid UTF-8 sequences are dropped.
parsed_name_t parse_display_name(std::string_view display_name);

}  // namespace verity::matching
