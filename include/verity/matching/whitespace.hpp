#pragma once

#include <string>
#include <string_view>

namespace verity::matching {

/// True for code points with the Unicode White_Space property (ASCII
/// whitespace, U+00A0, U+2000..U+200A, U+3000 and the rest).
bool is_unicode_space(char32_t code_point);

/// Decode UTF-8, skipping invalid sequences.
std::u32string decode_utf8(std::string_view text);

/// Replace every Unicode whitespace code point with an ASCII space. Invalid
/// UTF-8 sequences are dropped.
std::string unify_whitespace(std::string_view text);

}  // namespace verity::matching
