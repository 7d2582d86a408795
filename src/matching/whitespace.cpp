#include <verity/matching/whitespace.hpp>

#include <boost/locale/encoding_utf.hpp>
#include <unicode/uchar.h>

#include <algorithm>

namespace verity::matching {

bool is_unicode_space(const char32_t code_point) {
  return u_isUWhiteSpace(static_cast<UChar32>(code_point)) != 0;
}

std::u32string decode_utf8(const std::string_view text) {
  return boost::locale::conv::utf_to_utf<char32_t>(
      text.data(), text.data() + text.size(), boost::locale::conv::skip);
}

std::string unify_whitespace(const std::string_view text) {
  auto decoded = decode_utf8(text);
  std::ranges::replace_if(decoded, is_unicode_space, U' ');
  return boost::locale::conv::utf_to_utf<char>(
      decoded.data(), decoded.data() + decoded.size(),
      boost::locale::conv::skip);
}

}  // namespace verity::matching
