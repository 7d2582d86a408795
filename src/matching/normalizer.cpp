#include <verity/matching/normalizer.hpp>
#include <verity/matching/whitespace.hpp>

#include <boost/locale/conversion.hpp>
#include <boost/locale/generator.hpp>
#include <boost/locale/localization_backend.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>
#include <locale>
#include <string>
#include <string_view>

namespace verity::matching {

namespace {

const std::locale& unicode_locale() {
  static const auto locale = [] {
    auto manager = boost::locale::localization_backend_manager::global();
    manager.select("icu");
    auto generator = boost::locale::generator{manager};
    return generator("en_US.UTF-8");
  }();
  return locale;
}

// Keeps A-Z (upper-casing stray a-z), turns runs of Unicode whitespace into
// one space, and drops everything else, which after NFD includes the
// combining marks U+0300..U+036F.
std::string fold_to_canonical(const std::u32string_view text) {
  auto out = std::string{};
  out.reserve(text.size());
  auto pending_space = false;
  for (const auto code_point : text) {
    if (is_unicode_space(code_point)) {
      pending_space = true;
      continue;
    }
    if (code_point >= 0x80 ||
        std::isalpha(static_cast<unsigned char>(code_point)) == 0) {
      continue;
    }
    if (pending_space && !out.empty()) {
      out.push_back(' ');
    }
    pending_space = false;
    out.push_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(code_point))));
  }
  return out;
}

}  // namespace

std::string normalize(const std::string_view name) {
  if (name.empty()) {
    return {};
  }
  try {
    const auto& locale = unicode_locale();
    auto upper = boost::locale::to_upper(std::string{name}, locale);
    auto decomposed =
        boost::locale::normalize(upper, boost::locale::norm_nfd, locale);
    return fold_to_canonical(decode_utf8(decomposed));
  } catch (const std::exception& ex) {
    spdlog::warn("Unicode normalization unavailable ({}), using ASCII fold",
                 ex.what());
    return fold_to_canonical(decode_utf8(name));
  }
}

}  // namespace verity::matching
