#pragma once

#include <string>
#include <string_view>

namespace verity::matching {

/// Canonical form used for every name comparison.
///
/// Upper-cases (Unicode-aware, so "ß" becomes "SS"), decomposes to NFD and
/// drops the combining marks, keeps only A-Z and spaces, collapses runs of
/// Unicode whitespace (U+00A0 included) and trims. Idempotent. Never throws; input that is not valid UTF-8
/// falls back to an ASCII-only fold.
std::string normalize(std::string_view name);

}  // namespace verity::matching
