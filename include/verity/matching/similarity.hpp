#pragma once

#include <cstddef>
#include <string_view>

namespace verity::matching {

/// Levenshtein distance (unit cost insert/delete/substitute) over the raw
/// bytes of two strings; callers pass canonical forms.
std::size_t edit_distance(std::string_view lhs, std::string_view rhs);

/// 1 - distance / max(len) over the canonical forms of both inputs.
///
/// Equal canonical forms score 1.0 (including two empty ones); otherwise an
/// empty side scores 0.0. Symmetric and always within [0, 1].
double similarity(std::string_view lhs, std::string_view rhs);

}  // namespace verity::matching
