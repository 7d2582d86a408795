#include <verity/matching/normalizer.hpp>
#include <verity/matching/similarity.hpp>

#include <algorithm>
#include <vector>

namespace verity::matching {

std::size_t edit_distance(const std::string_view lhs,
                          const std::string_view rhs) {
  const auto rows = lhs.size() + 1;
  const auto cols = rhs.size() + 1;
  // Full (m+1) x (n+1) table, row-major.
  auto table = std::vector<std::size_t>(rows * cols, 0);
  auto at = [cols](const std::size_t i, const std::size_t j) {
    return (i * cols) + j;
  };

  for (std::size_t i = 0; i < rows; ++i) {
    table[at(i, 0)] = i;
  }
  for (std::size_t j = 0; j < cols; ++j) {
    table[at(0, j)] = j;
  }

  for (std::size_t i = 1; i < rows; ++i) {
    for (std::size_t j = 1; j < cols; ++j) {
      if (lhs[i - 1] == rhs[j - 1]) {
        table[at(i, j)] = table[at(i - 1, j - 1)];
        continue;
      }
      table[at(i, j)] = 1 + std::min({table[at(i - 1, j)],
                                      table[at(i, j - 1)],
                                      table[at(i - 1, j - 1)]});
    }
  }
  return table[at(rows - 1, cols - 1)];
}

double similarity(const std::string_view lhs, const std::string_view rhs) {
  const auto canonical_lhs = normalize(lhs);
  const auto canonical_rhs = normalize(rhs);

  if (canonical_lhs == canonical_rhs) {
    return 1.0;
  }
  if (canonical_lhs.empty() || canonical_rhs.empty()) {
    return 0.0;
  }

  const auto distance = edit_distance(canonical_lhs, canonical_rhs);
  const auto longest = std::max(canonical_lhs.size(), canonical_rhs.size());
  return 1.0 - (static_cast<double>(distance) / static_cast<double>(longest));
}

}  // namespace verity::matching
