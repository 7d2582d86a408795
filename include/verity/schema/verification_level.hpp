#pragma once

#include <verity/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: verification level.
// Trust tier derived from a verification record: none < basic < enhanced.
// enhanced always implies a passed name match.
namespace verity::schema {

enum class verification_level_t : uint8_t { none = 0, basic = 1, enhanced = 2 };

inline constexpr auto kVerificationLevelMappings =
    std::array{std::pair<std::string_view, verification_level_t>{
                   "none", verification_level_t::none},
               std::pair<std::string_view, verification_level_t>{
                   "basic", verification_level_t::basic},
               std::pair<std::string_view, verification_level_t>{
                   "enhanced", verification_level_t::enhanced}};

template <>
inline std::optional<verification_level_t> try_from_string<verification_level_t>(
    const std::string_view value) {
  return from_string(value, kVerificationLevelMappings);
}

inline constexpr std::string_view to_string(const verification_level_t value) {
  return to_string(value, kVerificationLevelMappings).value_or("unknown");
}

}  // namespace verity::schema
