#pragma once
#include <verity/schema/primitives.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace verity::blake3 {

verity::schema::hash32_t hash(const std::string_view& str);
verity::schema::hash32_t hash(const verity::schema::bytes_view_t& bytes);

/// First `hex_chars` characters of the hex BLAKE3 digest of `str`; a
/// non-secret handle for logging and identifiers.
std::string fingerprint(const std::string_view& str, std::size_t hex_chars = 16);

}  // namespace verity::blake3
