#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace verity::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

/// Lowercase hex, two characters per byte.
std::string to_hex(const bytes_view_t& bytes);
bool is_hex(std::string_view value);

/// Standard alphabet with '=' padding.
std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::string to_base64(const std::string_view& text);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

/// Milliseconds since the Unix epoch.
timestamp_milliseconds_t now_milliseconds();

}  // namespace verity::schema
