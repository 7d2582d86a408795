#pragma once

#include <verity/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace verity::crypto {

/// True when the OpenSSL build exposes SHA-256 and a seeded RNG.
bool available();

/// SHA-256 over `bytes`. On failure returns std::nullopt and sets `error`.
std::optional<verity::schema::hash32_t> sha256(
    const verity::schema::bytes_view_t& bytes,
    std::string& error);

/// Fill `out` from the OpenSSL CSPRNG.
bool random_bytes(std::span<uint8_t> out, std::string& error);

/// Length-checked, constant-time comparison for digests and MACs.
bool constant_time_equals(std::string_view lhs, std::string_view rhs);

}  // namespace verity::crypto
