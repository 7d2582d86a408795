#include <blake3.h>
#include <verity/blake3/hash.hpp>

#include <algorithm>
#include <tuple>

namespace verity::blake3 {

namespace {

verity::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = verity::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<verity::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

verity::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

verity::schema::hash32_t hash(const verity::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

std::string fingerprint(const std::string_view& str, const std::size_t hex_chars) {
  auto hashed = hash(str);
  auto hex = verity::schema::to_hex(
      verity::schema::bytes_view_t{hashed.data(), hashed.size()});
  hex.resize(std::min(hex_chars, hex.size()));
  return hex;
}

}  // namespace verity::blake3
