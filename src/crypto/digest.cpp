#include <verity/crypto/digest.hpp>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <climits>
#include <memory>

namespace verity::crypto {

namespace {

using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string last_openssl_error(const std::string_view context) {
  auto message = std::string{context};
  auto code = ERR_get_error();
  if (code != 0) {
    auto buffer = std::array<char, 256>{};
    ERR_error_string_n(code, buffer.data(), buffer.size());
    message.append(": ");
    message.append(buffer.data());
  }
  ERR_clear_error();
  return message;
}

evp_md_ptr fetch_sha256() {
  return evp_md_ptr{EVP_MD_fetch(nullptr, "SHA256", nullptr), EVP_MD_free};
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto md = fetch_sha256();
    if (!md) {
      ERR_clear_error();
      return false;
    }
    return RAND_status() == 1;
  }();
  return available_now;
}

std::optional<verity::schema::hash32_t> sha256(
    const verity::schema::bytes_view_t& bytes,
    std::string& error) {
  auto md = fetch_sha256();
  if (!md) {
    error = last_openssl_error("SHA-256 is not available");
    return std::nullopt;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    error = last_openssl_error("failed to allocate digest context");
    return std::nullopt;
  }

  auto out = verity::schema::hash32_t{};
  auto out_size = 0u;
  if (EVP_DigestInit_ex(ctx.get(), md.get(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &out_size) != 1) {
    error = last_openssl_error("SHA-256 digest failed");
    return std::nullopt;
  }
  if (out_size != out.size()) {
    error = "SHA-256 digest returned an unexpected length";
    return std::nullopt;
  }
  return out;
}

bool random_bytes(std::span<uint8_t> out, std::string& error) {
  if (out.size() > static_cast<std::size_t>(INT_MAX)) {
    error = "random byte request too large";
    return false;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    error = last_openssl_error("RAND_bytes failed");
    return false;
  }
  return true;
}

bool constant_time_equals(const std::string_view lhs,
                          const std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace verity::crypto
