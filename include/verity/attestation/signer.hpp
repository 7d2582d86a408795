#pragma once

#include <verity/schema/primitives.hpp>
#include <verity/schema/signed_attestation.hpp>
#include <verity/schema/verification_result.hpp>
#include <verity/storage/secure_store.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace verity::attestation {

inline constexpr auto kDeviceKeyName =
    std::string_view{"verification_device_key"};
inline constexpr auto kDeviceKeyBytes = std::size_t{32};
inline constexpr auto kSignatureSeparator = ':';

/// Host-supplied stable device identifier.
using device_id_provider_t =
    std::function<std::optional<std::string>(std::string& error)>;

/// Source of key material. Defaults to the OpenSSL CSPRNG.
using random_source_t =
    std::function<bool(std::span<uint8_t> out, std::string& error)>;

struct signer_options final {
  std::string app_version{"0.0.0"};
  std::string key_name{kDeviceKeyName};
};

/// Lowercase hex SHA-256 over "<payload>:<key>".
std::optional<std::string> create_signature(std::string_view payload,
                                            std::string_view key,
                                            std::string& error);

/// base64 of the SCALE encoding of `result`.
std::string encode_payload(const verity::schema::verification_result_t& result);

/// Inverse of encode_payload. std::nullopt for anything that is not a
/// well-formed payload.
std::optional<verity::schema::verification_result_t> decode_payload(
    std::string_view payload);

/// Recompute the signature over `attestation.payload` with `key` and compare.
bool verify_signed_verification(
    const verity::schema::signed_attestation_t& attestation,
    std::string_view key);

/// Short BLAKE3 handle for a device key, safe to log.
std::string key_fingerprint(std::string_view key);

class signer final {
 public:
  signer(verity::storage::secure_store_t store,
         device_id_provider_t device_id_provider,
         signer_options options = {});

  /// Load the device key, creating and persisting it on first use. The key is
  /// memoized after the first success. Creation holds the store's mutex, so
  /// concurrent callers, including other signers over the same store, share
  /// one key.
  std::optional<std::string> get_or_create_device_key(std::string& error);

  /// Encode, sign and bundle `result`. Returns std::nullopt, never a partial
  /// attestation, if the crypto provider, device id, key or digest is
  /// unavailable.
  std::optional<verity::schema::signed_attestation_t>
  create_signed_verification(
      const verity::schema::verification_result_t& result,
      std::string& error);

  void set_random_source(random_source_t random_source);
  const signer_options& options() const;

 private:
  std::optional<std::string> load_or_create_key_locked(std::string& error);

  verity::storage::secure_store_t store_;
  device_id_provider_t device_id_provider_;
  random_source_t random_source_;
  signer_options options_;
  std::shared_ptr<std::mutex> mutex_;
  std::optional<std::string> device_key_;
};

}  // namespace verity::attestation
