#include <verity/attestation/signer.hpp>
#include <verity/blake3/hash.hpp>
#include <verity/crypto/digest.hpp>
#include <verity/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <utility>

using namespace verity::schema;

namespace verity::attestation {

namespace {

bool is_well_formed_key(const std::string_view key) {
  return key.size() == (kDeviceKeyBytes * 2) && is_hex(key);
}

}  // namespace

std::optional<std::string> create_signature(const std::string_view payload,
                                            const std::string_view key,
                                            std::string& error) {
  auto message = std::string{};
  message.reserve(payload.size() + 1 + key.size());
  message.append(payload);
  message.push_back(kSignatureSeparator);
  message.append(key);

  auto digest = verity::crypto::sha256(make_bytes_view(message), error);
  if (!digest) {
    return std::nullopt;
  }
  return to_hex(bytes_view_t{digest->data(), digest->size()});
}

std::string encode_payload(const verification_result_t& result) {
  auto encoder = encoding::scale_encoder_t{};
  return to_base64(encoder.encode(result));
}

std::optional<verification_result_t> decode_payload(
    const std::string_view payload) {
  auto bytes = try_from_base64(payload);
  if (!bytes) {
    spdlog::debug("attestation payload is not valid base64");
    return std::nullopt;
  }
  auto encoder = encoding::scale_encoder_t{};
  return encoder.try_decode<verification_result_t>(make_bytes_view(*bytes));
}

bool verify_signed_verification(const signed_attestation_t& attestation,
                                const std::string_view key) {
  auto error = std::string{};
  auto expected = create_signature(attestation.payload, key, error);
  if (!expected) {
    spdlog::error("could not recompute attestation signature: {}", error);
    return false;
  }
  return verity::crypto::constant_time_equals(*expected,
                                              attestation.signature);
}

std::string key_fingerprint(const std::string_view key) {
  return verity::blake3::fingerprint(key);
}

signer::signer(verity::storage::secure_store_t store,
               device_id_provider_t device_id_provider,
               signer_options options)
    : store_{std::move(store)},
      device_id_provider_{std::move(device_id_provider)},
      random_source_{verity::crypto::random_bytes},
      options_{std::move(options)},
      mutex_{store_.mutex ? store_.mutex : std::make_shared<std::mutex>()} {}

void signer::set_random_source(random_source_t random_source) {
  auto lock = std::scoped_lock{*mutex_};
  random_source_ = std::move(random_source);
}

const signer_options& signer::options() const {
  return options_;
}

std::optional<std::string> signer::get_or_create_device_key(
    std::string& error) {
  auto lock = std::scoped_lock{*mutex_};
  if (device_key_) {
    return device_key_;
  }
  auto key = load_or_create_key_locked(error);
  if (key) {
    device_key_ = key;
  }
  return key;
}

std::optional<std::string> signer::load_or_create_key_locked(
    std::string& error) {
  if (!store_) {
    error = "secure store is not configured";
    spdlog::error("device key unavailable: {}", error);
    return std::nullopt;
  }

  auto stored = std::optional<std::string>{};
  if (!store_.get(options_.key_name, stored, error)) {
    spdlog::error("device key lookup failed: {}", error);
    return std::nullopt;
  }
  if (stored && !stored->empty()) {
    if (!is_well_formed_key(*stored)) {
      spdlog::warn("stored device key {} has unexpected format ({} chars)",
                   key_fingerprint(*stored), stored->size());
    }
    spdlog::info("loaded device key {}", key_fingerprint(*stored));
    return stored;
  }

  if (!random_source_) {
    error = "random source is not configured";
    spdlog::error("device key generation failed: {}", error);
    return std::nullopt;
  }
  auto material = std::array<uint8_t, kDeviceKeyBytes>{};
  if (!random_source_(std::span<uint8_t>{material}, error)) {
    spdlog::error("device key generation failed: {}", error);
    return std::nullopt;
  }

  auto key = to_hex(bytes_view_t{material.data(), material.size()});
  if (!store_.set(options_.key_name, key, error)) {
    spdlog::error("device key persist failed: {}", error);
    return std::nullopt;
  }
  spdlog::info("created device key {}", key_fingerprint(key));
  return key;
}

std::optional<signed_attestation_t> signer::create_signed_verification(
    const verification_result_t& result,
    std::string& error) {
  if (!verity::crypto::available()) {
    error = "crypto provider lacks SHA-256 or a seeded RNG";
    spdlog::error("attestation aborted: {}", error);
    return std::nullopt;
  }
  if (!device_id_provider_) {
    error = "device id provider is not configured";
    spdlog::error("attestation aborted: {}", error);
    return std::nullopt;
  }
  auto device_id = device_id_provider_(error);
  if (!device_id) {
    spdlog::error("attestation aborted, device id unavailable: {}", error);
    return std::nullopt;
  }

  auto key = get_or_create_device_key(error);
  if (!key) {
    return std::nullopt;
  }

  auto payload = encode_payload(result);
  auto signature = create_signature(payload, *key, error);
  if (!signature) {
    spdlog::error("attestation aborted, signing failed: {}", error);
    return std::nullopt;
  }

  auto attestation = signed_attestation_t{};
  attestation.payload = std::move(payload);
  attestation.signature = std::move(*signature);
  attestation.device_id = std::move(*device_id);
  attestation.app_version = options_.app_version;
  spdlog::debug("signed attestation: {} payload chars, key {}",
                attestation.payload.size(), key_fingerprint(*key));
  return attestation;
}

}  // namespace verity::attestation
