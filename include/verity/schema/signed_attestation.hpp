#pragma once

#include <cstdint>
#include <string>

// Schema type: signed attestation.
// What the networking collaborator submits to the remote verifier.
namespace verity::schema {

template <uint16_t Version>
struct signed_attestation;

template <>
struct signed_attestation<1> final {
  uint16_t version{1};
  // base64 of the encoded verification_result_t
  std::string payload;
  // lowercase hex SHA-256 over "<payload>:<device key>"
  std::string signature;
  std::string device_id;
  std::string app_version;
};

using signed_attestation_t = signed_attestation<1>;

}  // namespace verity::schema
