#include <verity/schema/encoding/scale/verification_result.hpp>

#include <fmt/format.h>

#include <bit>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace verity::schema {

namespace {

constexpr auto kSupportedVersion = uint16_t{1};

void encode_score(const double score, ::scale::Encoder& encoder) {
  encode(std::bit_cast<uint64_t>(score), encoder);
}

double decode_score(::scale::Decoder& decoder) {
  auto bits = uint64_t{};
  decode(bits, decoder);
  return std::bit_cast<double>(bits);
}

void decode_version(uint16_t& version,
                    const std::string_view record,
                    ::scale::Decoder& decoder) {
  decode(version, decoder);
  if (version != kSupportedVersion) {
    throw std::runtime_error{
        fmt::format("unsupported {} version {}", record, version)};
  }
}

}  // namespace

void encode(const name_component_t& o, ::scale::Encoder& encoder) {
  encode(o.document, encoder);
  encode(o.profile, encoder);
  encode(o.matched, encoder);
  encode_score(o.score, encoder);
}

void decode(name_component_t& o, ::scale::Decoder& decoder) {
  decode(o.document, decoder);
  decode(o.profile, decoder);
  decode(o.matched, decoder);
  o.score = decode_score(decoder);
}

void encode(const name_match_result<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_score(o.score, encoder);
  encode(o.passed, encoder);
  encode(o.first_name, encoder);
  encode(o.last_name, encoder);
}

void decode(name_match_result<1>& o, ::scale::Decoder& decoder) {
  decode_version(o.version, "name match", decoder);
  o.score = decode_score(decoder);
  decode(o.passed, decoder);
  decode(o.first_name, decoder);
  decode(o.last_name, decoder);
}

void encode(const face_match_result<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_score(o.score, encoder);
  encode(o.passed, encoder);
  encode(o.document_face_detected, encoder);
  encode(o.profile_face_detected, encoder);
  encode(o.selfie_face_detected, encoder);
}

void decode(face_match_result<1>& o, ::scale::Decoder& decoder) {
  decode_version(o.version, "face match", decoder);
  o.score = decode_score(decoder);
  decode(o.passed, decoder);
  decode(o.document_face_detected, decoder);
  decode(o.profile_face_detected, decoder);
  decode(o.selfie_face_detected, decoder);
}

void encode(const liveness_result<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.passed, encoder);
  encode(o.challenges, encoder);
  encode(o.duration, encoder);
}

void decode(liveness_result<1>& o, ::scale::Decoder& decoder) {
  decode_version(o.version, "liveness", decoder);
  decode(o.passed, decoder);
  decode(o.challenges, decoder);
  decode(o.duration, decoder);
}

// Optional checks are written as a presence byte (0 or 1) followed by the
// record, the same bytes SCALE uses for Option<T>.
void encode(const verification_result<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name_match, encoder);
  encode(o.face_match.has_value(), encoder);
  if (o.face_match) {
    encode(*o.face_match, encoder);
  }
  encode(o.liveness_check.has_value(), encoder);
  if (o.liveness_check) {
    encode(*o.liveness_check, encoder);
  }
  encode(o.timestamp, encoder);
  encode(o.document_type, encoder);
  encode(o.issuing_country, encoder);
}

void decode(verification_result<1>& o, ::scale::Decoder& decoder) {
  decode_version(o.version, "verification result", decoder);
  decode(o.name_match, decoder);

  auto present = false;
  decode(present, decoder);
  o.face_match.reset();
  if (present) {
    decode(o.face_match.emplace(), decoder);
  }

  decode(present, decoder);
  o.liveness_check.reset();
  if (present) {
    decode(o.liveness_check.emplace(), decoder);
  }

  decode(o.timestamp, decoder);
  decode(o.document_type, decoder);
  decode(o.issuing_country, decoder);
}

}  // namespace verity::schema
