#pragma once
#include <verity/schema/verification_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// SCALE field order for the verification records. Scores travel as the
// IEEE-754 bit pattern of the double (uint64) so a decode reproduces them
// exactly. Declared beside the record types so the codec finds them by
// argument-dependent lookup. Decoding a record with an unknown version throws.
namespace verity::schema {

void encode(const name_component_t& o, ::scale::Encoder& encoder);
void decode(name_component_t& o, ::scale::Decoder& decoder);

void encode(const name_match_result<1>& o, ::scale::Encoder& encoder);
void decode(name_match_result<1>& o, ::scale::Decoder& decoder);

void encode(const face_match_result<1>& o, ::scale::Encoder& encoder);
void decode(face_match_result<1>& o, ::scale::Decoder& decoder);

void encode(const liveness_result<1>& o, ::scale::Encoder& encoder);
void decode(liveness_result<1>& o, ::scale::Decoder& decoder);

void encode(const verification_result<1>& o, ::scale::Encoder& encoder);
void decode(verification_result<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
