#pragma once
#include <verity/common/critical.hpp>
#include <verity/schema/encoding/encoder.hpp>
#include <verity/schema/encoding/scale/verification_result.hpp>
#include <exception>
#include <utility>
#include <scale/scale.hpp>

namespace verity::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  verity::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const verity::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
verity::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    verity::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const verity::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  } catch (const std::exception& ex) {
    spdlog::debug("SCALE decode rejected {} bytes: {}", bytes.size(),
                  ex.what());
    return std::nullopt;
  }
}

}  // namespace verity::schema::encoding
