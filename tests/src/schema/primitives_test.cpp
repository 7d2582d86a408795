#include <gtest/gtest.h>
#include <verity/schema/primitives.hpp>
#include <verity/schema/failure_reason.hpp>
#include <verity/schema/verification_level.hpp>

#include <string>
#include <string_view>

TEST(primitives, hex_is_lowercase_two_chars_per_byte) {
  auto bytes = verity::schema::bytes_t{0x00, 0x0F, 0xA0, 0xFF};
  EXPECT_EQ(verity::schema::to_hex(verity::schema::make_bytes_view(bytes)),
            "000fa0ff");
  EXPECT_EQ(verity::schema::to_hex(verity::schema::bytes_view_t{}), "");
}

TEST(primitives, is_hex_accepts_either_case_only) {
  EXPECT_TRUE(verity::schema::is_hex("0123456789abcdefABCDEF"));
  EXPECT_FALSE(verity::schema::is_hex("0x12"));
  EXPECT_FALSE(verity::schema::is_hex("zz"));
}

TEST(primitives, base64_pads_to_quads) {
  EXPECT_EQ(verity::schema::to_base64(std::string_view{"f"}), "Zg==");
  EXPECT_EQ(verity::schema::to_base64(std::string_view{"fo"}), "Zm8=");
  EXPECT_EQ(verity::schema::to_base64(std::string_view{"foo"}), "Zm9v");
  EXPECT_EQ(verity::schema::to_base64(std::string_view{"foobar"}), "Zm9vYmFy");
  EXPECT_EQ(verity::schema::to_base64(std::string_view{}), "");
}

TEST(primitives, base64_round_trips_bytes) {
  auto payload = verity::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = verity::schema::to_base64(payload);
  auto decoded = verity::schema::try_from_base64(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(verity::schema::try_from_base64("not base64***").has_value());
  EXPECT_FALSE(verity::schema::try_from_base64("Zg=").has_value());
  EXPECT_FALSE(verity::schema::try_from_base64("Zg==Zm9v").has_value());
  EXPECT_FALSE(verity::schema::try_from_base64("Z=9v").has_value());
}

TEST(primitives, try_from_base64_skips_whitespace) {
  auto decoded = verity::schema::try_from_base64("Zm9v\nYmFy ");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "foobar");
}

TEST(primitives, now_milliseconds_is_monotonic_enough) {
  auto first = verity::schema::now_milliseconds();
  auto second = verity::schema::now_milliseconds();
  EXPECT_GT(first, 1'600'000'000'000u);
  EXPECT_GE(second, first);
}

TEST(primitives, verification_level_maps_to_strings) {
  using verity::schema::verification_level_t;
  EXPECT_EQ(verity::schema::to_string(verification_level_t::none), "none");
  EXPECT_EQ(verity::schema::to_string(verification_level_t::basic), "basic");
  EXPECT_EQ(verity::schema::to_string(verification_level_t::enhanced),
            "enhanced");
  EXPECT_EQ(
      verity::schema::try_from_string<verification_level_t>("enhanced"),
      verification_level_t::enhanced);
  EXPECT_FALSE(verity::schema::try_from_string<verification_level_t>("gold")
                   .has_value());
}

TEST(primitives, failure_reasons_map_to_fixed_text) {
  using verity::schema::failure_reason_t;
  EXPECT_EQ(verity::schema::to_string(failure_reason_t::name_mismatch),
            "Name does not match profile");
  EXPECT_EQ(verity::schema::to_string(failure_reason_t::liveness_failed),
            "Liveness check failed");
  EXPECT_EQ(verity::schema::try_from_string<failure_reason_t>(
                "Face does not match profile photo"),
            failure_reason_t::face_mismatch);
}
