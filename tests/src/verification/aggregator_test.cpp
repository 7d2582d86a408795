#include <gtest/gtest.h>
#include <verity/matching/name_matcher.hpp>
#include <verity/schema/primitives.hpp>
#include <verity/testing/common.hpp>
#include <verity/verification/aggregator.hpp>

#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using verity::schema::failure_reason_t;
using verity::schema::verification_level_t;

namespace {

verity::schema::face_match_result_t make_face(const bool passed) {
  return verity::verification::make_face_match_result(passed ? 0.92 : 0.40,
                                                      true, true, true);
}

verity::schema::liveness_result_t make_liveness(const bool passed) {
  auto required = std::vector<std::string>{"blink", "turn_left"};
  auto completed = passed ? std::vector<std::string>{"blink", "turn_left"}
                          : std::vector<std::string>{"blink"};
  return verity::verification::make_liveness_result(required, completed, 1500);
}

verity::schema::verification_result_t make_result(
    const bool name_passed,
    std::optional<verity::schema::face_match_result_t> face = std::nullopt,
    std::optional<verity::schema::liveness_result_t> liveness = std::nullopt) {
  return verity::verification::create_verification_result(
      verity::testing::make_name_match(name_passed), "passport", "USA",
      std::move(face), std::move(liveness));
}

void expect_reasons_iff_failed(
    const verity::schema::verification_result_t& result) {
  auto passed = verity::verification::is_verification_passed(result);
  auto reasons = verity::verification::get_verification_failure_reasons(result);
  EXPECT_EQ(passed, reasons.empty());
}

}  // namespace

TEST(aggregator, create_stamps_current_time) {
  auto before = verity::schema::now_milliseconds();
  auto result = make_result(true);
  auto after = verity::schema::now_milliseconds();
  EXPECT_GE(result.timestamp, before);
  EXPECT_LE(result.timestamp, after);
  EXPECT_EQ(result.document_type, "passport");
  EXPECT_EQ(result.issuing_country, "USA");
  EXPECT_FALSE(result.face_match.has_value());
  EXPECT_FALSE(result.liveness_check.has_value());
}

TEST(aggregator, failed_name_match_is_level_none) {
  EXPECT_EQ(verity::verification::get_verification_level(make_result(false)),
            verification_level_t::none);
  EXPECT_EQ(verity::verification::get_verification_level(
                make_result(false, make_face(true), make_liveness(true))),
            verification_level_t::none);
  EXPECT_FALSE(verity::verification::is_verification_passed(
      make_result(false, make_face(true), make_liveness(true))));
}

TEST(aggregator, name_only_is_basic_and_passes) {
  auto result = make_result(true);
  EXPECT_EQ(verity::verification::get_verification_level(result),
            verification_level_t::basic);
  EXPECT_TRUE(verity::verification::is_verification_passed(result));
  EXPECT_TRUE(
      verity::verification::get_verification_failure_reasons(result).empty());
}

TEST(aggregator, face_and_liveness_passed_is_enhanced) {
  auto result = make_result(true, make_face(true), make_liveness(true));
  EXPECT_EQ(verity::verification::get_verification_level(result),
            verification_level_t::enhanced);
  EXPECT_TRUE(verity::verification::is_verification_passed(result));
}

TEST(aggregator, face_without_liveness_stays_basic) {
  auto result = make_result(true, make_face(true));
  EXPECT_EQ(verity::verification::get_verification_level(result),
            verification_level_t::basic);
  EXPECT_TRUE(verity::verification::is_verification_passed(result));
}

TEST(aggregator, failed_face_blocks_pass_despite_name) {
  auto result = make_result(true, make_face(false));
  EXPECT_FALSE(verity::verification::is_verification_passed(result));
  EXPECT_EQ(verity::verification::get_verification_level(result),
            verification_level_t::basic);
  EXPECT_EQ(verity::verification::get_verification_failure_codes(result),
            (std::vector<failure_reason_t>{failure_reason_t::face_mismatch}));
}

TEST(aggregator, failed_liveness_blocks_pass) {
  auto result = make_result(true, make_face(true), make_liveness(false));
  EXPECT_FALSE(verity::verification::is_verification_passed(result));
  EXPECT_EQ(verity::verification::get_verification_level(result),
            verification_level_t::basic);
  EXPECT_EQ(verity::verification::get_verification_failure_reasons(result),
            (std::vector<std::string>{"Liveness check failed"}));
}

TEST(aggregator, reasons_identify_the_failing_name_component) {
  auto result = make_result(false);
  EXPECT_EQ(verity::verification::get_verification_failure_reasons(result),
            (std::vector<std::string>{"Name does not match profile"}));

  result.name_match.first_name.matched = true;
  EXPECT_EQ(verity::verification::get_verification_failure_reasons(result),
            (std::vector<std::string>{"Last name does not match"}));

  result.name_match.first_name.matched = false;
  result.name_match.last_name.matched = true;
  EXPECT_EQ(verity::verification::get_verification_failure_reasons(result),
            (std::vector<std::string>{"First name does not match"}));

  // Both components matched but the aggregate stayed below the bar.
  result.name_match.first_name.matched = true;
  EXPECT_EQ(verity::verification::get_verification_failure_codes(result),
            (std::vector<failure_reason_t>{failure_reason_t::name_mismatch}));
}

TEST(aggregator, reasons_are_additive_in_fixed_order) {
  auto face = verity::verification::make_face_match_result(0.99, false, false,
                                                           true);
  auto result = make_result(false, face, make_liveness(false));
  EXPECT_EQ(verity::verification::get_verification_failure_reasons(result),
            (std::vector<std::string>{"Name does not match profile",
                                      "Could not detect face in document photo",
                                      "Could not detect face in profile photo",
                                      "Liveness check failed"}));
}

TEST(aggregator, undetected_selfie_reports_face_mismatch) {
  auto face =
      verity::verification::make_face_match_result(0.95, true, true, false);
  auto result = make_result(true, face);
  EXPECT_EQ(verity::verification::get_verification_failure_codes(result),
            (std::vector<failure_reason_t>{failure_reason_t::face_mismatch}));
}

TEST(aggregator, reasons_empty_iff_passed) {
  for (const auto name : {false, true}) {
    for (const auto face : {0, 1, 2}) {
      for (const auto liveness : {0, 1, 2}) {
        auto face_match = std::optional<verity::schema::face_match_result_t>{};
        if (face != 0) {
          face_match = make_face(face == 1);
        }
        auto liveness_check =
            std::optional<verity::schema::liveness_result_t>{};
        if (liveness != 0) {
          liveness_check = make_liveness(liveness == 1);
        }
        expect_reasons_iff_failed(
            make_result(name, face_match, liveness_check));
      }
    }
  }
}

TEST(aggregator, face_match_applies_threshold) {
  auto passed =
      verity::verification::make_face_match_result(0.70, true, true, true);
  EXPECT_TRUE(passed.passed);
  EXPECT_DOUBLE_EQ(passed.score, 0.70);

  auto failed =
      verity::verification::make_face_match_result(0.69, true, true, true);
  EXPECT_FALSE(failed.passed);
}

TEST(aggregator, face_match_clamps_score) {
  EXPECT_DOUBLE_EQ(
      verity::verification::make_face_match_result(1.7, true, true, true).score,
      1.0);
  EXPECT_DOUBLE_EQ(
      verity::verification::make_face_match_result(-0.3, true, true, true)
          .score,
      0.0);
  auto nan = verity::verification::make_face_match_result(
      std::numeric_limits<double>::quiet_NaN(), true, true, true);
  EXPECT_DOUBLE_EQ(nan.score, 0.0);
  EXPECT_FALSE(nan.passed);
}

TEST(aggregator, missing_face_zeroes_score) {
  auto result =
      verity::verification::make_face_match_result(0.95, true, false, true);
  EXPECT_FALSE(result.passed);
  EXPECT_DOUBLE_EQ(result.score, 0.0);
  EXPECT_TRUE(result.document_face_detected);
  EXPECT_FALSE(result.profile_face_detected);
  EXPECT_TRUE(result.selfie_face_detected);
}

TEST(aggregator, liveness_requires_every_challenge) {
  auto required = std::vector<std::string>{"blink", "turn_left"};
  auto passed = verity::verification::make_liveness_result(
      required, {"turn_left", "smile", "blink"}, 2400);
  EXPECT_TRUE(passed.passed);
  EXPECT_EQ(passed.challenges,
            (std::vector<std::string>{"turn_left", "smile", "blink"}));
  EXPECT_EQ(passed.duration, 2400u);

  auto failed =
      verity::verification::make_liveness_result(required, {"blink"}, 900);
  EXPECT_FALSE(failed.passed);

  auto nothing_required =
      verity::verification::make_liveness_result({}, {"blink"}, 100);
  EXPECT_FALSE(nothing_required.passed);
}

TEST(aggregator, end_to_end_enhanced_verification) {
  auto name_match = verity::matching::match_names("MARIA", "GARCIA-LOPEZ",
                                                  "Maria Garcia-Lopez");
  EXPECT_TRUE(name_match.passed);
  EXPECT_NEAR(name_match.score, 1.0, 1e-9);

  auto face =
      verity::verification::make_face_match_result(0.92, true, true, true);
  EXPECT_TRUE(face.passed);

  auto required = std::vector<std::string>{"blink", "turn_left"};
  auto liveness = verity::verification::make_liveness_result(
      required, {"blink", "turn_left"}, 3200);
  EXPECT_TRUE(liveness.passed);

  auto result = verity::verification::create_verification_result(
      name_match, "passport", "ESP", face, liveness);
  EXPECT_EQ(verity::verification::get_verification_level(result),
            verification_level_t::enhanced);
  EXPECT_TRUE(verity::verification::is_verification_passed(result));
  EXPECT_TRUE(
      verity::verification::get_verification_failure_reasons(result).empty());
}
