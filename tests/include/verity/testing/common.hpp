#pragma once

#include <gtest/gtest.h>
#include <verity/schema/verification_result.hpp>
#include <verity/storage/secure_store.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace verity::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline verity::schema::name_match_result_t make_name_match(
    const bool passed,
    const double score = 1.0) {
  auto result = verity::schema::name_match_result_t{};
  result.score = score;
  result.passed = passed;
  result.first_name = verity::schema::name_component_t{
      .document = "JOHN", .profile = "John", .matched = passed, .score = score};
  result.last_name = verity::schema::name_component_t{
      .document = "SMITH", .profile = "Smith", .matched = passed, .score = score};
  return result;
}

/// Store whose every operation fails with `message`.
inline verity::storage::secure_store_t make_failing_store(
    const std::string& message) {
  return verity::storage::secure_store_t{
      .get =
          [message](std::string_view, std::optional<std::string>&,
                    std::string& error) {
            error = message;
            return false;
          },
      .set =
          [message](std::string_view, std::string_view, std::string& error) {
            error = message;
            return false;
          },
      .remove =
          [message](std::string_view, std::string& error) {
            error = message;
            return false;
          }};
}

inline void expect_component_eq(const verity::schema::name_component_t& lhs,
                                const verity::schema::name_component_t& rhs) {
  EXPECT_EQ(lhs.document, rhs.document);
  EXPECT_EQ(lhs.profile, rhs.profile);
  EXPECT_EQ(lhs.matched, rhs.matched);
  EXPECT_EQ(lhs.score, rhs.score);
}

inline void expect_result_eq(const verity::schema::verification_result_t& lhs,
                             const verity::schema::verification_result_t& rhs) {
  EXPECT_EQ(lhs.version, rhs.version);
  EXPECT_EQ(lhs.name_match.version, rhs.name_match.version);
  EXPECT_EQ(lhs.name_match.score, rhs.name_match.score);
  EXPECT_EQ(lhs.name_match.passed, rhs.name_match.passed);
  expect_component_eq(lhs.name_match.first_name, rhs.name_match.first_name);
  expect_component_eq(lhs.name_match.last_name, rhs.name_match.last_name);

  ASSERT_EQ(lhs.face_match.has_value(), rhs.face_match.has_value());
  if (lhs.face_match) {
    EXPECT_EQ(lhs.face_match->score, rhs.face_match->score);
    EXPECT_EQ(lhs.face_match->passed, rhs.face_match->passed);
    EXPECT_EQ(lhs.face_match->document_face_detected,
              rhs.face_match->document_face_detected);
    EXPECT_EQ(lhs.face_match->profile_face_detected,
              rhs.face_match->profile_face_detected);
    EXPECT_EQ(lhs.face_match->selfie_face_detected,
              rhs.face_match->selfie_face_detected);
  }

  ASSERT_EQ(lhs.liveness_check.has_value(), rhs.liveness_check.has_value());
  if (lhs.liveness_check) {
    EXPECT_EQ(lhs.liveness_check->passed, rhs.liveness_check->passed);
    EXPECT_EQ(lhs.liveness_check->challenges, rhs.liveness_check->challenges);
    EXPECT_EQ(lhs.liveness_check->duration, rhs.liveness_check->duration);
  }

  EXPECT_EQ(lhs.timestamp, rhs.timestamp);
  EXPECT_EQ(lhs.document_type, rhs.document_type);
  EXPECT_EQ(lhs.issuing_country, rhs.issuing_country);
}

}  // namespace verity::testing
