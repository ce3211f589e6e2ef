/**
 * @file annotation_test.cpp
 * @brief Unit tests for the annotation record
 */

#include "annotation/annotation.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

namespace annotate::annotation {
namespace {

constexpr uint64_t kCreatedAt = 1700000000000ULL;

// Relative age for a delta given in seconds
std::string AgeAfterSeconds(uint64_t seconds) {
  Annotation entry("note", kCreatedAt);
  auto age = entry.FormatRelativeAge(kCreatedAt + seconds * kMillisPerSecond);
  EXPECT_TRUE(age.has_value()) << age.error().message();
  return age.value_or("");
}

// ============================================================================
// Parse
// ============================================================================

TEST(AnnotationParseTest, ParsesTimestampAndContent) {
  auto parsed = ParseAnnotation("1000 hello");
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message();
  EXPECT_EQ(parsed->created_at, 1000U);
  EXPECT_EQ(parsed->content, "hello");
}

TEST(AnnotationParseTest, ContentKeepsEverythingAfterFirstSpace) {
  auto parsed = ParseAnnotation("2000  two  spaces here ");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->created_at, 2000U);
  EXPECT_EQ(parsed->content, " two  spaces here ");
}

TEST(AnnotationParseTest, EmptyContentIsAllowed) {
  auto parsed = ParseAnnotation("42 ");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->created_at, 42U);
  EXPECT_EQ(parsed->content, "");
}

TEST(AnnotationParseTest, LeadingDigitsInContentStayInContent) {
  auto parsed = ParseAnnotation("1000 300 apples");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->created_at, 1000U);
  EXPECT_EQ(parsed->content, "300 apples");
}

TEST(AnnotationParseTest, MaxTimestamp) {
  auto parsed = ParseAnnotation("18446744073709551615 max");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->created_at, std::numeric_limits<uint64_t>::max());
}

TEST(AnnotationParseTest, RejectsMissingDelimiter) {
  auto parsed = ParseAnnotation("helloworld");
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code(), utils::ErrorCode::kAnnotationMissingDelimiter);
}

TEST(AnnotationParseTest, RejectsNonNumericTimestamp) {
  auto parsed = ParseAnnotation("hello world");
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code(), utils::ErrorCode::kAnnotationInvalidTimestamp);
}

TEST(AnnotationParseTest, RejectsEmptyTimestamp) {
  auto parsed = ParseAnnotation(" hello");
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code(), utils::ErrorCode::kAnnotationInvalidTimestamp);
}

TEST(AnnotationParseTest, RejectsPartiallyNumericTimestamp) {
  auto parsed = ParseAnnotation("12ab hello");
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code(), utils::ErrorCode::kAnnotationInvalidTimestamp);
}

TEST(AnnotationParseTest, RejectsSignedTimestamp) {
  EXPECT_FALSE(ParseAnnotation("-5 hello").has_value());
  EXPECT_FALSE(ParseAnnotation("+5 hello").has_value());
}

TEST(AnnotationParseTest, RejectsOverflowingTimestamp) {
  auto parsed = ParseAnnotation("18446744073709551616 too big");
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code(), utils::ErrorCode::kAnnotationInvalidTimestamp);
}

// ============================================================================
// Serialize
// ============================================================================

TEST(AnnotationSerializeTest, WritesTimestampSpaceContent) {
  EXPECT_EQ(Annotation("world", 2000).Serialize(), "2000 world");
  EXPECT_EQ(Annotation("", 7).Serialize(), "7 ");
}

TEST(AnnotationSerializeTest, ParseRestoresSerializedRecord) {
  Annotation original("buy milk, eggs & bread", kCreatedAt);
  auto parsed = ParseAnnotation(original.Serialize());
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, original);
}

TEST(AnnotationSerializeTest, ToString) {
  EXPECT_EQ(Annotation("hello", 1000).ToString(), "(1000, hello)");
}

TEST(AnnotationContentTest, RejectsLineBreaks) {
  EXPECT_TRUE(ValidateContent("single line").has_value());
  EXPECT_TRUE(ValidateContent("").has_value());

  auto newline = ValidateContent("two\nlines");
  ASSERT_FALSE(newline.has_value());
  EXPECT_EQ(newline.error().code(), utils::ErrorCode::kAnnotationInvalidContent);
  EXPECT_FALSE(ValidateContent("carriage\rreturn").has_value());
}

// ============================================================================
// Relative age
// ============================================================================

TEST(AnnotationAgeTest, JustNow) {
  EXPECT_EQ(AgeAfterSeconds(0), "Just now");

  Annotation entry("note", kCreatedAt);
  EXPECT_EQ(entry.FormatRelativeAge(kCreatedAt + 999).value(), "Just now");
}

TEST(AnnotationAgeTest, Seconds) {
  EXPECT_EQ(AgeAfterSeconds(1), "1 seconds ago");
  EXPECT_EQ(AgeAfterSeconds(59), "59 seconds ago");
}

TEST(AnnotationAgeTest, Minutes) {
  EXPECT_EQ(AgeAfterSeconds(60), "1 minutes ago");
  EXPECT_EQ(AgeAfterSeconds(119), "1 minutes ago");
  EXPECT_EQ(AgeAfterSeconds(3599), "59 minutes ago");
}

TEST(AnnotationAgeTest, Hours) {
  EXPECT_EQ(AgeAfterSeconds(3600), "1 hours ago");
  EXPECT_EQ(AgeAfterSeconds(86399), "23 hours ago");
}

TEST(AnnotationAgeTest, Days) {
  EXPECT_EQ(AgeAfterSeconds(kSecondsPerDay), "1 days ago");
  EXPECT_EQ(AgeAfterSeconds(365 * kSecondsPerDay - 1), "364 days ago");
}

TEST(AnnotationAgeTest, Years) {
  EXPECT_EQ(AgeAfterSeconds(365 * kSecondsPerDay), "1 years ago");
  EXPECT_EQ(AgeAfterSeconds(2 * 365 * kSecondsPerDay - 1), "1 years ago");
  EXPECT_EQ(AgeAfterSeconds(3 * 365 * kSecondsPerDay + 10 * kSecondsPerDay), "3 years ago");
}

TEST(AnnotationAgeTest, MagnitudeNeverDecreases) {
  // Walk the unit boundaries in order; the unit rank must never go down
  const char* units[] = {"Just now", "seconds", "minutes", "hours", "days", "years"};
  auto rank = [&](const std::string& age) {
    for (int i = 5; i >= 0; --i) {
      if (age.find(units[i]) != std::string::npos) {
        return i;
      }
    }
    return -1;
  };

  const uint64_t deltas[] = {0, 1, 59, 60, 61, 3599, 3600, 86399, 86400, 31535999, 31536000, 99999999};
  int previous = -1;
  for (uint64_t delta : deltas) {
    int current = rank(AgeAfterSeconds(delta));
    ASSERT_GE(current, 0) << "delta=" << delta;
    EXPECT_GE(current, previous) << "delta=" << delta;
    previous = current;
  }
}

TEST(AnnotationAgeTest, FutureTimestampIsAnError) {
  Annotation entry("from the future", kCreatedAt);
  auto age = entry.FormatRelativeAge(kCreatedAt - 1);
  ASSERT_FALSE(age.has_value());
  EXPECT_EQ(age.error().code(), utils::ErrorCode::kAnnotationFutureTimestamp);
  EXPECT_TRUE(age.error().IsCorruptStore());
}

TEST(AnnotationClockTest, CurrentTimeIsMilliseconds) {
  // 2020-01-01 in milliseconds; any sane clock is past it
  constexpr uint64_t kYear2020Ms = 1577836800000ULL;
  uint64_t first = CurrentTimeMillis();
  uint64_t second = CurrentTimeMillis();
  EXPECT_GT(first, kYear2020Ms);
  EXPECT_GE(second, first);
}

}  // namespace
}  // namespace annotate::annotation
