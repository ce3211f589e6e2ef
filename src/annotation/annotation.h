/**
 * @file annotation.h
 * @brief Annotation record: parsing, serialization and relative age formatting
 *
 * A stored annotation occupies one line of the store file:
 *
 *   <created_at> <content>
 *
 * where created_at is milliseconds since the Unix epoch. Parsing splits on
 * the first space, so content starting with "<digits> " cannot be told apart
 * from a record with a shifted timestamp; this is accepted.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "utils/error.h"
#include "utils/expected.h"

namespace annotate::annotation {

// Time unit constants
constexpr uint64_t kMillisPerSecond = 1000;
constexpr uint64_t kSecondsPerMinute = 60;
constexpr uint64_t kSecondsPerHour = 60 * kSecondsPerMinute;
constexpr uint64_t kSecondsPerDay = 24 * kSecondsPerHour;
constexpr uint64_t kDaysPerYear = 365;

/**
 * @brief A single timestamped note
 */
struct Annotation {
  std::string content;      ///< Note text (single line)
  uint64_t created_at = 0;  ///< Creation time in milliseconds since the Unix epoch

  Annotation() = default;
  Annotation(std::string content_, uint64_t created_at_) : content(std::move(content_)), created_at(created_at_) {}

  /**
   * @brief Serialize to the store line format "<created_at> <content>"
   */
  std::string Serialize() const;

  /**
   * @brief Debug rendering "(<created_at>, <content>)"
   */
  std::string ToString() const;

  /**
   * @brief Render the elapsed time since creation
   *
   * Picks the largest unit that applies: "Just now", "N seconds ago",
   * "N minutes ago", "N hours ago", "N days ago" or "N years ago" (days / 365).
   * Units are truncated, never rounded.
   *
   * @param now_ms Current time in milliseconds since the Unix epoch
   * @return Relative age string, or kAnnotationFutureTimestamp if created_at > now_ms
   */
  utils::Expected<std::string, utils::Error> FormatRelativeAge(uint64_t now_ms) const;

  bool operator==(const Annotation& other) const {
    return created_at == other.created_at && content == other.content;
  }
  bool operator!=(const Annotation& other) const { return !(*this == other); }
};

/**
 * @brief Parse one store line
 *
 * @param line Line without its trailing newline
 * @return Annotation, or
 *         - kAnnotationMissingDelimiter if the line has no space
 *         - kAnnotationInvalidTimestamp if the prefix is not an unsigned 64-bit decimal
 */
utils::Expected<Annotation, utils::Error> ParseAnnotation(const std::string& line);

/**
 * @brief Check that content can be stored on a single line
 */
utils::Expected<void, utils::Error> ValidateContent(const std::string& content);

/**
 * @brief Current wall-clock time in milliseconds since the Unix epoch
 */
uint64_t CurrentTimeMillis();

}  // namespace annotate::annotation
