/**
 * @file annotation.cpp
 * @brief Annotation record implementation
 */

#include "annotation/annotation.h"

#include <charconv>
#include <chrono>
#include <system_error>

namespace annotate::annotation {

namespace {

constexpr char kDelimiter = ' ';

std::string Ago(uint64_t count, const char* unit) {
  return std::to_string(count) + " " + unit + " ago";
}

}  // namespace

std::string Annotation::Serialize() const {
  return std::to_string(created_at) + kDelimiter + content;
}

std::string Annotation::ToString() const {
  return "(" + std::to_string(created_at) + ", " + content + ")";
}

utils::Expected<std::string, utils::Error> Annotation::FormatRelativeAge(uint64_t now_ms) const {
  if (created_at > now_ms) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kAnnotationFutureTimestamp, "Annotation timestamp is in the future",
        "created_at=" + std::to_string(created_at) + " now=" + std::to_string(now_ms)));
  }

  const uint64_t seconds = (now_ms - created_at) / kMillisPerSecond;
  if (seconds == 0) {
    return std::string("Just now");
  }
  if (seconds < kSecondsPerMinute) {
    return Ago(seconds, "seconds");
  }
  if (seconds < kSecondsPerHour) {
    return Ago(seconds / kSecondsPerMinute, "minutes");
  }
  if (seconds < kSecondsPerDay) {
    return Ago(seconds / kSecondsPerHour, "hours");
  }

  const uint64_t days = seconds / kSecondsPerDay;
  if (days < kDaysPerYear) {
    return Ago(days, "days");
  }
  return Ago(days / kDaysPerYear, "years");
}

utils::Expected<Annotation, utils::Error> ParseAnnotation(const std::string& line) {
  const size_t delimiter_pos = line.find(kDelimiter);
  if (delimiter_pos == std::string::npos) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kAnnotationMissingDelimiter,
                                                  "Unable to find the created_at delimiter", line));
  }

  // from_chars accepts neither sign nor whitespace, which is the strictness wanted here
  uint64_t created_at = 0;
  const char* first = line.data();
  const char* last = line.data() + delimiter_pos;
  auto [ptr, ec] = std::from_chars(first, last, created_at);
  if (delimiter_pos == 0 || ec != std::errc() || ptr != last) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kAnnotationInvalidTimestamp,
                                                  "created_at could not be parsed", line.substr(0, delimiter_pos)));
  }

  return Annotation(line.substr(delimiter_pos + 1), created_at);
}

utils::Expected<void, utils::Error> ValidateContent(const std::string& content) {
  if (content.find_first_of("\r\n") != std::string::npos) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kAnnotationInvalidContent, "Annotation content must be a single line"));
  }
  return {};
}

uint64_t CurrentTimeMillis() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace annotate::annotation
