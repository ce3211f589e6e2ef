/**
 * @file error.h
 * @brief Error type and error codes for annotate
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace annotate::utils {

/**
 * @brief Error codes
 *
 * Grouped by subsystem:
 * - 0-99: generic
 * - 100-199: configuration
 * - 200-299: annotation record
 * - 300-399: annotation store
 * - 400-499: interactive session
 * - 500-599: command line
 */
enum class ErrorCode : std::uint16_t {
  // Generic
  kUnknown = 1,
  kInternalError = 6,

  // Configuration
  kConfigFileNotFound = 100,
  kConfigYamlError = 101,
  kConfigParseError = 102,
  kConfigInvalidValue = 103,

  // Annotation record
  kAnnotationMissingDelimiter = 200,
  kAnnotationInvalidTimestamp = 201,
  kAnnotationFutureTimestamp = 202,
  kAnnotationInvalidContent = 203,

  // Annotation store
  kStoreHomeNotSet = 300,
  kStoreOpenFailed = 301,
  kStoreReadError = 302,
  kStoreWriteError = 303,

  // Interactive session
  kUiInitFailed = 400,
  kUiIndexOutOfRange = 401,
  kUiInvalidState = 402,

  // Command line
  kCliMissingValue = 500,
};

/**
 * @brief Get a stable name for an error code
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kUnknown:
      return "Unknown";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kAnnotationMissingDelimiter:
      return "AnnotationMissingDelimiter";
    case ErrorCode::kAnnotationInvalidTimestamp:
      return "AnnotationInvalidTimestamp";
    case ErrorCode::kAnnotationFutureTimestamp:
      return "AnnotationFutureTimestamp";
    case ErrorCode::kAnnotationInvalidContent:
      return "AnnotationInvalidContent";
    case ErrorCode::kStoreHomeNotSet:
      return "StoreHomeNotSet";
    case ErrorCode::kStoreOpenFailed:
      return "StoreOpenFailed";
    case ErrorCode::kStoreReadError:
      return "StoreReadError";
    case ErrorCode::kStoreWriteError:
      return "StoreWriteError";
    case ErrorCode::kUiInitFailed:
      return "UiInitFailed";
    case ErrorCode::kUiIndexOutOfRange:
      return "UiIndexOutOfRange";
    case ErrorCode::kUiInvalidState:
      return "UiInvalidState";
    case ErrorCode::kCliMissingValue:
      return "CliMissingValue";
  }
  return "Unknown";
}

/**
 * @brief Error value carried by Expected<T, Error>
 *
 * Holds an error code, a human-readable message and an optional context
 * string (file path, line number, ...).
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code, std::string message = "", std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }

  /**
   * @brief Check whether the error represents a corrupt annotation store
   *
   * Malformed records and future timestamps are all reported to the user
   * as one class of failure.
   */
  [[nodiscard]] bool IsCorruptStore() const {
    return code_ == ErrorCode::kAnnotationMissingDelimiter || code_ == ErrorCode::kAnnotationInvalidTimestamp ||
           code_ == ErrorCode::kAnnotationFutureTimestamp;
  }

  /**
   * @brief Format as "[Code] message (context)"
   */
  [[nodiscard]] std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += "] ";
    result += message_;
    if (!context_.empty()) {
      result += " (" + context_ + ")";
    }
    return result;
  }

 private:
  ErrorCode code_ = ErrorCode::kUnknown;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an error
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace annotate::utils
