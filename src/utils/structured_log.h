/**
 * @file structured_log.h
 * @brief Structured logging utilities on top of spdlog
 *
 * Events are emitted either as one JSON object per line or as key=value
 * text, selected globally with StructuredLog::SetFormat().
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace annotate::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief Structured log builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("store_error")
 *   .Field("operation", "append")
 *   .Field("filepath", path)
 *   .Field("error", message)
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }

  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  /**
   * @brief Select JSON or TEXT from the logging.json config flag
   */
  static LogFormat FormatFromFlag(bool json) { return json ? LogFormat::JSON : LogFormat::TEXT; }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return AddString(key, value); }

  StructuredLog& Field(const std::string& key, const std::string& value) { return AddString(key, value); }

  StructuredLog& Field(const std::string& key, int64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, uint64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, bool value) { return AddRaw(key, value ? "true" : "false"); }

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }

  /**
   * @brief Render the event in the current global format
   */
  [[nodiscard]] std::string Build() const {
    std::vector<std::pair<std::string, FieldValue>> all;
    if (!event_.empty()) {
      all.emplace_back("event", FieldValue{event_, true});
    }
    if (!message_.empty()) {
      all.emplace_back("message", FieldValue{message_, true});
    }
    all.insert(all.end(), fields_.begin(), fields_.end());

    return GetFormat() == LogFormat::TEXT ? BuildText(all) : BuildJSON(all);
  }

 private:
  struct FieldValue {
    std::string text;
    bool is_string = false;
  };

  StructuredLog& AddString(const std::string& key, std::string value) {
    fields_.emplace_back(key, FieldValue{std::move(value), true});
    return *this;
  }

  StructuredLog& AddRaw(const std::string& key, std::string value) {
    fields_.emplace_back(key, FieldValue{std::move(value), false});
    return *this;
  }

  static std::string BuildJSON(const std::vector<std::pair<std::string, FieldValue>>& fields) {
    std::ostringstream json;
    json << "{";
    for (size_t i = 0; i < fields.size(); ++i) {
      if (i > 0) {
        json << ",";
      }
      json << "\"" << EscapeJSON(fields[i].first) << "\":";
      if (fields[i].second.is_string) {
        json << "\"" << EscapeJSON(fields[i].second.text) << "\"";
      } else {
        json << fields[i].second.text;
      }
    }
    json << "}";
    return json.str();
  }

  static std::string BuildText(const std::vector<std::pair<std::string, FieldValue>>& fields) {
    std::ostringstream text;
    for (size_t i = 0; i < fields.size(); ++i) {
      if (i > 0) {
        text << " ";
      }
      const std::string& value = fields[i].second.text;
      text << fields[i].first << "=";
      if (value.find_first_of(" \"\n\t") != std::string::npos) {
        text << "\"" << EscapeText(value) << "\"";
      } else {
        text << value;
      }
    }
    return text.str();
  }

  static std::string EscapeText(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char chr : str) {
      switch (chr) {
        case '"':
        case '\\':
          escaped += '\\';
          escaped += chr;
          break;
        case '\n':
          escaped += "\\n";
          break;
        case '\r':
          escaped += "\\r";
          break;
        case '\t':
          escaped += "\\t";
          break;
        default:
          escaped += chr;
      }
    }
    return escaped;
  }

  static std::string EscapeJSON(const std::string& str) {
    // Control character threshold for JSON escaping (0x20 = space)
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }

  std::string event_;
  std::string message_;
  std::vector<std::pair<std::string, FieldValue>> fields_;
  static inline std::atomic<LogFormat> format_{LogFormat::TEXT};
};

/**
 * @brief Log annotation store error in structured format
 */
inline void LogStoreError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("store_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log annotation store progress at debug level
 */
inline void LogStoreInfo(const std::string& operation, const std::string& filepath, uint64_t records) {
  StructuredLog()
      .Event("store_info")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("records", records)
      .Debug();
}

/**
 * @brief Log a stored line that could not be parsed
 */
inline void LogAnnotationParseError(const std::string& filepath, uint64_t line_number, const std::string& line,
                                    const std::string& error_msg) {
  // Maximum line length to log (prevent log spam)
  constexpr size_t kMaxLineLogLength = 200;

  StructuredLog()
      .Event("annotation_parse_error")
      .Field("filepath", filepath)
      .Field("line_number", line_number)
      .Field("line", line.substr(0, kMaxLineLogLength))
      .Field("error", error_msg)
      .Error();
}

}  // namespace annotate::utils
