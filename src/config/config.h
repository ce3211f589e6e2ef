/**
 * @file config.h
 * @brief Configuration structures and YAML parser for annotate
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace annotate::config {

// Default values for configuration
namespace defaults {

// Display defaults
constexpr const char* kTitle = "Annotations";
constexpr int kAgeWidth = 14;
constexpr int kMinAgeWidth = 1;
constexpr int kMaxAgeWidth = 64;

// Logging defaults
constexpr const char* kLogLevel = "warn";

// Per-user config file, relative to $HOME
constexpr const char* kUserConfigFilename = ".annotate.yaml";

}  // namespace defaults

/**
 * @brief Annotation store configuration
 */
struct StoreConfig {
  std::string path;  ///< Store file path (empty = $HOME/.annotations)
};

/**
 * @brief List rendering configuration
 */
struct DisplayConfig {
  std::string title = defaults::kTitle;  ///< Title of the list box
  int age_width = defaults::kAgeWidth;   ///< Right-aligned width of the relative age column
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = defaults::kLogLevel;  ///< Log level: trace, debug, info, warn, error, critical, off
  bool json = false;                        ///< Use structured JSON logging
  std::string file;                         ///< Log file path (empty = stderr)
};

/**
 * @brief Root configuration
 */
struct Config {
  StoreConfig store;      ///< Annotation store configuration
  DisplayConfig display;  ///< List rendering configuration
  LoggingConfig logging;  ///< Logging configuration
};

/**
 * @brief Load configuration from YAML file
 *
 * Missing sections and keys keep their defaults.
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

/**
 * @brief Path of the per-user config file ($HOME/.annotate.yaml)
 *
 * @return Path, or empty string when HOME is not set
 */
std::string UserConfigPath();

}  // namespace annotate::config
