/**
 * @file config.cpp
 * @brief Configuration parser implementation for annotate
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdlib>
#include <exception>
#include <string>

#include "utils/structured_log.h"

namespace annotate::config {

namespace {

constexpr std::array<const char*, 7> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

/**
 * @brief Parse store configuration
 */
StoreConfig ParseStoreConfig(const YAML::Node& node) {
  StoreConfig config;

  if (node["path"]) {
    config.path = node["path"].as<std::string>();
  }

  return config;
}

/**
 * @brief Parse display configuration
 */
DisplayConfig ParseDisplayConfig(const YAML::Node& node) {
  DisplayConfig config;

  if (node["title"]) {
    config.title = node["title"].as<std::string>();
  }
  if (node["age_width"]) {
    config.age_width = node["age_width"].as<int>();
  }

  return config;
}

/**
 * @brief Parse logging configuration
 */
LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;

  if (node["level"]) {
    config.level = node["level"].as<std::string>();
  }
  if (node["json"]) {
    config.json = node["json"].as<bool>();
  }
  if (node["file"]) {
    config.file = node["file"].as<std::string>();
  }

  return config;
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    YAML::Node root = YAML::LoadFile(path);

    Config config;

    // An empty file is a valid configuration with all defaults
    if (root.IsNull()) {
      return config;
    }
    if (!root.IsMap()) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kConfigParseError, "Top level of the configuration must be a mapping", path));
    }

    if (root["store"]) {
      config.store = ParseStoreConfig(root["store"]);
    }
    if (root["display"]) {
      config.display = ParseDisplayConfig(root["display"]);
    }
    if (root["logging"]) {
      config.logging = ParseLoggingConfig(root["logging"]);
    }

    auto validation = ValidateConfig(config);
    if (!validation) {
      return utils::MakeUnexpected(validation.error());
    }

    utils::StructuredLog().Event("config_loaded").Field("path", path).Debug();
    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound, "Failed to open config file: " + std::string(e.what()), path));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what()), path));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what()), path));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Validate display configuration
  if (config.display.title.empty()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "display.title must not be empty"));
  }
  if (config.display.age_width < defaults::kMinAgeWidth || config.display.age_width > defaults::kMaxAgeWidth) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue, "display.age_width must be between " +
                                                   std::to_string(defaults::kMinAgeWidth) + " and " +
                                                   std::to_string(defaults::kMaxAgeWidth) +
                                                   " (got: " + std::to_string(config.display.age_width) + ")"));
  }

  // Validate logging configuration
  bool known_level = false;
  for (const char* level : kLogLevels) {
    if (config.logging.level == level) {
      known_level = true;
      break;
    }
  }
  if (!known_level) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "logging.level must be one of: trace, debug, info, warn, error, critical, off (got: " + config.logging.level +
            ")"));
  }

  return {};
}

std::string UserConfigPath() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return "";
  }
  return std::string(home) + "/" + defaults::kUserConfigFilename;
}

}  // namespace annotate::config
