/**
 * @file version.h
 * @brief annotate version information
 */

#pragma once

#include <string>

namespace annotate {

/**
 * @brief Version information
 */
class Version {
 public:
  /**
   * @brief Get version string
   * @return Version string (e.g., "0.1.0")
   */
  static std::string String() { return "0.1.0"; }
};

}  // namespace annotate
