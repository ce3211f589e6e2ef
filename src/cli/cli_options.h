/**
 * @file cli_options.h
 * @brief Command line parsing for the annotate tool
 *
 * Only exact option names are options, and only before the note text
 * starts. Any other argument, including one starting with '-', begins the
 * note; "--" ends option parsing explicitly.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace annotate::cli {

enum class Mode {
  kInteractive,  ///< No text: open the interactive list
  kAppend,       ///< Text given: append one annotation
  kList,         ///< --list: print annotations and exit
  kHelp,         ///< --help
  kVersion,      ///< --version
};

/**
 * @brief Parsed command line
 */
struct CliOptions {
  Mode mode = Mode::kInteractive;
  std::string text;         ///< Note text (kAppend only)
  std::string config_path;  ///< -c/--config (empty = default lookup)
  std::string store_path;   ///< -f/--file (empty = config or $HOME/.annotations)
  bool json = false;        ///< --json (kList only)
};

/**
 * @brief Parse arguments (without the program name)
 *
 * -l/--list and --json select listing only when no note text follows and
 * --json comes with --list. Otherwise they are words of the note.
 *
 * @return Options, or kCliMissingValue when -c/-f lack a value
 */
utils::Expected<CliOptions, utils::Error> ParseCommandLine(const std::vector<std::string>& args);

/**
 * @brief Join args[first..] with single spaces
 */
std::string JoinArguments(const std::vector<std::string>& args, size_t first = 0);

/**
 * @brief Usage message for --help
 */
std::string UsageText(const std::string& program);

}  // namespace annotate::cli
