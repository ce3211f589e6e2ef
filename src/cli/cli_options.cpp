/**
 * @file cli_options.cpp
 * @brief Command line parsing for the annotate tool
 */

#include "cli/cli_options.h"

#include <sstream>

namespace annotate::cli {

using namespace utils;

namespace {

bool IsKnownOption(const std::string& arg) {
  static const char* const kOptions[] = {
      "--", "-h", "--help", "-v", "--version", "-c", "--config", "-f", "--file", "-l", "--list", "--json",
  };
  for (const char* option : kOptions) {
    if (arg == option) {
      return true;
    }
  }
  return false;
}

}  // namespace

Expected<CliOptions, Error> ParseCommandLine(const std::vector<std::string>& args) {
  CliOptions options;
  bool list = false;

  // Where -l/--list/--json first appeared, and the paths set before it
  size_t first_mode_flag = args.size();
  std::string config_before_mode;
  std::string store_before_mode;

  size_t index = 0;
  while (index < args.size() && IsKnownOption(args[index])) {
    const std::string& arg = args[index];
    if (arg == "--") {
      ++index;
      break;
    }

    if (arg == "-h" || arg == "--help") {
      options.mode = Mode::kHelp;
      return options;
    }
    if (arg == "-v" || arg == "--version") {
      options.mode = Mode::kVersion;
      return options;
    }

    if (arg == "-c" || arg == "--config" || arg == "-f" || arg == "--file") {
      if (index + 1 >= args.size()) {
        return MakeUnexpected(MakeError(ErrorCode::kCliMissingValue, arg + " requires a file path"));
      }
      const std::string& value = args[++index];
      if (arg == "-c" || arg == "--config") {
        options.config_path = value;
      } else {
        options.store_path = value;
      }
    } else {
      if (first_mode_flag == args.size()) {
        first_mode_flag = index;
        config_before_mode = options.config_path;
        store_before_mode = options.store_path;
      }
      if (arg == "--json") {
        options.json = true;
      } else {
        list = true;
      }
    }
    ++index;
  }

  const bool has_text = index < args.size();

  // "--list groceries" or a lone "--json" is not a listing request: the
  // words from the first listing flag on are the note.
  if ((list && has_text) || (options.json && !list)) {
    options.mode = Mode::kAppend;
    options.json = false;
    options.config_path = config_before_mode;
    options.store_path = store_before_mode;
    options.text = JoinArguments(args, first_mode_flag);
    return options;
  }

  if (list) {
    options.mode = Mode::kList;
  } else if (has_text) {
    options.mode = Mode::kAppend;
    options.text = JoinArguments(args, index);
  }
  return options;
}

std::string JoinArguments(const std::vector<std::string>& args, size_t first) {
  std::string joined;
  for (size_t i = first; i < args.size(); ++i) {
    if (i > first) {
      joined += ' ';
    }
    joined += args[i];
  }
  return joined;
}

std::string UsageText(const std::string& program) {
  std::ostringstream usage;
  usage << "Usage: " << program << " [OPTIONS] [--] [<text>...]\n";
  usage << "\n";
  usage << "  With text, append it as a new annotation.\n";
  usage << "  Without text, open the interactive annotation list.\n";
  usage << "\n";
  usage << "Options:\n";
  usage << "  -c, --config <file>            Configuration file (default: ~/.annotate.yaml if present)\n";
  usage << "  -f, --file <file>              Annotations file (default: ~/.annotations)\n";
  usage << "  -l, --list                     Print annotations and exit\n";
  usage << "      --json                     With --list, print annotations as JSON\n";
  usage << "  -h, --help                     Show this help message\n";
  usage << "  -v, --version                  Show version information\n";
  usage << "\n";
  usage << "Interactive keys:\n";
  usage << "  Up/Down, PgUp/PgDn, Home/End   Move\n";
  usage << "  Enter                          Remove the selected annotation (asks first)\n";
  usage << "  q, Esc, Ctrl-C                  Save and quit\n";
  usage << "\n";
  usage << "Example:\n";
  usage << "  " << program << " remember to water the plants\n";
  usage << "  " << program << " -5 degrees outside\n";
  usage << "  " << program << " -- --list is a word too\n";
  return usage.str();
}

}  // namespace annotate::cli
