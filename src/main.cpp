/**
 * @file main.cpp
 * @brief Entry point for the annotate tool
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "annotation/annotation.h"
#include "cli/cli_options.h"
#include "cli/commands.h"
#include "config/config.h"
#include "storage/annotation_store.h"
#include "utils/structured_log.h"
#include "version.h"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

constexpr const char* kLoggerName = "annotate";

/**
 * @brief Install the default spdlog logger from the logging configuration
 *
 * @return true if logs go to a file, false if they go to stderr
 */
bool SetupLogging(const annotate::config::LoggingConfig& logging) {
  bool file_sink = false;
  spdlog::drop(kLoggerName);
  if (!logging.file.empty()) {
    try {
      spdlog::set_default_logger(spdlog::basic_logger_mt(kLoggerName, logging.file));
      file_sink = true;
    } catch (const spdlog::spdlog_ex& e) {
      spdlog::set_default_logger(spdlog::stderr_color_mt(kLoggerName));
      spdlog::warn("Cannot open log file {}: {}", logging.file, e.what());
    }
  } else {
    spdlog::set_default_logger(spdlog::stderr_color_mt(kLoggerName));
  }

  spdlog::set_level(spdlog::level::from_str(logging.level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  annotate::utils::StructuredLog::SetFormat(annotate::utils::StructuredLog::FormatFromFlag(logging.json));
  return file_sink;
}

/**
 * @brief Load --config, else ~/.annotate.yaml when present, else defaults
 */
annotate::utils::Expected<annotate::config::Config, annotate::utils::Error> LoadEffectiveConfig(
    const annotate::cli::CliOptions& options) {
  if (!options.config_path.empty()) {
    return annotate::config::LoadConfig(options.config_path);
  }

  const std::string user_config = annotate::config::UserConfigPath();
  std::error_code ec;
  if (!user_config.empty() && std::filesystem::exists(user_config, ec)) {
    return annotate::config::LoadConfig(user_config);
  }
  return annotate::config::Config{};
}

/**
 * @brief --file, else store.path from the config, else $HOME/.annotations
 */
annotate::utils::Expected<std::string, annotate::utils::Error> ResolveStorePath(
    const annotate::cli::CliOptions& options, const annotate::config::Config& config) {
  if (!options.store_path.empty()) {
    return options.store_path;
  }
  if (!config.store.path.empty()) {
    return config.store.path;
  }
  return annotate::storage::AnnotationStore::ResolveDefaultPath();
}

void PrintError(const annotate::utils::Error& error) {
  if (error.IsCorruptStore()) {
    std::cerr << "Error: Corrupt annotation store: " << error.message();
  } else {
    std::cerr << "Error: " << error.message();
  }
  if (!error.context().empty()) {
    std::cerr << " (" << error.context() << ")";
  }
  std::cerr << "\n";
}

}  // namespace

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code
 */
int main(int argc, char* argv[]) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  std::vector<std::string> args(argv + 1, argv + argc);

  auto parsed = annotate::cli::ParseCommandLine(args);
  if (!parsed) {
    PrintError(parsed.error());
    std::cerr << "Use -h or --help for usage information\n";
    return kExitFailure;
  }
  const annotate::cli::CliOptions& options = *parsed;

  if (options.mode == annotate::cli::Mode::kHelp) {
    std::cout << annotate::cli::UsageText(argv[0]);
    return kExitSuccess;
  }
  if (options.mode == annotate::cli::Mode::kVersion) {
    std::cout << "annotate version " << annotate::Version::String() << "\n";
    std::cout << "Timestamped personal annotations from the command line\n";
    return kExitSuccess;
  }

  auto config = LoadEffectiveConfig(options);
  if (!config) {
    PrintError(config.error());
    return kExitFailure;
  }
  const bool logs_to_file = SetupLogging(config->logging);

  auto store_path = ResolveStorePath(options, *config);
  if (!store_path) {
    PrintError(store_path.error());
    return kExitFailure;
  }
  annotate::storage::AnnotationStore store(*store_path);
  spdlog::debug("Using annotations file: {}", store.Path());

  switch (options.mode) {
    case annotate::cli::Mode::kAppend: {
      auto appended = annotate::cli::RunAppend(store, options.text);
      if (!appended) {
        std::cerr << "Annotation failed: " << appended.error().message() << "\n";
        return kExitFailure;
      }
      return kExitSuccess;
    }

    case annotate::cli::Mode::kList: {
      auto listed = annotate::cli::RunList(store, config->display, options.json,
                                           annotate::annotation::CurrentTimeMillis(), std::cout);
      if (!listed) {
        PrintError(listed.error());
        return kExitFailure;
      }
      return kExitSuccess;
    }

    case annotate::cli::Mode::kInteractive: {
      auto session = annotate::cli::RunInteractive(store, config->display, !logs_to_file);
      if (!session) {
        PrintError(session.error());
        return kExitFailure;
      }
      return kExitSuccess;
    }

    case annotate::cli::Mode::kHelp:
    case annotate::cli::Mode::kVersion:
      break;
  }

  return kExitSuccess;
}
