/**
 * @file annotation_store.cpp
 * @brief Line-oriented annotation store implementation
 */

#include "storage/annotation_store.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <utility>

#include "utils/structured_log.h"

namespace annotate::storage {

using namespace utils;

namespace {

constexpr const char* kAnnotationsFilename = ".annotations";

std::string LastSystemError() {
  return errno != 0 ? std::strerror(errno) : "unknown error";
}

/**
 * @brief Create an empty store file if it does not exist yet
 */
Expected<void, Error> EnsureFileExists(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return {};
  }

  errno = 0;
  std::ofstream created(path, std::ios::out | std::ios::app);
  if (!created) {
    std::string reason = LastSystemError();
    LogStoreError("create", path, reason);
    return MakeUnexpected(MakeError(ErrorCode::kStoreOpenFailed, "Failed to create annotations file: " + reason, path));
  }
  LogStoreInfo("create", path, 0);
  return {};
}

}  // namespace

AnnotationStore::AnnotationStore(std::string path) : path_(std::move(path)) {}

Expected<std::string, Error> AnnotationStore::ResolveDefaultPath() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return MakeUnexpected(MakeError(ErrorCode::kStoreHomeNotSet, "Failed to get the home directory (HOME is not set)"));
  }
  return std::string(home) + "/" + kAnnotationsFilename;
}

Expected<AnnotationCollection, Error> AnnotationStore::Load() const {
  auto created = EnsureFileExists(path_);
  if (!created) {
    return MakeUnexpected(created.error());
  }

  errno = 0;
  std::ifstream input(path_);
  if (!input) {
    std::string reason = LastSystemError();
    LogStoreError("load", path_, reason);
    return MakeUnexpected(MakeError(ErrorCode::kStoreOpenFailed, "Failed to open annotations file: " + reason, path_));
  }

  AnnotationCollection annotations;
  std::string line;
  uint64_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }

    auto parsed = annotation::ParseAnnotation(line);
    if (!parsed) {
      LogAnnotationParseError(path_, line_number, line, parsed.error().message());
      return MakeUnexpected(MakeError(parsed.error().code(), parsed.error().message(),
                                      path_ + ":" + std::to_string(line_number)));
    }
    annotations.push_back(std::move(*parsed));
  }

  if (input.bad()) {
    LogStoreError("load", path_, "read failed");
    return MakeUnexpected(MakeError(ErrorCode::kStoreReadError, "Failed to read annotations file", path_));
  }

  LogStoreInfo("load", path_, annotations.size());
  return annotations;
}

Expected<void, Error> AnnotationStore::Append(const std::string& content) const {
  return Append(content, annotation::CurrentTimeMillis());
}

Expected<void, Error> AnnotationStore::Append(const std::string& content, uint64_t created_at) const {
  auto valid = annotation::ValidateContent(content);
  if (!valid) {
    return valid;
  }

  errno = 0;
  std::ofstream output(path_, std::ios::out | std::ios::app);
  if (!output) {
    std::string reason = LastSystemError();
    LogStoreError("append", path_, reason);
    return MakeUnexpected(MakeError(ErrorCode::kStoreOpenFailed, "Failed to open annotations file: " + reason, path_));
  }

  output << annotation::Annotation(content, created_at).Serialize() << '\n';
  output.flush();
  if (!output) {
    LogStoreError("append", path_, "write failed");
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write annotation", path_));
  }

  LogStoreInfo("append", path_, 1);
  return {};
}

Expected<void, Error> AnnotationStore::Save(const AnnotationCollection& annotations) const {
  errno = 0;
  std::ofstream output(path_, std::ios::out | std::ios::trunc);
  if (!output) {
    std::string reason = LastSystemError();
    LogStoreError("save", path_, reason);
    return MakeUnexpected(MakeError(ErrorCode::kStoreOpenFailed, "Failed to open annotations file: " + reason, path_));
  }

  for (const auto& entry : annotations) {
    output << entry.Serialize() << '\n';
  }
  output.flush();
  if (!output) {
    LogStoreError("save", path_, "write failed");
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write annotations file", path_));
  }

  LogStoreInfo("save", path_, annotations.size());
  return {};
}

}  // namespace annotate::storage
