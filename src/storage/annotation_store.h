/**
 * @file annotation_store.h
 * @brief Line-oriented annotation store file
 *
 * The store is a plain text file with one serialized annotation per line,
 * oldest first. New notes are appended; deletions are persisted only by
 * rewriting the whole file with Save().
 *
 * The file is not locked. A Save() issued at the end of an interactive
 * session overwrites anything appended by another process meanwhile.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "annotation/annotation.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace annotate::storage {

/**
 * @brief Ordered annotations, file order = insertion order
 */
using AnnotationCollection = std::vector<annotation::Annotation>;

/**
 * @brief Annotation store bound to one file
 *
 * Example:
 * @code
 * auto path = AnnotationStore::ResolveDefaultPath();
 * if (!path) { ... }
 * AnnotationStore store(*path);
 * auto appended = store.Append("call the plumber");
 * @endcode
 */
class AnnotationStore {
 public:
  /**
   * @brief Bind the store to a file path
   * @param path Store file path (not opened until first use)
   */
  explicit AnnotationStore(std::string path);

  /**
   * @brief Default store location: $HOME/.annotations
   * @return Path, or kStoreHomeNotSet when HOME is unset or empty
   */
  static utils::Expected<std::string, utils::Error> ResolveDefaultPath();

  /**
   * @brief Load every annotation in file order
   *
   * Creates an empty file when none exists. Empty lines are skipped. The
   * first malformed line aborts the load; its line number is reported in
   * the error context.
   */
  utils::Expected<AnnotationCollection, utils::Error> Load() const;

  /**
   * @brief Append one annotation created now
   */
  utils::Expected<void, utils::Error> Append(const std::string& content) const;

  /**
   * @brief Append one annotation with an explicit creation time
   *
   * Content containing a line break is rejected before the file is opened.
   */
  utils::Expected<void, utils::Error> Append(const std::string& content, uint64_t created_at) const;

  /**
   * @brief Replace the file contents with the given collection
   */
  utils::Expected<void, utils::Error> Save(const AnnotationCollection& annotations) const;

  const std::string& Path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace annotate::storage
