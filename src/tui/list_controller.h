/**
 * @file list_controller.h
 * @brief State machine behind the interactive annotation list
 *
 * The controller owns the in-memory collection for the duration of a
 * session. Every rendered row is derived from that collection, so a
 * displayed index always addresses the same entry in the collection.
 *
 * States:
 * - kBrowsing: list visible, cursor movable
 * - kConfirmingDelete: modal "remove this annotation?" for a captured index
 * - kClosed: session over, collection ready to be saved
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "storage/annotation_store.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace annotate::tui {

enum class SessionState {
  kBrowsing,
  kConfirmingDelete,
  kClosed,
};

enum class UiEventType {
  kMoveCursor,     ///< Move the cursor by delta rows
  kItemActivated,  ///< User submitted the entry at index
  kConfirmYes,     ///< Confirmation dialog: remove
  kConfirmNo,      ///< Confirmation dialog: keep
  kQuit,           ///< Close the session
};

/**
 * @brief Discrete UI event delivered to the controller
 */
struct UiEvent {
  UiEventType type = UiEventType::kQuit;
  size_t index = 0;   ///< kItemActivated only
  int64_t delta = 0;  ///< kMoveCursor only

  static UiEvent MoveCursor(int64_t delta) { return {UiEventType::kMoveCursor, 0, delta}; }
  static UiEvent ItemActivated(size_t index) { return {UiEventType::kItemActivated, index, 0}; }
  static UiEvent ConfirmYes() { return {UiEventType::kConfirmYes, 0, 0}; }
  static UiEvent ConfirmNo() { return {UiEventType::kConfirmNo, 0, 0}; }
  static UiEvent Quit() { return {UiEventType::kQuit, 0, 0}; }
};

/**
 * @brief Interactive list controller
 *
 * Example:
 * @code
 * ListController controller(std::move(*loaded));
 * controller.Dispatch(UiEvent::ItemActivated(0));
 * controller.Dispatch(UiEvent::ConfirmYes());
 * controller.Dispatch(UiEvent::Quit());
 * store.Save(controller.Collection());
 * @endcode
 */
class ListController {
 public:
  explicit ListController(storage::AnnotationCollection annotations);

  /**
   * @brief Route an event to the matching handler
   */
  utils::Expected<void, utils::Error> Dispatch(const UiEvent& event);

  /**
   * @brief Open the delete confirmation for the entry at index
   * @return kUiIndexOutOfRange for a bad index, kUiInvalidState outside kBrowsing
   */
  utils::Expected<void, utils::Error> OnActivate(size_t index);

  /**
   * @brief "Yes": remove the captured entry and return to browsing
   */
  utils::Expected<void, utils::Error> OnConfirmDelete();

  /**
   * @brief "No": return to browsing without changes
   */
  void OnCancelDelete();

  /**
   * @brief Close the session; a pending confirmation is discarded
   */
  void OnQuit();

  /**
   * @brief Move the cursor, clamped to the list bounds (kBrowsing only)
   */
  void MoveCursor(int64_t delta);

  /**
   * @brief Render one row per annotation: right-aligned age, " | ", content
   *
   * @param now_ms Current time in milliseconds since the Unix epoch
   * @param age_width Width the age column is right-aligned to
   */
  utils::Expected<std::vector<std::string>, utils::Error> BuildRows(uint64_t now_ms, int age_width) const;

  SessionState State() const { return state_; }
  size_t Cursor() const { return cursor_; }
  std::optional<size_t> PendingIndex() const { return pending_index_; }
  bool IsEmpty() const { return annotations_.empty(); }
  size_t DeletedCount() const { return deleted_count_; }

  const storage::AnnotationCollection& Collection() const { return annotations_; }

  /**
   * @brief Hand the collection back for saving
   */
  storage::AnnotationCollection TakeCollection() { return std::move(annotations_); }

 private:
  void ClampCursor();

  storage::AnnotationCollection annotations_;
  SessionState state_ = SessionState::kBrowsing;
  size_t cursor_ = 0;
  std::optional<size_t> pending_index_;
  size_t deleted_count_ = 0;
};

/**
 * @brief Format one list row, e.g. "   2 hours ago | buy milk"
 */
std::string FormatRow(const std::string& age, const std::string& content, int age_width);

}  // namespace annotate::tui
