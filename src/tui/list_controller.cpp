/**
 * @file list_controller.cpp
 * @brief State machine behind the interactive annotation list
 */

#include "tui/list_controller.h"

#include <utility>

#include "utils/structured_log.h"

namespace annotate::tui {

using namespace utils;

ListController::ListController(storage::AnnotationCollection annotations) : annotations_(std::move(annotations)) {}

Expected<void, Error> ListController::Dispatch(const UiEvent& event) {
  switch (event.type) {
    case UiEventType::kMoveCursor:
      MoveCursor(event.delta);
      return {};
    case UiEventType::kItemActivated:
      return OnActivate(event.index);
    case UiEventType::kConfirmYes:
      return OnConfirmDelete();
    case UiEventType::kConfirmNo:
      OnCancelDelete();
      return {};
    case UiEventType::kQuit:
      OnQuit();
      return {};
  }
  return MakeUnexpected(MakeError(ErrorCode::kInternalError, "Unhandled UI event"));
}

Expected<void, Error> ListController::OnActivate(size_t index) {
  if (state_ != SessionState::kBrowsing) {
    return MakeUnexpected(MakeError(ErrorCode::kUiInvalidState, "Entries can only be activated while browsing"));
  }
  if (index >= annotations_.size()) {
    return MakeUnexpected(MakeError(ErrorCode::kUiIndexOutOfRange, "No annotation at index " + std::to_string(index),
                                    "size=" + std::to_string(annotations_.size())));
  }

  cursor_ = index;
  pending_index_ = index;
  state_ = SessionState::kConfirmingDelete;
  return {};
}

Expected<void, Error> ListController::OnConfirmDelete() {
  if (state_ != SessionState::kConfirmingDelete || !pending_index_) {
    return MakeUnexpected(MakeError(ErrorCode::kUiInvalidState, "No deletion is awaiting confirmation"));
  }

  const size_t index = *pending_index_;
  annotations_.erase(annotations_.begin() + static_cast<std::ptrdiff_t>(index));
  ++deleted_count_;
  StructuredLog()
      .Event("annotation_deleted")
      .Field("index", static_cast<uint64_t>(index))
      .Field("remaining", static_cast<uint64_t>(annotations_.size()))
      .Debug();

  pending_index_.reset();
  state_ = SessionState::kBrowsing;
  ClampCursor();
  return {};
}

void ListController::OnCancelDelete() {
  if (state_ != SessionState::kConfirmingDelete) {
    return;
  }
  pending_index_.reset();
  state_ = SessionState::kBrowsing;
}

void ListController::OnQuit() {
  pending_index_.reset();
  state_ = SessionState::kClosed;
}

void ListController::MoveCursor(int64_t delta) {
  if (state_ != SessionState::kBrowsing || annotations_.empty()) {
    return;
  }

  const auto last = static_cast<int64_t>(annotations_.size()) - 1;
  int64_t target = static_cast<int64_t>(cursor_) + delta;
  if (target < 0) {
    target = 0;
  } else if (target > last) {
    target = last;
  }
  cursor_ = static_cast<size_t>(target);
}

Expected<std::vector<std::string>, Error> ListController::BuildRows(uint64_t now_ms, int age_width) const {
  std::vector<std::string> rows;
  rows.reserve(annotations_.size());
  for (const auto& entry : annotations_) {
    auto age = entry.FormatRelativeAge(now_ms);
    if (!age) {
      return MakeUnexpected(age.error());
    }
    rows.push_back(FormatRow(*age, entry.content, age_width));
  }
  return rows;
}

void ListController::ClampCursor() {
  if (annotations_.empty()) {
    cursor_ = 0;
  } else if (cursor_ >= annotations_.size()) {
    cursor_ = annotations_.size() - 1;
  }
}

std::string FormatRow(const std::string& age, const std::string& content, int age_width) {
  std::string row;
  const auto width = static_cast<size_t>(age_width > 0 ? age_width : 0);
  if (age.size() < width) {
    row.append(width - age.size(), ' ');
  }
  row += age;
  row += " | ";
  row += content;
  return row;
}

}  // namespace annotate::tui
