/**
 * @file commands.cpp
 * @brief The three things annotate can do: append, list, interactive session
 */

#include "cli/commands.h"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>
#include <utility>

#include "annotation/annotation.h"
#include "tui/list_controller.h"
#include "tui/list_view.h"
#include "utils/scope_guard.h"
#include "utils/structured_log.h"

namespace annotate::cli {

using namespace utils;

namespace {

constexpr int kJsonIndent = 2;

constexpr const char* kEmptyMessage = "You have not registered any annotation!";
constexpr const char* kEmptyHint = "Try: annotate [text]";

}  // namespace

Expected<void, Error> RunAppend(const storage::AnnotationStore& store, const std::string& text) {
  return store.Append(text);
}

Expected<void, Error> RunList(const storage::AnnotationStore& store, const config::DisplayConfig& display, bool json,
                              uint64_t now_ms, std::ostream& out) {
  auto loaded = store.Load();
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }

  if (json) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : *loaded) {
      auto age = entry.FormatRelativeAge(now_ms);
      if (!age) {
        return MakeUnexpected(age.error());
      }
      nlohmann::json item;
      item["created_at"] = entry.created_at;
      item["content"] = entry.content;
      item["age"] = *age;
      entries.push_back(item);
    }
    // Stored content is not guaranteed to be valid UTF-8
    out << entries.dump(kJsonIndent, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return {};
  }

  if (loaded->empty()) {
    out << kEmptyMessage << "\n" << kEmptyHint << "\n";
    return {};
  }

  tui::ListController controller(std::move(*loaded));
  auto rows = controller.BuildRows(now_ms, display.age_width);
  if (!rows) {
    return MakeUnexpected(rows.error());
  }
  for (const auto& row : *rows) {
    out << row << "\n";
  }
  return {};
}

Expected<void, Error> RunInteractive(const storage::AnnotationStore& store, const config::DisplayConfig& display,
                                     bool mute_logging) {
  auto loaded = store.Load();
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }

  tui::ListController controller(std::move(*loaded));

  // Surface future timestamps before the terminal switches to curses mode
  auto rows = controller.BuildRows(annotation::CurrentTimeMillis(), display.age_width);
  if (!rows) {
    return MakeUnexpected(rows.error());
  }

  Expected<void, Error> ran;
  {
    const auto previous_level = spdlog::get_level();
    if (mute_logging) {
      spdlog::set_level(spdlog::level::off);
    }
    ScopeGuard restore_level([previous_level]() { spdlog::set_level(previous_level); });

    tui::CursesListView view(controller, display);
    ran = view.Run();
  }

  return FinishSession(store, controller, ran);
}

Expected<void, Error> FinishSession(const storage::AnnotationStore& store, const tui::ListController& controller,
                                    const Expected<void, Error>& ran) {
  StructuredLog()
      .Event("session_closed")
      .Field("deleted", static_cast<uint64_t>(controller.DeletedCount()))
      .Field("remaining", static_cast<uint64_t>(controller.Collection().size()))
      .Field("ui_error", !ran.has_value())
      .Info();

  // Deletions confirmed before a UI failure are still written
  auto saved = store.Save(controller.Collection());
  if (!ran) {
    if (!saved) {
      StructuredLog().Event("session_save_error").Message(saved.error().to_string()).Error();
    }
    return ran;
  }
  return saved;
}

}  // namespace annotate::cli
