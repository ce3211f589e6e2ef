/**
 * @file list_view.cpp
 * @brief ncurses front end for the interactive annotation list
 */

#include "tui/list_view.h"

#include <algorithm>
#include <clocale>
#include <cstdint>

#include "annotation/annotation.h"
#include "utils/scope_guard.h"

// ncurses defines function-like macros (move, clear, erase, refresh, ...);
// it is included last and those names are not used as C++ identifiers below.
#include <ncurses.h>

namespace annotate::tui {

using namespace utils;

namespace keys {
const int kUp = KEY_UP;
const int kDown = KEY_DOWN;
const int kLeft = KEY_LEFT;
const int kRight = KEY_RIGHT;
const int kPageUp = KEY_PPAGE;
const int kPageDown = KEY_NPAGE;
const int kHome = KEY_HOME;
const int kEnd = KEY_END;
const int kEnter = KEY_ENTER;
const int kResize = KEY_RESIZE;
}  // namespace keys

namespace {

// Smallest screen the list box is drawn on
constexpr int kMinScreenRows = 6;
constexpr int kMinScreenCols = 24;

constexpr int kDialogHeight = 7;
constexpr int kDialogMinWidth = 44;
constexpr int kEscapeDelayMs = 25;

constexpr const char* kEmptyMessage = "You have not registered any annotation!";
constexpr const char* kEmptyHint = "Try: annotate [text]";
constexpr const char* kListHint = " Enter: remove  q: quit ";
constexpr const char* kDialogTitle = " Remove annotation ";
constexpr const char* kDialogQuestion = "Remove this annotation?";
constexpr const char* kYesLabel = "< Yes >";
constexpr const char* kNoLabel = "< No >";

/**
 * @brief Number of UTF-8 code points, used as the column width
 */
int DisplayWidth(const std::string& text) {
  int width = 0;
  for (unsigned char chr : text) {
    if ((chr & 0xC0U) != 0x80U) {
      ++width;
    }
  }
  return width;
}

void PutCentered(WINDOW* window, int row, int left, int width, const std::string& text) {
  std::string fitted = FitToWidth(text, width);
  int col = left + std::max(0, (width - DisplayWidth(fitted)) / 2);
  mvwaddstr(window, row, col, fitted.c_str());
}

}  // namespace

std::optional<UiEvent> TranslateKey(int key, const ListController& controller, DialogButton focused, int page_rows,
                                    bool screen_fits) {
  const int64_t page = page_rows > 0 ? page_rows : 1;

  // The terminal runs in raw mode, so Ctrl-C arrives as a key and closes
  // the session like 'q'
  if (key == keys::kCtrlC && controller.State() != SessionState::kClosed) {
    return UiEvent::Quit();
  }

  switch (controller.State()) {
    case SessionState::kBrowsing: {
      if (key == 'q' || key == 'Q' || key == keys::kEscape) {
        return UiEvent::Quit();
      }
      if (controller.IsEmpty() || !screen_fits) {
        return std::nullopt;
      }
      const auto size = static_cast<int64_t>(controller.Collection().size());
      if (key == keys::kUp || key == 'k') {
        return UiEvent::MoveCursor(-1);
      }
      if (key == keys::kDown || key == 'j') {
        return UiEvent::MoveCursor(1);
      }
      if (key == keys::kPageUp) {
        return UiEvent::MoveCursor(-page);
      }
      if (key == keys::kPageDown) {
        return UiEvent::MoveCursor(page);
      }
      if (key == keys::kHome) {
        return UiEvent::MoveCursor(-size);
      }
      if (key == keys::kEnd) {
        return UiEvent::MoveCursor(size);
      }
      if (key == keys::kEnter || key == keys::kNewline || key == keys::kReturn) {
        return UiEvent::ItemActivated(controller.Cursor());
      }
      return std::nullopt;
    }

    case SessionState::kConfirmingDelete:
      if (key == 'n' || key == 'N' || key == 'q' || key == 'Q' || key == keys::kEscape) {
        return UiEvent::ConfirmNo();
      }
      if (!screen_fits) {
        return std::nullopt;
      }
      if (key == 'y' || key == 'Y') {
        return UiEvent::ConfirmYes();
      }
      if (key == keys::kEnter || key == keys::kNewline || key == keys::kReturn) {
        return focused == DialogButton::kYes ? UiEvent::ConfirmYes() : UiEvent::ConfirmNo();
      }
      return std::nullopt;

    case SessionState::kClosed:
      return std::nullopt;
  }
  return std::nullopt;
}

bool ScreenFits(int rows, int cols) {
  return rows >= kMinScreenRows && cols >= kMinScreenCols;
}

bool IsFocusToggleKey(int key) {
  return key == keys::kLeft || key == keys::kRight || key == keys::kTab || key == 'h' || key == 'l';
}

size_t AdjustScrollOffset(size_t cursor, size_t offset, size_t visible_rows) {
  if (visible_rows == 0) {
    return cursor;
  }
  if (cursor < offset) {
    return cursor;
  }
  if (cursor >= offset + visible_rows) {
    return cursor - visible_rows + 1;
  }
  return offset;
}

std::string FitToWidth(const std::string& text, int width) {
  if (width <= 0) {
    return "";
  }
  int seen = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    auto chr = static_cast<unsigned char>(text[i]);
    if ((chr & 0xC0U) != 0x80U) {
      if (seen == width) {
        return text.substr(0, i);
      }
      ++seen;
    }
  }
  return text;
}

CursesListView::CursesListView(ListController& controller, config::DisplayConfig display)
    : controller_(controller), display_(display) {}

Expected<void, Error> CursesListView::Run() {
  std::setlocale(LC_ALL, "");
  SCREEN* screen = newterm(nullptr, stdout, stdin);
  if (screen == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kUiInitFailed, "Failed to initialize the terminal",
                                    "check that TERM names a known terminal"));
  }
  ScopeGuard restore_terminal([screen]() {
    endwin();
    delscreen(screen);
  });

  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  set_escdelay(kEscapeDelayMs);

  while (controller_.State() != SessionState::kClosed) {
    auto drawn = Draw();
    if (!drawn) {
      return drawn;
    }

    const int key = wgetch(stdscr);
    if (key == ERR || key == keys::kResize) {
      continue;
    }

    if (controller_.State() == SessionState::kConfirmingDelete && screen_fits_ && IsFocusToggleKey(key)) {
      focused_ = focused_ == DialogButton::kYes ? DialogButton::kNo : DialogButton::kYes;
      continue;
    }

    auto event = TranslateKey(key, controller_, focused_, page_rows_, screen_fits_);
    if (!event) {
      continue;
    }
    if (event->type == UiEventType::kItemActivated) {
      focused_ = DialogButton::kNo;
    }

    auto handled = controller_.Dispatch(*event);
    if (!handled) {
      return handled;
    }
  }

  return {};
}

Expected<void, Error> CursesListView::Draw() {
  int screen_rows = 0;
  int screen_cols = 0;
  getmaxyx(stdscr, screen_rows, screen_cols);
  werase(stdscr);

  screen_fits_ = ScreenFits(screen_rows, screen_cols);
  if (!screen_fits_) {
    mvwaddnstr(stdscr, 0, 0, "Terminal too small", screen_cols);
    wrefresh(stdscr);
    return {};
  }

  box(stdscr, 0, 0);
  wattron(stdscr, A_BOLD);
  PutCentered(stdscr, 0, 1, screen_cols - 2, " " + display_.title + " ");
  wattroff(stdscr, A_BOLD);

  const int top = 1;
  const int left = 2;
  const int height = screen_rows - 2;
  const int width = screen_cols - 4;

  if (controller_.IsEmpty()) {
    DrawEmptyState(top, left, height, width);
  } else {
    PutCentered(stdscr, screen_rows - 1, 1, screen_cols - 2, kListHint);
    auto rows = controller_.BuildRows(annotation::CurrentTimeMillis(), display_.age_width);
    if (!rows) {
      return MakeUnexpected(rows.error());
    }
    DrawList(top, left, height, width, *rows);
  }
  wnoutrefresh(stdscr);

  if (controller_.State() == SessionState::kConfirmingDelete) {
    DrawConfirmDialog(screen_rows, screen_cols);
  }
  doupdate();
  return {};
}

void CursesListView::DrawList(int top, int left, int height, int width, const std::vector<std::string>& rows) {
  const auto visible = static_cast<size_t>(height);
  page_rows_ = height;
  scroll_offset_ = AdjustScrollOffset(controller_.Cursor(), scroll_offset_, visible);

  for (size_t i = 0; i < visible && scroll_offset_ + i < rows.size(); ++i) {
    const size_t index = scroll_offset_ + i;
    std::string line = FitToWidth(rows[index], width);
    const bool selected = index == controller_.Cursor();
    if (selected) {
      line.append(static_cast<size_t>(std::max(0, width - DisplayWidth(line))), ' ');
      wattron(stdscr, A_REVERSE);
    }
    mvwaddstr(stdscr, top + static_cast<int>(i), left, line.c_str());
    if (selected) {
      wattroff(stdscr, A_REVERSE);
    }
  }
}

void CursesListView::DrawEmptyState(int top, int left, int height, int width) {
  const int row = top + std::max(0, height / 2 - 1);
  PutCentered(stdscr, row, left, width, kEmptyMessage);
  PutCentered(stdscr, row + 1, left, width, kEmptyHint);
}

void CursesListView::DrawConfirmDialog(int screen_rows, int screen_cols) {
  const auto pending = controller_.PendingIndex();
  if (!pending || *pending >= controller_.Collection().size()) {
    return;
  }
  const std::string& content = controller_.Collection()[*pending].content;

  const int width = std::min(screen_cols - 2, std::max(kDialogMinWidth, DisplayWidth(content) + 6));
  const int height = std::min(screen_rows, kDialogHeight);
  WINDOW* dialog = newwin(height, width, (screen_rows - height) / 2, (screen_cols - width) / 2);
  if (dialog == nullptr) {
    return;
  }
  ScopeGuard destroy_dialog([dialog]() { delwin(dialog); });

  box(dialog, 0, 0);
  wattron(dialog, A_BOLD);
  PutCentered(dialog, 0, 1, width - 2, kDialogTitle);
  wattroff(dialog, A_BOLD);
  PutCentered(dialog, 2, 2, width - 4, kDialogQuestion);
  PutCentered(dialog, 3, 2, width - 4, content);

  const int buttons_width = DisplayWidth(kYesLabel) + 2 + DisplayWidth(kNoLabel);
  const int yes_col = std::max(1, (width - buttons_width) / 2);
  const int no_col = yes_col + DisplayWidth(kYesLabel) + 2;

  wattron(dialog, focused_ == DialogButton::kYes ? A_REVERSE : A_NORMAL);
  mvwaddstr(dialog, height - 2, yes_col, kYesLabel);
  wattroff(dialog, A_REVERSE);
  wattron(dialog, focused_ == DialogButton::kNo ? A_REVERSE : A_NORMAL);
  mvwaddstr(dialog, height - 2, no_col, kNoLabel);
  wattroff(dialog, A_REVERSE);

  wnoutrefresh(dialog);
}

}  // namespace annotate::tui
