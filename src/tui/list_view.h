/**
 * @file list_view.h
 * @brief ncurses front end for the interactive annotation list
 *
 * Draws the controller's rows inside a titled box, shows the delete
 * confirmation as a modal window and feeds key presses back to the
 * controller as UiEvents until the session is closed.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "config/config.h"
#include "tui/list_controller.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace annotate::tui {

/**
 * @brief Key codes used by the view (ncurses KEY_* values)
 */
namespace keys {
extern const int kUp;
extern const int kDown;
extern const int kLeft;
extern const int kRight;
extern const int kPageUp;
extern const int kPageDown;
extern const int kHome;
extern const int kEnd;
extern const int kEnter;
extern const int kResize;
constexpr int kCtrlC = 3;
constexpr int kEscape = 27;
constexpr int kTab = '\t';
constexpr int kNewline = '\n';
constexpr int kReturn = '\r';
}  // namespace keys

/**
 * @brief Focused button of the confirmation dialog
 */
enum class DialogButton {
  kYes,
  kNo,
};

/**
 * @brief Translate a key press into a controller event
 *
 * @param key Key code as returned by wgetch()
 * @param controller Controller whose state decides the binding
 * @param focused Focused dialog button (kConfirmingDelete only)
 * @param page_rows Rows moved by PgUp/PgDn
 * @param screen_fits false while "Terminal too small" is shown; only keys
 *        that leave the list or the dialog are bound then
 * @return Event, or std::nullopt when the key is not bound in this state
 */
std::optional<UiEvent> TranslateKey(int key, const ListController& controller, DialogButton focused, int page_rows,
                                    bool screen_fits = true);

/**
 * @brief Whether a screen of this size can show the list box
 */
bool ScreenFits(int rows, int cols);

/**
 * @brief Whether the key switches the focused dialog button
 */
bool IsFocusToggleKey(int key);

/**
 * @brief Keep the cursor inside the visible window of rows
 *
 * @return First visible row index
 */
size_t AdjustScrollOffset(size_t cursor, size_t offset, size_t visible_rows);

/**
 * @brief Cut UTF-8 text to at most width code points
 */
std::string FitToWidth(const std::string& text, int width);

/**
 * @brief Interactive list session on the terminal
 */
class CursesListView {
 public:
  CursesListView(ListController& controller, config::DisplayConfig display);

  /**
   * @brief Run the event loop until the controller is closed
   *
   * The terminal is restored on every exit path.
   */
  utils::Expected<void, utils::Error> Run();

 private:
  utils::Expected<void, utils::Error> Draw();
  void DrawList(int top, int left, int height, int width, const std::vector<std::string>& rows);
  void DrawEmptyState(int top, int left, int height, int width);
  void DrawConfirmDialog(int screen_rows, int screen_cols);

  ListController& controller_;
  config::DisplayConfig display_;
  DialogButton focused_ = DialogButton::kNo;
  size_t scroll_offset_ = 0;
  int page_rows_ = 1;
  bool screen_fits_ = true;
};

}  // namespace annotate::tui
