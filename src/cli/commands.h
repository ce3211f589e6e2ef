/**
 * @file commands.h
 * @brief The three things annotate can do: append, list, interactive session
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "config/config.h"
#include "storage/annotation_store.h"
#include "tui/list_controller.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace annotate::cli {

/**
 * @brief Append one annotation created now
 */
utils::Expected<void, utils::Error> RunAppend(const storage::AnnotationStore& store, const std::string& text);

/**
 * @brief Print every annotation as "<age> | <content>", or as a JSON array
 *
 * @param now_ms Reference time for relative ages
 * @param out Destination stream
 */
utils::Expected<void, utils::Error> RunList(const storage::AnnotationStore& store,
                                            const config::DisplayConfig& display, bool json, uint64_t now_ms,
                                            std::ostream& out);

/**
 * @brief Interactive list with delete; saves the collection when closed
 *
 * @param mute_logging Silence spdlog while the terminal is in curses mode
 */
utils::Expected<void, utils::Error> RunInteractive(const storage::AnnotationStore& store,
                                                   const config::DisplayConfig& display, bool mute_logging);

/**
 * @brief Save the session's collection once the view has returned
 *
 * The collection is saved even when the view failed, so confirmed
 * deletions are kept; the view's error is returned in that case.
 *
 * @param ran Result of the view's event loop
 */
utils::Expected<void, utils::Error> FinishSession(const storage::AnnotationStore& store,
                                                  const tui::ListController& controller,
                                                  const utils::Expected<void, utils::Error>& ran);

}  // namespace annotate::cli
