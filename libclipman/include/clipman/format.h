/**
 * @file format.h
 * @brief Text formatting for clipboard display surfaces
 *
 * Pure functions that turn entry text into previews, status messages and
 * the plain-text output panel used by hosts without their own widgets.
 */

#ifndef CLIPMAN_FORMAT_H
#define CLIPMAN_FORMAT_H

#include "entry.h"
#include "platform.h"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clipman {

/// Default preview width for quick-panel rows
constexpr size_t DEFAULT_PREVIEW_WIDTH = 64;

/// Texts longer than this are shortened for popups
constexpr size_t POPUP_TEXT_LIMIT = 500;

/// Number of leading bytes kept when a popup text is shortened
constexpr size_t POPUP_TEXT_KEEP = 350;

/**
 * @brief Replace tab, newline and carriage return with visible escapes
 */
CLIPMAN_API std::string escape_control(const std::string &text);

/**
 * @brief Single-line preview of @p text, at most @p width bytes
 *
 * Control characters are escaped first. Truncation never splits a UTF-8
 * sequence.
 */
CLIPMAN_API std::string make_preview(const std::string &text, size_t width);

/**
 * @brief Shorten long text for a popup ("...\n" marks the cut)
 *
 * Keeps at most POPUP_TEXT_KEEP bytes, never splitting a UTF-8 sequence.
 */
CLIPMAN_API std::string truncate_for_popup(const std::string &text);

/**
 * @brief Status-bar message for the current entry
 * @return `Set Clipboard to "<text>"`, or "Nothing in history"
 */
CLIPMAN_API std::string format_status(const MaybeEntry &entry);

/**
 * @brief Render a history list for the output panel
 * @param title Panel title, e.g. "CLIPBOARD" or "YANK"
 * @param texts Entry texts, newest first
 * @param current Display index of the cursor, if any
 *
 * Example:
 * @code
 *    CLIPBOARD HISTORY (2)
 *   =======================
 *   -->   1. newest
 *         2. first line
 *          > second line
 * @endcode
 */
CLIPMAN_API std::string
format_history_panel(const std::string &title,
                     const std::vector<std::string> &texts,
                     std::optional<size_t> current);

/**
 * @brief Render registers for the output panel, in the given order
 */
CLIPMAN_API std::string format_register_panel(
    const std::vector<std::pair<char, std::string>> &registers);

} // namespace clipman

#endif // CLIPMAN_FORMAT_H
