/**
 * @file clipboard_linux.h
 * @brief Linux clipboard internal declarations
 *
 * Text clipboard access for X11/Wayland through command-line tools.
 */

#ifndef CLIPMAN_PLATFORM_LINUX_CLIPBOARD_LINUX_H
#define CLIPMAN_PLATFORM_LINUX_CLIPBOARD_LINUX_H

#include "clipman/error.h"
#include <string>

namespace clipman {
namespace platform {

/**
 * @brief Clipboard backend type
 */
enum class ClipboardBackend {
  Unknown,
  X11,
  Wayland,
  Headless // no display server reachable
};

/**
 * @brief Detect the current display server
 */
ClipboardBackend detect_display_server();

/**
 * @brief Get name for a backend ("x11", "wayland", "headless")
 */
const char *backend_name(ClipboardBackend backend);

/**
 * @brief Read text from the clipboard
 */
Result<std::string> read_clipboard_text();

/**
 * @brief Write text to the clipboard
 */
Result<void> write_clipboard_text(const std::string &text);

} // namespace platform
} // namespace clipman

#endif // CLIPMAN_PLATFORM_LINUX_CLIPBOARD_LINUX_H
