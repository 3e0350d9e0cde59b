/**
 * @file clipman.h
 * @brief Main clipman API Header
 *
 * clipman - Clipboard history for text editors
 *
 * This is the main header file for the clipman library. It provides
 * a unified API for:
 * - Bounded clipboard history with navigation
 * - Named registers
 * - A yank stack for replaying copies in order
 * - Mirroring the selected entry to the desktop clipboard
 *
 * Quick Start:
 * @code
 *   #include <clipman/clipman.h>
 *
 *   clipman::ClipboardManager clipboard(
 *       std::make_shared<clipman::SystemClipboardPort>());
 *   clipboard.init();
 *
 *   clipboard.copy(selection);
 *   auto text = clipboard.previous_and_get_text();
 * @endcode
 */

#ifndef CLIPMAN_CLIPMAN_H
#define CLIPMAN_CLIPMAN_H

#include "error.h"
#include "platform.h"
#include "types.h"

#include "clipboard.h"
#include "command.h"
#include "config.h"
#include "entry.h"
#include "format.h"
#include "history.h"
#include "log.h"
#include "registers.h"
#include "sync_port.h"
#include "watcher.h"

namespace clipman {

// ============================================================================
// Version Information
// ============================================================================

/// clipman major version
constexpr int VERSION_MAJOR = 1;

/// clipman minor version
constexpr int VERSION_MINOR = 0;

/// clipman patch version
constexpr int VERSION_PATCH = 0;

/// clipman version string
constexpr const char *VERSION_STRING = "1.0.0";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *build_date = __DATE__;
  const char *build_time = __TIME__;
};

CLIPMAN_API VersionInfo get_version();

} // namespace clipman

#endif // CLIPMAN_CLIPMAN_H
