/**
 * @file types.h
 * @brief Core type definitions for clipman
 */

#ifndef CLIPMAN_TYPES_H
#define CLIPMAN_TYPES_H

#include "platform.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace clipman {

// ============================================================================
// History Cursor
// ============================================================================

/**
 * @brief Position of the history cursor
 *
 * A single-entry history reports AtNewest.
 */
enum class CursorState : uint8_t {
  /// No entries; only a push leaves this state
  Empty = 0,

  /// Cursor on the most recent entry (always true right after a push)
  AtNewest = 1,

  /// Cursor strictly between newest and oldest
  AtOlder = 2,

  /// Cursor on the oldest retained entry
  AtOldest = 3
};

/**
 * @brief Get human-readable name for cursor state
 */
CLIPMAN_API const char *cursor_state_name(CursorState state);

// ============================================================================
// Registers
// ============================================================================

/**
 * @brief Subset of register keys affected by a reset
 */
enum class RegisterGroup : uint8_t {
  All = 0,
  Digits = 1,    // 0-9
  Lowercase = 2, // a-z
  Uppercase = 3  // A-Z
};

/**
 * @brief Get name for register group ("all", "digits", "lower", "upper")
 */
CLIPMAN_API const char *register_group_name(RegisterGroup group);

// ============================================================================
// Paste Options
// ============================================================================

/**
 * @brief Options threaded through paste operations to the host
 *
 * The engine never indents; it reports the choice back so the host can
 * pick its own insertion routine.
 */
struct PasteOptions {
  /// Host should use its indent-aware paste
  bool indent = false;

  /// Remove the pasted entry from history afterwards
  bool pop = false;
};

/**
 * @brief Text handed back to the host for insertion or display
 */
struct PasteText {
  std::string text;
  bool indent = false;
};

// ============================================================================
// Display Projections
// ============================================================================

/**
 * @brief One history row for quick-panel / output-panel rendering
 */
struct HistoryLine {
  /// Display index, 0 = newest
  size_t index = 0;

  /// Single-line preview (control characters escaped, width-limited)
  std::string preview;

  /// Row is under the history cursor
  bool is_current = false;

  /// Sequence number of the entry
  uint64_t sequence = 0;
};

/**
 * @brief One register row, sorted by key when listed
 */
struct RegisterLine {
  char key = '\0';
  std::string preview;
};

using HistoryLines = std::vector<HistoryLine>;
using RegisterLines = std::vector<RegisterLine>;

} // namespace clipman

#endif // CLIPMAN_TYPES_H
