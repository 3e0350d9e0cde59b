/**
 * @file history.h
 * @brief Bounded clipboard history with a navigation cursor
 */

#ifndef CLIPMAN_HISTORY_H
#define CLIPMAN_HISTORY_H

#include "entry.h"
#include "platform.h"
#include "types.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace clipman {

/// Default number of retained history entries
constexpr size_t DEFAULT_HISTORY_CAPACITY = 256;

/**
 * @brief Ordered, bounded sequence of clipboard entries
 *
 * Entries are kept most-recent-last. Callers address entries by display
 * index, where 0 is the newest entry. The cursor is "unset" after every
 * push, which always means the newest entry.
 *
 * Navigation clamps at both ends and never wraps. Every operation is
 * total on an empty buffer and reports "no entry" instead of failing.
 *
 * Not thread-safe; ClipboardManager serializes access.
 *
 * @code
 *   HistoryBuffer history;
 *   history.push("foo");
 *   history.push("bar");
 *   history.move_previous(); // "foo"
 *   history.move_previous(); // still "foo"
 *   history.move_next();     // "bar"
 * @endcode
 */
class CLIPMAN_API HistoryBuffer {
public:
  /**
   * @param capacity Maximum retained entries (values below 1 become 1)
   * @param allow_duplicates When false, a push removes any older entry
   *        with the same text so each text appears once
   */
  explicit HistoryBuffer(size_t capacity = DEFAULT_HISTORY_CAPACITY,
                         bool allow_duplicates = true);

  // ========================================================================
  // Mutation
  // ========================================================================

  /**
   * @brief Record a new newest entry and reset the cursor
   * @return The newest entry after the push
   *
   * If the newest entry already holds @p text, no entry is created and the
   * existing one is returned. The oldest entry is evicted when the push
   * would exceed capacity.
   */
  ClipboardEntry push(const std::string &text);

  /**
   * @brief Remove and return the entry under the cursor
   *
   * The cursor keeps its display index, clamped to the oldest entry.
   */
  MaybeEntry take_current();

  /**
   * @brief Drop all entries and the cursor
   */
  void reset();

  // ========================================================================
  // Navigation
  // ========================================================================

  /// One step toward the newest entry (clamped)
  MaybeEntry move_next();

  /// One step toward the oldest entry (clamped)
  MaybeEntry move_previous();

  /// Jump to the newest entry
  MaybeEntry move_to_newest();

  /// Jump to the oldest entry
  MaybeEntry move_to_oldest();

  /**
   * @brief Put the cursor on a display index
   * @return The selected entry, or no entry (cursor unchanged) when out of
   *         range
   */
  MaybeEntry select(size_t index);

  // ========================================================================
  // Queries
  // ========================================================================

  /// Entry under the cursor
  MaybeEntry current() const;

  /// Entry at a display index, without moving the cursor
  MaybeEntry at(size_t index) const;

  /// Display index of the cursor, nullopt when empty
  std::optional<size_t> cursor_index() const;

  /// Cursor state for the navigation state machine
  CursorState cursor_state() const;

  /// Rows newest first, each with a preview at most @p width bytes
  HistoryLines list_for_display(size_t width) const;

  /// Entry texts newest first
  std::vector<std::string> texts() const;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // ========================================================================
  // Settings
  // ========================================================================

  size_t capacity() const { return capacity_; }

  /// Change capacity, evicting oldest entries when shrinking
  void set_capacity(size_t capacity);

  bool allow_duplicates() const { return allow_duplicates_; }
  void set_allow_duplicates(bool allow) { allow_duplicates_ = allow; }

private:
  size_t storage_index(size_t display_index) const {
    return entries_.size() - 1 - display_index;
  }
  size_t cursor_storage() const;
  void evict_overflow();

  std::deque<ClipboardEntry> entries_; // oldest first
  std::optional<size_t> cursor_;       // storage index; unset = newest
  size_t capacity_;
  bool allow_duplicates_;
  uint64_t next_sequence_ = 1;
};

} // namespace clipman

#endif // CLIPMAN_HISTORY_H
