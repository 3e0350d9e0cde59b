/**
 * @file clipboard.h
 * @brief Clipboard history manager for clipman
 *
 * ClipboardManager is the public API a host binds its commands to. It owns
 * the history, the registers and the yank stack of one editing context and
 * keeps the system clipboard mirroring the currently selected history
 * entry.
 *
 * Key behaviour:
 * - copy/cut push into history and write the system clipboard
 * - next/previous move through history and re-mirror the selected entry
 * - registers are independent of history and only touch the clipboard
 *   when written or pasted
 * - the engine never inserts text itself; it hands text back to the host
 */

#ifndef CLIPMAN_CLIPBOARD_H
#define CLIPMAN_CLIPBOARD_H

#include "entry.h"
#include "error.h"
#include "format.h"
#include "history.h"
#include "platform.h"
#include "registers.h"
#include "sync_port.h"
#include "types.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace clipman {

// ============================================================================
// Manager Configuration
// ============================================================================

/**
 * @brief History, yank and display settings for a ClipboardManager
 */
struct ManagerConfig {
  /// Maximum retained history entries
  size_t history_capacity = DEFAULT_HISTORY_CAPACITY;

  /// Keep older entries whose text matches a new push
  /// (consecutive duplicates are always collapsed). Defaults to true so only
  /// the consecutive-duplicate rule applies; set false to keep each text once.
  bool allow_history_duplicates = true;

  /// Treat copy/cut of empty text as a no-op
  bool ignore_empty_copies = false;

  /// Push the clipboard's current text as the first entry during init()
  bool seed_from_clipboard = true;

  /// Copies made in yank mode go only to the yank stack, and leaving yank
  /// mode clears it. When false, yank mode starts enabled.
  bool explicit_yank_mode = false;

  /// Leave yank mode once the last yank entry has been yanked
  /// (explicit yank mode only)
  bool end_yank_mode_on_empty = false;

  /// Preview width for describe_*() rows
  size_t preview_width = DEFAULT_PREVIEW_WIDTH;
};

// ============================================================================
// Clipboard Manager
// ============================================================================

/**
 * @brief Orchestrates history, registers and clipboard mirroring
 *
 * Thread-safe: a ClipboardWatcher may call poll_external() while the host
 * thread runs commands. Mirroring happens under the same lock as the
 * history change, so an external poll never sees a selection that has not
 * been written yet.
 *
 * Example usage:
 * @code
 *   auto port = std::make_shared<MemoryClipboardPort>();
 *   ClipboardManager clipboard(port);
 *   clipboard.init();
 *
 *   clipboard.copy("foo");
 *   clipboard.copy("bar");
 *
 *   auto prev = clipboard.previous_and_get_text();
 *   if (prev && prev.value()) {
 *       host_insert(prev.value()->text); // "foo", also on the clipboard
 *   }
 * @endcode
 */
class CLIPMAN_API ClipboardManager {
public:
  using ChangedCallback = std::function<void()>;
  using ErrorCallback = std::function<void(const Error &)>;

  /**
   * @param port Clipboard slot to mirror into (nullptr = in-memory slot)
   */
  explicit ClipboardManager(std::shared_ptr<ClipboardSyncPort> port = nullptr);
  ~ClipboardManager();

  // Non-copyable
  ClipboardManager(const ClipboardManager &) = delete;
  ClipboardManager &operator=(const ClipboardManager &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Apply configuration and optionally seed history
   * @param config Manager configuration
   * @return AlreadyInitialized on a second call
   *
   * With seed_from_clipboard, non-empty clipboard text becomes the first
   * history entry. A clipboard read failure during seeding is logged and
   * otherwise ignored.
   */
  Result<void> init(const ManagerConfig &config = {});

  /**
   * @brief Drop history, yank stack and registers
   */
  void shutdown();

  bool is_initialized() const;

  // ========================================================================
  // Capture
  // ========================================================================

  /**
   * @brief Record copied text and mirror it to the clipboard
   * @return The newest entry, no entry if ignored, or a clipboard error
   *
   * The history is updated even when the clipboard write fails.
   */
  Result<MaybeEntry> copy(const std::string &text);

  /**
   * @brief Same as copy(); the host deletes the selection itself
   */
  Result<MaybeEntry> cut(const std::string &text);

  // ========================================================================
  // Paste and Navigation
  // ========================================================================

  /**
   * @brief Text of the current history entry for the host to insert
   * @param options indent is passed back; pop removes the entry afterwards
   * @return No entry when history is empty
   */
  Result<std::optional<PasteText>>
  paste_current(const PasteOptions &options = {});

  /// Move toward newer entries, mirror and return the selection
  Result<std::optional<PasteText>>
  next_and_get_text(const PasteOptions &options = {});

  /// Move toward older entries, mirror and return the selection
  Result<std::optional<PasteText>>
  previous_and_get_text(const PasteOptions &options = {});

  /**
   * @brief Select a display index (0 = newest), mirror and return it
   * @return No entry (nothing mirrored) when the index is out of range
   */
  Result<std::optional<PasteText>>
  select_and_get_text(size_t index, const PasteOptions &options = {});

  /// Jump to the oldest entry, mirror and return it
  Result<std::optional<PasteText>>
  oldest_and_get_text(const PasteOptions &options = {});

  /// Jump to the newest entry, mirror and return it
  Result<std::optional<PasteText>>
  newest_and_get_text(const PasteOptions &options = {});

  /// Entry under the history cursor
  MaybeEntry current() const;

  CursorState cursor_state() const;

  size_t history_size() const;

  /**
   * @brief Clear the history (registers and yank stack are kept)
   */
  void clear_history();

  // ========================================================================
  // Registers
  // ========================================================================

  /**
   * @brief Store text in a register and mirror it to the clipboard
   * @return InvalidRegisterKey before anything is stored, or a clipboard
   *         error after the register was written
   *
   * History is not touched.
   */
  Result<void> copy_to_register(const std::string &key,
                                const std::string &text);

  /**
   * @brief Register text for the host to insert, mirrored to the clipboard
   * @return No entry if the register was never set
   */
  Result<std::optional<PasteText>>
  paste_from_register(const std::string &key,
                      const PasteOptions &options = {});

  /**
   * @brief Mirror a register to the clipboard without pasting
   */
  Result<MaybeEntry> set_clipboard_from_register(const std::string &key);

  /**
   * @brief Erase registers of one group
   * @return Number of registers removed
   */
  size_t reset_registers(RegisterGroup group = RegisterGroup::All);

  // ========================================================================
  // Yank Stack
  // ========================================================================

  /**
   * @brief Enable or disable yank mode
   *
   * While enabled every copy/cut is also pushed to the yank stack. In
   * explicit yank mode, disabling clears the stack.
   */
  void set_yank_mode(bool enabled);

  bool is_yank_mode() const;

  /**
   * @brief Pop the oldest yank entry, mirror it and return it
   *
   * After select_and_yank(), yanks continue with the entry that was just
   * newer than the chosen one, until the newest is reached.
   *
   * @return No entry when the yank stack is empty
   */
  Result<std::optional<PasteText>> yank(const PasteOptions &options = {});

  /**
   * @brief Pop the yank entry at a display index (0 = newest)
   * @return No entry when the index is out of range; nothing is mirrored
   */
  Result<std::optional<PasteText>>
  select_and_yank(size_t index, const PasteOptions &options = {});

  void clear_yank_stack();

  size_t yank_stack_size() const;

  // ========================================================================
  // External Changes
  // ========================================================================

  /**
   * @brief Pick up text copied by other applications
   * @return The pushed entry, no entry if the clipboard still holds what
   *         clipman last mirrored (or is empty), or a clipboard error
   *
   * New text is pushed with the normal dedup rules and is not written
   * back to the clipboard.
   */
  Result<MaybeEntry> poll_external();

  // ========================================================================
  // Display
  // ========================================================================

  HistoryLines describe_history() const;
  RegisterLines describe_registers() const;
  HistoryLines describe_yank_stack() const;

  /// Output-panel text for history, registers and yank stack
  std::string render_history() const;
  std::string render_registers() const;
  std::string render_yank_stack() const;

  /// Status-bar text for the current entry
  std::string status_message() const;

  // ========================================================================
  // Configuration
  // ========================================================================

  /**
   * @brief Update configuration (shrinking capacity evicts oldest entries)
   */
  void set_config(const ManagerConfig &config);

  ManagerConfig get_config() const;

  // ========================================================================
  // Callbacks
  // ========================================================================

  /**
   * @brief Called after history, registers or yank stack change
   *
   * Invoked without internal locks held, possibly from a watcher thread.
   */
  void on_history_changed(ChangedCallback callback);

  /**
   * @brief Called for every error an operation returns
   */
  void on_error(ErrorCallback callback);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipman

#endif // CLIPMAN_CLIPBOARD_H
