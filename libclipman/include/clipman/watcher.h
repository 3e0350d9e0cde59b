/**
 * @file watcher.h
 * @brief Background polling of the clipboard for external copies
 */

#ifndef CLIPMAN_WATCHER_H
#define CLIPMAN_WATCHER_H

#include "clipboard.h"
#include "error.h"
#include "platform.h"
#include <chrono>
#include <cstdint>
#include <memory>

namespace clipman {

/// Default interval between clipboard polls
constexpr std::chrono::milliseconds DEFAULT_WATCH_INTERVAL{500};

/// Shortest accepted poll interval
constexpr std::chrono::milliseconds MIN_WATCH_INTERVAL{50};

/**
 * @brief Calls ClipboardManager::poll_external() on a worker thread
 *
 * Read failures are logged once per distinct error code and polling
 * continues. The watcher must not outlive the manager it was given.
 */
class CLIPMAN_API ClipboardWatcher {
public:
  explicit ClipboardWatcher(ClipboardManager &manager);
  ~ClipboardWatcher();

  // Non-copyable
  ClipboardWatcher(const ClipboardWatcher &) = delete;
  ClipboardWatcher &operator=(const ClipboardWatcher &) = delete;

  /**
   * @brief Start polling
   * @param interval Time between polls (at least MIN_WATCH_INTERVAL)
   * @return AlreadyInitialized if running, InvalidArgument for a too short
   *         interval
   */
  Result<void> start(std::chrono::milliseconds interval = DEFAULT_WATCH_INTERVAL);

  /**
   * @brief Stop polling and join the worker thread
   */
  void stop();

  bool is_running() const;

  /// Number of completed polls since construction
  uint64_t poll_count() const;

  /// Number of polls that pushed an external copy into history
  uint64_t capture_count() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipman

#endif // CLIPMAN_WATCHER_H
