/**
 * @file sync_port.h
 * @brief Access to the single external clipboard slot
 *
 * ClipboardManager mirrors the currently selected history entry through a
 * ClipboardSyncPort so that an ordinary paste outside clipman sees the
 * same text. The port is last-writer-wins: changes made by other
 * applications are only noticed through ClipboardManager::poll_external().
 */

#ifndef CLIPMAN_SYNC_PORT_H
#define CLIPMAN_SYNC_PORT_H

#include "error.h"
#include "platform.h"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace clipman {

// ============================================================================
// Port Interface
// ============================================================================

/**
 * @brief Read/write contract for one clipboard slot
 *
 * Implementations report I/O problems with the clipboard error group
 * (ClipboardUnavailable, ClipboardReadFailed, ClipboardWriteFailed,
 * ClipboardVerifyFailed, ClipboardToolMissing). They must be safe to call
 * from more than one thread.
 */
class CLIPMAN_API ClipboardSyncPort {
public:
  virtual ~ClipboardSyncPort() = default;

  /// Replace the clipboard text
  virtual Result<void> write(const std::string &text) = 0;

  /// Current clipboard text (empty string for an empty clipboard)
  virtual Result<std::string> read() = 0;

  /// Short backend name for logs ("memory", "wayland", "x11")
  virtual std::string name() const = 0;
};

// ============================================================================
// In-Process Port
// ============================================================================

/**
 * @brief Clipboard slot held in memory
 *
 * Used when no desktop clipboard is available, and by tests.
 */
class CLIPMAN_API MemoryClipboardPort : public ClipboardSyncPort {
public:
  MemoryClipboardPort() = default;
  explicit MemoryClipboardPort(std::string initial);

  Result<void> write(const std::string &text) override;
  Result<std::string> read() override;
  std::string name() const override { return "memory"; }

  /// Text as last written, without counting as a read
  std::string peek() const;

  /// Number of successful write() calls
  size_t write_count() const;

private:
  mutable std::mutex mutex_;
  std::string text_;
  size_t writes_ = 0;
};

// ============================================================================
// Desktop Clipboard Port (Linux)
// ============================================================================

/**
 * @brief System clipboard through wl-clipboard (Wayland) or xclip/xsel (X11)
 *
 * Each write is verified by reading the clipboard back. The write is
 * repeated until the text sticks or @c write_retries attempts have been
 * made, after which ClipboardVerifyFailed is returned.
 */
class CLIPMAN_API SystemClipboardPort : public ClipboardSyncPort {
public:
  explicit SystemClipboardPort(int write_retries = 3);

  Result<void> write(const std::string &text) override;
  Result<std::string> read() override;
  std::string name() const override;

  int write_retries() const { return write_retries_; }

private:
  std::mutex mutex_;
  int write_retries_;
};

/**
 * @brief Check if a desktop clipboard can be reached from this process
 */
CLIPMAN_API bool is_system_clipboard_available();

/**
 * @brief Create a port for the configured backend
 * @param backend "system", "memory" or "auto" (system if available)
 * @param write_retries Verification attempts for the system port
 */
CLIPMAN_API Result<std::shared_ptr<ClipboardSyncPort>>
make_clipboard_port(const std::string &backend, int write_retries = 3);

} // namespace clipman

#endif // CLIPMAN_SYNC_PORT_H
