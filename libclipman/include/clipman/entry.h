/**
 * @file entry.h
 * @brief Captured clipboard text fragment
 */

#ifndef CLIPMAN_ENTRY_H
#define CLIPMAN_ENTRY_H

#include "platform.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace clipman {

/**
 * @brief One captured unit of clipboard text
 *
 * Entries are immutable. Copying an entry shares its text; use detached()
 * to obtain an entry that owns a separate copy (registers do this so that
 * history eviction never touches them).
 */
class CLIPMAN_API ClipboardEntry {
public:
  using Clock = std::chrono::system_clock;

  /**
   * @brief Create an entry captured now
   * @param text Captured text (may be empty)
   * @param sequence Logical sequence number, 0 if not tracked
   */
  static ClipboardEntry from_text(std::string text, uint64_t sequence = 0);

  /// Captured text
  const std::string &text() const { return *text_; }

  /// Logical sequence number
  uint64_t sequence() const { return sequence_; }

  /// Wall-clock capture time
  Clock::time_point captured_at() const { return captured_at_; }

  /// Text length in bytes
  size_t size() const { return text_->size(); }

  /// True for an entry holding empty text (still a present entry)
  bool empty() const { return text_->empty(); }

  /// Copy with its own text storage, same sequence and timestamp
  ClipboardEntry detached() const;

  /// True if both entries reference the same text storage
  bool shares_text_with(const ClipboardEntry &other) const {
    return text_ == other.text_;
  }

  bool operator==(const ClipboardEntry &other) const {
    return sequence_ == other.sequence_ && *text_ == *other.text_;
  }
  bool operator!=(const ClipboardEntry &other) const {
    return !(*this == other);
  }

private:
  ClipboardEntry(std::shared_ptr<const std::string> text, uint64_t sequence,
                 Clock::time_point captured_at);

  std::shared_ptr<const std::string> text_;
  uint64_t sequence_ = 0;
  Clock::time_point captured_at_;
};

/// Entry or the explicit "no entry" state
using MaybeEntry = std::optional<ClipboardEntry>;

} // namespace clipman

#endif // CLIPMAN_ENTRY_H
