/**
 * @file entry.cpp
 * @brief ClipboardEntry and small enum helpers
 */

#include "clipman/entry.h"
#include "clipman/types.h"

namespace clipman {

// ============================================================================
// ClipboardEntry
// ============================================================================

ClipboardEntry::ClipboardEntry(std::shared_ptr<const std::string> text,
                               uint64_t sequence,
                               Clock::time_point captured_at)
    : text_(std::move(text)), sequence_(sequence), captured_at_(captured_at) {}

ClipboardEntry ClipboardEntry::from_text(std::string text, uint64_t sequence) {
  return ClipboardEntry(std::make_shared<const std::string>(std::move(text)),
                        sequence, Clock::now());
}

ClipboardEntry ClipboardEntry::detached() const {
  return ClipboardEntry(std::make_shared<const std::string>(*text_), sequence_,
                        captured_at_);
}

// ============================================================================
// Enum Names
// ============================================================================

const char *cursor_state_name(CursorState state) {
  switch (state) {
  case CursorState::Empty:
    return "Empty";
  case CursorState::AtNewest:
    return "AtNewest";
  case CursorState::AtOlder:
    return "AtOlder";
  case CursorState::AtOldest:
    return "AtOldest";
  default:
    return "Unknown";
  }
}

const char *register_group_name(RegisterGroup group) {
  switch (group) {
  case RegisterGroup::All:
    return "all";
  case RegisterGroup::Digits:
    return "digits";
  case RegisterGroup::Lowercase:
    return "lower";
  case RegisterGroup::Uppercase:
    return "upper";
  default:
    return "unknown";
  }
}

} // namespace clipman
