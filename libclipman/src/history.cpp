/**
 * @file history.cpp
 * @brief HistoryBuffer implementation
 */

#include "clipman/history.h"
#include "clipman/format.h"
#include <algorithm>

namespace clipman {

HistoryBuffer::HistoryBuffer(size_t capacity, bool allow_duplicates)
    : capacity_(std::max<size_t>(capacity, 1)),
      allow_duplicates_(allow_duplicates) {}

// ============================================================================
// Mutation
// ============================================================================

ClipboardEntry HistoryBuffer::push(const std::string &text) {
  // Repeated copy of the same selection only re-marks the newest entry
  if (!entries_.empty() && entries_.back().text() == text) {
    cursor_.reset();
    return entries_.back();
  }

  if (!allow_duplicates_) {
    auto it = std::find_if(
        entries_.begin(), entries_.end(),
        [&text](const ClipboardEntry &e) { return e.text() == text; });
    if (it != entries_.end()) {
      entries_.erase(it);
    }
  }

  entries_.push_back(ClipboardEntry::from_text(text, next_sequence_++));
  cursor_.reset();
  evict_overflow();
  return entries_.back();
}

MaybeEntry HistoryBuffer::take_current() {
  if (entries_.empty()) {
    return std::nullopt;
  }

  size_t pos = cursor_storage();
  ClipboardEntry taken = entries_[pos];
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));

  if (entries_.empty()) {
    cursor_.reset();
  } else if (cursor_) {
    // Same display index now refers to the next older entry
    cursor_ = pos > 0 ? pos - 1 : 0;
  }

  return taken;
}

void HistoryBuffer::reset() {
  entries_.clear();
  cursor_.reset();
}

// ============================================================================
// Navigation
// ============================================================================

MaybeEntry HistoryBuffer::move_next() {
  if (entries_.empty()) {
    return std::nullopt;
  }

  size_t pos = cursor_storage();
  if (pos + 1 < entries_.size()) {
    ++pos;
  }
  cursor_ = pos;
  return entries_[pos];
}

MaybeEntry HistoryBuffer::move_previous() {
  if (entries_.empty()) {
    return std::nullopt;
  }

  size_t pos = cursor_storage();
  if (pos > 0) {
    --pos;
  }
  cursor_ = pos;
  return entries_[pos];
}

MaybeEntry HistoryBuffer::move_to_newest() {
  if (entries_.empty()) {
    return std::nullopt;
  }
  cursor_ = entries_.size() - 1;
  return entries_.back();
}

MaybeEntry HistoryBuffer::move_to_oldest() {
  if (entries_.empty()) {
    return std::nullopt;
  }
  cursor_ = 0;
  return entries_.front();
}

MaybeEntry HistoryBuffer::select(size_t index) {
  if (index >= entries_.size()) {
    return std::nullopt;
  }
  cursor_ = storage_index(index);
  return entries_[*cursor_];
}

// ============================================================================
// Queries
// ============================================================================

MaybeEntry HistoryBuffer::current() const {
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_[cursor_storage()];
}

MaybeEntry HistoryBuffer::at(size_t index) const {
  if (index >= entries_.size()) {
    return std::nullopt;
  }
  return entries_[storage_index(index)];
}

std::optional<size_t> HistoryBuffer::cursor_index() const {
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.size() - 1 - cursor_storage();
}

CursorState HistoryBuffer::cursor_state() const {
  if (entries_.empty()) {
    return CursorState::Empty;
  }

  size_t pos = cursor_storage();
  if (pos == entries_.size() - 1) {
    return CursorState::AtNewest;
  }
  if (pos == 0) {
    return CursorState::AtOldest;
  }
  return CursorState::AtOlder;
}

HistoryLines HistoryBuffer::list_for_display(size_t width) const {
  HistoryLines lines;
  lines.reserve(entries_.size());

  auto current = cursor_index();
  for (size_t i = 0; i < entries_.size(); ++i) {
    const auto &entry = entries_[storage_index(i)];
    HistoryLine line;
    line.index = i;
    line.preview = make_preview(entry.text(), width);
    line.is_current = current && *current == i;
    line.sequence = entry.sequence();
    lines.push_back(std::move(line));
  }
  return lines;
}

std::vector<std::string> HistoryBuffer::texts() const {
  std::vector<std::string> result;
  result.reserve(entries_.size());
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    result.push_back(it->text());
  }
  return result;
}

// ============================================================================
// Settings
// ============================================================================

void HistoryBuffer::set_capacity(size_t capacity) {
  capacity_ = std::max<size_t>(capacity, 1);
  evict_overflow();
}

// ============================================================================
// Internals
// ============================================================================

size_t HistoryBuffer::cursor_storage() const {
  return cursor_ ? *cursor_ : entries_.size() - 1;
}

void HistoryBuffer::evict_overflow() {
  while (entries_.size() > capacity_) {
    entries_.pop_front();
    if (cursor_ && *cursor_ > 0) {
      --*cursor_;
    }
  }
}

} // namespace clipman
