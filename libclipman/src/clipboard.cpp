/**
 * @file clipboard.cpp
 * @brief Clipboard history manager implementation
 */

#include "clipman/clipboard.h"
#include "clipboard_pimpl.h"
#include "clipman/log.h"

namespace clipman {

// ============================================================================
// Impl Helpers
// ============================================================================

void ClipboardManager::Impl::apply_config(const ManagerConfig &cfg) {
  config = cfg;
  history.set_capacity(cfg.history_capacity);
  history.set_allow_duplicates(cfg.allow_history_duplicates);
  yank_stack.set_capacity(cfg.history_capacity);
}

Error ClipboardManager::Impl::fail(Error error, Notification &note) {
  log::get()->warn("{}", error.to_string());
  note.error = error;
  return error;
}

Result<void> ClipboardManager::Impl::mirror(const std::string &text,
                                            Notification &note) {
  auto result = port->write(text);
  if (result.is_error()) {
    log::get()->debug("clipboard write via {} failed", port->name());
    return fail(result.error(), note);
  }

  last_mirrored = text;
  return Result<void>::ok();
}

Result<MaybeEntry> ClipboardManager::Impl::capture(const std::string &text,
                                                   const char *kind,
                                                   bool write_port,
                                                   Notification &note) {
  if (text.empty() && config.ignore_empty_copies) {
    log::get()->debug("{}: empty text ignored", kind);
    return MaybeEntry{};
  }

  MaybeEntry entry;
  if (yank_mode) {
    // New entries shift display indices, so a resume point no longer holds
    entry = yank_stack.push(text);
    yank_resume.reset();
  }
  if (!(yank_mode && config.explicit_yank_mode)) {
    entry = history.push(text);
  }
  note.changed = true;

  log::get()->debug("{}: {} bytes, history {} / yank {}", kind, text.size(),
                    history.size(), yank_stack.size());

  if (write_port) {
    CLIPMAN_TRY(mirror(text, note));
  } else {
    last_mirrored = text;
  }
  return entry;
}

Result<std::optional<PasteText>>
ClipboardManager::Impl::present(const MaybeEntry &entry,
                                const PasteOptions &options,
                                Notification &note) {
  if (!entry) {
    return std::optional<PasteText>{};
  }

  CLIPMAN_TRY(mirror(entry->text(), note));
  return std::optional<PasteText>(PasteText{entry->text(), options.indent});
}

bool ClipboardManager::Impl::take_yank(
    const PasteOptions &options, Notification &note,
    Result<std::optional<PasteText>> &result) {
  auto entry = yank_stack.take_current();
  note.changed = entry.has_value();
  result = present(entry, options, note);

  if (yank_stack.empty()) {
    yank_resume.reset();
  }
  if (entry && yank_stack.empty() && config.explicit_yank_mode &&
      config.end_yank_mode_on_empty) {
    yank_mode = false;
    return true;
  }
  return false;
}

void ClipboardManager::Impl::dispatch(const Notification &note) {
  ChangedCallback on_changed;
  ErrorCallback on_err;
  {
    std::lock_guard<std::mutex> lock(mutex);
    on_changed = changed_cb;
    on_err = error_cb;
  }

  if (note.changed && on_changed) {
    on_changed();
  }
  if (note.error && on_err) {
    on_err(*note.error);
  }
}

// ============================================================================
// ClipboardManager Implementation
// ============================================================================

ClipboardManager::ClipboardManager(std::shared_ptr<ClipboardSyncPort> port)
    : impl_(std::make_unique<Impl>()) {
  impl_->port = port ? std::move(port) : std::make_shared<MemoryClipboardPort>();
  impl_->apply_config(impl_->config);
}

ClipboardManager::~ClipboardManager() { shutdown(); }

Result<void> ClipboardManager::init(const ManagerConfig &config) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->initialized) {
    return Error(ErrorCode::AlreadyInitialized,
                 "ClipboardManager already initialized");
  }

  impl_->apply_config(config);
  impl_->yank_mode = !config.explicit_yank_mode;
  impl_->initialized = true;

  if (config.seed_from_clipboard) {
    auto clip = impl_->port->read();
    if (clip.is_error()) {
      // Non-fatal: start with an empty history
      log::get()->debug("clipboard seed skipped: {}", clip.error().to_string());
    } else if (!clip.value().empty()) {
      impl_->history.push(clip.value());
      impl_->last_mirrored = clip.value();
    }
  }

  log::get()->debug("clipboard manager ready (port {}, capacity {})",
                    impl_->port->name(), impl_->history.capacity());
  return Result<void>::ok();
}

void ClipboardManager::shutdown() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->history.reset();
  impl_->yank_stack.reset();
  impl_->yank_resume.reset();
  impl_->registers.reset();
  impl_->last_mirrored.reset();
  impl_->initialized = false;
}

bool ClipboardManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->initialized;
}

// ============================================================================
// Capture
// ============================================================================

Result<MaybeEntry> ClipboardManager::copy(const std::string &text) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;
  auto result = impl_->capture(text, "copy", true, note);
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

Result<MaybeEntry> ClipboardManager::cut(const std::string &text) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;
  auto result = impl_->capture(text, "cut", true, note);
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

// ============================================================================
// Paste and Navigation
// ============================================================================

Result<std::optional<PasteText>>
ClipboardManager::paste_current(const PasteOptions &options) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;

  auto entry = impl_->history.current();
  auto result = impl_->present(entry, options, note);

  if (result.is_ok() && entry && options.pop) {
    impl_->history.take_current();
    note.changed = true;

    // The clipboard follows the entry that now sits under the cursor
    auto next = impl_->history.current();
    if (next) {
      auto mirrored = impl_->mirror(next->text(), note);
      if (mirrored.is_error()) {
        result = mirrored.error();
      }
    }
  }
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

Result<std::optional<PasteText>>
ClipboardManager::next_and_get_text(const PasteOptions &options) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;
  auto entry = impl_->history.move_next();
  note.changed = entry.has_value();
  auto result = impl_->present(entry, options, note);
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

Result<std::optional<PasteText>>
ClipboardManager::previous_and_get_text(const PasteOptions &options) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;
  auto entry = impl_->history.move_previous();
  note.changed = entry.has_value();
  auto result = impl_->present(entry, options, note);
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

Result<std::optional<PasteText>>
ClipboardManager::select_and_get_text(size_t index,
                                      const PasteOptions &options) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;
  auto entry = impl_->history.select(index);
  note.changed = entry.has_value();
  auto result = impl_->present(entry, options, note);
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

Result<std::optional<PasteText>>
ClipboardManager::oldest_and_get_text(const PasteOptions &options) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;
  auto entry = impl_->history.move_to_oldest();
  note.changed = entry.has_value();
  auto result = impl_->present(entry, options, note);
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

Result<std::optional<PasteText>>
ClipboardManager::newest_and_get_text(const PasteOptions &options) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;
  auto entry = impl_->history.move_to_newest();
  note.changed = entry.has_value();
  auto result = impl_->present(entry, options, note);
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

MaybeEntry ClipboardManager::current() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->history.current();
}

CursorState ClipboardManager::cursor_state() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->history.cursor_state();
}

size_t ClipboardManager::history_size() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->history.size();
}

void ClipboardManager::clear_history() {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  size_t dropped = impl_->history.size();
  impl_->history.reset();
  lock.unlock();

  log::get()->info("clipboard history cleared ({} entries)", dropped);
  Notification note;
  note.changed = true;
  impl_->dispatch(note);
}

// ============================================================================
// Registers
// ============================================================================

Result<void> ClipboardManager::copy_to_register(const std::string &key,
                                                const std::string &text) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;

  auto parsed = parse_register_key(key);
  if (parsed.is_error()) {
    impl_->fail(parsed.error(), note);
    lock.unlock();
    impl_->dispatch(note);
    return parsed.error();
  }

  Result<void> result =
      impl_->registers.set(parsed.value(), ClipboardEntry::from_text(text));
  if (result.is_ok()) {
    note.changed = true;
    log::get()->debug("register '{}' set ({} bytes)", parsed.value(),
                      text.size());
    result = impl_->mirror(text, note);
  } else {
    impl_->fail(result.error(), note);
  }
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

Result<std::optional<PasteText>>
ClipboardManager::paste_from_register(const std::string &key,
                                      const PasteOptions &options) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;

  auto parsed = parse_register_key(key);
  if (parsed.is_error()) {
    impl_->fail(parsed.error(), note);
    lock.unlock();
    impl_->dispatch(note);
    return parsed.error();
  }

  auto entry = impl_->registers.get(parsed.value());
  auto result = impl_->present(entry, options, note);
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

Result<MaybeEntry>
ClipboardManager::set_clipboard_from_register(const std::string &key) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;

  auto parsed = parse_register_key(key);
  if (parsed.is_error()) {
    impl_->fail(parsed.error(), note);
    lock.unlock();
    impl_->dispatch(note);
    return parsed.error();
  }

  Result<MaybeEntry> result = impl_->registers.get(parsed.value());
  if (result.value()) {
    auto mirrored = impl_->mirror(result.value()->text(), note);
    if (mirrored.is_error()) {
      result = mirrored.error();
    }
  }
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

size_t ClipboardManager::reset_registers(RegisterGroup group) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  size_t removed = impl_->registers.reset(group);
  lock.unlock();

  log::get()->info("reset {} registers ({} removed)",
                   register_group_name(group), removed);
  Notification note;
  note.changed = removed > 0;
  impl_->dispatch(note);
  return removed;
}

// ============================================================================
// Yank Stack
// ============================================================================

void ClipboardManager::set_yank_mode(bool enabled) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  impl_->yank_mode = enabled;

  Notification note;
  if (!enabled && impl_->config.explicit_yank_mode) {
    note.changed = !impl_->yank_stack.empty();
    impl_->yank_stack.reset();
    impl_->yank_resume.reset();
  }
  lock.unlock();

  log::get()->info("yank mode {}", enabled ? "on" : "off");
  impl_->dispatch(note);
}

bool ClipboardManager::is_yank_mode() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->yank_mode;
}

Result<std::optional<PasteText>>
ClipboardManager::yank(const PasteOptions &options) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;

  // Yanks replay copies oldest first, unless a chosen entry set a resume
  // point, in which case they continue with the next newer entry
  auto &resume = impl_->yank_resume;
  if (resume && *resume > 0 && *resume - 1 < impl_->yank_stack.size()) {
    impl_->yank_stack.select(*resume - 1);
    resume = *resume - 1;
  } else {
    impl_->yank_stack.move_to_oldest();
    resume.reset();
  }

  Result<std::optional<PasteText>> result = std::optional<PasteText>{};
  bool ended = impl_->take_yank(options, note, result);
  lock.unlock();

  if (ended) {
    log::get()->info("yank stack emptied, yank mode off");
  }
  impl_->dispatch(note);
  return result;
}

Result<std::optional<PasteText>>
ClipboardManager::select_and_yank(size_t index, const PasteOptions &options) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;

  if (!impl_->yank_stack.select(index)) {
    return std::optional<PasteText>{};
  }
  impl_->yank_resume = index;

  Result<std::optional<PasteText>> result = std::optional<PasteText>{};
  bool ended = impl_->take_yank(options, note, result);
  lock.unlock();

  if (ended) {
    log::get()->info("yank stack emptied, yank mode off");
  }
  impl_->dispatch(note);
  return result;
}

void ClipboardManager::clear_yank_stack() {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  impl_->yank_stack.reset();
  impl_->yank_resume.reset();
  lock.unlock();

  log::get()->info("yank stack cleared");
  Notification note;
  note.changed = true;
  impl_->dispatch(note);
}

size_t ClipboardManager::yank_stack_size() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->yank_stack.size();
}

// ============================================================================
// External Changes
// ============================================================================

Result<MaybeEntry> ClipboardManager::poll_external() {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  Notification note;

  auto clip = impl_->port->read();
  if (clip.is_error()) {
    // The watcher reports repeated read failures itself
    note.error = clip.error();
    lock.unlock();
    impl_->dispatch(note);
    return clip.error();
  }

  const std::string &text = clip.value();
  if (text.empty() ||
      (impl_->last_mirrored && *impl_->last_mirrored == text)) {
    return MaybeEntry{};
  }

  auto result = impl_->capture(text, "external", false, note);
  lock.unlock();

  impl_->dispatch(note);
  return result;
}

// ============================================================================
// Display
// ============================================================================

HistoryLines ClipboardManager::describe_history() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->history.list_for_display(impl_->config.preview_width);
}

RegisterLines ClipboardManager::describe_registers() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->registers.list_for_display(impl_->config.preview_width);
}

HistoryLines ClipboardManager::describe_yank_stack() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->yank_stack.list_for_display(impl_->config.preview_width);
}

std::string ClipboardManager::render_history() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return format_history_panel("CLIPBOARD", impl_->history.texts(),
                              impl_->history.cursor_index());
}

std::string ClipboardManager::render_registers() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return format_register_panel(impl_->registers.contents());
}

std::string ClipboardManager::render_yank_stack() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return format_history_panel("YANK", impl_->yank_stack.texts(),
                              impl_->yank_stack.cursor_index());
}

std::string ClipboardManager::status_message() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return format_status(impl_->history.current());
}

// ============================================================================
// Configuration
// ============================================================================

void ClipboardManager::set_config(const ManagerConfig &config) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->apply_config(config);
}

ManagerConfig ClipboardManager::get_config() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->config;
}

// ============================================================================
// Callbacks
// ============================================================================

void ClipboardManager::on_history_changed(ChangedCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->changed_cb = std::move(callback);
}

void ClipboardManager::on_error(ErrorCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->error_cb = std::move(callback);
}

} // namespace clipman
