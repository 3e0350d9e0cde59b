/**
 * @file sync_port.cpp
 * @brief Clipboard port implementations
 */

#include "clipman/sync_port.h"
#include "clipman/log.h"

#ifdef CLIPMAN_HAS_SYSTEM_CLIPBOARD
#include "platform/linux/clipboard_linux.h"
#endif

namespace clipman {

// ============================================================================
// MemoryClipboardPort
// ============================================================================

MemoryClipboardPort::MemoryClipboardPort(std::string initial)
    : text_(std::move(initial)) {}

Result<void> MemoryClipboardPort::write(const std::string &text) {
  std::lock_guard<std::mutex> lock(mutex_);
  text_ = text;
  ++writes_;
  return Result<void>::ok();
}

Result<std::string> MemoryClipboardPort::read() {
  std::lock_guard<std::mutex> lock(mutex_);
  return text_;
}

std::string MemoryClipboardPort::peek() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return text_;
}

size_t MemoryClipboardPort::write_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return writes_;
}

// ============================================================================
// SystemClipboardPort
// ============================================================================

SystemClipboardPort::SystemClipboardPort(int write_retries)
    : write_retries_(write_retries < 1 ? 1 : write_retries) {}

#ifdef CLIPMAN_HAS_SYSTEM_CLIPBOARD

Result<void> SystemClipboardPort::write(const std::string &text) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (int attempt = 1; attempt <= write_retries_; ++attempt) {
    CLIPMAN_TRY(platform::write_clipboard_text(text));

    auto readback = platform::read_clipboard_text();
    if (readback.is_error()) {
      return readback.error();
    }
    if (readback.value() == text) {
      return Result<void>::ok();
    }

    log::get()->debug("clipboard write not kept (attempt {}/{})", attempt,
                      write_retries_);
  }

  return Error(ErrorCode::ClipboardVerifyFailed,
               "Clipboard text changed after write",
               std::to_string(write_retries_) + " attempts");
}

Result<std::string> SystemClipboardPort::read() {
  std::lock_guard<std::mutex> lock(mutex_);
  return platform::read_clipboard_text();
}

std::string SystemClipboardPort::name() const {
  return platform::backend_name(platform::detect_display_server());
}

bool is_system_clipboard_available() {
  return platform::detect_display_server() !=
         platform::ClipboardBackend::Headless;
}

#else

Result<void> SystemClipboardPort::write(const std::string &text) {
  CLIPMAN_UNUSED(text);
  return Error(ErrorCode::NotSupported,
               "System clipboard not supported on " CLIPMAN_PLATFORM_NAME);
}

Result<std::string> SystemClipboardPort::read() {
  return Error(ErrorCode::NotSupported,
               "System clipboard not supported on " CLIPMAN_PLATFORM_NAME);
}

std::string SystemClipboardPort::name() const { return "unsupported"; }

bool is_system_clipboard_available() { return false; }

#endif

// ============================================================================
// Factory
// ============================================================================

Result<std::shared_ptr<ClipboardSyncPort>>
make_clipboard_port(const std::string &backend, int write_retries) {
  if (backend == "memory") {
    return std::shared_ptr<ClipboardSyncPort>(
        std::make_shared<MemoryClipboardPort>());
  }

  if (backend == "system") {
    return std::shared_ptr<ClipboardSyncPort>(
        std::make_shared<SystemClipboardPort>(write_retries));
  }

  if (backend == "auto" || backend.empty()) {
    if (is_system_clipboard_available()) {
      return std::shared_ptr<ClipboardSyncPort>(
          std::make_shared<SystemClipboardPort>(write_retries));
    }
    log::get()->info("no display server, using in-memory clipboard");
    return std::shared_ptr<ClipboardSyncPort>(
        std::make_shared<MemoryClipboardPort>());
  }

  return Error(ErrorCode::InvalidConfigValue,
               "Unknown clipboard backend: " + backend);
}

} // namespace clipman
