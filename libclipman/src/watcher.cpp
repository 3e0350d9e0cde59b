/**
 * @file watcher.cpp
 * @brief Clipboard watcher implementation
 */

#include "clipman/watcher.h"
#include "clipman/log.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace clipman {

// ============================================================================
// Watcher Implementation
// ============================================================================

class ClipboardWatcher::Impl {
public:
  explicit Impl(ClipboardManager &mgr) : manager(mgr) {}

  ClipboardManager &manager;

  std::thread worker;
  std::atomic<bool> running{false};
  std::atomic<uint64_t> polls{0};
  std::atomic<uint64_t> captures{0};

  std::mutex wait_mutex;
  std::condition_variable wake;
  bool stop_requested = false;

  // Last reported read failure, so a missing clipboard is logged once
  std::optional<ErrorCode> last_error;

  void run(std::chrono::milliseconds interval) {
    log::get()->debug("clipboard watcher started ({} ms)", interval.count());

    while (true) {
      poll_once();

      std::unique_lock<std::mutex> lock(wait_mutex);
      if (wake.wait_for(lock, interval, [this] { return stop_requested; })) {
        break;
      }
    }

    log::get()->debug("clipboard watcher stopped after {} polls",
                      polls.load());
  }

  void poll_once() {
    auto result = manager.poll_external();
    polls.fetch_add(1);

    if (result.is_error()) {
      if (last_error != result.error().code) {
        log::get()->warn("clipboard watch: {}", result.error().to_string());
        last_error = result.error().code;
      }
      return;
    }

    if (last_error) {
      log::get()->info("clipboard watch recovered");
      last_error.reset();
    }
    if (result.value()) {
      captures.fetch_add(1);
    }
  }
};

// ============================================================================
// ClipboardWatcher
// ============================================================================

ClipboardWatcher::ClipboardWatcher(ClipboardManager &manager)
    : impl_(std::make_unique<Impl>(manager)) {}

ClipboardWatcher::~ClipboardWatcher() { stop(); }

Result<void> ClipboardWatcher::start(std::chrono::milliseconds interval) {
  if (impl_->running.load()) {
    return Error(ErrorCode::AlreadyInitialized, "Watcher already running");
  }

  CLIPMAN_REQUIRE(interval >= MIN_WATCH_INTERVAL, ErrorCode::InvalidArgument,
                  "Watch interval must be at least " +
                      std::to_string(MIN_WATCH_INTERVAL.count()) + " ms");

  {
    std::lock_guard<std::mutex> lock(impl_->wait_mutex);
    impl_->stop_requested = false;
  }
  impl_->last_error.reset();
  impl_->running.store(true);

  Impl *impl = impl_.get();
  impl_->worker = std::thread([impl, interval] { impl->run(interval); });
  return Result<void>::ok();
}

void ClipboardWatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(impl_->wait_mutex);
    impl_->stop_requested = true;
  }
  impl_->wake.notify_all();

  if (impl_->worker.joinable()) {
    impl_->worker.join();
  }
  impl_->running.store(false);
}

bool ClipboardWatcher::is_running() const { return impl_->running.load(); }

uint64_t ClipboardWatcher::poll_count() const { return impl_->polls.load(); }

uint64_t ClipboardWatcher::capture_count() const {
  return impl_->captures.load();
}

} // namespace clipman
