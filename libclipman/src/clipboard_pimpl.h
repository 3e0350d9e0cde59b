#ifndef CLIPMAN_CLIPBOARD_PIMPL_H
#define CLIPMAN_CLIPBOARD_PIMPL_H

#include "clipman/clipboard.h"
#include <mutex>
#include <optional>
#include <string>

namespace clipman {

/// Work to report once the manager lock is released
struct Notification {
  bool changed = false;
  std::optional<Error> error;
};

class ClipboardManager::Impl {
public:
  ManagerConfig config;
  std::shared_ptr<ClipboardSyncPort> port;
  mutable std::mutex mutex;
  bool initialized = false;

  HistoryBuffer history;
  HistoryBuffer yank_stack;
  RegisterStore registers;
  bool yank_mode = true;

  // Display index of the last chosen yank; later yanks walk toward newer
  // entries from there instead of popping the oldest
  std::optional<size_t> yank_resume;

  // Text clipman last wrote to (or adopted from) the clipboard
  std::optional<std::string> last_mirrored;

  // Callbacks
  ChangedCallback changed_cb;
  ErrorCallback error_cb;

  void apply_config(const ManagerConfig &cfg);

  // The helpers below expect mutex to be held

  Result<void> mirror(const std::string &text, Notification &note);

  Result<MaybeEntry> capture(const std::string &text, const char *kind,
                             bool write_port, Notification &note);

  Result<std::optional<PasteText>> present(const MaybeEntry &entry,
                                           const PasteOptions &options,
                                           Notification &note);

  // Takes the yank entry under the cursor; returns true if yank mode ended
  bool take_yank(const PasteOptions &options, Notification &note,
                 Result<std::optional<PasteText>> &result);

  // Logs at warn and records the error for on_error
  Error fail(Error error, Notification &note);

  // Call without holding mutex
  void dispatch(const Notification &note);
};

} // namespace clipman

#endif // CLIPMAN_CLIPBOARD_PIMPL_H
