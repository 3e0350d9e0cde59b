/**
 * @file clipboard_linux.cpp
 * @brief Linux clipboard access through wl-clipboard, xclip or xsel
 *
 * Text is piped through the first tool found on PATH for the running
 * display server. Reads keep the tool's output byte for byte; a tool that
 * exits non-zero is reported as a failure, except wl-paste with no output,
 * which is how it answers for an empty selection.
 */

#include "clipboard_linux.h"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sys/wait.h>

namespace clipman {
namespace platform {

// ============================================================================
// Display Server Detection
// ============================================================================

namespace {

bool env_set(const char *name) {
  const char *value = std::getenv(name);
  return value && value[0] != '\0';
}

} // namespace

ClipboardBackend detect_display_server() {
  // Wayland sessions usually export DISPLAY too (XWayland)
  if (env_set("WAYLAND_DISPLAY")) {
    return ClipboardBackend::Wayland;
  }
  if (env_set("DISPLAY")) {
    return ClipboardBackend::X11;
  }
  return ClipboardBackend::Headless;
}

const char *backend_name(ClipboardBackend backend) {
  switch (backend) {
  case ClipboardBackend::X11:
    return "x11";
  case ClipboardBackend::Wayland:
    return "wayland";
  case ClipboardBackend::Headless:
    return "headless";
  default:
    return "unknown";
  }
}

// ============================================================================
// Tool Selection
// ============================================================================

namespace {

struct ClipboardTool {
  ClipboardBackend backend;
  const char *read_binary;
  const char *write_binary;
  const char *read_cmd;
  const char *write_cmd;
  bool empty_exit_nonzero; // non-zero exit with no output means "no selection"
};

// Preferred tool first for each backend
constexpr std::array<ClipboardTool, 3> CLIPBOARD_TOOLS = {{
    {ClipboardBackend::Wayland, "wl-paste", "wl-copy", "wl-paste --no-newline",
     "wl-copy", true},
    {ClipboardBackend::X11, "xclip", "xclip", "xclip -selection clipboard -o",
     "xclip -selection clipboard", false},
    {ClipboardBackend::X11, "xsel", "xsel", "xsel --clipboard --output",
     "xsel --clipboard --input", false},
}};

bool on_path(const char *binary) {
  std::string check = std::string("command -v ") + binary + " >/dev/null 2>&1";
  return std::system(check.c_str()) == 0;
}

Result<const ClipboardTool *> find_tool(bool for_write) {
  ClipboardBackend backend = detect_display_server();
  if (backend == ClipboardBackend::Headless) {
    return Error(ErrorCode::ClipboardUnavailable,
                 "No display server detected (headless mode?)");
  }

  for (const auto &tool : CLIPBOARD_TOOLS) {
    if (tool.backend == backend &&
        on_path(for_write ? tool.write_binary : tool.read_binary)) {
      return &tool;
    }
  }

  return Error(ErrorCode::ClipboardToolMissing,
               backend == ClipboardBackend::Wayland
                   ? "wl-clipboard not found. Install the wl-clipboard package."
                   : "xclip or xsel not found. Install one of them.",
               backend_name(backend));
}

bool exited_cleanly(int status) {
  return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace

// ============================================================================
// Clipboard Operations
// ============================================================================

Result<std::string> read_clipboard_text() {
  auto tool = find_tool(false);
  CLIPMAN_TRY(tool);

  std::string cmd = std::string(tool.value()->read_cmd) + " 2>/dev/null";
  std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"),
                                                pclose);
  if (!pipe) {
    return Error(ErrorCode::ClipboardReadFailed, "Could not start clipboard tool",
                 cmd);
  }

  std::string text;
  std::array<char, 4096> chunk;
  size_t n = 0;
  while ((n = std::fread(chunk.data(), 1, chunk.size(), pipe.get())) > 0) {
    text.append(chunk.data(), n);
  }

  int status = pclose(pipe.release());
  if (exited_cleanly(status)) {
    return text;
  }
  if (status != -1 && text.empty() && tool.value()->empty_exit_nonzero) {
    return std::string();
  }
  return Error(ErrorCode::ClipboardReadFailed, "Clipboard tool failed", cmd);
}

Result<void> write_clipboard_text(const std::string &text) {
  auto tool = find_tool(true);
  CLIPMAN_TRY(tool);

  std::string cmd = std::string(tool.value()->write_cmd) + " 2>/dev/null";
  std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "w"),
                                                pclose);
  if (!pipe) {
    return Error(ErrorCode::ClipboardWriteFailed,
                 "Could not start clipboard tool", cmd);
  }

  bool written =
      std::fwrite(text.data(), 1, text.size(), pipe.get()) == text.size();
  int status = pclose(pipe.release());

  if (!written) {
    return Error(ErrorCode::ClipboardWriteFailed,
                 "Short write to clipboard tool", cmd);
  }
  if (!exited_cleanly(status)) {
    return Error(ErrorCode::ClipboardWriteFailed, "Clipboard tool failed", cmd);
  }
  return Result<void>::ok();
}

} // namespace platform
} // namespace clipman
