/**
 * @file command.h
 * @brief Named commands bound to a ClipboardManager
 *
 * Hosts (editor plugins, the CLI) dispatch by command name. The table turns
 * a name plus the selection text into a typed ClipboardManager call and
 * describes what the host should do with the result.
 */

#ifndef CLIPMAN_COMMAND_H
#define CLIPMAN_COMMAND_H

#include "clipboard.h"
#include "error.h"
#include "platform.h"
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace clipman {

// ============================================================================
// Requests and Outcomes
// ============================================================================

/**
 * @brief What the host should do after a command
 */
enum class CommandAction : uint8_t {
  /// Nothing beyond showing the message
  None = 0,
  /// Insert CommandOutcome::text at the selection
  Insert = 1,
  /// Show CommandOutcome::text in an output panel
  Display = 2
};

/**
 * @brief Get name for command action
 */
CLIPMAN_API const char *command_action_name(CommandAction action);

/**
 * @brief One command invocation from a host
 */
struct CommandRequest {
  std::string name;

  /// Positional arguments (register key, history index, register group)
  std::vector<std::string> args;

  /// Text currently selected in the host
  std::string selection;

  bool indent = false;
  bool pop = false;
};

/**
 * @brief Result of a command, for the host to act on
 */
struct CommandOutcome {
  CommandAction action = CommandAction::None;

  /// Text to insert or display
  std::string text;

  /// Use the host's indent-aware paste for Insert
  bool indent = false;

  /// Host should delete the selection (cut)
  bool delete_selection = false;

  /// Status-bar message
  std::string message;

  /// Entry that became current, shortened for a popup near the cursor
  std::string popup;
};

// ============================================================================
// Command Table
// ============================================================================

/**
 * @brief Maps command names to ClipboardManager operations
 *
 * @code
 *   CommandTable commands(manager);
 *   auto outcome = commands.execute({"previous_and_paste"});
 *   if (outcome && outcome.value().action == CommandAction::Insert) {
 *       host_insert(outcome.value().text);
 *   }
 * @endcode
 */
class CLIPMAN_API CommandTable {
public:
  using Handler = std::function<Result<CommandOutcome>(const CommandRequest &)>;

  explicit CommandTable(ClipboardManager &manager);

  /**
   * @brief Run a command
   * @return UnknownCommand for an unregistered name, MissingArgument if a
   *         required argument is absent, or the manager's error
   */
  Result<CommandOutcome> execute(const CommandRequest &request) const;

  /**
   * @brief Build a request from one line of text
   *
   * Syntax: `name [--indent] [--pop] [args...] [selection]`. The command
   * decides how many arguments it takes; the remainder of the line is the
   * selection, with `\n`, `\t` and `\\` escapes decoded.
   *
   * @return UnknownCommand for an unregistered name, MissingArgument for
   *         an empty line
   */
  Result<CommandRequest> parse(const std::string &line) const;

  bool has(const std::string &name) const;

  /// Registered command names, sorted
  std::vector<std::string> names() const;

private:
  struct Command {
    Handler handler;
    /// Arguments consumed before the selection
    size_t arg_count = 0;
    /// Last argument may be omitted
    bool optional_arg = false;
  };

  void add(const std::string &name, size_t arg_count, bool optional_arg,
           Handler handler);

  ClipboardManager &manager_;
  std::map<std::string, Command> commands_;
};

/**
 * @brief Decode `\n`, `\t`, `\r` and `\\` escapes
 */
CLIPMAN_API std::string decode_escapes(const std::string &text);

} // namespace clipman

#endif // CLIPMAN_COMMAND_H
