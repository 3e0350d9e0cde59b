/**
 * @file command.cpp
 * @brief Command table implementation
 */

#include "clipman/command.h"
#include "clipman/format.h"
#include "clipman/log.h"
#include <stdexcept>

namespace clipman {

namespace {

PasteOptions paste_options(const CommandRequest &request) {
  PasteOptions options;
  options.indent = request.indent;
  options.pop = request.pop;
  return options;
}

CommandOutcome message_only(std::string message) {
  CommandOutcome outcome;
  outcome.message = std::move(message);
  return outcome;
}

CommandOutcome display(std::string text) {
  CommandOutcome outcome;
  outcome.action = CommandAction::Display;
  outcome.text = std::move(text);
  return outcome;
}

// Insert the pasted text, or report that there was nothing to paste
Result<CommandOutcome>
insert_or(const Result<std::optional<PasteText>> &pasted,
          const std::string &empty_message) {
  if (pasted.is_error()) {
    return pasted.error();
  }
  if (!pasted.value()) {
    return message_only(empty_message);
  }

  CommandOutcome outcome;
  outcome.action = CommandAction::Insert;
  outcome.text = pasted.value()->text;
  outcome.indent = pasted.value()->indent;
  return outcome;
}

std::string take_token(const std::string &line, size_t &pos) {
  while (pos < line.size() && line[pos] == ' ') {
    ++pos;
  }
  size_t start = pos;
  while (pos < line.size() && line[pos] != ' ') {
    ++pos;
  }
  return line.substr(start, pos - start);
}

Result<size_t> parse_index(const std::string &text) {
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    return Error(ErrorCode::InvalidArgument, "You entered a wrong value",
                 text);
  }

  try {
    size_t consumed = 0;
    unsigned long value = std::stoul(text, &consumed);
    if (consumed != text.size()) {
      return Error(ErrorCode::InvalidArgument, "You entered a wrong value",
                   text);
    }
    return static_cast<size_t>(value);
  } catch (const std::invalid_argument &) {
    return Error(ErrorCode::InvalidArgument, "You entered a wrong value",
                 text);
  } catch (const std::out_of_range &) {
    return Error(ErrorCode::InvalidArgument, "Index out of range", text);
  }
}

} // namespace

// ============================================================================
// Helpers
// ============================================================================

const char *command_action_name(CommandAction action) {
  switch (action) {
  case CommandAction::None:
    return "None";
  case CommandAction::Insert:
    return "Insert";
  case CommandAction::Display:
    return "Display";
  default:
    return "Unknown";
  }
}

std::string decode_escapes(const std::string &text) {
  std::string out;
  out.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c != '\\' || i + 1 == text.size()) {
      out += c;
      continue;
    }

    char next = text[++i];
    switch (next) {
    case 'n':
      out += '\n';
      break;
    case 't':
      out += '\t';
      break;
    case 'r':
      out += '\r';
      break;
    case '\\':
      out += '\\';
      break;
    default:
      out += '\\';
      out += next;
      break;
    }
  }
  return out;
}

// ============================================================================
// CommandTable
// ============================================================================

CommandTable::CommandTable(ClipboardManager &manager) : manager_(manager) {
  ClipboardManager *mgr = &manager_;

  // ---- History ----

  add("copy", 0, false, [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
    auto copied = mgr->copy(req.selection);
    CLIPMAN_TRY(copied);
    if (!copied.value()) {
      return message_only("Nothing copied");
    }
    return message_only(mgr->status_message());
  });

  add("cut", 0, false, [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
    auto cut = mgr->cut(req.selection);
    CLIPMAN_TRY(cut);
    if (!cut.value()) {
      return message_only("Nothing copied");
    }
    CommandOutcome outcome = message_only(mgr->status_message());
    outcome.delete_selection = true;
    return outcome;
  });

  add("paste", 0, false, [mgr](const CommandRequest &req) {
    return insert_or(mgr->paste_current(paste_options(req)),
                     "Nothing in history");
  });

  auto navigate = [mgr](const Result<std::optional<PasteText>> &moved)
      -> Result<CommandOutcome> {
    if (moved.is_error()) {
      return moved.error();
    }
    if (!moved.value()) {
      return message_only("Nothing in history");
    }
    CommandOutcome outcome = message_only(mgr->status_message());
    outcome.popup = truncate_for_popup(moved.value()->text);
    return outcome;
  };

  add("next", 0, false, [mgr, navigate](const CommandRequest &) {
    return navigate(mgr->next_and_get_text());
  });

  add("previous", 0, false, [mgr, navigate](const CommandRequest &) {
    return navigate(mgr->previous_and_get_text());
  });

  add("oldest", 0, false, [mgr, navigate](const CommandRequest &) {
    return navigate(mgr->oldest_and_get_text());
  });

  add("newest", 0, false, [mgr, navigate](const CommandRequest &) {
    return navigate(mgr->newest_and_get_text());
  });

  add("next_and_paste", 0, false, [mgr](const CommandRequest &req) {
    return insert_or(mgr->next_and_get_text(paste_options(req)),
                     "Nothing in history");
  });

  add("previous_and_paste", 0, false, [mgr](const CommandRequest &req) {
    return insert_or(mgr->previous_and_get_text(paste_options(req)),
                     "Nothing in history");
  });

  add("paste_and_next", 0, false,
      [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
        auto pasted =
            insert_or(mgr->paste_current(paste_options(req)), "Nothing in history");
        if (pasted.is_error() || pasted.value().action != CommandAction::Insert) {
          return pasted;
        }
        CLIPMAN_TRY(mgr->next_and_get_text());
        return pasted;
      });

  add("paste_and_previous", 0, false,
      [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
        auto pasted =
            insert_or(mgr->paste_current(paste_options(req)), "Nothing in history");
        if (pasted.is_error() || pasted.value().action != CommandAction::Insert) {
          return pasted;
        }
        CLIPMAN_TRY(mgr->previous_and_get_text());
        return pasted;
      });

  add("choose_and_paste", 1, false,
      [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
        auto index = parse_index(req.args[0]);
        CLIPMAN_TRY(index);

        if (mgr->history_size() == 0) {
          return message_only("Nothing in history");
        }
        return insert_or(
            mgr->select_and_get_text(index.value(), paste_options(req)),
            "Entry " + req.args[0] + " doesn't exist");
      });

  add("show", 0, false, [mgr](const CommandRequest &) -> Result<CommandOutcome> {
    return display(mgr->render_history());
  });

  add("status", 0, false, [mgr](const CommandRequest &) -> Result<CommandOutcome> {
    return message_only(mgr->status_message());
  });

  add("clear_history", 0, false, [mgr](const CommandRequest &) -> Result<CommandOutcome> {
    mgr->clear_history();
    return message_only("Clipboard history cleared");
  });

  // ---- Registers ----

  add("copy_to_register", 1, false,
      [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
        CLIPMAN_TRY(mgr->copy_to_register(req.args[0], req.selection));
        return message_only("Registered in " + req.args[0]);
      });

  add("paste_from_register", 1, false, [mgr](const CommandRequest &req) {
    return insert_or(mgr->paste_from_register(req.args[0], paste_options(req)),
                     "Register " + req.args[0] + " is empty");
  });

  add("set_clipboard_from_register", 1, false,
      [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
        auto entry = mgr->set_clipboard_from_register(req.args[0]);
        CLIPMAN_TRY(entry);
        if (!entry.value()) {
          return message_only("Register " + req.args[0] + " is empty");
        }
        return message_only("Clipboard set to register '" + req.args[0] + "'");
      });

  add("show_registers", 0, false, [mgr](const CommandRequest &) -> Result<CommandOutcome> {
    return display(mgr->render_registers());
  });

  add("reset_registers", 1, true,
      [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
        auto group =
            parse_register_group(req.args.empty() ? std::string() : req.args[0]);
        CLIPMAN_TRY(group);

        size_t removed = mgr->reset_registers(group.value());
        return message_only("Reset " + std::to_string(removed) + " " +
                            register_group_name(group.value()) + " registers");
      });

  // ---- Yank ----

  add("yank", 0, false, [mgr](const CommandRequest &req) {
    return insert_or(mgr->yank(paste_options(req)), "Nothing to yank");
  });

  add("yank_choose", 1, false,
      [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
        auto index = parse_index(req.args[0]);
        CLIPMAN_TRY(index);

        if (mgr->yank_stack_size() == 0) {
          return message_only("Nothing to yank");
        }
        return insert_or(
            mgr->select_and_yank(index.value(), paste_options(req)),
            "Entry " + req.args[0] + " doesn't exist");
      });

  add("yank_mode", 1, true,
      [mgr](const CommandRequest &req) -> Result<CommandOutcome> {
        bool enabled = !mgr->is_yank_mode();
        if (!req.args.empty()) {
          if (req.args[0] == "on") {
            enabled = true;
          } else if (req.args[0] == "off") {
            enabled = false;
          } else {
            return Error(ErrorCode::InvalidArgument,
                         "Yank mode must be on or off", req.args[0]);
          }
        }

        mgr->set_yank_mode(enabled);
        return message_only(std::string("YANK MODE: ") +
                            (enabled ? "On" : "Off"));
      });

  add("clear_yank_stack", 0, false, [mgr](const CommandRequest &) -> Result<CommandOutcome> {
    mgr->clear_yank_stack();
    return message_only("Yank history cleared");
  });

  add("show_yank", 0, false, [mgr](const CommandRequest &) -> Result<CommandOutcome> {
    return display(mgr->render_yank_stack());
  });
}

void CommandTable::add(const std::string &name, size_t arg_count,
                       bool optional_arg, Handler handler) {
  Command command;
  command.handler = std::move(handler);
  command.arg_count = arg_count;
  command.optional_arg = optional_arg;
  commands_[name] = std::move(command);
}

Result<CommandOutcome>
CommandTable::execute(const CommandRequest &request) const {
  auto it = commands_.find(request.name);
  if (it == commands_.end()) {
    return Error(ErrorCode::UnknownCommand, "Unknown command: " + request.name);
  }

  const Command &command = it->second;
  size_t required = command.arg_count - (command.optional_arg ? 1 : 0);
  if (request.args.size() < required) {
    return Error(ErrorCode::MissingArgument,
                 request.name + " needs " + std::to_string(required) +
                     " argument" + (required == 1 ? "" : "s"));
  }

  log::get()->debug("command {} (args {}, selection {} bytes)", request.name,
                    request.args.size(), request.selection.size());
  return command.handler(request);
}

Result<CommandRequest> CommandTable::parse(const std::string &line) const {
  std::string text = line;
  if (!text.empty() && text.back() == '\r') {
    text.pop_back();
  }

  size_t pos = 0;
  CommandRequest request;
  request.name = take_token(text, pos);
  if (request.name.empty()) {
    return Error(ErrorCode::MissingArgument, "Empty command");
  }

  auto it = commands_.find(request.name);
  if (it == commands_.end()) {
    return Error(ErrorCode::UnknownCommand, "Unknown command: " + request.name);
  }

  // Flags come right after the name
  while (pos < text.size()) {
    size_t saved = pos;
    std::string token = take_token(text, pos);
    if (token == "--indent") {
      request.indent = true;
    } else if (token == "--pop") {
      request.pop = true;
    } else {
      pos = saved;
      break;
    }
  }

  for (size_t i = 0; i < it->second.arg_count; ++i) {
    std::string arg = take_token(text, pos);
    if (arg.empty()) {
      break;
    }
    request.args.push_back(std::move(arg));
  }

  // One space separates the selection from what precedes it
  if (pos < text.size() && text[pos] == ' ') {
    ++pos;
  }
  request.selection = decode_escapes(text.substr(pos));
  return request;
}

bool CommandTable::has(const std::string &name) const {
  return commands_.count(name) != 0;
}

std::vector<std::string> CommandTable::names() const {
  std::vector<std::string> result;
  result.reserve(commands_.size());
  for (const auto &pair : commands_) {
    result.push_back(pair.first);
  }
  return result;
}

} // namespace clipman
