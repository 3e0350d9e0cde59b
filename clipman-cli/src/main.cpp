/**
 * @file main.cpp
 * @brief clipman command-line host
 *
 * Reads one command per line from stdin and prints what an editor would
 * insert or display. The selection is the rest of the line after the
 * command and its arguments, with \n and \t escapes decoded:
 *
 *   copy first line\nsecond line
 *   copy_to_register a some text
 *   previous_and_paste
 *   show
 */

#include <clipman/clipman.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

struct Options {
  std::string config_path;
  std::optional<std::string> log_level;
  bool memory = false;
  bool watch = false;
  bool help = false;
  bool version = false;
};

void print_usage(const char *program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "\n"
            << "Options:\n"
            << "  --config <file>      Configuration file (YAML)\n"
            << "  --memory             Use an in-memory clipboard\n"
            << "  --watch              Pick up copies made by other applications\n"
            << "  --log-level <level>  trace, debug, info, warn, error, off\n"
            << "  --version            Print version and exit\n"
            << "  --help               Show this help\n"
            << "\n"
            << "Reads one command per line from stdin. Type 'help' for the\n"
            << "command list and 'quit' to exit.\n";
}

clipman::Result<Options> parse_args(int argc, char *argv[]) {
  Options options;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--config" || arg == "--log-level") {
      if (i + 1 >= argc) {
        return clipman::Error(clipman::ErrorCode::MissingArgument,
                              arg + " needs a value");
      }
      if (arg == "--config") {
        options.config_path = argv[++i];
      } else {
        options.log_level = argv[++i];
      }
    } else if (arg == "--memory") {
      options.memory = true;
    } else if (arg == "--watch") {
      options.watch = true;
    } else if (arg == "--version") {
      options.version = true;
    } else if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else {
      return clipman::Error(clipman::ErrorCode::InvalidArgument,
                            "Unknown option: " + arg);
    }
  }

  return options;
}

void print_outcome(const clipman::CommandOutcome &outcome) {
  using clipman::CommandAction;

  if (outcome.delete_selection) {
    std::cout << "-- delete selection\n";
  }
  if (outcome.action == CommandAction::Insert) {
    std::cout << (outcome.indent ? "-- insert (indent)\n" : "-- insert\n");
    std::cout << outcome.text << "\n";
  } else if (outcome.action == CommandAction::Display) {
    std::cout << outcome.text;
  }
  if (!outcome.popup.empty()) {
    std::cout << "-- popup\n" << outcome.popup << "\n";
  }
  if (!outcome.message.empty()) {
    std::cout << "-- " << outcome.message << "\n";
  }
  std::cout.flush();
}

void print_commands(const clipman::CommandTable &commands) {
  std::cout << "Commands:\n";
  for (const auto &name : commands.names()) {
    std::cout << "  " << name << "\n";
  }
  std::cout << "  help\n  quit\n";
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace clipman;

  auto parsed = parse_args(argc, argv);
  if (parsed.is_error()) {
    std::cerr << "clipman: " << parsed.error().to_string() << "\n";
    print_usage(argv[0]);
    return 2;
  }
  const Options &options = parsed.value();

  if (options.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (options.version) {
    std::cout << "clipman " << get_version().version_string << "\n";
    return 0;
  }

  // Configuration
  ConfigManager config_manager;
  auto loaded = config_manager.init(options.config_path);
  if (loaded.is_error()) {
    std::cerr << "clipman: " << loaded.error().to_string() << "\n";
    return 1;
  }

  ClipmanConfig config = config_manager.get();
  if (options.memory) {
    config.clipboard_backend = "memory";
  }
  if (options.watch) {
    config.watch = true;
  }
  if (options.log_level) {
    config.log_level = *options.log_level;
  }

  auto valid = config.validate();
  if (valid.is_error()) {
    std::cerr << "clipman: " << valid.error().to_string() << "\n";
    return 1;
  }

  auto logging = log::init(config.log_level, config.log_file);
  if (logging.is_error()) {
    std::cerr << "clipman: " << logging.error().to_string() << "\n";
    return 1;
  }

  // Clipboard
  auto port = make_clipboard_port(config.clipboard_backend,
                                  config.write_retries);
  if (port.is_error()) {
    std::cerr << "clipman: " << port.error().to_string() << "\n";
    return 1;
  }

  ClipboardManager manager(port.value());
  auto ready = manager.init(config.manager);
  if (ready.is_error()) {
    std::cerr << "clipman: " << ready.error().to_string() << "\n";
    return 1;
  }
  log::get()->info("clipman {} using {} clipboard", VERSION_STRING,
                   port.value()->name());

  std::unique_ptr<ClipboardWatcher> watcher;
  if (config.watch) {
    watcher = std::make_unique<ClipboardWatcher>(manager);
    auto started =
        watcher->start(std::chrono::milliseconds(config.watch_interval_ms));
    if (started.is_error()) {
      std::cerr << "clipman: " << started.error().to_string() << "\n";
      return 1;
    }
  }

  // Command loop
  CommandTable commands(manager);
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (line == "quit" || line == "exit") {
      break;
    }
    if (line == "help") {
      print_commands(commands);
      continue;
    }

    auto request = commands.parse(line);
    if (request.is_error()) {
      std::cerr << "error: " << request.error().to_string() << "\n";
      continue;
    }

    auto outcome = commands.execute(request.value());
    if (outcome.is_error()) {
      std::cerr << "error: " << outcome.error().to_string() << "\n";
      continue;
    }
    print_outcome(outcome.value());
  }

  if (watcher) {
    watcher->stop();
  }
  manager.shutdown();
  return 0;
}
