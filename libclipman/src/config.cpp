/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

#include <pwd.h>
#include <unistd.h>

#include <yaml-cpp/yaml.h>

#include "clipman/config.h"
#include "clipman/log.h"
#include "clipman/watcher.h"

namespace fs = ::std::filesystem;

namespace clipman {

namespace {

constexpr long long MAX_HISTORY_CAPACITY = 100000;
constexpr size_t MIN_PREVIEW_WIDTH = 8;
constexpr int MAX_WRITE_RETRIES = 10;

// Reads a non-negative integer, rejecting negatives before they wrap
size_t read_size(const YAML::Node &node, const char *key) {
  long long value = node.as<long long>();
  if (value < 0) {
    throw YAML::RepresentationException(node.Mark(),
                                        std::string(key) + " is negative");
  }
  return static_cast<size_t>(value);
}

void apply_yaml(const YAML::Node &root, ClipmanConfig &config) {
  ManagerConfig &mgr = config.manager;

  if (auto history = root["history"]) {
    if (history["capacity"])
      mgr.history_capacity = read_size(history["capacity"], "capacity");
    if (history["allow_duplicates"])
      mgr.allow_history_duplicates = history["allow_duplicates"].as<bool>();
    if (history["ignore_empty"])
      mgr.ignore_empty_copies = history["ignore_empty"].as<bool>();
    if (history["seed_from_clipboard"])
      mgr.seed_from_clipboard = history["seed_from_clipboard"].as<bool>();
  }

  if (auto yank = root["yank"]) {
    if (yank["explicit_mode"])
      mgr.explicit_yank_mode = yank["explicit_mode"].as<bool>();
    if (yank["end_on_empty"])
      mgr.end_yank_mode_on_empty = yank["end_on_empty"].as<bool>();
  }

  if (auto display = root["display"]) {
    if (display["preview_width"])
      mgr.preview_width =
          read_size(display["preview_width"], "preview_width");
  }

  if (auto clipboard = root["clipboard"]) {
    if (clipboard["backend"])
      config.clipboard_backend = clipboard["backend"].as<std::string>();
    if (clipboard["write_retries"])
      config.write_retries = clipboard["write_retries"].as<int>();
    if (clipboard["watch"])
      config.watch = clipboard["watch"].as<bool>();
    if (clipboard["watch_interval_ms"])
      config.watch_interval_ms = clipboard["watch_interval_ms"].as<int>();
  }

  if (auto logging = root["log"]) {
    if (logging["level"])
      config.log_level = logging["level"].as<std::string>();
    if (logging["file"] && !logging["file"].IsNull())
      config.log_file = logging["file"].as<std::string>();
  }
}

Result<void> write_file(const fs::path &path, const std::string &text) {
  auto dir = path.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      return Error(ErrorCode::ConfigWriteError,
                   "Cannot create config directory", ec.message());
    }
  }

  // Write to .tmp, then move into place
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      return Error(ErrorCode::ConfigWriteError, "Cannot open config file",
                   tmp.string());
    }
    out << text << '\n';
    if (!out) {
      return Error(ErrorCode::ConfigWriteError, "Cannot write config file",
                   tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    return Error(ErrorCode::ConfigWriteError, "Cannot replace config file",
                 ec.message());
  }
  return Result<void>::ok();
}

} // namespace

// ============================================================================
// ClipmanConfig Methods
// ============================================================================

void ClipmanConfig::load_defaults() {
  manager = ManagerConfig{};

  clipboard_backend = "auto";
  write_retries = 3;
  watch = false;
  watch_interval_ms = 500;

  log_level = "info";
  log_file.clear();

  config_file_path = get_default_config_dir() / CONFIG_FILE_NAME;
}

Result<void> ClipmanConfig::validate() const {
  if (manager.history_capacity < 1 ||
      manager.history_capacity > static_cast<size_t>(MAX_HISTORY_CAPACITY)) {
    return Error(ErrorCode::InvalidConfigValue,
                 "History capacity must be between 1 and " +
                     std::to_string(MAX_HISTORY_CAPACITY));
  }

  if (manager.preview_width < MIN_PREVIEW_WIDTH) {
    return Error(ErrorCode::InvalidConfigValue,
                 "Preview width must be at least " +
                     std::to_string(MIN_PREVIEW_WIDTH));
  }

  if (write_retries < 1 || write_retries > MAX_WRITE_RETRIES) {
    return Error(ErrorCode::InvalidConfigValue,
                 "Write retries must be between 1 and " +
                     std::to_string(MAX_WRITE_RETRIES));
  }

  if (watch_interval_ms < MIN_WATCH_INTERVAL.count()) {
    return Error(ErrorCode::InvalidConfigValue,
                 "Watch interval must be at least " +
                     std::to_string(MIN_WATCH_INTERVAL.count()) + " ms");
  }

  if (clipboard_backend != "auto" && clipboard_backend != "system" &&
      clipboard_backend != "memory") {
    return Error(ErrorCode::InvalidConfigValue,
                 "Unknown clipboard backend: " + clipboard_backend);
  }

  auto level = log::parse_level(log_level);
  if (level.is_error()) {
    return level.error();
  }

  return Result<void>::ok();
}

fs::path ClipmanConfig::get_default_config_dir() {
  // Use XDG_CONFIG_HOME or ~/.config
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return fs::path(xdg_config) / "clipman";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "clipman";
  }

  return fs::path("/tmp/clipman");
}

// ============================================================================
// YAML Conversion
// ============================================================================

Result<ClipmanConfig> parse_config(const std::string &yaml,
                                   const ClipmanConfig &base) {
  ClipmanConfig config = base;

  try {
    YAML::Node root = YAML::Load(yaml);
    if (root && !root.IsNull()) {
      if (!root.IsMap()) {
        return Error(ErrorCode::ConfigParseError,
                     "Config root must be a mapping");
      }
      apply_yaml(root, config);
    }
  } catch (const YAML::Exception &ex) {
    return Error(ErrorCode::ConfigParseError, "Malformed config", ex.what());
  }

  auto validation = config.validate();
  if (validation.is_error()) {
    return validation.error();
  }
  return config;
}

std::string emit_config(const ClipmanConfig &config) {
  const ManagerConfig &mgr = config.manager;

  YAML::Emitter emitter;
  emitter << YAML::BeginMap;

  emitter << YAML::Key << "history" << YAML::Value << YAML::BeginMap;
  emitter << YAML::Key << "capacity" << YAML::Value
          << static_cast<unsigned long long>(mgr.history_capacity);
  emitter << YAML::Key << "allow_duplicates" << YAML::Value
          << mgr.allow_history_duplicates;
  emitter << YAML::Key << "ignore_empty" << YAML::Value
          << mgr.ignore_empty_copies;
  emitter << YAML::Key << "seed_from_clipboard" << YAML::Value
          << mgr.seed_from_clipboard;
  emitter << YAML::EndMap;

  emitter << YAML::Key << "yank" << YAML::Value << YAML::BeginMap;
  emitter << YAML::Key << "explicit_mode" << YAML::Value
          << mgr.explicit_yank_mode;
  emitter << YAML::Key << "end_on_empty" << YAML::Value
          << mgr.end_yank_mode_on_empty;
  emitter << YAML::EndMap;

  emitter << YAML::Key << "display" << YAML::Value << YAML::BeginMap;
  emitter << YAML::Key << "preview_width" << YAML::Value
          << static_cast<unsigned long long>(mgr.preview_width);
  emitter << YAML::EndMap;

  emitter << YAML::Key << "clipboard" << YAML::Value << YAML::BeginMap;
  emitter << YAML::Key << "backend" << YAML::Value << config.clipboard_backend;
  emitter << YAML::Key << "write_retries" << YAML::Value
          << config.write_retries;
  emitter << YAML::Key << "watch" << YAML::Value << config.watch;
  emitter << YAML::Key << "watch_interval_ms" << YAML::Value
          << config.watch_interval_ms;
  emitter << YAML::EndMap;

  emitter << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
  emitter << YAML::Key << "level" << YAML::Value << config.log_level;
  emitter << YAML::Key << "file" << YAML::Value << config.log_file.string();
  emitter << YAML::EndMap;

  emitter << YAML::EndMap;
  return emitter.c_str();
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  ClipmanConfig config;
  fs::path config_path;
  std::mutex mutex;
  bool initialized = false;

  Result<void> load_locked() {
    std::ifstream in(config_path);
    if (!in) {
      return Error(ErrorCode::ConfigReadError, "Cannot open config file",
                   config_path.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    ClipmanConfig base;
    base.load_defaults();
    auto parsed = parse_config(buffer.str(), base);
    if (parsed.is_error()) {
      Error error = parsed.error();
      error.location = config_path.string();
      return error;
    }

    config = std::move(parsed.value());
    config.config_file_path = config_path;
    log::get()->debug("loaded config from {}", config_path.string());
    return Result<void>::ok();
  }

  Result<void> save_locked() {
    if (!initialized) {
      return Error(ErrorCode::NotInitialized, "ConfigManager not initialized");
    }
    CLIPMAN_TRY(write_file(config_path, emit_config(config)));
    log::get()->debug("saved config to {}", config_path.string());
    return Result<void>::ok();
  }
};

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config.load_defaults();
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (config_path.empty()) {
    impl_->config_path =
        ClipmanConfig::get_default_config_dir() / CONFIG_FILE_NAME;
  } else {
    impl_->config_path = config_path;
  }
  impl_->config.config_file_path = impl_->config_path;
  impl_->initialized = true;

  std::error_code ec;
  if (fs::exists(impl_->config_path, ec)) {
    return impl_->load_locked();
  }
  return Result<void>::ok();
}

const ClipmanConfig &ConfigManager::get() const { return impl_->config; }

ClipmanConfig &ConfigManager::get_mutable() { return impl_->config; }

Result<void> ConfigManager::set(const ClipmanConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  fs::path path = impl_->config.config_file_path;
  impl_->config = config;
  impl_->config.config_file_path = path;
  return Result<void>::ok();
}

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (!impl_->initialized) {
    return Error(ErrorCode::NotInitialized, "ConfigManager not initialized");
  }
  return impl_->load_locked();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->save_locked();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
  if (impl_->initialized) {
    impl_->config.config_file_path = impl_->config_path;
  }
}

Result<void> ConfigManager::set_history_capacity(size_t capacity) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  ClipmanConfig updated = impl_->config;
  updated.manager.history_capacity = capacity;
  CLIPMAN_TRY(updated.validate());

  impl_->config = std::move(updated);
  return impl_->save_locked();
}

Result<void> ConfigManager::set_clipboard_backend(const std::string &backend) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  ClipmanConfig updated = impl_->config;
  updated.clipboard_backend = backend;
  CLIPMAN_TRY(updated.validate());

  impl_->config = std::move(updated);
  return impl_->save_locked();
}

Result<void> ConfigManager::set_watch(bool enabled) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.watch = enabled;
  return impl_->save_locked();
}

Result<void> ConfigManager::set_log_level(const std::string &level) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  ClipmanConfig updated = impl_->config;
  updated.log_level = level;
  CLIPMAN_TRY(updated.validate());

  impl_->config = std::move(updated);
  return impl_->save_locked();
}

} // namespace clipman
