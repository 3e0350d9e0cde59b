/**
 * @file config.h
 * @brief User configuration and settings for clipman
 */

#ifndef CLIPMAN_CONFIG_H
#define CLIPMAN_CONFIG_H

#include "clipboard.h"
#include "error.h"
#include "platform.h"
#include <filesystem>
#include <memory>
#include <string>

namespace clipman {

/// File name of the configuration inside the config directory
constexpr const char *CONFIG_FILE_NAME = "config.yaml";

// ============================================================================
// User Configuration
// ============================================================================

/**
 * @brief Complete user configuration for clipman
 */
struct ClipmanConfig {
  // ========================================================================
  // History, Yank and Display
  // ========================================================================

  /// Settings handed to ClipboardManager::init()
  ManagerConfig manager;

  // ========================================================================
  // Clipboard
  // ========================================================================

  /// "auto", "system" or "memory"
  std::string clipboard_backend = "auto";

  /// Write verification attempts for the system clipboard
  int write_retries = 3;

  /// Poll the clipboard for copies made by other applications
  bool watch = false;

  /// Milliseconds between clipboard polls
  int watch_interval_ms = 500;

  // ========================================================================
  // Logging
  // ========================================================================

  /// spdlog level name
  std::string log_level = "info";

  /// Log file (empty = stderr only)
  std::filesystem::path log_file;

  // ========================================================================
  // Data Paths
  // ========================================================================

  /// Path to configuration file
  std::filesystem::path config_file_path;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Load defaults based on platform
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /// Get default config directory for platform
  static std::filesystem::path get_default_config_dir();
};

// ============================================================================
// YAML Conversion
// ============================================================================

/**
 * @brief Apply YAML text on top of @p base
 * @return The merged configuration; ConfigParseError for malformed YAML or
 *         mistyped values, InvalidConfigValue if the result fails validate()
 *
 * Keys that are absent keep the value from @p base.
 */
CLIPMAN_API Result<ClipmanConfig> parse_config(const std::string &yaml,
                                               const ClipmanConfig &base);

/**
 * @brief Serialize a configuration as YAML
 */
CLIPMAN_API std::string emit_config(const ClipmanConfig &config);

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Manages loading, saving, and validating configuration
 */
class CLIPMAN_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Initialize with config file path
   * @param config_path Path to config file (default directory if empty)
   * @return Error from load() if the file exists but cannot be used
   *
   * A missing file is not an error; defaults are kept until save().
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  // ========================================================================
  // Configuration Access
  // ========================================================================

  /**
   * @brief Get current configuration
   */
  const ClipmanConfig &get() const;

  /**
   * @brief Get mutable configuration reference
   *
   * After modifying, call save() to persist changes.
   */
  ClipmanConfig &get_mutable();

  /**
   * @brief Set entire configuration
   */
  Result<void> set(const ClipmanConfig &config);

  // ========================================================================
  // Persistence
  // ========================================================================

  /**
   * @brief Load configuration from file
   */
  Result<void> load();

  /**
   * @brief Save configuration to file
   */
  Result<void> save();

  /**
   * @brief Reset to defaults
   */
  void reset_defaults();

  // ========================================================================
  // Individual Settings
  // ========================================================================

  /// Set history capacity and save
  Result<void> set_history_capacity(size_t capacity);

  /// Set clipboard backend and save
  Result<void> set_clipboard_backend(const std::string &backend);

  /// Enable or disable clipboard watching and save
  Result<void> set_watch(bool enabled);

  /// Set log level and save
  Result<void> set_log_level(const std::string &level);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipman

#endif // CLIPMAN_CONFIG_H
