/**
 * @file log.h
 * @brief Process logger for clipman
 *
 * All library code logs through the spdlog logger named "clipman". It
 * writes to stderr until log::init() adds a file sink or changes the level.
 *
 * @code
 *   clipman::log::init("debug", "/tmp/clipman.log");
 *   clipman::log::get()->info("history cleared ({} entries)", n);
 * @endcode
 */

#ifndef CLIPMAN_LOG_H
#define CLIPMAN_LOG_H

#include "error.h"
#include "platform.h"
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace clipman {
namespace log {

/// Logger name registered with spdlog
constexpr const char *LOGGER_NAME = "clipman";

/**
 * @brief Get the clipman logger, creating it on first use
 */
CLIPMAN_API std::shared_ptr<spdlog::logger> get();

/**
 * @brief Parse "trace", "debug", "info", "warn", "error", "critical", "off"
 */
CLIPMAN_API Result<spdlog::level::level_enum>
parse_level(const std::string &level);

/**
 * @brief Configure level and optional log file
 * @param level Level name accepted by parse_level()
 * @param file Log file to append to (empty = stderr only)
 * @return InvalidConfigValue for an unknown level, ConfigWriteError if the
 *         file cannot be opened
 */
CLIPMAN_API Result<void> init(const std::string &level,
                              const std::filesystem::path &file = {});

} // namespace log
} // namespace clipman

#endif // CLIPMAN_LOG_H
