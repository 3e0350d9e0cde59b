/**
 * @file log.cpp
 * @brief Logger setup
 */

#include "clipman/log.h"
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace clipman {
namespace log {

namespace {

std::mutex g_log_mutex;

std::shared_ptr<spdlog::logger> create_logger() {
  auto existing = spdlog::get(LOGGER_NAME);
  if (existing) {
    return existing;
  }

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
  logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  logger->set_level(spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return create_logger();
  }();
  return logger;
}

Result<spdlog::level::level_enum> parse_level(const std::string &level) {
  if (level == "trace") {
    return spdlog::level::trace;
  }
  if (level == "debug") {
    return spdlog::level::debug;
  }
  if (level == "info") {
    return spdlog::level::info;
  }
  if (level == "warn" || level == "warning") {
    return spdlog::level::warn;
  }
  if (level == "error") {
    return spdlog::level::err;
  }
  if (level == "critical") {
    return spdlog::level::critical;
  }
  if (level == "off") {
    return spdlog::level::off;
  }
  return Error(ErrorCode::InvalidConfigValue, "Unknown log level: " + level);
}

Result<void> init(const std::string &level, const std::filesystem::path &file) {
  auto parsed = parse_level(level);
  if (parsed.is_error()) {
    return parsed.error();
  }

  auto logger = get();
  std::lock_guard<std::mutex> lock(g_log_mutex);

  if (!file.empty()) {
    try {
      auto file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string());
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      logger->sinks().push_back(file_sink);
    } catch (const spdlog::spdlog_ex &ex) {
      return Error(ErrorCode::ConfigWriteError, "Cannot open log file",
                   ex.what());
    }
  }

  logger->set_level(parsed.value());
  return Result<void>::ok();
}

} // namespace log
} // namespace clipman
