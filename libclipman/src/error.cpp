/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "clipman/error.h"
#include <sstream>

namespace clipman {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::InvalidRegisterKey:
    return "InvalidRegisterKey";
  case ErrorCode::InvalidRegisterGroup:
    return "InvalidRegisterGroup";

  case ErrorCode::ClipboardUnavailable:
    return "ClipboardUnavailable";
  case ErrorCode::ClipboardReadFailed:
    return "ClipboardReadFailed";
  case ErrorCode::ClipboardWriteFailed:
    return "ClipboardWriteFailed";
  case ErrorCode::ClipboardVerifyFailed:
    return "ClipboardVerifyFailed";
  case ErrorCode::ClipboardToolMissing:
    return "ClipboardToolMissing";

  case ErrorCode::UnknownCommand:
    return "UnknownCommand";
  case ErrorCode::MissingArgument:
    return "MissingArgument";

  case ErrorCode::ConfigParseError:
    return "ConfigParseError";
  case ErrorCode::ConfigReadError:
    return "ConfigReadError";
  case ErrorCode::ConfigWriteError:
    return "ConfigWriteError";
  case ErrorCode::InvalidConfigValue:
    return "InvalidConfigValue";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";

  case ErrorCode::InvalidRegisterKey:
    return "Register key must be a single printable character";
  case ErrorCode::InvalidRegisterGroup:
    return "Unknown register group";

  case ErrorCode::ClipboardUnavailable:
    return "System clipboard is not available";
  case ErrorCode::ClipboardReadFailed:
    return "Failed to read the system clipboard";
  case ErrorCode::ClipboardWriteFailed:
    return "Failed to write the system clipboard";
  case ErrorCode::ClipboardVerifyFailed:
    return "System clipboard did not keep the written text";
  case ErrorCode::ClipboardToolMissing:
    return "Clipboard command-line tool not installed";

  case ErrorCode::UnknownCommand:
    return "Unknown command";
  case ErrorCode::MissingArgument:
    return "Command is missing a required argument";

  case ErrorCode::ConfigParseError:
    return "Configuration file could not be parsed";
  case ErrorCode::ConfigReadError:
    return "Configuration file could not be read";
  case ErrorCode::ConfigWriteError:
    return "Configuration file could not be written";
  case ErrorCode::InvalidConfigValue:
    return "Configuration value out of range";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::NotSupported:
  case ErrorCode::ClipboardUnavailable:
  case ErrorCode::ClipboardToolMissing:
    return false;

  // All others are potentially recoverable
  default:
    return true;
  }
}

bool is_clipboard_error(ErrorCode code) {
  int value = static_cast<int>(code);
  return value >= 300 && value < 400;
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace clipman
