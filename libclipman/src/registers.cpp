/**
 * @file registers.cpp
 * @brief RegisterStore implementation
 */

#include "clipman/registers.h"
#include "clipman/format.h"
#include <cctype>

namespace clipman {

// ============================================================================
// Key Validation
// ============================================================================

bool is_valid_register_key(char key) {
  return std::isprint(static_cast<unsigned char>(key)) != 0;
}

Result<char> parse_register_key(const std::string &key) {
  if (key.size() != 1) {
    return Error(ErrorCode::InvalidRegisterKey,
                 "Register key must be a single character",
                 "got \"" + key + "\"");
  }
  if (!is_valid_register_key(key[0])) {
    return Error(ErrorCode::InvalidRegisterKey,
                 "Register key must be printable");
  }
  return key[0];
}

Result<RegisterGroup> parse_register_group(const std::string &name) {
  if (name.empty() || name == "all") {
    return RegisterGroup::All;
  }
  if (name == "digits" || name == "numbers") {
    return RegisterGroup::Digits;
  }
  if (name == "lower" || name == "lowercase") {
    return RegisterGroup::Lowercase;
  }
  if (name == "upper" || name == "uppercase") {
    return RegisterGroup::Uppercase;
  }
  return Error(ErrorCode::InvalidRegisterGroup,
               "Unknown register group: " + name);
}

bool register_in_group(char key, RegisterGroup group) {
  auto c = static_cast<unsigned char>(key);
  switch (group) {
  case RegisterGroup::All:
    return true;
  case RegisterGroup::Digits:
    return std::isdigit(c) != 0;
  case RegisterGroup::Lowercase:
    return c >= 'a' && c <= 'z';
  case RegisterGroup::Uppercase:
    return c >= 'A' && c <= 'Z';
  default:
    return false;
  }
}

// ============================================================================
// RegisterStore
// ============================================================================

Result<void> RegisterStore::set(char key, const ClipboardEntry &entry) {
  CLIPMAN_REQUIRE(is_valid_register_key(key), ErrorCode::InvalidRegisterKey,
                  "Register key must be printable");

  // Overwrite, never merge
  registers_.erase(key);
  registers_.emplace(key, entry.detached());
  return Result<void>::ok();
}

MaybeEntry RegisterStore::get(char key) const {
  auto it = registers_.find(key);
  if (it == registers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool RegisterStore::erase(char key) { return registers_.erase(key) != 0; }

size_t RegisterStore::reset(RegisterGroup group) {
  if (group == RegisterGroup::All) {
    size_t removed = registers_.size();
    registers_.clear();
    return removed;
  }

  size_t removed = 0;
  for (auto it = registers_.begin(); it != registers_.end();) {
    if (register_in_group(it->first, group)) {
      it = registers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

RegisterLines RegisterStore::list_for_display(size_t width) const {
  RegisterLines lines;
  lines.reserve(registers_.size());
  for (const auto &reg : registers_) {
    lines.push_back(RegisterLine{reg.first, make_preview(reg.second.text(), width)});
  }
  return lines;
}

std::vector<std::pair<char, std::string>> RegisterStore::contents() const {
  std::vector<std::pair<char, std::string>> result;
  result.reserve(registers_.size());
  for (const auto &reg : registers_) {
    result.emplace_back(reg.first, reg.second.text());
  }
  return result;
}

} // namespace clipman
