/**
 * @file registers.h
 * @brief Named single-slot clipboard registers
 */

#ifndef CLIPMAN_REGISTERS_H
#define CLIPMAN_REGISTERS_H

#include "entry.h"
#include "error.h"
#include "platform.h"
#include "types.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace clipman {

/**
 * @brief Check whether @p key may name a register (printable character)
 */
CLIPMAN_API bool is_valid_register_key(char key);

/**
 * @brief Validate a register key supplied by a host
 * @return The key, or InvalidRegisterKey unless @p key is exactly one
 *         printable character
 */
CLIPMAN_API Result<char> parse_register_key(const std::string &key);

/**
 * @brief Parse "all", "digits", "lower" or "upper"
 */
CLIPMAN_API Result<RegisterGroup> parse_register_group(const std::string &name);

/**
 * @brief Check whether @p key belongs to @p group
 */
CLIPMAN_API bool register_in_group(char key, RegisterGroup group);

/**
 * @brief Mapping from a single character to one clipboard entry
 *
 * Writes overwrite. Stored entries are detached copies, so they never
 * share text with history slots and survive history eviction and resets.
 * Not thread-safe; ClipboardManager serializes access.
 */
class CLIPMAN_API RegisterStore {
public:
  RegisterStore() = default;

  /**
   * @brief Store @p entry under @p key, replacing any previous value
   * @return InvalidRegisterKey if @p key is not printable
   */
  Result<void> set(char key, const ClipboardEntry &entry);

  /**
   * @brief Read a register
   * @return The entry, or no entry if @p key was never set
   */
  MaybeEntry get(char key) const;

  bool contains(char key) const { return registers_.count(key) != 0; }

  /// Remove one register; returns true if it existed
  bool erase(char key);

  /**
   * @brief Remove every register in @p group
   * @return Number of registers removed
   */
  size_t reset(RegisterGroup group = RegisterGroup::All);

  /// Rows sorted by key
  RegisterLines list_for_display(size_t width) const;

  /// Keys with their full text, sorted by key
  std::vector<std::pair<char, std::string>> contents() const;

  size_t size() const { return registers_.size(); }
  bool empty() const { return registers_.empty(); }

private:
  std::map<char, ClipboardEntry> registers_;
};

} // namespace clipman

#endif // CLIPMAN_REGISTERS_H
