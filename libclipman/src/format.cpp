/**
 * @file format.cpp
 * @brief Display formatting implementation
 */

#include "clipman/format.h"
#include <iomanip>
#include <sstream>

namespace clipman {

namespace {

void replace_all(std::string &text, const std::string &from,
                 const std::string &to) {
  if (from.empty()) {
    return;
  }
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

/// Normalize line endings and indent continuation lines
std::string panel_item(std::string item, const std::string &continuation) {
  replace_all(item, "\t", "\\t");
  replace_all(item, "\r\n", "\n");
  replace_all(item, "\r", "\n");
  replace_all(item, "\n", "\n" + continuation);
  return item;
}

/// Largest length <= @p limit that does not end inside a UTF-8 sequence
size_t utf8_cut(const std::string &text, size_t limit) {
  size_t cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return cut;
}

size_t digit_count(size_t value) {
  return std::to_string(value).size();
}

} // namespace

// ============================================================================
// Previews
// ============================================================================

std::string escape_control(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '\t':
      out += "\\t";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out += c;
      break;
    }
  }
  return out;
}

std::string make_preview(const std::string &text, size_t width) {
  std::string preview = escape_control(text);
  if (preview.size() <= width) {
    return preview;
  }

  preview.resize(utf8_cut(preview, width));
  return preview;
}

std::string truncate_for_popup(const std::string &text) {
  if (text.size() <= POPUP_TEXT_LIMIT) {
    return text;
  }
  return text.substr(0, utf8_cut(text, POPUP_TEXT_KEEP)) + "\n...\n";
}

std::string format_status(const MaybeEntry &entry) {
  if (!entry) {
    return "Nothing in history";
  }
  return "Set Clipboard to \"" + escape_control(entry->text()) + "\"";
}

// ============================================================================
// Output Panel
// ============================================================================

std::string format_history_panel(const std::string &title,
                                 const std::vector<std::string> &texts,
                                 std::optional<size_t> current) {
  std::ostringstream oss;
  oss << " " << title << " HISTORY (" << texts.size() << ")\n";
  oss << std::string(20 + digit_count(texts.size()), '=') << "==\n";

  for (size_t i = 0; i < texts.size(); ++i) {
    oss << (current && *current == i ? "--> " : "    ");

    // Only the last three digits fit the number column
    std::string number = std::to_string(i + 1);
    if (number.size() > 3) {
      number = number.substr(number.size() - 3);
    }
    oss << std::setw(3) << number << ". "
        << panel_item(texts[i], "       > ") << "\n";
  }
  return oss.str();
}

std::string format_register_panel(
    const std::vector<std::pair<char, std::string>> &registers) {
  std::ostringstream oss;
  oss << " CLIPBOARD REGISTERS (" << registers.size() << ")\n";
  oss << std::string(21 + digit_count(registers.size()), '=') << "==\n";

  for (const auto &reg : registers) {
    oss << reg.first << ": " << panel_item(reg.second, " > ") << "\n";
  }
  return oss.str();
}

} // namespace clipman
