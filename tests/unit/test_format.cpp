/**
 * @file test_format.cpp
 * @brief Unit tests for previews, status text and output panels
 */

#include <clipman/clipman.h>
#include <gtest/gtest.h>

using namespace clipman;

// ============================================================================
// Previews
// ============================================================================

TEST(FormatTest, EscapeControl) {
  EXPECT_EQ(escape_control("a\tb\nc\rd"), "a\\tb\\nc\\rd");
  EXPECT_EQ(escape_control("plain"), "plain");
}

TEST(FormatTest, PreviewWithinWidthIsUnchanged) {
  EXPECT_EQ(make_preview("short", 64), "short");
}

TEST(FormatTest, PreviewTruncatesToWidth) {
  EXPECT_EQ(make_preview("abcdefghij", 4), "abcd");
}

TEST(FormatTest, PreviewCountsEscapes) {
  // "a\nb" escapes to 4 bytes
  EXPECT_EQ(make_preview("a\nb", 3), "a\\n");
}

TEST(FormatTest, PreviewNeverSplitsUtf8) {
  // "é" is two bytes; a cut after its first byte backs off
  std::string text = "ab\xC3\xA9" "cd";
  EXPECT_EQ(make_preview(text, 3), "ab");
  EXPECT_EQ(make_preview(text, 4), "ab\xC3\xA9");
}

TEST(FormatTest, PopupTruncation) {
  std::string small(POPUP_TEXT_LIMIT, 'a');
  EXPECT_EQ(truncate_for_popup(small), small);

  std::string large(POPUP_TEXT_LIMIT + 1, 'b');
  std::string shortened = truncate_for_popup(large);
  EXPECT_EQ(shortened, std::string(POPUP_TEXT_KEEP, 'b') + "\n...\n");
}

TEST(FormatTest, PopupTruncationKeepsUtf8Whole) {
  // Two-byte "é" straddles the cut point
  std::string text(POPUP_TEXT_KEEP - 1, 'a');
  text += "\xC3\xA9";
  text += std::string(POPUP_TEXT_LIMIT, 'z');

  std::string shortened = truncate_for_popup(text);
  EXPECT_EQ(shortened, std::string(POPUP_TEXT_KEEP - 1, 'a') + "\n...\n");
}

// ============================================================================
// Status
// ============================================================================

TEST(FormatTest, StatusForEntry) {
  auto entry = ClipboardEntry::from_text("two\nlines");
  EXPECT_EQ(format_status(entry), "Set Clipboard to \"two\\nlines\"");
}

TEST(FormatTest, StatusForNoEntry) {
  EXPECT_EQ(format_status(std::nullopt), "Nothing in history");
}

// ============================================================================
// Output Panels
// ============================================================================

TEST(FormatTest, HistoryPanel) {
  std::vector<std::string> texts = {"newest", "first\nsecond"};

  std::string expected = " CLIPBOARD HISTORY (2)\n"
                         "=======================\n"
                         "-->   1. newest\n"
                         "      2. first\n"
                         "       > second\n";
  EXPECT_EQ(format_history_panel("CLIPBOARD", texts, 0), expected);
}

TEST(FormatTest, HistoryPanelMarksCursor) {
  std::vector<std::string> texts = {"c", "b", "a"};

  std::string panel = format_history_panel("YANK", texts, 2);
  EXPECT_NE(panel.find(" YANK HISTORY (3)\n"), std::string::npos);
  EXPECT_NE(panel.find("-->   3. a\n"), std::string::npos);
  EXPECT_NE(panel.find("      1. c\n"), std::string::npos);
}

TEST(FormatTest, HistoryPanelEscapesTabsAndLineEndings) {
  std::vector<std::string> texts = {"a\tb\r\nc"};

  std::string panel = format_history_panel("CLIPBOARD", texts, std::nullopt);
  EXPECT_NE(panel.find("      1. a\\tb\n       > c\n"), std::string::npos);
}

TEST(FormatTest, EmptyHistoryPanel) {
  std::string panel = format_history_panel("CLIPBOARD", {}, std::nullopt);
  EXPECT_EQ(panel, " CLIPBOARD HISTORY (0)\n=======================\n");
}

TEST(FormatTest, HistoryPanelKeepsLastThreeDigits) {
  std::vector<std::string> texts(1000, "x");

  std::string panel = format_history_panel("CLIPBOARD", texts, std::nullopt);
  EXPECT_NE(panel.find("    999. x\n"), std::string::npos);
  EXPECT_NE(panel.find("    000. x\n"), std::string::npos);
}

TEST(FormatTest, RegisterPanel) {
  std::vector<std::pair<char, std::string>> registers = {
      {'a', "alpha"}, {'b', "two\nlines"}};

  std::string expected = " CLIPBOARD REGISTERS (2)\n"
                         "========================\n"
                         "a: alpha\n"
                         "b: two\n"
                         " > lines\n";
  EXPECT_EQ(format_register_panel(registers), expected);
}
