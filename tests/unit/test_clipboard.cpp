/**
 * @file test_clipboard.cpp
 * @brief Unit tests for the clipboard history manager
 */

#include <clipman/clipman.h>
#include <gtest/gtest.h>

using namespace clipman;

namespace {

/// Port whose reads and writes can be made to fail
class FlakyPort : public ClipboardSyncPort {
public:
  bool fail_writes = false;
  bool fail_reads = false;
  std::string text;
  int writes = 0;

  Result<void> write(const std::string &t) override {
    if (fail_writes) {
      return Error(ErrorCode::ClipboardWriteFailed, "write refused");
    }
    text = t;
    ++writes;
    return Result<void>::ok();
  }

  Result<std::string> read() override {
    if (fail_reads) {
      return Error(ErrorCode::ClipboardReadFailed, "read refused");
    }
    return text;
  }

  std::string name() const override { return "flaky"; }
};

std::string text_of(const Result<std::optional<PasteText>> &result) {
  if (result.is_error()) {
    return "<error>";
  }
  return result.value() ? result.value()->text : "<none>";
}

} // namespace

class ClipboardManagerTest : public ::testing::Test {
protected:
  std::shared_ptr<MemoryClipboardPort> port =
      std::make_shared<MemoryClipboardPort>();
  ClipboardManager manager{port};

  void SetUp() override { ASSERT_TRUE(manager.init().is_ok()); }

  void TearDown() override { manager.shutdown(); }

  void copy_all(std::initializer_list<const char *> texts) {
    for (const char *text : texts) {
      ASSERT_TRUE(manager.copy(text).is_ok());
    }
  }
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ClipboardManagerTest, DoubleInitialize) {
  EXPECT_TRUE(manager.is_initialized());

  auto result = manager.init();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::AlreadyInitialized);
}

TEST_F(ClipboardManagerTest, ShutdownDropsState) {
  copy_all({"a"});
  ASSERT_TRUE(manager.copy_to_register("r", "reg").is_ok());

  manager.shutdown();
  EXPECT_FALSE(manager.is_initialized());
  EXPECT_EQ(manager.history_size(), 0u);
  EXPECT_TRUE(manager.describe_registers().empty());
}

TEST(ClipboardManagerInitTest, SeedsHistoryFromClipboard) {
  auto port = std::make_shared<MemoryClipboardPort>("already there");
  ClipboardManager manager(port);
  ASSERT_TRUE(manager.init().is_ok());

  EXPECT_EQ(manager.history_size(), 1u);
  EXPECT_EQ(manager.current()->text(), "already there");
  EXPECT_EQ(port->write_count(), 0u);
}

TEST(ClipboardManagerInitTest, SeedingCanBeDisabled) {
  auto port = std::make_shared<MemoryClipboardPort>("already there");
  ClipboardManager manager(port);

  ManagerConfig config;
  config.seed_from_clipboard = false;
  ASSERT_TRUE(manager.init(config).is_ok());

  EXPECT_EQ(manager.history_size(), 0u);
}

TEST(ClipboardManagerInitTest, SeedReadFailureIsNotFatal) {
  auto port = std::make_shared<FlakyPort>();
  port->fail_reads = true;
  ClipboardManager manager(port);

  EXPECT_TRUE(manager.init().is_ok());
  EXPECT_EQ(manager.history_size(), 0u);
}

TEST(ClipboardManagerInitTest, DefaultPortIsInMemory) {
  ClipboardManager manager;
  ASSERT_TRUE(manager.init().is_ok());
  ASSERT_TRUE(manager.copy("x").is_ok());
  EXPECT_EQ(text_of(manager.paste_current()), "x");
}

// ============================================================================
// History Scenarios
// ============================================================================

TEST_F(ClipboardManagerTest, NavigateBackThroughHistory) {
  copy_all({"foo", "bar", "baz"});
  EXPECT_EQ(manager.current()->text(), "baz");

  EXPECT_EQ(text_of(manager.previous_and_get_text()), "bar");
  EXPECT_EQ(text_of(manager.previous_and_get_text()), "foo");
  EXPECT_EQ(text_of(manager.previous_and_get_text()), "foo");
  EXPECT_EQ(manager.cursor_state(), CursorState::AtOldest);

  EXPECT_EQ(text_of(manager.next_and_get_text()), "bar");
  EXPECT_EQ(port->peek(), "bar");
}

TEST_F(ClipboardManagerTest, RepeatedCopyKeepsOneEntry) {
  copy_all({"x", "x"});
  EXPECT_EQ(manager.history_size(), 1u);
}

TEST_F(ClipboardManagerTest, EmptyHistoryIsNotAnError) {
  auto next = manager.next_and_get_text();
  ASSERT_TRUE(next.is_ok());
  EXPECT_FALSE(next.value().has_value());

  auto paste = manager.paste_current();
  ASSERT_TRUE(paste.is_ok());
  EXPECT_FALSE(paste.value().has_value());

  EXPECT_EQ(manager.cursor_state(), CursorState::Empty);
  EXPECT_EQ(port->write_count(), 0u);
}

TEST_F(ClipboardManagerTest, NavigationRemirrorsSingleEntry) {
  copy_all({"alpha"});
  EXPECT_EQ(port->peek(), "alpha");
  EXPECT_EQ(port->write_count(), 1u);

  EXPECT_EQ(text_of(manager.previous_and_get_text()), "alpha");
  EXPECT_EQ(port->peek(), "alpha");
  EXPECT_EQ(port->write_count(), 2u);
}

TEST_F(ClipboardManagerTest, CutBehavesLikeCopy) {
  auto entry = manager.cut("removed");
  ASSERT_TRUE(entry.is_ok());
  ASSERT_TRUE(entry.value().has_value());
  EXPECT_EQ(entry.value()->text(), "removed");
  EXPECT_EQ(port->peek(), "removed");
}

TEST_F(ClipboardManagerTest, EmptyCopyAcceptedByDefault) {
  auto entry = manager.copy("");
  ASSERT_TRUE(entry.is_ok());
  EXPECT_TRUE(entry.value().has_value());
  EXPECT_EQ(manager.history_size(), 1u);
}

TEST(ClipboardManagerConfigTest, EmptyCopyIgnoredWhenConfigured) {
  auto port = std::make_shared<MemoryClipboardPort>();
  ClipboardManager manager(port);

  ManagerConfig config;
  config.ignore_empty_copies = true;
  ASSERT_TRUE(manager.init(config).is_ok());

  auto entry = manager.copy("");
  ASSERT_TRUE(entry.is_ok());
  EXPECT_FALSE(entry.value().has_value());
  EXPECT_EQ(manager.history_size(), 0u);
  EXPECT_EQ(port->write_count(), 0u);
}

// ============================================================================
// Paste Options
// ============================================================================

TEST_F(ClipboardManagerTest, IndentOptionIsThreadedThrough) {
  copy_all({"code"});

  PasteOptions options;
  options.indent = true;
  auto result = manager.paste_current(options);
  ASSERT_TRUE(result.is_ok());
  ASSERT_TRUE(result.value().has_value());
  EXPECT_TRUE(result.value()->indent);

  auto plain = manager.paste_current();
  EXPECT_FALSE(plain.value()->indent);
}

TEST_F(ClipboardManagerTest, PopRemovesPastedEntry) {
  copy_all({"a", "b"});

  PasteOptions options;
  options.pop = true;
  EXPECT_EQ(text_of(manager.paste_current(options)), "b");

  EXPECT_EQ(manager.history_size(), 1u);
  EXPECT_EQ(manager.current()->text(), "a");
  EXPECT_EQ(port->peek(), "a");
}

TEST_F(ClipboardManagerTest, PopLastEntryLeavesEmptyHistory) {
  copy_all({"only"});

  PasteOptions options;
  options.pop = true;
  EXPECT_EQ(text_of(manager.paste_current(options)), "only");
  EXPECT_EQ(manager.history_size(), 0u);
  EXPECT_EQ(port->peek(), "only");
}

// ============================================================================
// Jumps and Selection
// ============================================================================

TEST_F(ClipboardManagerTest, SelectByIndex) {
  copy_all({"a", "b", "c"});

  EXPECT_EQ(text_of(manager.select_and_get_text(1)), "b");
  EXPECT_EQ(port->peek(), "b");
  EXPECT_EQ(manager.cursor_state(), CursorState::AtOlder);
}

TEST_F(ClipboardManagerTest, SelectOutOfRangeMirrorsNothing) {
  copy_all({"a"});
  size_t writes = port->write_count();

  auto result = manager.select_and_get_text(3);
  ASSERT_TRUE(result.is_ok());
  EXPECT_FALSE(result.value().has_value());
  EXPECT_EQ(port->write_count(), writes);
}

TEST_F(ClipboardManagerTest, OldestAndNewest) {
  copy_all({"a", "b", "c"});

  EXPECT_EQ(text_of(manager.oldest_and_get_text()), "a");
  EXPECT_EQ(port->peek(), "a");
  EXPECT_EQ(text_of(manager.newest_and_get_text()), "c");
  EXPECT_EQ(port->peek(), "c");
}

TEST_F(ClipboardManagerTest, ClearHistoryKeepsRegisters) {
  copy_all({"a", "b"});
  ASSERT_TRUE(manager.copy_to_register("k", "kept").is_ok());

  manager.clear_history();
  EXPECT_EQ(manager.history_size(), 0u);
  EXPECT_EQ(text_of(manager.paste_from_register("k")), "kept");
}

// ============================================================================
// Registers
// ============================================================================

TEST_F(ClipboardManagerTest, RegisterRoundTrip) {
  ASSERT_TRUE(manager.copy_to_register("a", "hello").is_ok());

  EXPECT_EQ(text_of(manager.paste_from_register("a")), "hello");

  auto missing = manager.paste_from_register("b");
  ASSERT_TRUE(missing.is_ok());
  EXPECT_FALSE(missing.value().has_value());
}

TEST_F(ClipboardManagerTest, RegistersDoNotTouchHistory) {
  copy_all({"history"});
  ASSERT_TRUE(manager.copy_to_register("a", "register").is_ok());

  EXPECT_EQ(manager.history_size(), 1u);
  EXPECT_EQ(manager.current()->text(), "history");
  EXPECT_EQ(port->peek(), "register");
}

TEST_F(ClipboardManagerTest, RegistersSurviveEviction) {
  ManagerConfig config = manager.get_config();
  config.history_capacity = 1;
  manager.set_config(config);

  copy_all({"a"});
  ASSERT_TRUE(manager.copy_to_register("1", "a").is_ok());
  copy_all({"b", "c"});

  EXPECT_EQ(manager.history_size(), 1u);
  EXPECT_EQ(text_of(manager.paste_from_register("1")), "a");
}

TEST_F(ClipboardManagerTest, InvalidRegisterKeyLeavesStateUntouched) {
  Error reported;
  manager.on_error([&reported](const Error &e) { reported = e; });

  auto result = manager.copy_to_register("ab", "text");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidRegisterKey);
  EXPECT_EQ(reported.code, ErrorCode::InvalidRegisterKey);

  EXPECT_TRUE(manager.describe_registers().empty());
  EXPECT_EQ(port->write_count(), 0u);

  auto paste = manager.paste_from_register("");
  ASSERT_TRUE(paste.is_error());
  EXPECT_EQ(paste.error().code, ErrorCode::InvalidRegisterKey);
}

TEST_F(ClipboardManagerTest, SetClipboardFromRegister) {
  ASSERT_TRUE(manager.copy_to_register("q", "quoted").is_ok());
  copy_all({"later"});

  auto entry = manager.set_clipboard_from_register("q");
  ASSERT_TRUE(entry.is_ok());
  ASSERT_TRUE(entry.value().has_value());
  EXPECT_EQ(port->peek(), "quoted");
  EXPECT_EQ(manager.current()->text(), "later");

  auto unset = manager.set_clipboard_from_register("z");
  ASSERT_TRUE(unset.is_ok());
  EXPECT_FALSE(unset.value().has_value());
  EXPECT_EQ(port->peek(), "quoted");
}

TEST_F(ClipboardManagerTest, ResetRegisterGroup) {
  ASSERT_TRUE(manager.copy_to_register("1", "one").is_ok());
  ASSERT_TRUE(manager.copy_to_register("a", "alpha").is_ok());

  EXPECT_EQ(manager.reset_registers(RegisterGroup::Digits), 1u);
  auto lines = manager.describe_registers();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].key, 'a');

  EXPECT_EQ(manager.reset_registers(), 1u);
  EXPECT_TRUE(manager.describe_registers().empty());
}

// ============================================================================
// Clipboard Failures
// ============================================================================

TEST(ClipboardManagerFailureTest, WriteFailureKeepsHistory) {
  auto port = std::make_shared<FlakyPort>();
  ClipboardManager manager(port);
  ASSERT_TRUE(manager.init().is_ok());

  std::vector<ErrorCode> reported;
  manager.on_error([&reported](const Error &e) { reported.push_back(e.code); });

  port->fail_writes = true;
  auto result = manager.copy("kept anyway");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ClipboardWriteFailed);
  EXPECT_TRUE(is_clipboard_error(result.error().code));

  EXPECT_EQ(manager.history_size(), 1u);
  EXPECT_EQ(manager.current()->text(), "kept anyway");
  ASSERT_EQ(reported.size(), 1u);
  EXPECT_EQ(reported[0], ErrorCode::ClipboardWriteFailed);
}

TEST(ClipboardManagerFailureTest, NavigationFailurePropagates) {
  auto port = std::make_shared<FlakyPort>();
  ClipboardManager manager(port);
  ASSERT_TRUE(manager.init().is_ok());
  ASSERT_TRUE(manager.copy("a").is_ok());
  ASSERT_TRUE(manager.copy("b").is_ok());

  port->fail_writes = true;
  auto result = manager.previous_and_get_text();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ClipboardWriteFailed);

  // Cursor moved even though the clipboard could not follow
  EXPECT_EQ(manager.current()->text(), "a");
}

TEST(ClipboardManagerFailureTest, RegisterStoredBeforeWriteFailure) {
  auto port = std::make_shared<FlakyPort>();
  ClipboardManager manager(port);
  ASSERT_TRUE(manager.init().is_ok());

  port->fail_writes = true;
  auto result = manager.copy_to_register("a", "value");
  ASSERT_TRUE(result.is_error());

  port->fail_writes = false;
  EXPECT_EQ(text_of(manager.paste_from_register("a")), "value");
}

// ============================================================================
// External Changes
// ============================================================================

TEST_F(ClipboardManagerTest, PollPicksUpExternalCopy) {
  copy_all({"mine"});

  auto unchanged = manager.poll_external();
  ASSERT_TRUE(unchanged.is_ok());
  EXPECT_FALSE(unchanged.value().has_value());

  ASSERT_TRUE(port->write("theirs").is_ok());
  size_t writes = port->write_count();

  auto picked = manager.poll_external();
  ASSERT_TRUE(picked.is_ok());
  ASSERT_TRUE(picked.value().has_value());
  EXPECT_EQ(picked.value()->text(), "theirs");
  EXPECT_EQ(manager.history_size(), 2u);
  EXPECT_EQ(manager.current()->text(), "theirs");

  // Adopted text is not written back and not picked up twice
  EXPECT_EQ(port->write_count(), writes);
  EXPECT_FALSE(manager.poll_external().value().has_value());
}

TEST_F(ClipboardManagerTest, PollIgnoresNavigationMirror) {
  copy_all({"a", "b"});
  ASSERT_TRUE(manager.previous_and_get_text().is_ok());

  auto polled = manager.poll_external();
  ASSERT_TRUE(polled.is_ok());
  EXPECT_FALSE(polled.value().has_value());
  EXPECT_EQ(manager.history_size(), 2u);
}

TEST_F(ClipboardManagerTest, PollIgnoresEmptyClipboard) {
  auto polled = manager.poll_external();
  ASSERT_TRUE(polled.is_ok());
  EXPECT_FALSE(polled.value().has_value());
  EXPECT_EQ(manager.history_size(), 0u);
}

TEST(ClipboardManagerFailureTest, PollReportsReadFailure) {
  auto port = std::make_shared<FlakyPort>();
  ClipboardManager manager(port);
  ASSERT_TRUE(manager.init().is_ok());

  port->fail_reads = true;
  auto polled = manager.poll_external();
  ASSERT_TRUE(polled.is_error());
  EXPECT_EQ(polled.error().code, ErrorCode::ClipboardReadFailed);
}

// ============================================================================
// Yank Stack
// ============================================================================

TEST_F(ClipboardManagerTest, YankReplaysCopiesInOrder) {
  EXPECT_TRUE(manager.is_yank_mode());
  copy_all({"one", "two", "three"});
  EXPECT_EQ(manager.yank_stack_size(), 3u);

  EXPECT_EQ(text_of(manager.yank()), "one");
  EXPECT_EQ(port->peek(), "one");
  EXPECT_EQ(text_of(manager.yank()), "two");
  EXPECT_EQ(text_of(manager.yank()), "three");
  EXPECT_EQ(text_of(manager.yank()), "<none>");

  // History is unaffected by yanking
  EXPECT_EQ(manager.history_size(), 3u);
}

TEST_F(ClipboardManagerTest, ChosenYankContinuesTowardNewer) {
  copy_all({"a", "b", "c", "d"});

  // Display order: d c b a
  auto chosen = manager.select_and_yank(2, PasteOptions{true, false});
  ASSERT_TRUE(chosen.is_ok());
  ASSERT_TRUE(chosen.value().has_value());
  EXPECT_EQ(chosen.value()->text, "b");
  EXPECT_TRUE(chosen.value()->indent);
  EXPECT_EQ(port->peek(), "b");
  EXPECT_EQ(manager.yank_stack_size(), 3u);

  EXPECT_EQ(text_of(manager.yank()), "c");
  EXPECT_EQ(text_of(manager.yank()), "d");
  EXPECT_EQ(text_of(manager.yank()), "a");
  EXPECT_EQ(text_of(manager.yank()), "<none>");
}

TEST_F(ClipboardManagerTest, ChosenYankOutOfRange) {
  copy_all({"a", "b"});
  size_t writes = port->write_count();

  EXPECT_EQ(text_of(manager.select_and_yank(5)), "<none>");
  EXPECT_EQ(manager.yank_stack_size(), 2u);
  EXPECT_EQ(port->write_count(), writes);
}

TEST_F(ClipboardManagerTest, CopyAfterChosenYankRestartsFromOldest) {
  copy_all({"a", "b", "c"});
  EXPECT_EQ(text_of(manager.select_and_yank(0)), "c");

  copy_all({"d"});
  EXPECT_EQ(text_of(manager.yank()), "a");
  EXPECT_EQ(text_of(manager.yank()), "b");
  EXPECT_EQ(text_of(manager.yank()), "d");
}

TEST_F(ClipboardManagerTest, YankModeOffSkipsStack) {
  manager.set_yank_mode(false);
  copy_all({"a"});
  EXPECT_EQ(manager.yank_stack_size(), 0u);
  EXPECT_EQ(manager.history_size(), 1u);
}

TEST_F(ClipboardManagerTest, ClearYankStack) {
  copy_all({"a", "b"});
  manager.clear_yank_stack();
  EXPECT_EQ(manager.yank_stack_size(), 0u);
  EXPECT_EQ(manager.history_size(), 2u);
}

TEST(ClipboardManagerYankTest, ExplicitYankModeBypassesHistory) {
  ClipboardManager manager;
  ManagerConfig config;
  config.explicit_yank_mode = true;
  ASSERT_TRUE(manager.init(config).is_ok());
  EXPECT_FALSE(manager.is_yank_mode());

  ASSERT_TRUE(manager.copy("a").is_ok());
  EXPECT_EQ(manager.yank_stack_size(), 0u);
  EXPECT_EQ(manager.history_size(), 1u);

  manager.set_yank_mode(true);
  auto entry = manager.copy("b");
  ASSERT_TRUE(entry.is_ok());
  EXPECT_EQ(entry.value()->text(), "b");
  ASSERT_TRUE(manager.copy("c").is_ok());
  EXPECT_EQ(manager.yank_stack_size(), 2u);
  EXPECT_EQ(manager.history_size(), 1u);

  EXPECT_EQ(text_of(manager.yank()), "b");

  manager.set_yank_mode(false);
  EXPECT_EQ(manager.yank_stack_size(), 0u);
}

TEST(ClipboardManagerYankTest, YankModeEndsOnEmptyStack) {
  ClipboardManager manager;
  ManagerConfig config;
  config.explicit_yank_mode = true;
  config.end_yank_mode_on_empty = true;
  ASSERT_TRUE(manager.init(config).is_ok());

  manager.set_yank_mode(true);
  ASSERT_TRUE(manager.copy("x").is_ok());
  ASSERT_TRUE(manager.copy("y").is_ok());

  EXPECT_EQ(text_of(manager.yank()), "x");
  EXPECT_TRUE(manager.is_yank_mode());
  EXPECT_EQ(text_of(manager.yank()), "y");
  EXPECT_FALSE(manager.is_yank_mode());
}

// ============================================================================
// Display
// ============================================================================

TEST_F(ClipboardManagerTest, RenderHistoryMatchesPanelFormat) {
  copy_all({"a", "b"});

  EXPECT_EQ(manager.render_history(),
            format_history_panel("CLIPBOARD", {"b", "a"}, 0));

  ASSERT_TRUE(manager.previous_and_get_text().is_ok());
  EXPECT_EQ(manager.render_history(),
            format_history_panel("CLIPBOARD", {"b", "a"}, 1));
}

TEST_F(ClipboardManagerTest, RenderRegistersAndYank) {
  ASSERT_TRUE(manager.copy_to_register("a", "alpha").is_ok());
  copy_all({"y"});

  EXPECT_EQ(manager.render_registers(),
            format_register_panel({{'a', "alpha"}}));
  EXPECT_NE(manager.render_yank_stack().find(" YANK HISTORY (1)"),
            std::string::npos);
}

TEST_F(ClipboardManagerTest, StatusMessage) {
  EXPECT_EQ(manager.status_message(), "Nothing in history");
  copy_all({"tab\there"});
  EXPECT_EQ(manager.status_message(), "Set Clipboard to \"tab\\there\"");
}

TEST_F(ClipboardManagerTest, DescribeHistoryUsesPreviewWidth) {
  ManagerConfig config = manager.get_config();
  config.preview_width = 8;
  manager.set_config(config);

  copy_all({"0123456789abcdef"});
  auto lines = manager.describe_history();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].preview, "01234567");
  EXPECT_TRUE(lines[0].is_current);
}

TEST_F(ClipboardManagerTest, ShrinkingCapacityEvicts) {
  copy_all({"1", "2", "3", "4"});

  ManagerConfig config = manager.get_config();
  config.history_capacity = 2;
  manager.set_config(config);

  EXPECT_EQ(manager.history_size(), 2u);
  EXPECT_EQ(manager.get_config().history_capacity, 2u);
}

// ============================================================================
// Callbacks
// ============================================================================

TEST_F(ClipboardManagerTest, ChangeCallbackFires) {
  int changes = 0;
  manager.on_history_changed([&changes] { ++changes; });

  copy_all({"a", "b"});
  EXPECT_EQ(changes, 2);

  ASSERT_TRUE(manager.paste_current().is_ok());
  EXPECT_EQ(changes, 2);

  ASSERT_TRUE(manager.previous_and_get_text().is_ok());
  EXPECT_EQ(changes, 3);

  manager.clear_history();
  EXPECT_EQ(changes, 4);
}

TEST_F(ClipboardManagerTest, CallbackMayCallBackIntoManager) {
  size_t seen = 0;
  manager.on_history_changed([this, &seen] { seen = manager.history_size(); });

  copy_all({"a", "b"});
  EXPECT_EQ(seen, 2u);
}
