/**
 * @file test_error.cpp
 * @brief Unit tests for error codes and the Result type
 */

#include <clipman/clipman.h>
#include <gtest/gtest.h>

using namespace clipman;

namespace {

Result<int> parse_positive(int value) {
  CLIPMAN_REQUIRE(value > 0, ErrorCode::InvalidArgument, "must be positive");
  return value;
}

Result<void> check_ready(bool ready) {
  if (!ready) {
    return Error(ErrorCode::NotInitialized, "not ready");
  }
  return Result<void>::ok();
}

Result<int> doubled_when_ready(bool ready, int value) {
  CLIPMAN_TRY(check_ready(ready));
  return value * 2;
}

} // namespace

// ============================================================================
// Error Codes
// ============================================================================

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(error_code_name(ErrorCode::Success), "Success");
  EXPECT_STREQ(error_code_name(ErrorCode::InvalidRegisterKey),
               "InvalidRegisterKey");
  EXPECT_STREQ(error_code_name(ErrorCode::ClipboardVerifyFailed),
               "ClipboardVerifyFailed");
  EXPECT_STREQ(error_code_name(ErrorCode::ConfigParseError),
               "ConfigParseError");
}

TEST(ErrorTest, CodeDescriptions) {
  EXPECT_STREQ(error_code_description(ErrorCode::InvalidRegisterKey),
               "Register key must be a single printable character");
  EXPECT_STREQ(error_code_description(ErrorCode::InvalidConfigValue),
               "Configuration value out of range");
}

TEST(ErrorTest, Recoverability) {
  EXPECT_TRUE(is_recoverable(ErrorCode::ClipboardWriteFailed));
  EXPECT_TRUE(is_recoverable(ErrorCode::InvalidRegisterKey));
  EXPECT_FALSE(is_recoverable(ErrorCode::NotSupported));
  EXPECT_FALSE(is_recoverable(ErrorCode::ClipboardUnavailable));
  EXPECT_FALSE(is_recoverable(ErrorCode::ClipboardToolMissing));
}

TEST(ErrorTest, ClipboardGroup) {
  EXPECT_TRUE(is_clipboard_error(ErrorCode::ClipboardReadFailed));
  EXPECT_TRUE(is_clipboard_error(ErrorCode::ClipboardToolMissing));
  EXPECT_FALSE(is_clipboard_error(ErrorCode::InvalidRegisterKey));
  EXPECT_FALSE(is_clipboard_error(ErrorCode::ConfigReadError));
}

TEST(ErrorTest, ToString) {
  Error error(ErrorCode::ClipboardWriteFailed, "Clipboard command failed",
              "xclip");
  EXPECT_EQ(error.to_string(),
            "ClipboardWriteFailed: Clipboard command failed (xclip)");

  error.location = "write_clipboard_text";
  EXPECT_EQ(error.to_string(), "ClipboardWriteFailed: Clipboard command "
                               "failed (xclip) [write_clipboard_text]");

  EXPECT_EQ(Error(ErrorCode::Timeout).to_string(), "Timeout");
}

TEST(ErrorTest, OkError) {
  Error ok = Error::ok();
  EXPECT_TRUE(ok.is_ok());
  EXPECT_FALSE(ok.is_error());
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, HoldsValue) {
  Result<std::string> result(std::string("text"));
  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), "text");
  EXPECT_EQ(result.value_or("other"), "text");
}

TEST(ResultTest, HoldsError) {
  Result<std::string> result(ErrorCode::ClipboardReadFailed, "no pipe");
  ASSERT_TRUE(result.is_error());
  EXPECT_FALSE(static_cast<bool>(result));
  EXPECT_EQ(result.error().code, ErrorCode::ClipboardReadFailed);
  EXPECT_EQ(result.error().message, "no pipe");
  EXPECT_EQ(result.value_or("fallback"), "fallback");
}

TEST(ResultTest, VoidResult) {
  Result<void> ok = Result<void>::ok();
  EXPECT_TRUE(ok.is_ok());

  Result<void> failed(ErrorCode::InvalidState);
  ASSERT_TRUE(failed.is_error());
  EXPECT_EQ(failed.error().code, ErrorCode::InvalidState);
}

TEST(ResultTest, RequireMacro) {
  EXPECT_EQ(parse_positive(4).value(), 4);

  auto result = parse_positive(-1);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
  EXPECT_EQ(result.error().message, "must be positive");
}

TEST(ResultTest, TryMacroPropagates) {
  EXPECT_EQ(doubled_when_ready(true, 21).value(), 42);

  auto result = doubled_when_ready(false, 21);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NotInitialized);
  EXPECT_EQ(result.error().message, "not ready");
}
