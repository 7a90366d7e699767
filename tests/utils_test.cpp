/**
 * @file utils_test.cpp
 * @brief 文本解码、按行切分和枚举名称
 */

#include <gtest/gtest.h>
#include "core/utils.h"
#include "core/types.h"
#include "core/logger.h"
#include "sandbox/process.h"
#include "test_helpers.h"

using namespace ojt;

using Lines = std::vector<std::string>;

//==============================================================================
// UTF-8 校验与 Latin-1 回退
//==============================================================================

TEST(Utf8Test, AcceptsWellFormedText) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii\n"));
    EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9"));
    EXPECT_TRUE(is_valid_utf8("\xe4\xb8\xad\xe6\x96\x87"));
    EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x98\x80"));
    EXPECT_TRUE(is_valid_utf8("\xf4\x8f\xbf\xbf"));   // U+10FFFF
}

TEST(Utf8Test, RejectsOverlongEncodings) {
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));
    EXPECT_FALSE(is_valid_utf8("\xc1\xbf"));
    EXPECT_FALSE(is_valid_utf8("\xe0\x80\xaf"));
    EXPECT_FALSE(is_valid_utf8("\xf0\x80\x80\xaf"));
}

TEST(Utf8Test, RejectsSurrogatesAndOutOfRange) {
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));       // U+D800
    EXPECT_FALSE(is_valid_utf8("\xed\xbf\xbf"));       // U+DFFF
    EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));   // U+110000
    EXPECT_FALSE(is_valid_utf8("\xf8\x88\x80\x80\x80"));
}

TEST(Utf8Test, RejectsTruncatedAndStrayBytes) {
    EXPECT_FALSE(is_valid_utf8("\xe2\x82"));
    EXPECT_FALSE(is_valid_utf8("abc\xc3"));
    EXPECT_FALSE(is_valid_utf8("\x80"));
    EXPECT_FALSE(is_valid_utf8("\xc3\x28"));
    EXPECT_FALSE(is_valid_utf8("\xff\n"));
}

TEST(Utf8Test, Latin1MapsEachByteToItsCodePoint) {
    EXPECT_EQ(latin1_to_utf8("abc"), "abc");
    EXPECT_EQ(latin1_to_utf8("\xe9"), "\xc3\xa9");
    EXPECT_EQ(latin1_to_utf8("\x80\xff"), "\xc2\x80\xc3\xbf");
}

TEST(Utf8Test, DecodeKeepsValidUtf8) {
    EXPECT_EQ(decode_text("caf\xc3\xa9\n"), "caf\xc3\xa9\n");
    EXPECT_EQ(decode_text(""), "");
}

TEST(Utf8Test, DecodeFallsBackToLatin1) {
    EXPECT_EQ(decode_text("\xff\n"), "\xc3\xbf\n");
    EXPECT_EQ(decode_text("caf\xe9\n"), "caf\xc3\xa9\n");
    // 一个非法序列就让整段按 Latin-1 解读
    EXPECT_EQ(decode_text("\xc3\xa9\xe9"), "\xc3\x83\xc2\xa9\xc3\xa9");
    EXPECT_EQ(decode_text("\xed\xa0\x80"), "\xc3\xad\xc2\xa0\xc2\x80");
}

class ReadTextFileTest : public ojt_test::TempDirTest {};

TEST_F(ReadTextFileTest, ReadsUtf8Verbatim) {
    auto path = write_file("u.txt", "\xe4\xb8\xad\r\n2\n");
    auto r = read_text_file(path.string());
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value(), "\xe4\xb8\xad\r\n2\n");
}

TEST_F(ReadTextFileTest, ReencodesLatin1File) {
    auto path = write_file("l.txt", std::string("na\xefve\n\xff\n"));
    auto r = read_text_file(path.string());
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    EXPECT_EQ(r.value(), "na\xc3\xafve\n\xc3\xbf\n");
}

TEST_F(ReadTextFileTest, KeepsEmbeddedNul) {
    auto path = write_file("z.txt", std::string("a\0b", 3));
    auto r = read_text_file(path.string());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), std::string("a\0b", 3));
}

TEST_F(ReadTextFileTest, MissingFileIsReadError) {
    auto r = read_text_file((work_dir / "absent.txt").string());
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::FILE_READ_ERROR);
    EXPECT_NE(r.error().message().find("absent.txt"), std::string::npos);
}

//==============================================================================
// 按行切分
//==============================================================================

TEST(SplitLinesTest, CommonTerminators) {
    EXPECT_EQ(split_lines(""), Lines{});
    EXPECT_EQ(split_lines("a"), (Lines{"a"}));
    EXPECT_EQ(split_lines("a\nb"), (Lines{"a", "b"}));
    EXPECT_EQ(split_lines("a\r\nb\r\n"), (Lines{"a", "b"}));
    EXPECT_EQ(split_lines("a\rb"), (Lines{"a", "b"}));
    EXPECT_EQ(split_lines("a\n\rb"), (Lines{"a", "", "b"}));
}

TEST(SplitLinesTest, TrailingTerminatorAddsNoLine) {
    EXPECT_EQ(split_lines("a\n"), (Lines{"a"}));
    EXPECT_EQ(split_lines("a\n\n"), (Lines{"a", ""}));
    EXPECT_EQ(split_lines("\n"), (Lines{""}));
}

TEST(SplitLinesTest, ControlCharacterBoundaries) {
    EXPECT_EQ(split_lines("a\vb"), (Lines{"a", "b"}));
    EXPECT_EQ(split_lines("a\fb"), (Lines{"a", "b"}));
    EXPECT_EQ(split_lines("a\x1c" "b\x1d" "c\x1e" "d"), (Lines{"a", "b", "c", "d"}));
    // \x1f 和制表符不是行结束符
    EXPECT_EQ(split_lines("a\x1f" "b\tc"), (Lines{"a\x1f" "b\tc"}));
}

TEST(SplitLinesTest, UnicodeBoundaries) {
    EXPECT_EQ(split_lines("a\xc2\x85" "b"), (Lines{"a", "b"}));
    EXPECT_EQ(split_lines("a\xe2\x80\xa8" "b\xe2\x80\xa9"), (Lines{"a", "b"}));
    // 同一前缀的其他字符保持原样
    EXPECT_EQ(split_lines("\xc2\xa9\xe2\x80\x94"), (Lines{"\xc2\xa9\xe2\x80\x94"}));
    // Latin-1 解码得到的 U+0085 同样切分
    EXPECT_EQ(split_lines(decode_text("x\x85y")), (Lines{"x", "y"}));
}

//==============================================================================
// 枚举名称
//==============================================================================

TEST(EnumNameTest, StatusNames) {
    EXPECT_STREQ(status_to_string(Status::AC), "AC");
    EXPECT_STREQ(status_to_string(Status::WA), "WA");
    EXPECT_STREQ(status_to_string(Status::TLE), "TLE");
    EXPECT_STREQ(status_to_string(Status::RE), "RE");
    EXPECT_STREQ(status_to_string(Status::MISSING), "MISSING");
    EXPECT_STREQ(status_description(Status::AC), "Accepted");
    EXPECT_STREQ(status_description(Status::WA), "Wrong Answer");
    EXPECT_STREQ(status_description(Status::TLE), "Time Limit Exceeded");
    EXPECT_STREQ(status_description(Status::RE), "Runtime Error");
    EXPECT_STREQ(status_description(Status::MISSING), "Missing Expected Output");
}

TEST(EnumNameTest, ExitKindAndErrorCodeNames) {
    EXPECT_STREQ(sandbox::exit_kind_to_string(sandbox::ExitKind::EXITED), "EXITED");
    EXPECT_STREQ(sandbox::exit_kind_to_string(sandbox::ExitKind::SIGNALED), "SIGNALED");
    EXPECT_STREQ(sandbox::exit_kind_to_string(sandbox::ExitKind::TIMED_OUT), "TIMED_OUT");
    EXPECT_STREQ(error_code_str(ErrorCode::FILE_READ_ERROR), "FILE_READ_ERROR");
    EXPECT_STREQ(error_code_str(ErrorCode::WAIT_FAILED), "WAIT_FAILED");
    EXPECT_STREQ(error_code_str(ErrorCode::UNKNOWN_ERROR), "UNKNOWN_ERROR");
}

TEST(EnumNameTest, LogLevelNames) {
    EXPECT_STREQ(level_to_string(LogLevel::WARN), "WARN ");
    EXPECT_STREQ(level_to_string(LogLevel::OFF), "OFF  ");
}
