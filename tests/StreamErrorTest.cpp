#include <gtest/gtest.h>

#include <cerrno>
#include <string>

#include "common/IoError.h"
#include "common/StreamError.h"
#include "json/Utf.h"

using jstream::common::IoErr;
using jstream::common::StreamErr;
using jstream::json::Utf8Status;

TEST(StreamErrorTest, DescribeIncludesOffsetOrCause) {
    EXPECT_EQ(jstream::common::describe(jstream::common::syntax_error("invalid literal", 12)),
              "syntax error at offset 12: invalid literal");
    EXPECT_EQ(jstream::common::describe(jstream::common::decode_error("expected integer, got string", 3)),
              "decode error at offset 3: expected integer, got string");
    EXPECT_EQ(jstream::common::describe(jstream::common::source_fault(IoErr::BadFd, "read failed")),
              "source fault (bad_fd): read failed");
    EXPECT_EQ(jstream::common::cancelled_error().code, StreamErr::Cancelled);
}

TEST(StreamErrorTest, ErrnoMapsToIoErr) {
    EXPECT_EQ(jstream::common::io_err_from_errno(EBADF), IoErr::BadFd);
    EXPECT_EQ(jstream::common::io_err_from_errno(ECONNRESET), IoErr::ConnReset);
    EXPECT_EQ(jstream::common::io_err_from_errno(EISDIR), IoErr::IsDirectory);
    EXPECT_EQ(jstream::common::io_err_from_errno(ENOENT), IoErr::NotFound);
}

TEST(UtfTest, DecodesAndReportsTruncation) {
    std::string text = "a\xC3\xA9\xF0\x9F\x98\x80";
    std::size_t pos = 0;
    std::uint32_t cp = 0;
    ASSERT_EQ(jstream::json::utf8_next_codepoint(text, pos, cp), Utf8Status::Ok);
    EXPECT_EQ(cp, 0x61u);
    ASSERT_EQ(jstream::json::utf8_next_codepoint(text, pos, cp), Utf8Status::Ok);
    EXPECT_EQ(cp, 0xE9u);
    ASSERT_EQ(jstream::json::utf8_next_codepoint(text, pos, cp), Utf8Status::Ok);
    EXPECT_EQ(cp, 0x1F600u);
    EXPECT_EQ(pos, text.size());

    std::size_t cut = 0;
    EXPECT_EQ(jstream::json::utf8_next_codepoint("\xF0\x9F", cut, cp), Utf8Status::Truncated);

    std::size_t overlong = 0;
    EXPECT_EQ(jstream::json::utf8_next_codepoint("\xC0\xAF", overlong, cp), Utf8Status::Invalid);
    std::size_t surrogate = 0;
    EXPECT_EQ(jstream::json::utf8_next_codepoint("\xED\xA0\x80", surrogate, cp), Utf8Status::Invalid);
}

TEST(UtfTest, AppendAndHex) {
    std::string out;
    jstream::json::utf8_append(out, 0x24);
    jstream::json::utf8_append(out, 0x20AC);
    jstream::json::utf8_append(out, 0x10348);
    EXPECT_EQ(out, "$\xE2\x82\xAC\xF0\x90\x8D\x88");
    EXPECT_EQ(jstream::json::hex_value('7'), 7);
    EXPECT_EQ(jstream::json::hex_value('b'), 11);
    EXPECT_EQ(jstream::json::hex_value('F'), 15);
    EXPECT_EQ(jstream::json::hex_value('g'), -1);
}
