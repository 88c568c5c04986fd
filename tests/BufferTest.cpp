#include <gtest/gtest.h>

#include <cstring>
#include <string>

#include "common/mem/Buffer.h"
#include "io/ByteSequence.h"

using jstream::io::ByteSequence;
using jstream::mem::Buffer;

TEST(BufferTest, AppendAndConsume) {
    Buffer buffer;
    EXPECT_TRUE(buffer.empty());
    ASSERT_TRUE(buffer.append("hello", 5));
    ASSERT_TRUE(buffer.append(' '));
    ASSERT_TRUE(buffer.append("world", 5));
    EXPECT_EQ(buffer.view(), "hello world");

    buffer.consume(6);
    EXPECT_EQ(buffer.view(), "world");
    buffer.consume(5);
    EXPECT_TRUE(buffer.empty());
}

TEST(BufferTest, PrepareAndCommit) {
    Buffer buffer;
    char *dst = buffer.prepare(4);
    ASSERT_NE(dst, nullptr);
    std::memcpy(dst, "abcd", 4);
    buffer.commit(3);
    EXPECT_EQ(buffer.view(), "abc");
    EXPECT_GE(buffer.capacity(), 4u);
}

TEST(BufferTest, ConsumedPrefixIsReclaimed) {
    Buffer buffer;
    std::string block(48, 'x');
    ASSERT_TRUE(buffer.append(block.data(), block.size()));
    std::size_t capacity = buffer.capacity();
    buffer.consume(40);
    ASSERT_TRUE(buffer.append(block.data(), 40));
    EXPECT_EQ(buffer.capacity(), capacity);
    EXPECT_EQ(buffer.size(), 48u);
}

TEST(BufferTest, GrowsForLargeAppends) {
    Buffer buffer;
    std::string big(1000, 'y');
    ASSERT_TRUE(buffer.append(big.data(), big.size()));
    EXPECT_EQ(buffer.size(), 1000u);
    EXPECT_GE(buffer.capacity(), 1000u);
    EXPECT_EQ(buffer.view(), big);
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
}

TEST(ByteSequenceTest, LinearizeSingleSegmentWithoutCopy) {
    std::string backing = "[1,2]";
    ByteSequence bytes;
    bytes.append(backing);
    bytes.append("");
    std::string scratch;
    auto view = bytes.linearize(scratch);
    EXPECT_EQ(view.data(), backing.data());
    EXPECT_TRUE(scratch.empty());
    EXPECT_EQ(bytes.segment_count(), 1u);
}

TEST(ByteSequenceTest, LinearizeJoinsSegments) {
    std::string first = "[1,";
    std::string second = "2]";
    ByteSequence bytes;
    bytes.append(first);
    bytes.append(second);
    EXPECT_EQ(bytes.size(), 5u);
    EXPECT_EQ(bytes.segment(1), "2]");
    std::string scratch;
    EXPECT_EQ(bytes.linearize(scratch), "[1,2]");
    EXPECT_EQ(bytes.to_string(), "[1,2]");
}

TEST(ByteSequenceTest, EmptySequence) {
    ByteSequence bytes;
    std::string scratch;
    EXPECT_TRUE(bytes.empty());
    EXPECT_TRUE(bytes.linearize(scratch).empty());
    EXPECT_EQ(bytes.to_string(), "");
}
