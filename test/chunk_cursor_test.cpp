#include <gtest/gtest.h>

#include "../src/chunk_cursor/chunk_cursor.hpp"
#include "test_utils.hpp"

TEST(chunk_cursor_test, protocol_chunks) {
    const auto payload = make_payload(12000000);
    ChunkCursor cursor(payload);
    EXPECT_EQ(cursor.length(), 12000000);

    ASSERT_TRUE(cursor.has_next());
    auto chunk = cursor.next();
    EXPECT_EQ(chunk.offset, 0);
    EXPECT_EQ(chunk.data.size(), 5242880);

    ASSERT_TRUE(cursor.has_next());
    chunk = cursor.next();
    EXPECT_EQ(chunk.offset, 5242880);
    EXPECT_EQ(chunk.data.size(), 5242880);

    ASSERT_TRUE(cursor.has_next());
    chunk = cursor.next();
    EXPECT_EQ(chunk.offset, 10485760);
    EXPECT_EQ(chunk.data.size(), 1514240);
    EXPECT_EQ(chunk.data, std::string_view(payload).substr(10485760));

    EXPECT_FALSE(cursor.has_next());
    EXPECT_EQ(cursor.offset(), 12000000);
    EXPECT_EQ(cursor.percent(), 100);
}

TEST(chunk_cursor_test, exact_multiple) {
    const auto payload = make_payload(30);
    ChunkCursor cursor(payload, 10);
    unsigned int chunks = 0;
    unsigned long long expected_offset = 0;
    while (cursor.has_next()) {
        const auto chunk = cursor.next();
        EXPECT_EQ(chunk.offset, expected_offset);
        EXPECT_EQ(chunk.data.size(), 10);
        expected_offset += chunk.data.size();
        chunks++;
    }
    EXPECT_EQ(chunks, 3);
}

TEST(chunk_cursor_test, percent_advances) {
    const auto payload = make_payload(40);
    ChunkCursor cursor(payload, 10);
    EXPECT_EQ(cursor.percent(), 0);
    cursor.next();
    EXPECT_EQ(cursor.percent(), 25);
    cursor.next();
    EXPECT_EQ(cursor.percent(), 50);
}

TEST(chunk_cursor_test, empty_buffer) {
    ChunkCursor cursor(std::string_view(""));
    EXPECT_FALSE(cursor.has_next());
    EXPECT_EQ(cursor.percent(), 100);
    const auto chunk = cursor.next();
    EXPECT_EQ(chunk.data.size(), 0);
}

TEST(chunk_cursor_test, zero_chunk_size_uses_protocol_size) {
    const auto payload = make_payload(UPLOAD_CHUNK_SIZE + 1);
    ChunkCursor cursor(payload, 0);
    EXPECT_EQ(cursor.next().data.size(), UPLOAD_CHUNK_SIZE);
    EXPECT_EQ(cursor.next().data.size(), 1);
    EXPECT_FALSE(cursor.has_next());
}
