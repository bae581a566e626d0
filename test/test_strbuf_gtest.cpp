/*
 * StrBuf Test Suite (GTest Version)
 * =================================
 *
 * Covers creation, appending, formatting and reallocation of the
 * growable string buffer used by the writer.
 */

#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <string>
#include <cstdint>

extern "C" {
#include "../lib/strbuf.h"
}

class StrBufTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Runs before each test
    }

    void TearDown() override {
        // Runs after each test
    }
};

TEST_F(StrBufTest, TestNew) {
    StrBuf* sb = strbuf_new();
    ASSERT_NE(sb, nullptr) << "strbuf_new() should return non-null pointer";
    ASSERT_NE(sb->str, nullptr) << "String buffer should be allocated";
    ASSERT_EQ(sb->length, 0u) << "Initial length should be 0";
    ASSERT_GT(sb->capacity, 0u) << "Initial capacity should be at least 1";
    ASSERT_EQ(sb->str[0], '\0') << "Buffer should be null-terminated";
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestNewCap) {
    StrBuf* sb = strbuf_new_cap(100);
    ASSERT_NE(sb, nullptr);
    ASSERT_GE(sb->capacity, 100u) << "Capacity should be at least the requested size";
    ASSERT_EQ(sb->length, 0u);
    ASSERT_STREQ(sb->str, "");
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestAppendStr) {
    StrBuf* sb = strbuf_new();
    strbuf_append_str(sb, "HEADER;");
    strbuf_append_str(sb, "\n");
    strbuf_append_str(sb, "ENDSEC;");
    ASSERT_STREQ(sb->str, "HEADER;\nENDSEC;");
    ASSERT_EQ(sb->length, 15u);

    strbuf_append_str(sb, NULL);
    ASSERT_EQ(sb->length, 15u) << "Appending NULL should be a no-op";
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestAppendStrN) {
    StrBuf* sb = strbuf_new();
    strbuf_append_str_n(sb, "CARTESIAN_POINT", 9);
    ASSERT_STREQ(sb->str, "CARTESIAN");
    ASSERT_EQ(sb->length, 9u);

    // embedded zero bytes are kept
    strbuf_append_str_n(sb, "a\0b", 3);
    ASSERT_EQ(sb->length, 12u);
    ASSERT_EQ(sb->str[10], '\0');
    ASSERT_EQ(sb->str[11], 'b');
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestAppendChar) {
    StrBuf* sb = strbuf_new();
    strbuf_append_char(sb, '#');
    strbuf_append_char(sb, '1');
    strbuf_append_char(sb, '=');
    ASSERT_STREQ(sb->str, "#1=");
    ASSERT_EQ(sb->length, 3u);
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestAppendFormat) {
    StrBuf* sb = strbuf_new();
    strbuf_append_format(sb, "#%d=%s(%s);", 42, "DIRECTION", "'',(0.,0.,1.)");
    ASSERT_STREQ(sb->str, "#42=DIRECTION('',(0.,0.,1.));");
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestAppendInt64) {
    StrBuf* sb = strbuf_new();
    strbuf_append_int64(sb, -17);
    strbuf_append_char(sb, ' ');
    strbuf_append_int64(sb, INT64_MAX);
    strbuf_append_char(sb, ' ');
    strbuf_append_int64(sb, INT64_MIN);
    ASSERT_STREQ(sb->str, "-17 9223372036854775807 -9223372036854775808");
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestFormatWithEmbeddedZero) {
    // formatting stops at the first zero byte of a %s argument
    StrBuf* sb = strbuf_new();
    strbuf_append_format(sb, "%s|", "A\0B");
    ASSERT_STREQ(sb->str, "A|");

    strbuf_append_str_n(sb, "A\0B", 3);
    ASSERT_EQ(sb->length, 5u);
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestNullBuffer) {
    strbuf_append_str(NULL, "x");
    strbuf_append_char(NULL, 'x');
    strbuf_append_format(NULL, "%d", 1);
    ASSERT_FALSE(strbuf_ensure_cap(NULL, 8));
    strbuf_free(NULL);
}

TEST_F(StrBufTest, TestMemoryReallocation) {
    StrBuf* sb = strbuf_new_cap(8);
    size_t initial_capacity = sb->capacity;

    std::string expected;
    for (int i = 0; i < 200; i++) {
        strbuf_append_str(sb, "0123456789");
        expected += "0123456789";
    }
    ASSERT_GT(sb->capacity, initial_capacity) << "Buffer should have grown";
    ASSERT_EQ(sb->length, expected.length());
    ASSERT_EQ(std::string(sb->str), expected) << "Content should survive reallocation";
    ASSERT_GT(sb->capacity, sb->length) << "Room for the terminator is kept";
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestCharAppendReallocation) {
    StrBuf* sb = strbuf_new_cap(2);
    for (int i = 0; i < 100; i++) {
        strbuf_append_char(sb, (char)('a' + i % 26));
    }
    ASSERT_EQ(sb->length, 100u);
    ASSERT_EQ(sb->str[0], 'a');
    ASSERT_EQ(sb->str[26], 'a');
    ASSERT_EQ(sb->str[99], (char)('a' + 99 % 26));
    ASSERT_EQ(sb->str[100], '\0');
    strbuf_free(sb);
}

TEST_F(StrBufTest, TestEnsureCap) {
    StrBuf* sb = strbuf_new_cap(16);
    ASSERT_TRUE(strbuf_ensure_cap(sb, 8));
    ASSERT_EQ(sb->capacity, 16u) << "Smaller requests should not shrink the buffer";

    ASSERT_TRUE(strbuf_ensure_cap(sb, 20));
    ASSERT_EQ(sb->capacity, 32u) << "Growth should double the capacity";

    ASSERT_TRUE(strbuf_ensure_cap(sb, 1000));
    ASSERT_EQ(sb->capacity, 1000u) << "Large requests should be honoured exactly";
    strbuf_free(sb);
}
