// regionmap World Format Tests
// byte_cursor_test.cpp - Tests for bounds-checked buffer reads

#include <gtest/gtest.h>

#include <regionmap/world/byte_cursor.hpp>
#include <regionmap/world/decode_error.hpp>

#include <vector>

namespace regionmap::world {
namespace {

class ByteCursorTest : public ::testing::Test {
protected:
    std::vector<uint8_t> data_ = {0x12, 0x34, 0x56, 0x78, 0xFF, 'a', 'b', 'c'};
};

TEST_F(ByteCursorTest, ReadBigEndian) {
    ByteCursor cursor(data_);
    EXPECT_EQ(cursor.read_u16(Endian::Big), 0x1234);
    cursor.seek(0);
    EXPECT_EQ(cursor.read_u32(Endian::Big), 0x12345678u);
    EXPECT_EQ(cursor.position(), 4u);
}

TEST_F(ByteCursorTest, ReadLittleEndian) {
    ByteCursor cursor(data_);
    EXPECT_EQ(cursor.read_u16(Endian::Little), 0x3412);
    cursor.seek(0);
    EXPECT_EQ(cursor.read_u32(Endian::Little), 0x78563412u);
}

TEST_F(ByteCursorTest, ReadSigned) {
    ByteCursor cursor(data_);
    cursor.seek(4);
    EXPECT_EQ(cursor.read_i8(), -1);
}

TEST_F(ByteCursorTest, ReadStringAndBytes) {
    ByteCursor cursor(data_);
    cursor.skip(5);
    EXPECT_EQ(cursor.read_string(3), "abc");
    EXPECT_EQ(cursor.remaining(), 0u);

    cursor.seek(1);
    auto bytes = cursor.read_bytes(2);
    ASSERT_EQ(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], 0x34);
    EXPECT_EQ(bytes[1], 0x56);
}

TEST_F(ByteCursorTest, OverrunThrowsWithOffset) {
    ByteCursor cursor(data_);
    cursor.skip(6);

    try {
        (void)cursor.read_u32(Endian::Big);
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), DecodeErrorCode::CorruptFormat);
        EXPECT_EQ(e.offset(), 6u);
        EXPECT_EQ(e.expected(), 4u);
    }

    // Failed reads do not move the cursor
    EXPECT_EQ(cursor.position(), 6u);
    EXPECT_EQ(cursor.read_u16(Endian::Big), 0x6263);
}

TEST_F(ByteCursorTest, SeekPastEndThrows) {
    ByteCursor cursor(data_);
    EXPECT_NO_THROW(cursor.seek(data_.size()));
    EXPECT_THROW(cursor.seek(data_.size() + 1), DecodeError);
}

TEST_F(ByteCursorTest, EmptyBuffer) {
    ByteCursor cursor(std::span<const uint8_t>{});
    EXPECT_FALSE(cursor.can_read(1));
    EXPECT_TRUE(cursor.can_read(0));
    EXPECT_THROW((void)cursor.read_u8(), DecodeError);
}

TEST(DecodeErrorTest, CodeNames) {
    EXPECT_STREQ(decode_error_code_to_string(DecodeErrorCode::NotFound), "NotFound");
    EXPECT_STREQ(decode_error_code_to_string(DecodeErrorCode::CorruptFormat), "CorruptFormat");
    EXPECT_STREQ(decode_error_code_to_string(DecodeErrorCode::CorruptPayload), "CorruptPayload");
}

TEST(DecodeErrorTest, CarriesContext) {
    DecodeError error(DecodeErrorCode::CorruptFormat, "truncated", 42, 8);
    EXPECT_STREQ(error.what(), "truncated");
    EXPECT_EQ(error.offset(), 42u);
    EXPECT_EQ(error.expected(), 8u);

    DecodeError plain(DecodeErrorCode::NotFound, "missing");
    EXPECT_EQ(plain.offset(), DecodeError::NO_OFFSET);
}

}  // namespace
}  // namespace regionmap::world
