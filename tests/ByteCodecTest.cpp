#include "sampleconv/io/ByteCodec.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <vector>

namespace sampleconv::io {
namespace {

using common::ConvertErrorKind;

}  // namespace

TEST(ByteCodecTest, ReadLSBInt32AssemblesLeastSignificantByteFirst) {
    const std::vector<uint8_t> bytes = {0x78, 0x56, 0x34, 0x12};
    ByteReader reader(bytes);

    auto value = readLSBInt32(reader);
    ASSERT_TRUE(value.has_value()) << value.error().message;
    EXPECT_EQ(*value, 0x12345678u);
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(ByteCodecTest, ReadLSBInt32FailsWhenAnyByteIsMissing) {
    const std::vector<uint8_t> bytes = {0x01, 0x02, 0x03};
    ByteReader reader(bytes);

    auto value = readLSBInt32(reader);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().kind, ConvertErrorKind::EndOfInput);
}

TEST(ByteCodecTest, VariableWidthIntegersHonourByteOrder) {
    const std::vector<uint8_t> bytes = {0x01, 0x02, 0x03};
    EXPECT_EQ(fromLSBBytes(bytes), 0x030201u);
    EXPECT_EQ(fromMSBBytes(bytes), 0x010203u);
    EXPECT_EQ(fromLSBBytes({}), 0u);
}

TEST(ByteCodecTest, ReadsLittleEndianFloat) {
    // 1.5f == 0x3FC00000
    const std::array<uint8_t, 4> little = {0x00, 0x00, 0xC0, 0x3F};
    const std::array<uint8_t, 4> big = {0x3F, 0xC0, 0x00, 0x00};

    EXPECT_FLOAT_EQ(readLittleEndianFloat32(little), 1.5f);
    EXPECT_FLOAT_EQ(readFloat32(std::span<const uint8_t, 4>(big), ByteOrder::BigEndian), 1.5f);
}

TEST(ByteCodecTest, VariableLengthIntSingleByte) {
    const std::vector<uint8_t> bytes = {0x05};
    ByteReader reader(bytes);

    auto value = read7BitVariableLengthInt(reader);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->value, 5u);
    EXPECT_EQ(value->byteCount, 1);
}

TEST(ByteCodecTest, VariableLengthIntLowGroupFirst) {
    const std::vector<uint8_t> bytes = {0x85, 0x01};
    ByteReader reader(bytes);

    auto value = read7BitVariableLengthInt(reader);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->value, 133u);
    EXPECT_EQ(value->byteCount, 2);
}

TEST(ByteCodecTest, VariableLengthIntRejectsRunawayContinuation) {
    const std::vector<uint8_t> bytes = {0x80, 0x80, 0x80, 0x80, 0x80, 0x01};
    ByteReader reader(bytes);

    auto value = read7BitVariableLengthInt(reader);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().kind, ConvertErrorKind::CorruptFormat);
}

TEST(ByteCodecTest, VariableLengthIntRejectsValuesAbove32Bits) {
    const std::vector<uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0xFF, 0x7F};
    ByteReader reader(bytes);

    auto value = read7BitVariableLengthInt(reader);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().kind, ConvertErrorKind::CorruptFormat);
}

TEST(ByteCodecTest, VariableLengthIntAcceptsMaximumValue) {
    const std::vector<uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0xFF, 0x0F};
    ByteReader reader(bytes);

    auto value = read7BitVariableLengthInt(reader);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->value, 0xFFFFFFFFu);
    EXPECT_EQ(value->byteCount, 5);
}

TEST(ByteCodecTest, VariableLengthIntFailsAtEndOfInput) {
    const std::vector<uint8_t> bytes = {0x81};
    ByteReader reader(bytes);

    auto value = read7BitVariableLengthInt(reader);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().kind, ConvertErrorKind::EndOfInput);
}

TEST(ByteCodecTest, FixedLengthTextDecodesEachEncoding) {
    {
        const std::vector<uint8_t> bytes = {'h', 's', 'i', 'n'};
        ByteReader reader(bytes);
        auto text = readFixedLengthText(reader, 4);
        ASSERT_TRUE(text.has_value());
        EXPECT_EQ(*text, "hsin");
    }
    {
        const std::vector<uint8_t> bytes = {'C', 0xE9, 'l', 'l', 'o'};
        ByteReader reader(bytes);
        auto text = readFixedLengthText(reader, bytes.size(), TextEncoding::Latin1);
        ASSERT_TRUE(text.has_value());
        EXPECT_EQ(*text, "C\xC3\xA9llo");
    }
    {
        const std::vector<uint8_t> bytes = {'O', 0x00, 'k', 0x00};
        ByteReader reader(bytes);
        auto text = readFixedLengthText(reader, bytes.size(), TextEncoding::Utf16LE);
        ASSERT_TRUE(text.has_value());
        EXPECT_EQ(*text, "Ok");
    }
    {
        const std::vector<uint8_t> bytes = {0x00, 'O', 0x00, 'k'};
        ByteReader reader(bytes);
        auto text = readFixedLengthText(reader, bytes.size(), TextEncoding::Utf16BE);
        ASSERT_TRUE(text.has_value());
        EXPECT_EQ(*text, "Ok");
    }
}

TEST(ByteCodecTest, FixedLengthTextStripsTrailingNulCharacters) {
    const std::vector<uint8_t> bytes = {'A', 'B', 0x00, 0x00};
    ByteReader reader(bytes);

    auto text = readFixedLengthText(reader, 4);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "AB");
    EXPECT_EQ(reader.position(), 4u);
}

TEST(ByteCodecTest, FixedLengthTextReportsTruncation) {
    const std::vector<uint8_t> bytes = {'A', 'B'};
    ByteReader reader(bytes);

    auto text = readFixedLengthText(reader, 4);
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().kind, ConvertErrorKind::TruncatedRead);
}

TEST(ByteCodecTest, Utf16TextWithOddLengthIsCorrupt) {
    const std::vector<uint8_t> bytes = {'A', 0x00, 'B'};
    ByteReader reader(bytes);

    auto text = readFixedLengthText(reader, 3, TextEncoding::Utf16LE);
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().kind, ConvertErrorKind::CorruptFormat);
}

TEST(ByteCodecTest, UnixTimestampIsReadAsSeconds) {
    // 2001-09-09 01:46:40 UTC
    const std::vector<uint8_t> bytes = {0x00, 0xCA, 0x9A, 0x3B};
    ByteReader reader(bytes);

    auto timestamp = readUnixTimestampLSB(reader);
    ASSERT_TRUE(timestamp.has_value());
    EXPECT_EQ(timestamp->time_since_epoch().count(), 1000000000);
}

TEST(ByteCodecTest, SkipExactlyAdvancesOrFails) {
    const std::vector<uint8_t> bytes(6, 0);
    ByteReader reader(bytes);

    ASSERT_TRUE(skipExactly(reader, 4).has_value());
    EXPECT_EQ(reader.position(), 4u);

    auto skipped = skipExactly(reader, 3);
    ASSERT_FALSE(skipped.has_value());
    EXPECT_EQ(skipped.error().kind, ConvertErrorKind::CorruptFormat);
    EXPECT_EQ(reader.position(), 4u);
}

TEST(ByteCodecTest, ByteOrderedHelpersReadBothOrders) {
    const std::vector<uint8_t> bytes = {0x12, 0x34, 0x12, 0x34, 0x56, 0x78};
    ByteReader little(bytes);
    ByteReader big(bytes);

    EXPECT_EQ(*readUInt16(little, ByteOrder::LittleEndian), 0x3412u);
    EXPECT_EQ(*readUInt16(big, ByteOrder::BigEndian), 0x1234u);
    EXPECT_EQ(*readUInt32(little, ByteOrder::LittleEndian), 0x78563412u);
    EXPECT_EQ(*readUInt32(big, ByteOrder::BigEndian), 0x12345678u);

    auto missing = readUInt8(little);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ConvertErrorKind::EndOfInput);
}

TEST(ByteCodecTest, SignedReadKeepsNegativeValues) {
    const std::vector<uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0xFF};
    ByteReader reader(bytes);

    auto value = readInt32(reader, ByteOrder::LittleEndian);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, -1);
}

TEST(ByteCodecTest, LengthPrefixedTextReadsVlqLength) {
    const std::vector<uint8_t> bytes = {0x03, 'a', 'b', 'c', 'd'};
    ByteReader reader(bytes);

    auto text = readLengthPrefixedText(reader, TextEncoding::Latin1);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "abc");
    EXPECT_EQ(reader.remaining(), 1u);
}

TEST(ByteCodecTest, ReaderSeekClampsToEnd) {
    const std::vector<uint8_t> bytes = {1, 2, 3};
    ByteReader reader(bytes);

    reader.seek(10);
    EXPECT_EQ(reader.position(), 3u);
    EXPECT_EQ(reader.readByte(), -1);
    EXPECT_TRUE(reader.take(1).empty());
}

}  // namespace sampleconv::io
