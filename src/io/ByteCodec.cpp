#include "sampleconv/io/ByteCodec.hpp"

#include <bit>
#include <cstring>
#include <format>
#include <limits>
#include <utility>

namespace sampleconv::io {
namespace {

using common::ConvertErrorKind;

constexpr size_t kMaxTextLength = 64 * 1024;

std::unexpected<ConvertError> fail(ConvertErrorKind kind, std::string message) {
    return std::unexpected(ConvertError{kind, std::move(message)});
}

void appendUtf8(std::string& out, uint32_t codePoint) {
    if (codePoint < 0x80u) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800u) {
        out.push_back(static_cast<char>(0xC0u | (codePoint >> 6u)));
        out.push_back(static_cast<char>(0x80u | (codePoint & 0x3Fu)));
    } else if (codePoint < 0x10000u) {
        out.push_back(static_cast<char>(0xE0u | (codePoint >> 12u)));
        out.push_back(static_cast<char>(0x80u | ((codePoint >> 6u) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (codePoint & 0x3Fu)));
    } else {
        out.push_back(static_cast<char>(0xF0u | (codePoint >> 18u)));
        out.push_back(static_cast<char>(0x80u | ((codePoint >> 12u) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | ((codePoint >> 6u) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (codePoint & 0x3Fu)));
    }
}

std::expected<std::string, ConvertError> decodeUtf16(std::span<const uint8_t> bytes, ByteOrder order) {
    if ((bytes.size() % 2u) != 0u) {
        return fail(ConvertErrorKind::CorruptFormat, std::format("UTF-16 text has odd byte length {}", bytes.size()));
    }

    std::string out;
    out.reserve(bytes.size() / 2u);
    for (size_t i = 0; i < bytes.size(); i += 2u) {
        const auto current = bytes.subspan(i, 2);
        uint32_t unit = static_cast<uint32_t>(order == ByteOrder::BigEndian ? fromMSBBytes(current)
                                                                             : fromLSBBytes(current));

        if (unit >= 0xD800u && unit <= 0xDBFFu && i + 3u < bytes.size()) {
            const auto next = bytes.subspan(i + 2u, 2);
            const uint32_t low = static_cast<uint32_t>(order == ByteOrder::BigEndian ? fromMSBBytes(next)
                                                                                      : fromLSBBytes(next));
            if (low >= 0xDC00u && low <= 0xDFFFu) {
                appendUtf8(out, 0x10000u + ((unit - 0xD800u) << 10u) + (low - 0xDC00u));
                i += 2u;
                continue;
            }
        }
        if (unit >= 0xD800u && unit <= 0xDFFFu) {
            unit = 0xFFFDu;
        }
        appendUtf8(out, unit);
    }
    return out;
}

}  // namespace

std::span<const uint8_t> ByteReader::take(size_t length) {
    if (length > remaining()) {
        return {};
    }
    auto slice = bytes_.subspan(pos_, length);
    pos_ += length;
    return slice;
}

std::expected<uint32_t, ConvertError> readLSBInt32(ByteReader& reader) {
    const int ch1 = reader.readByte();
    const int ch2 = reader.readByte();
    const int ch3 = reader.readByte();
    const int ch4 = reader.readByte();
    if ((ch1 | ch2 | ch3 | ch4) < 0) {
        return fail(ConvertErrorKind::EndOfInput, "Unexpected end of input while reading a 32-bit value");
    }
    return static_cast<uint32_t>(ch1) | (static_cast<uint32_t>(ch2) << 8u) | (static_cast<uint32_t>(ch3) << 16u) |
           (static_cast<uint32_t>(ch4) << 24u);
}

uint64_t fromLSBBytes(std::span<const uint8_t> bytes) {
    uint64_t number = 0;
    for (size_t i = 0; i < bytes.size() && i < sizeof(uint64_t); ++i) {
        number |= static_cast<uint64_t>(bytes[i]) << (8u * i);
    }
    return number;
}

uint64_t fromMSBBytes(std::span<const uint8_t> bytes) {
    uint64_t number = 0;
    for (size_t i = 0; i < bytes.size() && i < sizeof(uint64_t); ++i) {
        number = (number << 8u) | bytes[i];
    }
    return number;
}

float readLittleEndianFloat32(std::span<const uint8_t, 4> bytes) {
    return std::bit_cast<float>(static_cast<uint32_t>(fromLSBBytes(bytes)));
}

float readFloat32(std::span<const uint8_t, 4> bytes, ByteOrder order) {
    if (order == ByteOrder::LittleEndian) {
        return readLittleEndianFloat32(bytes);
    }
    return std::bit_cast<float>(static_cast<uint32_t>(fromMSBBytes(bytes)));
}

std::expected<VariableLengthInt, ConvertError> read7BitVariableLengthInt(ByteReader& reader) {
    uint64_t number = 0;
    for (size_t count = 0; count < kMaxVariableLengthBytes; ++count) {
        const int value = reader.readByte();
        if (value < 0) {
            return fail(ConvertErrorKind::EndOfInput, "Unexpected end of input inside a variable length number");
        }

        number |= static_cast<uint64_t>(value & 0x7F) << (7u * count);
        if ((value & 0x80) == 0) {
            if (number > std::numeric_limits<uint32_t>::max()) {
                return fail(ConvertErrorKind::CorruptFormat, "Variable length number exceeds 32 bits");
            }
            return VariableLengthInt{static_cast<uint32_t>(number), static_cast<int>(count + 1)};
        }
    }
    return fail(ConvertErrorKind::CorruptFormat,
                std::format("Variable length number longer than {} bytes", kMaxVariableLengthBytes));
}

std::expected<std::string, ConvertError> readFixedLengthText(ByteReader& reader, size_t length,
                                                             TextEncoding encoding) {
    if (length > reader.remaining()) {
        return fail(ConvertErrorKind::TruncatedRead,
                    std::format("Text of {} bytes at offset {} is truncated", length, reader.position()));
    }
    const auto bytes = reader.take(length);

    std::string text;
    switch (encoding) {
    case TextEncoding::Ascii:
        text.reserve(bytes.size());
        for (const uint8_t ch : bytes) {
            text.push_back(ch < 0x80u ? static_cast<char>(ch) : '?');
        }
        break;
    case TextEncoding::Latin1:
        text.reserve(bytes.size());
        for (const uint8_t ch : bytes) {
            appendUtf8(text, ch);
        }
        break;
    case TextEncoding::Utf16LE:
    case TextEncoding::Utf16BE: {
        auto decoded = decodeUtf16(bytes, encoding == TextEncoding::Utf16LE ? ByteOrder::LittleEndian
                                                                            : ByteOrder::BigEndian);
        if (!decoded.has_value()) {
            return std::unexpected(decoded.error());
        }
        text = std::move(*decoded);
        break;
    }
    }

    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    return text;
}

std::expected<std::chrono::sys_seconds, ConvertError> readUnixTimestampLSB(ByteReader& reader) {
    auto seconds = readLSBInt32(reader);
    if (!seconds.has_value()) {
        return std::unexpected(seconds.error());
    }
    return std::chrono::sys_seconds{std::chrono::seconds{static_cast<int64_t>(*seconds)}};
}

std::expected<void, ConvertError> skipExactly(ByteReader& reader, size_t count) {
    if (count > reader.remaining()) {
        return fail(ConvertErrorKind::CorruptFormat,
                    std::format("Could only skip {} of {} bytes at offset {}", reader.remaining(), count,
                                reader.position()));
    }
    reader.seek(reader.position() + count);
    return {};
}

std::expected<uint8_t, ConvertError> readUInt8(ByteReader& reader) {
    const int value = reader.readByte();
    if (value < 0) {
        return fail(ConvertErrorKind::EndOfInput, "Unexpected end of input while reading a byte");
    }
    return static_cast<uint8_t>(value);
}

std::expected<uint16_t, ConvertError> readUInt16(ByteReader& reader, ByteOrder order) {
    const auto bytes = reader.take(2);
    if (bytes.empty()) {
        return fail(ConvertErrorKind::EndOfInput, "Unexpected end of input while reading a 16-bit value");
    }
    return static_cast<uint16_t>(order == ByteOrder::LittleEndian ? fromLSBBytes(bytes) : fromMSBBytes(bytes));
}

std::expected<uint32_t, ConvertError> readUInt32(ByteReader& reader, ByteOrder order) {
    if (order == ByteOrder::LittleEndian) {
        return readLSBInt32(reader);
    }
    const auto bytes = reader.take(4);
    if (bytes.empty()) {
        return fail(ConvertErrorKind::EndOfInput, "Unexpected end of input while reading a 32-bit value");
    }
    return static_cast<uint32_t>(fromMSBBytes(bytes));
}

std::expected<int32_t, ConvertError> readInt32(ByteReader& reader, ByteOrder order) {
    auto value = readUInt32(reader, order);
    if (!value.has_value()) {
        return std::unexpected(value.error());
    }
    return std::bit_cast<int32_t>(*value);
}

std::expected<float, ConvertError> readFloat32(ByteReader& reader, ByteOrder order) {
    const auto bytes = reader.take(4);
    if (bytes.empty()) {
        return fail(ConvertErrorKind::EndOfInput, "Unexpected end of input while reading a float");
    }
    return readFloat32(bytes.first<4>(), order);
}

std::expected<std::string, ConvertError> readLengthPrefixedText(ByteReader& reader, TextEncoding encoding) {
    auto length = read7BitVariableLengthInt(reader);
    if (!length.has_value()) {
        return std::unexpected(length.error());
    }
    if (length->value > kMaxTextLength) {
        return fail(ConvertErrorKind::CorruptFormat,
                    std::format("Text length {} at offset {} is implausible", length->value, reader.position()));
    }
    return readFixedLengthText(reader, length->value, encoding);
}

}  // namespace sampleconv::io
