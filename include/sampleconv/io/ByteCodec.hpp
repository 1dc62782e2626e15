#pragma once

#include "sampleconv/common/ConvertError.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace sampleconv::io {

using common::ConvertError;

enum class ByteOrder : uint8_t {
    LittleEndian,
    BigEndian,
};

enum class TextEncoding : uint8_t {
    Ascii,
    Latin1,
    Utf16LE,
    Utf16BE,
};

// A MIDI-style variable length quantity never spans more bytes than this.
inline constexpr size_t kMaxVariableLengthBytes = 5;

/// Forward-only cursor over an in-memory byte buffer. Seeking is allowed; reads past the
/// end are reported by the codec functions, never by undefined behaviour.
class ByteReader {
public:
    ByteReader() = default;
    explicit ByteReader(std::span<const uint8_t> bytes) : bytes_(bytes) {}

    [[nodiscard]] size_t position() const {
        return pos_;
    }

    [[nodiscard]] size_t size() const {
        return bytes_.size();
    }

    [[nodiscard]] size_t remaining() const {
        return pos_ < bytes_.size() ? bytes_.size() - pos_ : 0;
    }

    /// Moves the cursor; positions past the end are clamped to the end.
    void seek(size_t offset) {
        pos_ = offset < bytes_.size() ? offset : bytes_.size();
    }

    /// Returns the next byte or -1 when no data is left.
    int readByte() {
        if (pos_ >= bytes_.size()) {
            return -1;
        }
        return bytes_[pos_++];
    }

    /// Returns the next `length` bytes and advances, or an empty span if fewer remain.
    std::span<const uint8_t> take(size_t length);

    [[nodiscard]] std::span<const uint8_t> bytes() const {
        return bytes_;
    }

private:
    std::span<const uint8_t> bytes_;
    size_t pos_ = 0;
};

struct VariableLengthInt {
    uint32_t value = 0;
    int byteCount = 0;
};

std::expected<uint32_t, ConvertError> readLSBInt32(ByteReader& reader);

uint64_t fromLSBBytes(std::span<const uint8_t> bytes);
uint64_t fromMSBBytes(std::span<const uint8_t> bytes);

float readLittleEndianFloat32(std::span<const uint8_t, 4> bytes);
float readFloat32(std::span<const uint8_t, 4> bytes, ByteOrder order);

std::expected<VariableLengthInt, ConvertError> read7BitVariableLengthInt(ByteReader& reader);

std::expected<std::string, ConvertError> readFixedLengthText(ByteReader& reader, size_t length,
                                                             TextEncoding encoding = TextEncoding::Ascii);

std::expected<std::chrono::sys_seconds, ConvertError> readUnixTimestampLSB(ByteReader& reader);

std::expected<void, ConvertError> skipExactly(ByteReader& reader, size_t count);

std::expected<uint8_t, ConvertError> readUInt8(ByteReader& reader);
std::expected<uint16_t, ConvertError> readUInt16(ByteReader& reader, ByteOrder order);
std::expected<uint32_t, ConvertError> readUInt32(ByteReader& reader, ByteOrder order);
std::expected<int32_t, ConvertError> readInt32(ByteReader& reader, ByteOrder order);
std::expected<float, ConvertError> readFloat32(ByteReader& reader, ByteOrder order);

/// Reads a VLQ byte length followed by that many bytes of text.
std::expected<std::string, ConvertError> readLengthPrefixedText(ByteReader& reader, TextEncoding encoding);

}  // namespace sampleconv::io
