#pragma once

#include "sampleconv/common/ConvertError.hpp"
#include "sampleconv/io/ByteCodec.hpp"
#include "sampleconv/io/ChunkStore.hpp"
#include "sampleconv/model/MultisampleSource.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sampleconv::nki::detail {

using common::ConvertError;
using common::ConvertErrorKind;

struct NkiFileHeader {
    uint32_t magic = 0;
    uint16_t revision = 0;
    uint16_t flags = 0;
    std::chrono::sys_seconds created{};
};

inline std::unexpected<ConvertError> corrupt(std::string message) {
    return std::unexpected(ConvertError{ConvertErrorKind::CorruptFormat, std::move(message)});
}

/// Reads chunk payload fields in one byte order and keeps the first failure, so a fixed
/// record can be read field by field and checked once at the end.
class FieldReader {
public:
    FieldReader(io::ByteReader reader, io::ByteOrder order) : reader_(reader), order_(order) {}

    uint8_t u8() {
        return keep(io::readUInt8(reader_), uint8_t{0});
    }
    uint16_t u16() {
        return keep(io::readUInt16(reader_, order_), uint16_t{0});
    }
    uint32_t u32() {
        return keep(io::readUInt32(reader_, order_), uint32_t{0});
    }
    int32_t i32() {
        return keep(io::readInt32(reader_, order_), int32_t{0});
    }
    float f32() {
        const size_t offset = reader_.position();
        const float value = keep(io::readFloat32(reader_, order_), 0.0f);
        if (!std::isfinite(value)) {
            fail(std::format("Non-finite float at offset {}", offset));
            return 0.0f;
        }
        return value;
    }
    /// Unsigned 32-bit frame position that must fit a signed int.
    int32_t frameIndex() {
        const size_t offset = reader_.position();
        const uint32_t value = u32();
        if (value > static_cast<uint32_t>(std::numeric_limits<int32_t>::max())) {
            fail(std::format("Frame position {} at offset {} is out of range", value, offset));
            return 0;
        }
        return static_cast<int32_t>(value);
    }
    std::string text(io::TextEncoding encoding) {
        return keep(io::readLengthPrefixedText(reader_, encoding), std::string{});
    }

    [[nodiscard]] bool ok() const {
        return !error_.has_value();
    }
    [[nodiscard]] const ConvertError& error() const {
        return *error_;
    }
    [[nodiscard]] size_t remaining() const {
        return reader_.remaining();
    }
    [[nodiscard]] size_t position() const {
        return reader_.position();
    }

private:
    void fail(std::string message) {
        if (!error_.has_value()) {
            error_ = ConvertError{ConvertErrorKind::CorruptFormat, std::move(message)};
        }
    }

    template <typename T>
    T keep(std::expected<T, ConvertError> value, T fallback) {
        if (!value.has_value()) {
            if (!error_.has_value()) {
                error_ = std::move(value.error());
            }
            return fallback;
        }
        return std::move(*value);
    }

    io::ByteReader reader_;
    io::ByteOrder order_;
    std::optional<ConvertError> error_;
};

/// Turns a short or malformed record into a structural error naming the chunk.
inline std::unexpected<ConvertError> recordError(const io::Chunk& chunk, const FieldReader& fields) {
    return corrupt(std::format("Chunk {} at offset {} is malformed: {}", chunk.toString(), chunk.position(),
                               fields.error().message));
}

inline std::expected<NkiFileHeader, ConvertError> readFileHeader(io::ByteReader& reader, io::ByteOrder order) {
    reader.seek(0);
    if (reader.remaining() < 16) {
        return std::unexpected(ConvertError{ConvertErrorKind::EndOfInput,
                                            std::format("File header needs 16 bytes, found {}", reader.remaining())});
    }

    NkiFileHeader header;
    header.magic = static_cast<uint32_t>(io::fromMSBBytes(reader.take(4)));

    auto revision = io::readUInt16(reader, order);
    auto flags = io::readUInt16(reader, order);
    if (!revision.has_value() || !flags.has_value()) {
        return corrupt("File header is truncated");
    }
    header.revision = *revision;
    header.flags = *flags;

    if (order == io::ByteOrder::LittleEndian) {
        auto created = io::readUnixTimestampLSB(reader);
        if (!created.has_value()) {
            return std::unexpected(created.error());
        }
        header.created = *created;
    } else {
        auto seconds = io::readUInt32(reader, order);
        if (!seconds.has_value()) {
            return std::unexpected(seconds.error());
        }
        header.created = std::chrono::sys_seconds{std::chrono::seconds{static_cast<int64_t>(*seconds)}};
    }

    // Reserved signature bytes; the dispatcher already vetted them.
    auto skipped = io::skipExactly(reader, 4);
    if (!skipped.has_value()) {
        return std::unexpected(skipped.error());
    }
    return header;
}

/// Frame offsets use -1 for "whole sample"; any other negative value means the same.
inline int frameOrUnset(int32_t value) {
    return value < 0 ? -1 : value;
}

/// Negative envelope values are stored for "not set".
inline double envelopeValue(float value) {
    return value < 0.0f ? -1.0 : static_cast<double>(value);
}

inline std::optional<std::chrono::sys_seconds> creationTime(const NkiFileHeader& header) {
    if (header.created.time_since_epoch().count() == 0) {
        return std::nullopt;
    }
    return header.created;
}

}  // namespace sampleconv::nki::detail
