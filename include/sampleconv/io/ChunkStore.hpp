#pragma once

#include "sampleconv/io/ByteCodec.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sampleconv::io {

/// Packs a four character tag into an integer, first character in the high byte.
constexpr uint32_t fourCC(std::string_view tag) {
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        const char ch = i < tag.size() ? tag[i] : ' ';
        value = (value << 8u) | static_cast<uint8_t>(ch);
    }
    return value;
}

std::string fourCCToString(uint32_t tag);

inline constexpr uint32_t kFormId = fourCC("FORM");
inline constexpr uint32_t kListId = fourCC("LIST");
inline constexpr size_t kChunkHeaderSize = 8;
inline constexpr size_t kMaxChunkDepth = 32;

/// Lookup identity of a chunk: the enclosing group's form type plus the chunk id.
struct ChunkKey {
    uint32_t type = 0;
    uint32_t id = 0;

    auto operator<=>(const ChunkKey&) const = default;
};

/// One node of a parsed chunk container. Group chunks (FORM/LIST) carry their form type
/// as `type` and own their children; data chunks own a private copy of their payload.
class Chunk {
public:
    Chunk(uint32_t type, uint32_t id, uint32_t size = 0, size_t position = 0);

    [[nodiscard]] uint32_t type() const {
        return type_;
    }
    [[nodiscard]] uint32_t id() const {
        return id_;
    }
    [[nodiscard]] uint32_t size() const {
        return size_;
    }
    [[nodiscard]] size_t position() const {
        return position_;
    }
    [[nodiscard]] ChunkKey key() const {
        return ChunkKey{type_, id_};
    }
    [[nodiscard]] bool isGroup() const {
        return id_ == kFormId || id_ == kListId;
    }

    [[nodiscard]] std::span<const uint8_t> payload() const {
        return payload_;
    }
    void setPayload(std::vector<uint8_t> payload);

    /// Cursor over this chunk's payload.
    [[nodiscard]] ByteReader reader() const {
        return ByteReader(payload_);
    }

    [[nodiscard]] const std::optional<std::string>& parserMessage() const {
        return parserMessage_;
    }
    void setParserMessage(std::string message);

    /// Inserts or replaces the property child with the same (type, id).
    void putPropertyChunk(Chunk chunk);
    [[nodiscard]] const Chunk* getPropertyChunk(uint32_t id) const;
    [[nodiscard]] const std::vector<Chunk>& propertyChunks() const {
        return propertyChunks_;
    }

    void addCollectionChunk(Chunk chunk);
    [[nodiscard]] std::vector<const Chunk*> getCollectionChunks(uint32_t id) const;
    [[nodiscard]] const std::vector<Chunk>& collectionChunks() const {
        return collectionChunks_;
    }

    [[nodiscard]] std::string toString() const;

private:
    uint32_t type_ = 0;
    uint32_t id_ = 0;
    uint32_t size_ = 0;
    size_t position_ = 0;
    std::vector<uint8_t> payload_;
    std::optional<std::string> parserMessage_;

    std::vector<Chunk> propertyChunks_;
    std::map<ChunkKey, size_t> propertyIndex_;
    std::vector<Chunk> collectionChunks_;
};

/// Walks a FORM/LIST chunk container once and builds an owned Chunk tree.
///
/// Wire layout: [4-byte id][4-byte little-endian size][size bytes]. FORM and LIST payloads
/// start with a 4-byte form type followed by child chunks. Chunks declared as property
/// chunks for their enclosing form type are stored map-like, everything else in file order.
class ChunkParser {
public:
    void declarePropertyChunk(uint32_t type, uint32_t id);
    [[nodiscard]] bool isPropertyChunk(uint32_t type, uint32_t id) const;

    /// Parses the container whose FORM header starts at `offset`.
    [[nodiscard]] std::expected<Chunk, ConvertError> parse(std::span<const uint8_t> bytes, size_t offset = 0) const;

private:
    std::expected<Chunk, ConvertError> parseGroup(std::span<const uint8_t> bytes, size_t headerPos, uint32_t id,
                                                  uint32_t declaredSize, uint32_t effectiveSize, size_t depth) const;

    std::set<ChunkKey> propertyChunkKeys_;
};

}  // namespace sampleconv::io
