#include "sampleconv/io/ChunkStore.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace sampleconv::io {
namespace {

using common::ConvertErrorKind;

std::unexpected<ConvertError> corrupt(std::string message) {
    return std::unexpected(ConvertError{ConvertErrorKind::CorruptFormat, std::move(message)});
}

uint32_t readTag(std::span<const uint8_t> bytes, size_t offset) {
    return static_cast<uint32_t>(fromMSBBytes(bytes.subspan(offset, 4)));
}

uint32_t readSize(std::span<const uint8_t> bytes, size_t offset) {
    return static_cast<uint32_t>(fromLSBBytes(bytes.subspan(offset, 4)));
}

}  // namespace

std::string fourCCToString(uint32_t tag) {
    std::string text(4, ' ');
    for (size_t i = 0; i < 4; ++i) {
        const auto ch = static_cast<unsigned char>((tag >> (8u * (3u - i))) & 0xFFu);
        text[i] = (ch >= 0x20u && ch < 0x7Fu) ? static_cast<char>(ch) : '.';
    }
    return text;
}

Chunk::Chunk(uint32_t type, uint32_t id, uint32_t size, size_t position)
    : type_(type), id_(id), size_(size), position_(position) {}

void Chunk::setPayload(std::vector<uint8_t> payload) {
    payload_ = std::move(payload);
}

void Chunk::setParserMessage(std::string message) {
    if (parserMessage_.has_value()) {
        *parserMessage_ += "; ";
        *parserMessage_ += message;
        return;
    }
    parserMessage_ = std::move(message);
}

void Chunk::putPropertyChunk(Chunk chunk) {
    const ChunkKey key = chunk.key();
    if (const auto it = propertyIndex_.find(key); it != propertyIndex_.end()) {
        propertyChunks_[it->second] = std::move(chunk);
        return;
    }
    propertyIndex_.emplace(key, propertyChunks_.size());
    propertyChunks_.push_back(std::move(chunk));
}

const Chunk* Chunk::getPropertyChunk(uint32_t id) const {
    const auto it = propertyIndex_.find(ChunkKey{type_, id});
    if (it == propertyIndex_.end()) {
        return nullptr;
    }
    return &propertyChunks_[it->second];
}

void Chunk::addCollectionChunk(Chunk chunk) {
    collectionChunks_.push_back(std::move(chunk));
}

std::vector<const Chunk*> Chunk::getCollectionChunks(uint32_t id) const {
    std::vector<const Chunk*> chunks;
    for (const auto& chunk : collectionChunks_) {
        if (chunk.id_ == id) {
            chunks.push_back(&chunk);
        }
    }
    return chunks;
}

std::string Chunk::toString() const {
    return std::format("{{{},{}}}", fourCCToString(type_), fourCCToString(id_));
}

void ChunkParser::declarePropertyChunk(uint32_t type, uint32_t id) {
    propertyChunkKeys_.insert(ChunkKey{type, id});
}

bool ChunkParser::isPropertyChunk(uint32_t type, uint32_t id) const {
    return propertyChunkKeys_.contains(ChunkKey{type, id});
}

std::expected<Chunk, ConvertError> ChunkParser::parse(std::span<const uint8_t> bytes, size_t offset) const {
    if (offset > bytes.size() || bytes.size() - offset < kChunkHeaderSize) {
        return corrupt(std::format("Container header at offset {} is truncated", offset));
    }

    const uint32_t id = readTag(bytes, offset);
    if (id != kFormId) {
        return corrupt(std::format("Container at offset {} starts with '{}' instead of a FORM group", offset,
                                   fourCCToString(id)));
    }

    const uint32_t size = readSize(bytes, offset + 4);
    const size_t available = bytes.size() - offset - kChunkHeaderSize;
    if (size > available) {
        return corrupt(std::format("FORM size {} exceeds the {} bytes left in the stream", size, available));
    }

    auto root = parseGroup(bytes, offset, id, size, size, 0);
    if (!root.has_value()) {
        return std::unexpected(root.error());
    }
    if (size < available) {
        root->setParserMessage(std::format("{} bytes follow the container", available - size));
    }
    return root;
}

std::expected<Chunk, ConvertError> ChunkParser::parseGroup(std::span<const uint8_t> bytes, size_t headerPos,
                                                           uint32_t id, uint32_t declaredSize, uint32_t effectiveSize,
                                                           size_t depth) const {
    if (depth >= kMaxChunkDepth) {
        return corrupt(std::format("Groups nested deeper than {} levels at offset {}", kMaxChunkDepth, headerPos));
    }
    if (effectiveSize < 4) {
        return corrupt(std::format("Group at offset {} is too short for its form type", headerPos));
    }

    const size_t payloadStart = headerPos + kChunkHeaderSize;
    const uint32_t formType = readTag(bytes, payloadStart);
    Chunk group(formType, id, declaredSize, headerPos);

    size_t cursor = payloadStart + 4;
    const size_t end = payloadStart + effectiveSize;
    while (cursor < end) {
        if (end - cursor < kChunkHeaderSize) {
            group.setParserMessage(std::format("{} trailing bytes in group {}", end - cursor, group.toString()));
            break;
        }

        const uint32_t childId = readTag(bytes, cursor);
        const uint32_t childSize = readSize(bytes, cursor + 4);
        const size_t childPayload = cursor + kChunkHeaderSize;
        if (childSize > bytes.size() - childPayload) {
            return corrupt(std::format("Chunk '{}' at offset {} declares {} bytes but only {} remain",
                                       fourCCToString(childId), cursor, childSize, bytes.size() - childPayload));
        }

        const uint32_t childEffective = static_cast<uint32_t>(std::min<size_t>(childSize, end - childPayload));
        std::optional<Chunk> child;
        if (childId == kFormId || childId == kListId) {
            auto parsed = parseGroup(bytes, cursor, childId, childSize, childEffective, depth + 1);
            if (!parsed.has_value()) {
                return std::unexpected(parsed.error());
            }
            child = std::move(*parsed);
        } else {
            child.emplace(formType, childId, childSize, cursor);
            const auto data = bytes.subspan(childPayload, childEffective);
            child->setPayload(std::vector<uint8_t>(data.begin(), data.end()));
        }

        if (childEffective < childSize) {
            child->setParserMessage(std::format("Chunk size {} exceeds its enclosing group, truncated to {}",
                                                childSize, childEffective));
        }

        if (!child->isGroup() && isPropertyChunk(formType, childId)) {
            group.putPropertyChunk(std::move(*child));
        } else {
            group.addCollectionChunk(std::move(*child));
        }
        cursor = childPayload + childEffective;
    }

    return group;
}

}  // namespace sampleconv::io
