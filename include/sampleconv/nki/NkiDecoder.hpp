#pragma once

#include "sampleconv/common/ConvertConfig.hpp"
#include "sampleconv/common/ConvertError.hpp"
#include "sampleconv/io/ByteCodec.hpp"
#include "sampleconv/io/ChunkStore.hpp"
#include "sampleconv/model/MultisampleSource.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>

namespace sampleconv::nki {

using common::ConvertError;

// Every NKI variant starts with a 16 byte header; the chunk container follows it.
inline constexpr size_t kNkiHeaderSize = 16;

inline constexpr uint32_t kVersion1FormType = io::fourCC("INS1");
inline constexpr uint32_t kVersion1GroupType = io::fourCC("GRUP");
inline constexpr uint32_t kVersion1ZoneId = io::fourCC("ZONE");
inline constexpr uint32_t kNameId = io::fourCC("NAME");
inline constexpr uint16_t kVersion1EnvelopeRevision = 0x0110;

inline constexpr uint32_t kVersion2FormType = io::fourCC("INS2");
inline constexpr uint32_t kVersion2LayerType = io::fourCC("LAYR");
inline constexpr uint32_t kVersion2RegionId = io::fourCC("RGN ");
inline constexpr uint32_t kInfoId = io::fourCC("INFO");
inline constexpr uint32_t kPathId = io::fourCC("PATH");
inline constexpr uint32_t kSampleTableId = io::fourCC("SMPL");
inline constexpr uint16_t kVersion2ExtendedRevision = 0x0200;

struct NkiDecodeContext {
    std::filesystem::path sourceFile;
    std::filesystem::path sourceFolder;  // Top folder of the scan, used for path parts
    common::MetadataConfig metadata;
};

/// One structural revision of the NKI container. Implementations read the complete file
/// (header included) and return one instrument, or nothing when no region was found.
class NkiDecoder {
public:
    virtual ~NkiDecoder() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual std::expected<std::vector<model::MultisampleSource>, ConvertError>
    decode(io::ByteReader& reader, const NkiDecodeContext& context) const = 0;
};

/// Revision 1: little-endian numbers, ISO-8859-1 strings, GRUP lists holding ZONE chunks.
class NkiVersion1Decoder final : public NkiDecoder {
public:
    [[nodiscard]] std::string_view name() const override {
        return "NKI version 1";
    }

    [[nodiscard]] std::expected<std::vector<model::MultisampleSource>, ConvertError>
    decode(io::ByteReader& reader, const NkiDecodeContext& context) const override;
};

/// Revision 2: a shared sample table plus LAYR lists holding RGN chunks. The byte order
/// applies to every number and UTF-16 string; the layout is the same for both orders.
class NkiVersion2Decoder final : public NkiDecoder {
public:
    explicit NkiVersion2Decoder(io::ByteOrder byteOrder) : byteOrder_(byteOrder) {}

    [[nodiscard]] std::string_view name() const override {
        return byteOrder_ == io::ByteOrder::LittleEndian ? "NKI version 2 (little-endian)"
                                                         : "NKI version 2 (big-endian)";
    }

    [[nodiscard]] io::ByteOrder byteOrder() const {
        return byteOrder_;
    }

    [[nodiscard]] std::expected<std::vector<model::MultisampleSource>, ConvertError>
    decode(io::ByteReader& reader, const NkiDecodeContext& context) const override;

private:
    io::ByteOrder byteOrder_;
};

}  // namespace sampleconv::nki
