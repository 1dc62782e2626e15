#pragma once

#include "sampleconv/common/ConvertError.hpp"
#include "sampleconv/common/Notifier.hpp"
#include "sampleconv/model/MultisampleSource.hpp"
#include "sampleconv/nki/NkiDecoder.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace sampleconv::nki {

enum class NkiVariant : uint8_t {
    Version1,
    Version2LittleEndian,
    Version2BigEndian,
    Monolith,
};

inline constexpr uint32_t kVersion1Magic = 0x5EE56EB3;
inline constexpr uint32_t kVersion2LittleEndianMagic = 0x1290A87F;
inline constexpr uint32_t kVersion2BigEndianMagic = 0x7FA89012;
inline constexpr uint32_t kMonolithMagic = 0x2F5C204E;

// The newer container stores this signature where older files keep reserved bytes.
inline constexpr std::string_view kNextGenerationSignature = "hsin";
inline constexpr size_t kSignatureOffset = 12;

/// Maps the big-endian magic at offset 0 to a known variant.
std::optional<NkiVariant> variantForMagic(uint32_t magic);

std::string_view variantName(NkiVariant variant);

/// Identifies the NKI variant of a file and hands it to the matching decoder.
class NkiDispatcher {
public:
    explicit NkiDispatcher(common::Notifier& notifier);

    /// Decodes a complete file image. Rejected variants, unknown magic numbers, decode
    /// failures and files without regions come back as errors carrying their diagnostic key.
    [[nodiscard]] std::expected<std::vector<model::MultisampleSource>, ConvertError>
    detect(std::span<const uint8_t> bytes, const NkiDecodeContext& context) const;

    /// Per-file boundary: reads and decodes `file`, reports any failure as exactly one
    /// diagnostic naming the file, and returns an empty list in that case.
    std::vector<model::MultisampleSource> readFile(const std::filesystem::path& file,
                                                   const NkiDecodeContext& context) const;

private:
    [[nodiscard]] const NkiDecoder& decoderFor(NkiVariant variant) const;

    common::Notifier& notifier_;
    NkiVersion1Decoder version1_;
    NkiVersion2Decoder version2LittleEndian_{io::ByteOrder::LittleEndian};
    NkiVersion2Decoder version2BigEndian_{io::ByteOrder::BigEndian};
};

}  // namespace sampleconv::nki
