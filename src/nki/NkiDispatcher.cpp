#include "sampleconv/nki/NkiDispatcher.hpp"

#include "sampleconv/common/FileUtils.hpp"
#include "sampleconv/io/ByteCodec.hpp"

#include <format>
#include <string>
#include <utility>

namespace sampleconv::nki {
namespace {

using common::ConvertErrorKind;
namespace msg = common::msg;

std::unexpected<ConvertError> reject(ConvertErrorKind kind, std::string_view key, std::string message) {
    return std::unexpected(ConvertError{kind, std::move(message), key});
}

bool hasNextGenerationSignature(std::span<const uint8_t> bytes) {
    io::ByteReader reader(bytes);
    reader.seek(kSignatureOffset);
    auto signature = io::readFixedLengthText(reader, kNextGenerationSignature.size());
    return signature.has_value() && *signature == kNextGenerationSignature;
}

}  // namespace

std::optional<NkiVariant> variantForMagic(uint32_t magic) {
    switch (magic) {
    case kVersion1Magic:
        return NkiVariant::Version1;
    case kVersion2LittleEndianMagic:
        return NkiVariant::Version2LittleEndian;
    case kVersion2BigEndianMagic:
        return NkiVariant::Version2BigEndian;
    case kMonolithMagic:
        return NkiVariant::Monolith;
    default:
        return std::nullopt;
    }
}

std::string_view variantName(NkiVariant variant) {
    switch (variant) {
    case NkiVariant::Version1:
        return "Version1";
    case NkiVariant::Version2LittleEndian:
        return "Version2LittleEndian";
    case NkiVariant::Version2BigEndian:
        return "Version2BigEndian";
    case NkiVariant::Monolith:
        return "Monolith";
    }
    return "Unknown";
}

NkiDispatcher::NkiDispatcher(common::Notifier& notifier) : notifier_(notifier) {}

const NkiDecoder& NkiDispatcher::decoderFor(NkiVariant variant) const {
    switch (variant) {
    case NkiVariant::Version1:
        return version1_;
    case NkiVariant::Version2LittleEndian:
        return version2LittleEndian_;
    case NkiVariant::Version2BigEndian:
        return version2BigEndian_;
    case NkiVariant::Monolith:
        break;  // Rejected in detect()
    }
    return version1_;
}

std::expected<std::vector<model::MultisampleSource>, ConvertError>
NkiDispatcher::detect(std::span<const uint8_t> bytes, const NkiDecodeContext& context) const {
    if (hasNextGenerationSignature(bytes)) {
        return reject(ConvertErrorKind::UnsupportedVariant, msg::kNkiNextGenerationNotSupported,
                      "Newer container signature found at offset 12");
    }

    io::ByteReader reader(bytes);
    const auto magicBytes = reader.take(4);
    if (magicBytes.empty()) {
        return reject(ConvertErrorKind::EndOfInput, msg::kNkiUnsupportedFileFormat,
                      std::format("File holds only {} bytes", bytes.size()));
    }
    const auto magic = static_cast<uint32_t>(io::fromMSBBytes(magicBytes));

    const auto variant = variantForMagic(magic);
    if (!variant.has_value()) {
        return reject(ConvertErrorKind::UnknownFormat, msg::kNkiUnknownFileId, std::format("{:X}", magic));
    }
    if (*variant == NkiVariant::Monolith) {
        return reject(ConvertErrorKind::UnsupportedVariant, msg::kNkiMonolithNotSupported,
                      "Monolith containers are not decoded");
    }

    reader.seek(0);
    auto result = decoderFor(*variant).decode(reader, context);
    if (!result.has_value()) {
        auto error = std::move(result.error());
        if (error.messageKey.empty()) {
            error.messageKey = msg::kNkiUnsupportedFileFormat;
        }
        return std::unexpected(std::move(error));
    }
    if (result->empty()) {
        return reject(ConvertErrorKind::NoRegionsFound, msg::kNkiCouldNotDetectLayers,
                      std::format("{} file without regions", variantName(*variant)));
    }
    return result;
}

std::vector<model::MultisampleSource> NkiDispatcher::readFile(const std::filesystem::path& file,
                                                              const NkiDecodeContext& context) const {
    auto bytes = common::readBinaryFile(file);
    if (!bytes.has_value()) {
        notifier_.logError(msg::kNotifyErrLoadFile, bytes.error());
        return {};
    }

    auto result = detect(*bytes, context);
    if (!result.has_value()) {
        const auto& error = result.error();
        notifier_.logError(error.messageKey, std::format("{}: {} ({})", file.string(), error.message,
                                                         common::errorKindName(error.kind)));
        return {};
    }
    return std::move(*result);
}

}  // namespace sampleconv::nki
