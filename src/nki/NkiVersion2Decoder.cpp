#include "sampleconv/nki/NkiDecoder.hpp"

#include "NkiDecoderShared.hpp"

#include "sampleconv/model/ModelAssembly.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace sampleconv::nki {
namespace {

using detail::FieldReader;

constexpr uint16_t kFlagReversed = 0x0001;
constexpr uint16_t kFlagRoundRobin = 0x0002;

constexpr int kDefaultSampleRate = 44100;

struct InstrumentInfo {
    std::string name;
    double tune = 0.0;
    double gain = 0.0;
};

io::ChunkParser makeParser() {
    io::ChunkParser parser;
    parser.declarePropertyChunk(kVersion2FormType, kInfoId);
    parser.declarePropertyChunk(kVersion2FormType, kPathId);
    parser.declarePropertyChunk(kVersion2FormType, kSampleTableId);
    parser.declarePropertyChunk(kVersion2LayerType, kInfoId);
    return parser;
}

io::TextEncoding textEncoding(io::ByteOrder order) {
    return order == io::ByteOrder::LittleEndian ? io::TextEncoding::Utf16LE : io::TextEncoding::Utf16BE;
}

std::expected<InstrumentInfo, ConvertError> readInstrumentInfo(const io::Chunk& root, io::ByteOrder order) {
    const io::Chunk* infoChunk = root.getPropertyChunk(kInfoId);
    if (infoChunk == nullptr) {
        return detail::corrupt("Instrument has no INFO chunk");
    }

    FieldReader fields(infoChunk->reader(), order);
    InstrumentInfo info;
    info.name = fields.text(textEncoding(order));
    info.tune = fields.f32();
    info.gain = fields.f32();
    if (!fields.ok()) {
        return detail::recordError(*infoChunk, fields);
    }
    return info;
}

std::expected<std::string, ConvertError> readSampleFolder(const io::Chunk& root, io::ByteOrder order) {
    const io::Chunk* pathChunk = root.getPropertyChunk(kPathId);
    if (pathChunk == nullptr) {
        return std::string{};
    }
    FieldReader fields(pathChunk->reader(), order);
    std::string folder = fields.text(textEncoding(order));
    if (!fields.ok()) {
        return detail::recordError(*pathChunk, fields);
    }
    return folder;
}

std::expected<std::vector<std::string>, ConvertError> readSampleTable(const io::Chunk& root, io::ByteOrder order) {
    const io::Chunk* tableChunk = root.getPropertyChunk(kSampleTableId);
    if (tableChunk == nullptr) {
        return detail::corrupt("Instrument has no SMPL chunk");
    }

    FieldReader fields(tableChunk->reader(), order);
    const uint32_t count = fields.u32();
    if (!fields.ok()) {
        return detail::recordError(*tableChunk, fields);
    }
    // Each entry needs at least its one byte length prefix.
    if (count > fields.remaining()) {
        return detail::corrupt(std::format("Sample table declares {} entries but holds only {} bytes", count,
                                           fields.remaining()));
    }

    std::vector<std::string> names;
    names.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        names.push_back(fields.text(textEncoding(order)));
        if (!fields.ok()) {
            return detail::recordError(*tableChunk, fields);
        }
    }
    return names;
}

std::expected<model::LoopType, ConvertError> loopTypeFromCode(uint8_t code, const io::Chunk& region) {
    switch (code) {
    case 0:
        return model::LoopType::Forward;
    case 1:
        return model::LoopType::Backward;
    case 2:
        return model::LoopType::Alternating;
    default:
        return detail::corrupt(
            std::format("Region at offset {} has unknown loop type {}", region.position(), code));
    }
}

class RegionReader {
public:
    RegionReader(io::ByteOrder order, uint16_t revision, const InstrumentInfo& info, const std::string& sampleFolder,
                 const std::vector<std::string>& sampleNames, const NkiDecodeContext& context)
        : order_(order), revision_(revision), info_(info), sampleFolder_(sampleFolder), sampleNames_(sampleNames),
          context_(context) {}

    std::expected<model::SampleMetadata, ConvertError> read(const io::Chunk& region) const {
        FieldReader fields(region.reader(), order_);

        model::SampleMetadata sample;
        const uint16_t flags = fields.u16();
        sample.reversed = (flags & kFlagReversed) != 0;
        sample.playLogic =
            (flags & kFlagRoundRobin) != 0 ? model::PlayLogic::RoundRobin : model::PlayLogic::OneShot;

        sample.keyRoot = fields.u8();
        sample.keyLow = fields.u8();
        sample.keyHigh = fields.u8();
        sample.velocityLow = fields.u8();
        const uint8_t velocityHigh = fields.u8();
        sample.velocityHigh = velocityHigh == 0 ? model::kMaxMidiValue : velocityHigh;

        sample.start = detail::frameOrUnset(fields.i32());
        sample.stop = detail::frameOrUnset(fields.i32());
        sample.tune = static_cast<double>(fields.f32()) + info_.tune;
        sample.gain = static_cast<double>(fields.f32()) + info_.gain;
        const uint32_t sampleRate = fields.u32();
        sample.sampleRate = sampleRate == 0 ? kDefaultSampleRate : static_cast<int>(sampleRate);
        const uint16_t sampleIndex = fields.u16();

        auto& envelope = sample.amplitudeEnvelope;
        envelope.attack = detail::envelopeValue(fields.f32());
        envelope.decay = detail::envelopeValue(fields.f32());
        envelope.sustain = detail::envelopeValue(fields.f32());
        envelope.release = detail::envelopeValue(fields.f32());

        const uint8_t loopCount = fields.u8();
        for (uint8_t i = 0; i < loopCount && fields.ok(); ++i) {
            const uint8_t type = fields.u8();
            model::SampleLoop loop;
            loop.start = fields.frameIndex();
            loop.end = fields.frameIndex();
            loop.crossfade = std::clamp(static_cast<double>(fields.f32()), 0.0, 1.0);
            if (!fields.ok()) {
                break;
            }
            auto loopType = loopTypeFromCode(type, region);
            if (!loopType.has_value()) {
                return std::unexpected(loopType.error());
            }
            loop.type = *loopType;
            sample.loops.push_back(loop);
        }

        if (revision_ >= kVersion2ExtendedRevision) {
            sample.noteCrossfadeLow = fields.u8();
            sample.noteCrossfadeHigh = fields.u8();
            sample.velocityCrossfadeLow = fields.u8();
            sample.velocityCrossfadeHigh = fields.u8();
            sample.keyTracking = fields.f32();
            envelope.delay = detail::envelopeValue(fields.f32());
            envelope.hold = detail::envelopeValue(fields.f32());
            envelope.start = detail::envelopeValue(fields.f32());
        }

        if (!fields.ok()) {
            return detail::recordError(region, fields);
        }

        if (sampleIndex >= sampleNames_.size()) {
            return detail::corrupt(std::format("Region at offset {} references sample {} of {}", region.position(),
                                               sampleIndex, sampleNames_.size()));
        }
        const std::string& sampleName = sampleNames_[sampleIndex];
        const std::string storedPath = sampleFolder_.empty() ? sampleName : sampleFolder_ + "/" + sampleName;
        sample.sampleFile = model::resolveSamplePath(context_.sourceFile, storedPath);
        sample.filename = sample.sampleFile.filename().string();

        model::normalizeRanges(sample);
        return sample;
    }

private:
    io::ByteOrder order_;
    uint16_t revision_;
    const InstrumentInfo& info_;
    const std::string& sampleFolder_;
    const std::vector<std::string>& sampleNames_;
    const NkiDecodeContext& context_;
};

}  // namespace

std::expected<std::vector<model::MultisampleSource>, ConvertError>
NkiVersion2Decoder::decode(io::ByteReader& reader, const NkiDecodeContext& context) const {
    auto header = detail::readFileHeader(reader, byteOrder_);
    if (!header.has_value()) {
        return std::unexpected(header.error());
    }

    const auto parser = makeParser();
    auto root = parser.parse(reader.bytes(), kNkiHeaderSize);
    if (!root.has_value()) {
        return std::unexpected(root.error());
    }
    if (root->type() != kVersion2FormType) {
        return detail::corrupt(std::format("Expected form type INS2, found '{}'", io::fourCCToString(root->type())));
    }

    auto info = readInstrumentInfo(*root, byteOrder_);
    if (!info.has_value()) {
        return std::unexpected(info.error());
    }
    auto sampleFolder = readSampleFolder(*root, byteOrder_);
    if (!sampleFolder.has_value()) {
        return std::unexpected(sampleFolder.error());
    }
    auto sampleNames = readSampleTable(*root, byteOrder_);
    if (!sampleNames.has_value()) {
        return std::unexpected(sampleNames.error());
    }

    const RegionReader regionReader(byteOrder_, header->revision, *info, *sampleFolder, *sampleNames, context);

    std::vector<model::VelocityLayer> layers;
    for (const io::Chunk* layerChunk : root->getCollectionChunks(io::kListId)) {
        if (layerChunk->type() != kVersion2LayerType) {
            continue;
        }

        model::VelocityLayer layer;
        if (const io::Chunk* layerInfo = layerChunk->getPropertyChunk(kInfoId)) {
            FieldReader fields(layerInfo->reader(), byteOrder_);
            layer.name = fields.text(textEncoding(byteOrder_));
            if (!fields.ok()) {
                return detail::recordError(*layerInfo, fields);
            }
        }

        for (const io::Chunk* region : layerChunk->getCollectionChunks(kVersion2RegionId)) {
            auto sample = regionReader.read(*region);
            if (!sample.has_value()) {
                return std::unexpected(sample.error());
            }
            layer.samples.push_back(std::move(*sample));
        }
        layers.push_back(std::move(layer));
    }

    auto source = model::assembleMultisampleSource(context.sourceFile, context.sourceFolder, std::move(info->name),
                                                   std::move(layers), context.metadata);
    source.creationTime = detail::creationTime(*header);
    if (model::regionCount(source) == 0) {
        return std::vector<model::MultisampleSource>{};
    }

    std::vector<model::MultisampleSource> result;
    result.push_back(std::move(source));
    return result;
}

}  // namespace sampleconv::nki
