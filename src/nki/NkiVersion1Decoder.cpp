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

constexpr uint8_t kFlagReversed = 0x01;
constexpr uint8_t kFlagRoundRobin = 0x02;

constexpr uint8_t kLoopModeNone = 0;
constexpr uint8_t kLoopModeForward = 1;
constexpr uint8_t kLoopModeBackward = 2;
constexpr uint8_t kLoopModeAlternating = 3;

constexpr int kDefaultSampleRate = 44100;

io::ChunkParser makeParser() {
    io::ChunkParser parser;
    parser.declarePropertyChunk(kVersion1FormType, kNameId);
    parser.declarePropertyChunk(kVersion1GroupType, kNameId);
    return parser;
}

std::expected<std::string, ConvertError> readName(const io::Chunk& owner) {
    const io::Chunk* nameChunk = owner.getPropertyChunk(kNameId);
    if (nameChunk == nullptr) {
        return std::string{};
    }
    auto reader = nameChunk->reader();
    auto name = io::readLengthPrefixedText(reader, io::TextEncoding::Latin1);
    if (!name.has_value()) {
        return detail::corrupt(std::format("Name chunk at offset {} is malformed: {}", nameChunk->position(),
                                           name.error().message));
    }
    return name;
}

std::expected<model::SampleMetadata, ConvertError> parseZone(const io::Chunk& zone, uint16_t revision,
                                                             const NkiDecodeContext& context) {
    FieldReader fields(zone.reader(), io::ByteOrder::LittleEndian);

    model::SampleMetadata sample;
    sample.keyRoot = fields.u8();
    sample.keyLow = fields.u8();
    sample.keyHigh = fields.u8();
    sample.velocityLow = fields.u8();
    const uint8_t velocityHigh = fields.u8();
    sample.velocityHigh = velocityHigh == 0 ? model::kMaxMidiValue : velocityHigh;

    const uint8_t flags = fields.u8();
    sample.reversed = (flags & kFlagReversed) != 0;
    sample.playLogic = (flags & kFlagRoundRobin) != 0 ? model::PlayLogic::RoundRobin : model::PlayLogic::OneShot;

    sample.start = detail::frameOrUnset(fields.i32());
    sample.stop = detail::frameOrUnset(fields.i32());
    sample.tune = fields.f32();
    sample.gain = fields.f32();
    const uint32_t sampleRate = fields.u32();
    sample.sampleRate = sampleRate == 0 ? kDefaultSampleRate : static_cast<int>(sampleRate);

    const uint8_t loopMode = fields.u8();
    const int32_t loopStart = fields.frameIndex();
    const int32_t loopEnd = fields.frameIndex();
    const float loopCrossfade = fields.f32();

    const std::string samplePath = fields.text(io::TextEncoding::Latin1);

    if (revision >= kVersion1EnvelopeRevision) {
        auto& envelope = sample.amplitudeEnvelope;
        envelope.attack = detail::envelopeValue(fields.f32());
        envelope.hold = detail::envelopeValue(fields.f32());
        envelope.decay = detail::envelopeValue(fields.f32());
        envelope.sustain = detail::envelopeValue(fields.f32());
        envelope.release = detail::envelopeValue(fields.f32());
    }

    if (!fields.ok()) {
        return detail::recordError(zone, fields);
    }

    if (loopMode > kLoopModeAlternating) {
        return detail::corrupt(std::format("Zone at offset {} has unknown loop mode {}", zone.position(), loopMode));
    }
    if (loopMode != kLoopModeNone) {
        model::SampleLoop loop;
        loop.type = loopMode == kLoopModeForward    ? model::LoopType::Forward
                    : loopMode == kLoopModeBackward ? model::LoopType::Backward
                                                    : model::LoopType::Alternating;
        loop.start = loopStart;
        loop.end = loopEnd;
        loop.crossfade = std::clamp(static_cast<double>(loopCrossfade), 0.0, 1.0);
        sample.loops.push_back(loop);
    }

    if (samplePath.empty()) {
        return detail::corrupt(std::format("Zone at offset {} does not reference a sample", zone.position()));
    }
    sample.sampleFile = model::resolveSamplePath(context.sourceFile, samplePath);
    sample.filename = sample.sampleFile.filename().string();

    model::normalizeRanges(sample);
    return sample;
}

}  // namespace

std::expected<std::vector<model::MultisampleSource>, ConvertError>
NkiVersion1Decoder::decode(io::ByteReader& reader, const NkiDecodeContext& context) const {
    auto header = detail::readFileHeader(reader, io::ByteOrder::LittleEndian);
    if (!header.has_value()) {
        return std::unexpected(header.error());
    }

    const auto parser = makeParser();
    auto root = parser.parse(reader.bytes(), kNkiHeaderSize);
    if (!root.has_value()) {
        return std::unexpected(root.error());
    }
    if (root->type() != kVersion1FormType) {
        return detail::corrupt(std::format("Expected form type INS1, found '{}'", io::fourCCToString(root->type())));
    }

    auto name = readName(*root);
    if (!name.has_value()) {
        return std::unexpected(name.error());
    }

    std::vector<model::VelocityLayer> layers;
    for (const io::Chunk* group : root->getCollectionChunks(io::kListId)) {
        if (group->type() != kVersion1GroupType) {
            continue;
        }

        model::VelocityLayer layer;
        auto layerName = readName(*group);
        if (!layerName.has_value()) {
            return std::unexpected(layerName.error());
        }
        layer.name = std::move(*layerName);

        for (const io::Chunk* zone : group->getCollectionChunks(kVersion1ZoneId)) {
            auto sample = parseZone(*zone, header->revision, context);
            if (!sample.has_value()) {
                return std::unexpected(sample.error());
            }
            layer.samples.push_back(std::move(*sample));
        }
        layers.push_back(std::move(layer));
    }

    auto source = model::assembleMultisampleSource(context.sourceFile, context.sourceFolder, std::move(*name),
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
