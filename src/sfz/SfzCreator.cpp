#include "sampleconv/sfz/SfzCreator.hpp"

#include "sampleconv/common/FileUtils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <format>
#include <map>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace sampleconv::sfz {
namespace {

using common::ConvertErrorKind;
namespace msg = common::msg;

constexpr std::string_view kHeaderRule = "/////////////////////////////////////////////////////////////////////////////";
constexpr std::string_view kCommentPrefix = "//// ";
constexpr std::string_view kUnnamed = "unnamed";

namespace opcode {
constexpr std::string_view kGlobalLabel = "global_label";
constexpr std::string_view kGroupLabel = "group_label";
constexpr std::string_view kSeqLength = "seq_length";
constexpr std::string_view kSeqPosition = "seq_position";
constexpr std::string_view kSample = "sample";
constexpr std::string_view kDirection = "direction";
constexpr std::string_view kKey = "key";
constexpr std::string_view kPitchKeycenter = "pitch_keycenter";
constexpr std::string_view kLoKey = "lo_key";
constexpr std::string_view kHiKey = "hi_key";
constexpr std::string_view kXfInLoKey = "xfin_lokey";
constexpr std::string_view kXfInHiKey = "xfin_hikey";
constexpr std::string_view kXfOutLoKey = "xfout_lokey";
constexpr std::string_view kXfOutHiKey = "xfout_hikey";
constexpr std::string_view kLoVel = "lovel";
constexpr std::string_view kHiVel = "hivel";
constexpr std::string_view kXfInLoVel = "xfin_lovel";
constexpr std::string_view kXfInHiVel = "xfin_hivel";
constexpr std::string_view kXfOutLoVel = "xfout_lovel";
constexpr std::string_view kXfOutHiVel = "xfout_hivel";
constexpr std::string_view kOffset = "offset";
constexpr std::string_view kEnd = "end";
constexpr std::string_view kTune = "tune";
constexpr std::string_view kPitchKeytrack = "pitch_keytrack";
constexpr std::string_view kVolume = "volume";
constexpr std::string_view kAmpegDelay = "ampeg_delay";
constexpr std::string_view kAmpegAttack = "ampeg_attack";
constexpr std::string_view kAmpegHold = "ampeg_hold";
constexpr std::string_view kAmpegDecay = "ampeg_decay";
constexpr std::string_view kAmpegRelease = "ampeg_release";
constexpr std::string_view kAmpegStart = "ampeg_start";
constexpr std::string_view kAmpegSustain = "ampeg_sustain";
constexpr std::string_view kLoopMode = "loop_mode";
constexpr std::string_view kLoopType = "loop_type";
constexpr std::string_view kLoopStart = "loop_start";
constexpr std::string_view kLoopEnd = "loop_end";
constexpr std::string_view kLoopCrossfade = "loop_crossfade";
}  // namespace opcode

/// Rounds halves towards positive infinity.
long long roundHalfUp(double value) {
    return static_cast<long long>(std::floor(value + 0.5));
}

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
}

/// Collects `name=value` tokens that share one output line.
class OpcodeLine {
public:
    template <typename T>
    void add(std::string_view name, const T& value) {
        if (!text_.empty()) {
            text_ += ' ';
        }
        text_ += std::format("{}={}", name, value);
    }

    void writeTo(std::string& out) const {
        if (!text_.empty()) {
            out += text_;
            out += '\n';
        }
    }

private:
    std::string text_;
};

template <typename T>
void writeOpcode(std::string& out, std::string_view name, const T& value) {
    out += std::format("{}={}\n", name, value);
}

void addEnvelopeValue(OpcodeLine& line, std::string_view name, double value) {
    if (value < 0.0) {
        return;
    }
    line.add(name, std::clamp(value, 0.0, 100.0));
}

void writeComment(std::string& out, std::string_view label, std::string_view value) {
    if (isBlank(value)) {
        return;
    }
    out += kCommentPrefix;
    out += label;
    out += value;
    out += '\n';
}

void writeHeader(std::string& out, const model::MultisampleSource& source) {
    out += kHeaderRule;
    out += "\n////\n";

    writeComment(out, "Creator : ", source.creator);
    writeComment(out, "Category: ", source.category);
    if (source.creationTime.has_value()) {
        writeComment(out, "Created : ", std::format("{:%Y-%m-%d %H:%M:%S}", *source.creationTime));
    }
    if (!isBlank(source.description)) {
        std::string description;
        for (const char ch : source.description) {
            description += ch;
            if (ch == '\n') {
                description += kCommentPrefix;
            }
        }
        writeComment(out, "", description);
    }
    out += '\n';
}

void writeKeyRange(std::string& out, const model::SampleMetadata& sample) {
    const int keyLow = sample.keyLow < 0 ? model::kMinMidiValue : sample.keyLow;
    const int keyHigh = sample.keyHigh < 0 ? model::kMaxMidiValue : sample.keyHigh;

    if (sample.keyRoot == sample.keyLow && sample.keyLow == sample.keyHigh) {
        writeOpcode(out, opcode::kKey, sample.keyRoot);
    } else {
        writeOpcode(out, opcode::kPitchKeycenter, sample.keyRoot);
        OpcodeLine range;
        range.add(opcode::kLoKey, keyLow);
        range.add(opcode::kHiKey, keyHigh);
        range.writeTo(out);
    }

    if (sample.noteCrossfadeLow > 0) {
        OpcodeLine fadeIn;
        fadeIn.add(opcode::kXfInLoKey, std::max(model::kMinMidiValue, keyLow - sample.noteCrossfadeLow));
        fadeIn.add(opcode::kXfInHiKey, keyLow);
        fadeIn.writeTo(out);
    }
    if (sample.noteCrossfadeHigh > 0) {
        OpcodeLine fadeOut;
        fadeOut.add(opcode::kXfOutLoKey, keyHigh);
        fadeOut.add(opcode::kXfOutHiKey, std::min(model::kMaxMidiValue, keyHigh + sample.noteCrossfadeHigh));
        fadeOut.writeTo(out);
    }
}

void writeVelocityRange(std::string& out, const model::SampleMetadata& sample) {
    const int velocityLow = sample.velocityLow;
    const int velocityHigh = sample.velocityHigh;

    OpcodeLine range;
    if (velocityLow > 1) {
        range.add(opcode::kLoVel, velocityLow);
    }
    if (velocityHigh > 0 && velocityHigh < model::kMaxMidiValue) {
        range.add(opcode::kHiVel, velocityHigh);
    }
    range.writeTo(out);

    if (sample.velocityCrossfadeLow > 0) {
        OpcodeLine fadeIn;
        fadeIn.add(opcode::kXfInLoVel, std::max(model::kMinMidiValue, velocityLow - sample.velocityCrossfadeLow));
        fadeIn.add(opcode::kXfInHiVel, std::clamp(velocityLow, model::kMinMidiValue, model::kMaxMidiValue));
        fadeIn.writeTo(out);
    }
    if (sample.velocityCrossfadeHigh > 0) {
        OpcodeLine fadeOut;
        fadeOut.add(opcode::kXfOutLoVel, std::clamp(velocityHigh, model::kMinMidiValue, model::kMaxMidiValue));
        fadeOut.add(opcode::kXfOutHiVel, std::min(model::kMaxMidiValue, velocityHigh + sample.velocityCrossfadeHigh));
        fadeOut.writeTo(out);
    }
}

void writeLevels(std::string& out, const model::SampleMetadata& sample) {
    OpcodeLine trim;
    if (sample.start >= 0) {
        trim.add(opcode::kOffset, sample.start);
    }
    if (sample.stop >= 0) {
        trim.add(opcode::kEnd, sample.stop);
    }
    trim.writeTo(out);

    if (sample.tune != 0.0) {
        writeOpcode(out, opcode::kTune, roundHalfUp(sample.tune * 100.0));
    }
    const long long keyTracking = roundHalfUp(sample.keyTracking * 100.0);
    if (keyTracking != 100) {
        writeOpcode(out, opcode::kPitchKeytrack, keyTracking);
    }
    if (sample.gain != 0.0) {
        writeOpcode(out, opcode::kVolume, sample.gain);
    }

    const auto& envelope = sample.amplitudeEnvelope;
    OpcodeLine envelopeLine;
    addEnvelopeValue(envelopeLine, opcode::kAmpegDelay, envelope.delay);
    addEnvelopeValue(envelopeLine, opcode::kAmpegAttack, envelope.attack);
    addEnvelopeValue(envelopeLine, opcode::kAmpegHold, envelope.hold);
    addEnvelopeValue(envelopeLine, opcode::kAmpegDecay, envelope.decay);
    addEnvelopeValue(envelopeLine, opcode::kAmpegRelease, envelope.release);
    // Levels are stored as fractions; unset (-1) stays negative after scaling.
    addEnvelopeValue(envelopeLine, opcode::kAmpegStart, envelope.start * 100.0);
    addEnvelopeValue(envelopeLine, opcode::kAmpegSustain, envelope.sustain * 100.0);
    envelopeLine.writeTo(out);
}

void writeLoop(std::string& out, const model::SampleMetadata& sample) {
    OpcodeLine line;
    if (sample.loops.empty()) {
        line.add(opcode::kLoopMode, "no_loop");
        line.writeTo(out);
        return;
    }

    // Only the first loop is expressible.
    const auto& loop = sample.loops.front();
    line.add(opcode::kLoopMode, "loop_continuous");
    if (loop.type != model::LoopType::Forward) {
        line.add(opcode::kLoopType, model::loopTypeName(loop.type));
    }
    line.add(opcode::kLoopStart, loop.start);
    line.add(opcode::kLoopEnd, loop.end);

    if (loop.crossfade > 0.0) {
        const int64_t loopLength = static_cast<int64_t>(loop.start) - loop.end;
        if (loopLength > 0 && sample.sampleRate > 0) {
            const double lengthSeconds = static_cast<double>(loopLength) / sample.sampleRate;
            line.add(opcode::kLoopCrossfade, roundHalfUp(loop.crossfade * lengthSeconds));
        }
    }
    line.writeTo(out);
}

/// Assigns each distinct sample file one name inside the sample folder. A file whose name is
/// already taken by a different source gets a numbered suffix.
class SamplePlacer {
public:
    explicit SamplePlacer(std::vector<SamplePlacement>& placements) : placements_(placements) {}

    std::string place(const model::SampleMetadata& sample) {
        if (sample.filename.empty()) {
            return {};
        }
        const auto source = sample.sampleFile.lexically_normal();
        if (const auto it = placedSources_.find(source); it != placedSources_.end()) {
            return it->second;
        }

        std::string name = sample.filename;
        if (usedNames_.contains(name)) {
            const std::filesystem::path original(sample.filename);
            const std::string stem = original.stem().string();
            const std::string extension = original.extension().string();
            for (int suffix = 2; usedNames_.contains(name); ++suffix) {
                name = std::format("{}_{}{}", stem, suffix, extension);
            }
        }

        usedNames_.insert(name);
        placedSources_.emplace(source, name);
        placements_.push_back(SamplePlacement{sample.sampleFile, name});
        return name;
    }

private:
    std::vector<SamplePlacement>& placements_;
    std::map<std::filesystem::path, std::string> placedSources_;
    std::set<std::string> usedNames_;
};

void writeRegion(std::string& out, const std::string& sampleFolderName, const std::string& placedName,
                 const model::SampleMetadata& sample, int sequencePosition) {
    out += "\n<region>\n";
    if (!placedName.empty()) {
        writeOpcode(out, opcode::kSample, std::format("{}\\{}", sampleFolderName, placedName));
    }
    if (sample.reversed) {
        writeOpcode(out, opcode::kDirection, "reverse");
    }
    if (sample.playLogic == model::PlayLogic::RoundRobin) {
        writeOpcode(out, opcode::kSeqPosition, sequencePosition);
    }

    writeKeyRange(out, sample);
    writeVelocityRange(out, sample);
    writeLevels(out, sample);
    writeLoop(out, sample);
}

}  // namespace

std::string createSafeFilename(std::string_view name) {
    constexpr std::string_view kForbidden = "\\/:*?\"<>|";

    std::string safe;
    safe.reserve(name.size());
    for (const char ch : name) {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte < 0x20u || byte == 0x7Fu || kForbidden.find(ch) != std::string_view::npos) {
            safe += '_';
        } else {
            safe += ch;
        }
    }

    const auto first = safe.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return std::string(kUnnamed);
    }
    const auto last = safe.find_last_not_of(" \t");
    return safe.substr(first, last - first + 1);
}

SfzDocument buildSfzDocument(const model::MultisampleSource& source) {
    SfzDocument document;
    document.sampleFolderName = createSafeFilename(source.name) + std::string(kSampleFolderSuffix);

    std::string& out = document.text;
    writeHeader(out, source);

    out += "<global>\n";
    if (!isBlank(source.name)) {
        writeOpcode(out, opcode::kGlobalLabel, source.name);
    }

    SamplePlacer placer(document.placements);
    for (const auto& layer : source.layers) {
        if (layer.samples.empty()) {
            continue;
        }

        const auto roundRobinCount =
            std::count_if(layer.samples.begin(), layer.samples.end(),
                          [](const model::SampleMetadata& s) { return s.playLogic == model::PlayLogic::RoundRobin; });

        out += "\n<group>\n";
        if (!isBlank(layer.name)) {
            writeOpcode(out, opcode::kGroupLabel, layer.name);
        }
        if (roundRobinCount > 0) {
            writeOpcode(out, opcode::kSeqLength, roundRobinCount);
        }

        int sequencePosition = 1;
        for (const auto& sample : layer.samples) {
            writeRegion(out, document.sampleFolderName, placer.place(sample), sample, sequencePosition);
            if (sample.playLogic == model::PlayLogic::RoundRobin) {
                ++sequencePosition;
            }
        }
    }
    return document;
}

std::expected<std::filesystem::path, ConvertError>
SfzCreator::create(const std::filesystem::path& destinationFolder, const model::MultisampleSource& source) const {
    const std::string safeName = createSafeFilename(source.name);
    const auto sfzFile = destinationFolder / (safeName + std::string(kSfzExtension));

    std::error_code ec;
    if (std::filesystem::exists(sfzFile, ec)) {
        notifier_.logError(msg::kNotifyAlreadyExists, sfzFile.string());
        return std::unexpected(ConvertError{ConvertErrorKind::DestinationCollision,
                                            std::format("'{}' already exists", sfzFile.string()),
                                            msg::kNotifyAlreadyExists});
    }

    const auto document = buildSfzDocument(source);
    notifier_.log(msg::kNotifyStoring, sfzFile.string());

    if (auto written = common::writeTextFile(sfzFile, document.text); !written.has_value()) {
        return std::unexpected(ConvertError{ConvertErrorKind::Io, written.error()});
    }

    const auto sampleFolder = destinationFolder / document.sampleFolderName;
    std::filesystem::create_directories(sampleFolder, ec);
    if (ec) {
        return std::unexpected(ConvertError{
            ConvertErrorKind::Io, std::format("Failed to create '{}': {}", sampleFolder.string(), ec.message())});
    }

    for (const auto& placement : document.placements) {
        auto copied = common::copySampleFile(placement.source, sampleFolder / placement.filename);
        if (!copied.has_value()) {
            notifier_.logError(msg::kNotifyErrSampleCopy, copied.error());
        }
    }

    notifier_.log(msg::kNotifyProgressDone);
    return sfzFile;
}

}  // namespace sampleconv::sfz
