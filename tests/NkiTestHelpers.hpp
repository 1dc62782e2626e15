#pragma once

#include "sampleconv/common/Notifier.hpp"
#include "sampleconv/io/ByteCodec.hpp"

#include <algorithm>
#include <bit>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sampleconv::test_helpers {

inline std::filesystem::path uniqueTempPath(std::string_view stem, std::string_view ext = {}) {
    const auto tempDir = std::filesystem::temp_directory_path();
    const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
    if (ext.empty()) {
        return tempDir / std::format("{}-{}", stem, tick);
    }
    return tempDir / std::format("{}-{}.{}", stem, tick, ext);
}

inline void writeFile(const std::filesystem::path& path, std::span<const uint8_t> bytes) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), {});
}

/// Appends numbers and texts in one byte order. Test strings are plain ASCII.
class ByteWriter {
public:
    explicit ByteWriter(io::ByteOrder order = io::ByteOrder::LittleEndian) : order_(order) {}

    ByteWriter& u8(uint8_t value) {
        bytes_.push_back(value);
        return *this;
    }

    ByteWriter& u16(uint16_t value) {
        return number(value, 2);
    }

    ByteWriter& u32(uint32_t value) {
        return number(value, 4);
    }

    ByteWriter& i32(int32_t value) {
        return number(std::bit_cast<uint32_t>(value), 4);
    }

    ByteWriter& f32(float value) {
        return number(std::bit_cast<uint32_t>(value), 4);
    }

    /// Four characters exactly as written, independent of the byte order.
    ByteWriter& tag(std::string_view fourCC) {
        for (size_t i = 0; i < 4; ++i) {
            bytes_.push_back(static_cast<uint8_t>(i < fourCC.size() ? fourCC[i] : ' '));
        }
        return *this;
    }

    ByteWriter& raw(std::span<const uint8_t> bytes) {
        bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
        return *this;
    }

    ByteWriter& vlq(uint32_t value) {
        while (value >= 0x80u) {
            bytes_.push_back(static_cast<uint8_t>((value & 0x7Fu) | 0x80u));
            value >>= 7u;
        }
        bytes_.push_back(static_cast<uint8_t>(value));
        return *this;
    }

    /// VLQ byte length followed by the encoded text.
    ByteWriter& text(std::string_view value, io::TextEncoding encoding) {
        const bool wide = encoding == io::TextEncoding::Utf16LE || encoding == io::TextEncoding::Utf16BE;
        vlq(static_cast<uint32_t>(wide ? value.size() * 2 : value.size()));
        for (const char ch : value) {
            const auto byte = static_cast<uint8_t>(ch);
            if (encoding == io::TextEncoding::Utf16LE) {
                bytes_.push_back(byte);
                bytes_.push_back(0);
            } else if (encoding == io::TextEncoding::Utf16BE) {
                bytes_.push_back(0);
                bytes_.push_back(byte);
            } else {
                bytes_.push_back(byte);
            }
        }
        return *this;
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const {
        return bytes_;
    }

private:
    ByteWriter& number(uint32_t value, int width) {
        for (int i = 0; i < width; ++i) {
            const int shift = order_ == io::ByteOrder::LittleEndian ? 8 * i : 8 * (width - 1 - i);
            bytes_.push_back(static_cast<uint8_t>((value >> shift) & 0xFFu));
        }
        return *this;
    }

    io::ByteOrder order_;
    std::vector<uint8_t> bytes_;
};

/// [id][little-endian size][payload]
inline std::vector<uint8_t> dataChunk(std::string_view id, std::span<const uint8_t> payload) {
    ByteWriter writer;
    writer.tag(id).u32(static_cast<uint32_t>(payload.size())).raw(payload);
    return writer.bytes();
}

inline std::vector<uint8_t> groupChunk(std::string_view id, std::string_view formType,
                                       const std::vector<std::vector<uint8_t>>& children) {
    std::vector<uint8_t> payload;
    ByteWriter type;
    type.tag(formType);
    payload.insert(payload.end(), type.bytes().begin(), type.bytes().end());
    for (const auto& child : children) {
        payload.insert(payload.end(), child.begin(), child.end());
    }
    return dataChunk(id, payload);
}

/// 16 byte NKI file header. The magic is stored most significant byte first.
inline std::vector<uint8_t> fileHeader(uint32_t magic, io::ByteOrder order, uint16_t revision, uint32_t created,
                                       std::string_view reserved = {}) {
    ByteWriter writer(order);
    ByteWriter magicWriter(io::ByteOrder::BigEndian);
    magicWriter.u32(magic);
    writer.raw(magicWriter.bytes()).u16(revision).u16(0).u32(created);
    for (size_t i = 0; i < 4; ++i) {
        writer.u8(i < reserved.size() ? static_cast<uint8_t>(reserved[i]) : 0);
    }
    return writer.bytes();
}

struct ZoneSpec {
    uint8_t root = 60;
    uint8_t lowKey = 0;
    uint8_t highKey = 127;
    uint8_t lowVelocity = 0;
    uint8_t highVelocity = 127;
    uint8_t flags = 0;
    int32_t start = -1;
    int32_t end = -1;
    float tune = 0.0f;
    float gain = 0.0f;
    uint32_t sampleRate = 44100;
    uint8_t loopMode = 0;
    uint32_t loopStart = 0;
    uint32_t loopEnd = 0;
    float loopCrossfade = 0.0f;
    std::string samplePath = "Samples\\piano.wav";
    float attack = 0.01f;
    float hold = 0.0f;
    float decay = 0.5f;
    float sustain = 0.8f;
    float release = 0.3f;
};

struct Version1LayerSpec {
    std::string name;
    std::vector<ZoneSpec> zones;
};

struct Version1Spec {
    std::string name = "Grand Piano";
    std::vector<Version1LayerSpec> layers;
    uint16_t revision = 0x0110;
    uint32_t created = 0;
};

inline std::vector<uint8_t> zonePayload(const ZoneSpec& zone, bool withEnvelope) {
    ByteWriter writer;
    writer.u8(zone.root).u8(zone.lowKey).u8(zone.highKey).u8(zone.lowVelocity).u8(zone.highVelocity).u8(zone.flags);
    writer.i32(zone.start).i32(zone.end).f32(zone.tune).f32(zone.gain).u32(zone.sampleRate);
    writer.u8(zone.loopMode).u32(zone.loopStart).u32(zone.loopEnd).f32(zone.loopCrossfade);
    writer.text(zone.samplePath, io::TextEncoding::Latin1);
    if (withEnvelope) {
        writer.f32(zone.attack).f32(zone.hold).f32(zone.decay).f32(zone.sustain).f32(zone.release);
    }
    return writer.bytes();
}

inline std::vector<uint8_t> buildVersion1File(const Version1Spec& spec) {
    const bool withEnvelope = spec.revision >= 0x0110;

    std::vector<std::vector<uint8_t>> children;
    ByteWriter name;
    name.text(spec.name, io::TextEncoding::Latin1);
    children.push_back(dataChunk("NAME", name.bytes()));

    for (const auto& layer : spec.layers) {
        std::vector<std::vector<uint8_t>> layerChildren;
        ByteWriter layerName;
        layerName.text(layer.name, io::TextEncoding::Latin1);
        layerChildren.push_back(dataChunk("NAME", layerName.bytes()));
        for (const auto& zone : layer.zones) {
            layerChildren.push_back(dataChunk("ZONE", zonePayload(zone, withEnvelope)));
        }
        children.push_back(groupChunk("LIST", "GRUP", layerChildren));
    }

    auto file = fileHeader(0x5EE56EB3, io::ByteOrder::LittleEndian, spec.revision, spec.created);
    const auto form = groupChunk("FORM", "INS1", children);
    file.insert(file.end(), form.begin(), form.end());
    return file;
}

struct LoopSpec {
    uint8_t type = 0;
    uint32_t start = 0;
    uint32_t end = 0;
    float crossfade = 0.0f;
};

struct RegionSpec {
    uint16_t flags = 0;
    uint8_t root = 60;
    uint8_t lowKey = 0;
    uint8_t highKey = 127;
    uint8_t lowVelocity = 0;
    uint8_t highVelocity = 127;
    int32_t start = -1;
    int32_t end = -1;
    float tune = 0.0f;
    float gain = 0.0f;
    uint32_t sampleRate = 44100;
    uint16_t sampleIndex = 0;
    float attack = -1.0f;
    float decay = -1.0f;
    float sustain = -1.0f;
    float release = -1.0f;
    std::vector<LoopSpec> loops;
    uint8_t keyCrossfadeLow = 0;
    uint8_t keyCrossfadeHigh = 0;
    uint8_t velocityCrossfadeLow = 0;
    uint8_t velocityCrossfadeHigh = 0;
    float keyTracking = 1.0f;
    float delay = -1.0f;
    float hold = -1.0f;
    float startLevel = -1.0f;
};

struct Version2LayerSpec {
    std::string name;
    std::vector<RegionSpec> regions;
};

struct Version2Spec {
    std::string name = "Strings";
    float tune = 0.0f;
    float gain = 0.0f;
    std::optional<std::string> sampleFolder;
    std::vector<std::string> samples = {"violin_c3.wav"};
    std::vector<Version2LayerSpec> layers;
    uint16_t revision = 0x0200;
    uint32_t created = 0;
    bool includeInfo = true;
    bool includeSampleTable = true;
};

inline std::vector<uint8_t> regionPayload(const RegionSpec& region, io::ByteOrder order, bool extended) {
    ByteWriter writer(order);
    writer.u16(region.flags);
    writer.u8(region.root).u8(region.lowKey).u8(region.highKey).u8(region.lowVelocity).u8(region.highVelocity);
    writer.i32(region.start).i32(region.end).f32(region.tune).f32(region.gain).u32(region.sampleRate);
    writer.u16(region.sampleIndex);
    writer.f32(region.attack).f32(region.decay).f32(region.sustain).f32(region.release);
    writer.u8(static_cast<uint8_t>(region.loops.size()));
    for (const auto& loop : region.loops) {
        writer.u8(loop.type).u32(loop.start).u32(loop.end).f32(loop.crossfade);
    }
    if (extended) {
        writer.u8(region.keyCrossfadeLow).u8(region.keyCrossfadeHigh);
        writer.u8(region.velocityCrossfadeLow).u8(region.velocityCrossfadeHigh);
        writer.f32(region.keyTracking).f32(region.delay).f32(region.hold).f32(region.startLevel);
    }
    return writer.bytes();
}

inline std::vector<uint8_t> buildVersion2File(const Version2Spec& spec, io::ByteOrder order) {
    const auto encoding = order == io::ByteOrder::LittleEndian ? io::TextEncoding::Utf16LE : io::TextEncoding::Utf16BE;
    const bool extended = spec.revision >= 0x0200;

    std::vector<std::vector<uint8_t>> children;
    if (spec.includeInfo) {
        ByteWriter info(order);
        info.text(spec.name, encoding).f32(spec.tune).f32(spec.gain);
        children.push_back(dataChunk("INFO", info.bytes()));
    }
    if (spec.sampleFolder.has_value()) {
        ByteWriter path(order);
        path.text(*spec.sampleFolder, encoding);
        children.push_back(dataChunk("PATH", path.bytes()));
    }
    if (spec.includeSampleTable) {
        ByteWriter table(order);
        table.u32(static_cast<uint32_t>(spec.samples.size()));
        for (const auto& sample : spec.samples) {
            table.text(sample, encoding);
        }
        children.push_back(dataChunk("SMPL", table.bytes()));
    }

    for (const auto& layer : spec.layers) {
        std::vector<std::vector<uint8_t>> layerChildren;
        if (!layer.name.empty()) {
            ByteWriter layerInfo(order);
            layerInfo.text(layer.name, encoding);
            layerChildren.push_back(dataChunk("INFO", layerInfo.bytes()));
        }
        for (const auto& region : layer.regions) {
            layerChildren.push_back(dataChunk("RGN ", regionPayload(region, order, extended)));
        }
        children.push_back(groupChunk("LIST", "LAYR", layerChildren));
    }

    const uint32_t magic = order == io::ByteOrder::LittleEndian ? 0x1290A87F : 0x7FA89012;
    auto file = fileHeader(magic, order, spec.revision, spec.created);
    const auto form = groupChunk("FORM", "INS2", children);
    file.insert(file.end(), form.begin(), form.end());
    return file;
}

/// Keeps every diagnostic for inspection. Safe to use from a worker thread.
class RecordingNotifier : public common::Notifier {
public:
    struct Entry {
        std::string key;
        std::string detail;
        bool error = false;
    };

    void log(std::string_view key, std::string_view detail = {}) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{std::string(key), std::string(detail), false});
    }

    void logError(std::string_view key, std::string_view detail = {}) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{std::string(key), std::string(detail), true});
    }

    [[nodiscard]] std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    [[nodiscard]] std::vector<Entry> errors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Entry> result;
        std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(result),
                     [](const Entry& entry) { return entry.error; });
        return result;
    }

    [[nodiscard]] size_t count(std::string_view key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                 [&](const Entry& entry) { return entry.key == key; }));
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

}  // namespace sampleconv::test_helpers
