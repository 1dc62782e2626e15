#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sampleconv::model {

inline constexpr int kMinMidiValue = 0;
inline constexpr int kMaxMidiValue = 127;

enum class PlayLogic : uint8_t {
    OneShot,
    RoundRobin,
};

enum class LoopType : uint8_t {
    Forward,
    Backward,
    Alternating,
};

struct SampleLoop {
    LoopType type = LoopType::Forward;
    int start = 0;
    int end = 0;
    double crossfade = 0.0;  // Fraction of the loop length, 0..1
};

/// Amplitude envelope. Times are in seconds, levels are fractions; -1 means "not set".
struct Envelope {
    double delay = -1.0;
    double attack = -1.0;
    double hold = -1.0;
    double decay = -1.0;
    double release = -1.0;
    double start = -1.0;
    double sustain = -1.0;
};

struct SampleMetadata {
    std::filesystem::path sampleFile;  // Resolved path of the referenced audio file
    std::string filename;              // Name of the file inside the output sample folder

    int keyRoot = 60;
    int keyLow = 0;    // -1 = not set
    int keyHigh = 127; // -1 = not set
    int noteCrossfadeLow = 0;
    int noteCrossfadeHigh = 0;
    int velocityLow = 0;
    int velocityHigh = 127;
    int velocityCrossfadeLow = 0;
    int velocityCrossfadeHigh = 0;

    PlayLogic playLogic = PlayLogic::OneShot;
    bool reversed = false;
    int start = -1;  // Frames, -1 = whole sample
    int stop = -1;

    double tune = 0.0;         // Semitones
    double keyTracking = 1.0;  // 1.0 = full tracking
    double gain = 0.0;         // dB
    int sampleRate = 44100;

    std::vector<SampleLoop> loops;
    Envelope amplitudeEnvelope;
};

struct VelocityLayer {
    std::string name;
    std::vector<SampleMetadata> samples;
};

struct MultisampleSource {
    std::filesystem::path sourceFile;
    std::vector<std::string> pathParts;  // File stem first, then enclosing folders outwards
    std::string name;
    std::string mappingName;
    std::string description;
    std::string creator;
    std::string category;
    std::vector<std::string> keywords;
    std::optional<std::chrono::sys_seconds> creationTime;
    std::vector<VelocityLayer> layers;
};

std::string_view loopTypeName(LoopType type);

/// Total number of regions across all layers.
size_t regionCount(const MultisampleSource& source);

}  // namespace sampleconv::model
