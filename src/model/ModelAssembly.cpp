#include "sampleconv/model/ModelAssembly.hpp"

#include "sampleconv/model/TagDetector.hpp"

#include <algorithm>
#include <utility>

namespace sampleconv::model {

std::vector<std::string> createPathParts(const std::filesystem::path& file, const std::filesystem::path& sourceFolder) {
    std::vector<std::string> parts;
    parts.push_back(file.stem().string());

    const auto parent = file.parent_path().lexically_normal();
    const auto root = sourceFolder.lexically_normal();
    const auto relative = root.empty() ? std::filesystem::path{} : parent.lexically_relative(root);

    if (relative.empty() || *relative.begin() == "..") {
        if (!parent.filename().empty()) {
            parts.push_back(parent.filename().string());
        }
        return parts;
    }

    std::vector<std::string> folders;
    for (const auto& segment : relative) {
        if (segment != "." && !segment.empty()) {
            folders.push_back(segment.string());
        }
    }
    parts.insert(parts.end(), folders.rbegin(), folders.rend());
    return parts;
}

MultisampleSource assembleMultisampleSource(const std::filesystem::path& file,
                                            const std::filesystem::path& sourceFolder, std::string name,
                                            std::vector<VelocityLayer> layers,
                                            const common::MetadataConfig& metadata) {
    MultisampleSource source;
    source.sourceFile = file;
    source.mappingName = file.filename().string();
    source.pathParts = createPathParts(file, sourceFolder);
    source.name = name.empty() ? file.stem().string() : std::move(name);

    source.creator = detectCreator(source.pathParts, metadata.creatorTags, metadata.creatorName);
    source.category = detectCategory(source.pathParts, metadata.categories);
    source.keywords = detectKeywords(source.pathParts, metadata.keywords);

    for (auto& layer : layers) {
        if (!layer.samples.empty()) {
            source.layers.push_back(std::move(layer));
        }
    }
    return source;
}

std::filesystem::path resolveSamplePath(const std::filesystem::path& instrumentFile, std::string_view storedPath) {
    std::string normalized(storedPath);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    const std::filesystem::path stored(normalized);
    if (stored.is_absolute()) {
        return stored.lexically_normal();
    }
    return (instrumentFile.parent_path() / stored).lexically_normal();
}

void normalizeRanges(SampleMetadata& sample) {
    const auto clampMidi = [](int value) { return std::clamp(value, kMinMidiValue, kMaxMidiValue); };

    if (sample.keyLow >= 0) {
        sample.keyLow = clampMidi(sample.keyLow);
    }
    if (sample.keyHigh >= 0) {
        sample.keyHigh = clampMidi(sample.keyHigh);
    }
    if (sample.keyLow >= 0 && sample.keyHigh >= 0 && sample.keyLow > sample.keyHigh) {
        std::swap(sample.keyLow, sample.keyHigh);
    }
    const int rootLow = sample.keyLow >= 0 ? sample.keyLow : kMinMidiValue;
    const int rootHigh = sample.keyHigh >= 0 ? sample.keyHigh : kMaxMidiValue;
    sample.keyRoot = std::clamp(sample.keyRoot, rootLow, rootHigh);

    sample.velocityLow = clampMidi(sample.velocityLow);
    sample.velocityHigh = clampMidi(sample.velocityHigh);
    if (sample.velocityLow > sample.velocityHigh) {
        std::swap(sample.velocityLow, sample.velocityHigh);
    }

    sample.noteCrossfadeLow = std::max(0, sample.noteCrossfadeLow);
    sample.noteCrossfadeHigh = std::max(0, sample.noteCrossfadeHigh);
    sample.velocityCrossfadeLow = std::max(0, sample.velocityCrossfadeLow);
    sample.velocityCrossfadeHigh = std::max(0, sample.velocityCrossfadeHigh);
}

}  // namespace sampleconv::model
