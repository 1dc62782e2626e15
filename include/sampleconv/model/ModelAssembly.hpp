#pragma once

#include "sampleconv/common/ConvertConfig.hpp"
#include "sampleconv/model/MultisampleSource.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sampleconv::model {

/// Splits the location of `file` into display parts: its stem, then each enclosing folder
/// up to (not including) `sourceFolder`. Without a common root only the parent is used.
std::vector<std::string> createPathParts(const std::filesystem::path& file, const std::filesystem::path& sourceFolder);

/// Builds the normalized instrument for one decoded file: keeps non-empty layers in order,
/// fills path-derived parts and the inferred creator, category and keywords.
MultisampleSource assembleMultisampleSource(const std::filesystem::path& file,
                                            const std::filesystem::path& sourceFolder, std::string name,
                                            std::vector<VelocityLayer> layers,
                                            const common::MetadataConfig& metadata);

/// Resolves a path stored in an instrument file against the folder of that file.
std::filesystem::path resolveSamplePath(const std::filesystem::path& instrumentFile, std::string_view storedPath);

/// Clamps key and velocity values into the MIDI range, orders low/high and keeps the root
/// key inside the key range.
void normalizeRanges(SampleMetadata& sample);

}  // namespace sampleconv::model
