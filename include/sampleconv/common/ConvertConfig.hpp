#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sampleconv::common {

struct CategoryRule {
    std::string name;
    std::vector<std::string> keywords;  // Lower-case words that select this category
};

/// Tag vocabulary consumed by the tag detector. Read-only during a conversion.
struct MetadataConfig {
    std::vector<std::string> creatorTags;
    std::string creatorName;
    std::vector<CategoryRule> categories;
    std::vector<std::string> keywords;
};

struct ConvertConfig {
    MetadataConfig metadata;
    std::filesystem::path logFile;
    std::filesystem::path outputFolder;
};

ConvertConfig defaultConvertConfig();

/// Parses a configuration document on top of the built-in defaults.
std::expected<ConvertConfig, std::string> parseConvertConfig(std::string_view jsonText);

/// Loads built-in defaults, then merges the bundled config and the user override (or
/// `overridePath` when given, which must exist). Missing optional files are skipped;
/// malformed JSON is an error.
std::expected<ConvertConfig, std::string>
loadConvertConfig(const std::optional<std::filesystem::path>& overridePath = std::nullopt);

}  // namespace sampleconv::common
