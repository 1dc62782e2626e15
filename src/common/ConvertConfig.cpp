#include "sampleconv/common/ConvertConfig.hpp"

#include "sampleconv/common/Paths.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <format>
#include <fstream>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace sampleconv::common {
namespace {

constexpr std::string_view kDefaultConfigJson = R"({
  "creatorTags": [],
  "creatorName": "",
  "categories": {
    "Bass": ["bass", "sub"],
    "Brass": ["brass", "trumpet", "trombone", "horn", "tuba"],
    "Chromatic Percussion": ["bell", "bells", "celesta", "glockenspiel", "marimba", "vibraphone", "xylophone"],
    "Drums": ["drum", "drums", "kick", "snare", "hihat", "kit"],
    "Guitar": ["guitar", "gtr", "strat", "nylon"],
    "Keyboards": ["clav", "epiano", "rhodes", "wurli", "harpsichord"],
    "Orchestral": ["orchestra", "orchestral", "ensemble"],
    "Organ": ["organ", "hammond"],
    "Pad": ["pad", "pads", "atmosphere"],
    "Percussion": ["percussion", "perc", "shaker", "conga", "bongo"],
    "Piano": ["piano", "grand", "upright"],
    "Lead": ["lead", "solo"],
    "Strings": ["string", "strings", "violin", "viola", "cello", "contrabass"],
    "Synth": ["synth", "analog", "poly"],
    "Vocal": ["vocal", "vocals", "voice", "choir"],
    "Winds": ["flute", "clarinet", "oboe", "bassoon", "sax", "saxophone"]
  },
  "keywords": ["acoustic", "ambient", "bright", "dark", "digital", "distorted", "dry", "electric",
               "hard", "loop", "mellow", "soft", "vintage", "warm", "wet"],
  "logFile": "",
  "outputFolder": ""
})";

std::expected<std::optional<json>, std::string> loadJsonFile(const std::filesystem::path& path, bool required) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec) || ec) {
        if (required) {
            return std::unexpected(std::format("Config file '{}' does not exist", path.string()));
        }
        return std::optional<json>{};
    }

    std::ifstream in(path);
    if (!in) {
        return std::unexpected(std::format("Failed to open '{}'", path.string()));
    }

    try {
        json parsed;
        in >> parsed;
        return std::optional<json>(std::move(parsed));
    } catch (const std::exception& ex) {
        return std::unexpected(std::format("Failed to parse '{}': {}", path.string(), ex.what()));
    }
}

void mergeJsonObject(json& base, const json& overrides) {
    if (!base.is_object() || !overrides.is_object()) {
        return;
    }

    for (const auto& [key, overrideValue] : overrides.items()) {
        if (overrideValue.is_null()) {
            base.erase(key);
            continue;
        }

        auto baseIt = base.find(key);
        if (baseIt != base.end() && baseIt->is_object() && overrideValue.is_object()) {
            mergeJsonObject(*baseIt, overrideValue);
            continue;
        }

        base[key] = overrideValue;
    }
}

std::expected<std::vector<std::string>, std::string> parseStringList(const json& value, std::string_view what) {
    if (!value.is_array()) {
        return std::unexpected(std::format("'{}' must be an array of strings", what));
    }
    std::vector<std::string> values;
    values.reserve(value.size());
    for (const auto& entry : value) {
        if (!entry.is_string()) {
            return std::unexpected(std::format("'{}' must only contain strings", what));
        }
        values.push_back(entry.get<std::string>());
    }
    return values;
}

std::expected<std::vector<std::string>, std::string> readStringArray(const json& root, const char* key) {
    const auto it = root.find(key);
    if (it == root.end()) {
        return std::vector<std::string>{};
    }
    return parseStringList(*it, key);
}

std::expected<std::string, std::string> readString(const json& root, const char* key) {
    const auto it = root.find(key);
    if (it == root.end()) {
        return std::string{};
    }
    if (!it->is_string()) {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    return it->get<std::string>();
}

std::expected<ConvertConfig, std::string> configFromJson(const json& root) {
    if (!root.is_object()) {
        return std::unexpected("Config root must be an object");
    }

    ConvertConfig config;

    auto creatorTags = readStringArray(root, "creatorTags");
    if (!creatorTags.has_value()) {
        return std::unexpected(creatorTags.error());
    }
    config.metadata.creatorTags = std::move(*creatorTags);

    auto creatorName = readString(root, "creatorName");
    if (!creatorName.has_value()) {
        return std::unexpected(creatorName.error());
    }
    config.metadata.creatorName = std::move(*creatorName);

    auto keywords = readStringArray(root, "keywords");
    if (!keywords.has_value()) {
        return std::unexpected(keywords.error());
    }
    config.metadata.keywords = std::move(*keywords);

    if (const auto it = root.find("categories"); it != root.end()) {
        if (!it->is_object()) {
            return std::unexpected("'categories' must be an object");
        }
        for (const auto& [name, words] : it->items()) {
            auto parsed = parseStringList(words, name);
            if (!parsed.has_value()) {
                return std::unexpected(parsed.error());
            }
            config.metadata.categories.push_back(CategoryRule{name, std::move(*parsed)});
        }
    }

    auto logFile = readString(root, "logFile");
    if (!logFile.has_value()) {
        return std::unexpected(logFile.error());
    }
    config.logFile = *logFile;

    auto outputFolder = readString(root, "outputFolder");
    if (!outputFolder.has_value()) {
        return std::unexpected(outputFolder.error());
    }
    config.outputFolder = *outputFolder;

    return config;
}

json defaultConfigJson() {
    return json::parse(kDefaultConfigJson);
}

}  // namespace

ConvertConfig defaultConvertConfig() {
    auto config = configFromJson(defaultConfigJson());
    return config.has_value() ? std::move(*config) : ConvertConfig{};
}

std::expected<ConvertConfig, std::string> parseConvertConfig(std::string_view jsonText) {
    json overrides;
    try {
        overrides = json::parse(jsonText);
    } catch (const std::exception& ex) {
        return std::unexpected(std::format("Failed to parse config: {}", ex.what()));
    }
    if (!overrides.is_object()) {
        return std::unexpected("Config root must be an object");
    }

    json root = defaultConfigJson();
    mergeJsonObject(root, overrides);
    return configFromJson(root);
}

std::expected<ConvertConfig, std::string> loadConvertConfig(const std::optional<std::filesystem::path>& overridePath) {
    json root = defaultConfigJson();

    auto bundled = loadJsonFile(bundledConfigPath(), false);
    if (!bundled.has_value()) {
        return std::unexpected(bundled.error());
    }
    if (bundled->has_value()) {
        if (!(*bundled)->is_object()) {
            return std::unexpected("Bundled config root must be an object");
        }
        mergeJsonObject(root, **bundled);
    }

    const bool explicitOverride = overridePath.has_value();
    auto user = loadJsonFile(explicitOverride ? *overridePath : userConfigPath(), explicitOverride);
    if (!user.has_value()) {
        return std::unexpected(user.error());
    }
    if (user->has_value()) {
        if (!(*user)->is_object()) {
            return std::unexpected("User config root must be an object");
        }
        mergeJsonObject(root, **user);
    }

    return configFromJson(root);
}

}  // namespace sampleconv::common
