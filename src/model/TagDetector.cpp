#include "sampleconv/model/TagDetector.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>

namespace sampleconv::model {
namespace {

[[nodiscard]] std::string lowerCopy(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

/// Lower-cased alphanumeric words of one path part.
std::vector<std::string> splitWords(std::string_view part) {
    std::vector<std::string> words;
    std::string current;
    for (const char raw : part) {
        const auto ch = static_cast<unsigned char>(raw);
        if (std::isalnum(ch) != 0) {
            current.push_back(static_cast<char>(std::tolower(ch)));
            continue;
        }
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

}  // namespace

std::string detectCreator(std::span<const std::string> parts, std::span<const std::string> creatorTags,
                          const std::string& defaultCreator) {
    for (const auto& part : parts) {
        const std::string lowerPart = lowerCopy(part);
        for (const auto& tag : creatorTags) {
            if (tag.empty()) {
                continue;
            }
            if (lowerPart.find(lowerCopy(tag)) != std::string::npos) {
                return tag;
            }
        }
    }
    return defaultCreator;
}

std::string detectCategory(std::span<const std::string> parts, std::span<const common::CategoryRule> categories) {
    for (const auto& part : parts) {
        for (const auto& word : splitWords(part)) {
            for (const auto& rule : categories) {
                const bool matches = std::any_of(rule.keywords.begin(), rule.keywords.end(),
                                                 [&](const std::string& keyword) { return lowerCopy(keyword) == word; });
                if (matches) {
                    return rule.name;
                }
            }
        }
    }
    return {};
}

std::vector<std::string> detectKeywords(std::span<const std::string> parts, std::span<const std::string> vocabulary) {
    std::vector<std::string> allWords;
    for (const auto& part : parts) {
        auto words = splitWords(part);
        allWords.insert(allWords.end(), words.begin(), words.end());
    }

    std::vector<std::string> keywords;
    for (const auto& keyword : vocabulary) {
        const std::string lowerKeyword = lowerCopy(keyword);
        if (std::find(allWords.begin(), allWords.end(), lowerKeyword) != allWords.end() &&
            std::find(keywords.begin(), keywords.end(), keyword) == keywords.end()) {
            keywords.push_back(keyword);
        }
    }
    return keywords;
}

}  // namespace sampleconv::model
