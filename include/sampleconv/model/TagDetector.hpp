#pragma once

#include "sampleconv/common/ConvertConfig.hpp"

#include <span>
#include <string>
#include <vector>

namespace sampleconv::model {

/// Returns the first creator tag found in any path part, or `defaultCreator`.
std::string detectCreator(std::span<const std::string> parts, std::span<const std::string> creatorTags,
                          const std::string& defaultCreator);

/// Returns the category whose keywords match a word of the path parts, earliest part first.
std::string detectCategory(std::span<const std::string> parts, std::span<const common::CategoryRule> categories);

/// Returns the vocabulary words that occur in the path parts, in vocabulary order.
std::vector<std::string> detectKeywords(std::span<const std::string> parts, std::span<const std::string> vocabulary);

}  // namespace sampleconv::model
