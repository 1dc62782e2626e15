#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sampleconv::common {

std::expected<std::vector<uint8_t>, std::string> readBinaryFile(const std::filesystem::path& path);

std::expected<void, std::string> writeTextFile(const std::filesystem::path& path, std::string_view text);

/// Copies a referenced audio file verbatim. An existing destination is left alone.
std::expected<void, std::string> copySampleFile(const std::filesystem::path& source,
                                                const std::filesystem::path& destination);

}  // namespace sampleconv::common
