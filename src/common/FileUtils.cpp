#include "sampleconv/common/FileUtils.hpp"

#include <format>
#include <fstream>
#include <iterator>

namespace sampleconv::common {

std::expected<std::vector<uint8_t>, std::string> readBinaryFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open '{}'", path.string()));
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), {});
}

std::expected<void, std::string> writeTextFile(const std::filesystem::path& path, std::string_view text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to open '{}' for writing", path.string()));
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out.good()) {
        return std::unexpected(std::format("Failed while writing '{}'", path.string()));
    }
    return {};
}

std::expected<void, std::string> copySampleFile(const std::filesystem::path& source,
                                                const std::filesystem::path& destination) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return std::unexpected(std::format("Sample '{}' does not exist", source.string()));
    }
    std::filesystem::copy_file(source, destination, std::filesystem::copy_options::skip_existing, ec);
    if (ec) {
        return std::unexpected(
            std::format("Failed to copy '{}' to '{}': {}", source.string(), destination.string(), ec.message()));
    }
    return {};
}

}  // namespace sampleconv::common
