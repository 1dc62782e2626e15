#include "sampleconv/common/Paths.hpp"

#include <array>
#include <cstdlib>
#include <string_view>
#include <system_error>

#ifdef _WIN32
#include <Windows.h>
#endif

namespace sampleconv::common {
namespace {

constexpr std::string_view kProjectName = "sampleconv";
constexpr std::string_view kConfigFileName = "sampleconv.json";

std::filesystem::path runningBinaryDir() {
#ifdef _WIN32
    std::array<wchar_t, MAX_PATH> buffer{};
    const DWORD length = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    if (length == 0 || length >= buffer.size()) {
        return {};
    }
    return std::filesystem::path(std::wstring(buffer.data(), length)).parent_path();
#else
    std::error_code ec;
    const auto binary = std::filesystem::read_symlink("/proc/self/exe", ec);
    return ec ? std::filesystem::path{} : binary.parent_path();
#endif
}

std::filesystem::path environmentPath(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return {};
    }
    return std::filesystem::path(value);
}

}  // namespace

std::filesystem::path bundledConfigPath() {
    static const std::filesystem::path binaryDir = runningBinaryDir();
    if (binaryDir.empty()) {
        return {};
    }

    const std::array candidates = {
        binaryDir / "config" / kConfigFileName,
        binaryDir.parent_path() / "share" / kProjectName / "config" / kConfigFileName,
    };
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return {};
}

std::filesystem::path userConfigPath() {
#ifdef _WIN32
    std::filesystem::path base = environmentPath("APPDATA");
#else
    std::filesystem::path base = environmentPath("XDG_CONFIG_HOME");
    if (base.empty()) {
        if (const auto home = environmentPath("HOME"); !home.empty()) {
            base = home / ".config";
        }
    }
#endif
    return base.empty() ? base : base / kProjectName / kConfigFileName;
}

}  // namespace sampleconv::common
