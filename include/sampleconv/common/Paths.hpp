#pragma once

#include <filesystem>

namespace sampleconv::common {

/// Default configuration shipped with the converter. Checked in order:
/// <exe_dir>/config/sampleconv.json (build tree), then
/// <exe_dir>/../share/sampleconv/config/sampleconv.json (installed tree).
/// Returns an empty path when neither exists.
std::filesystem::path bundledConfigPath();

/// Per-user override: $XDG_CONFIG_HOME/sampleconv/sampleconv.json, falling back to
/// ~/.config/sampleconv/sampleconv.json (%APPDATA%\sampleconv on Windows).
/// Returns an empty path when the environment names no home.
std::filesystem::path userConfigPath();

}  // namespace sampleconv::common
