#pragma once

#include <filesystem>
#include <string>

namespace sampleconv::common {

/// Timestamped conversion log. Writes nothing until init() was given a file path,
/// so batch runs stay quiet on disk unless a log file is configured.
class Logger {
public:
    static bool init(const std::filesystem::path& logPath);
    static void log(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();
    static bool isOpen();

private:
    Logger() = default;
};

}  // namespace sampleconv::common
