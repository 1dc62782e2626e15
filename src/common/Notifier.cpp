#include "sampleconv/common/Notifier.hpp"

#include "sampleconv/common/Log.hpp"
#include "sampleconv/common/Logger.hpp"

#include <array>
#include <utility>

namespace sampleconv::common {
namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 12> kMessageTable = {{
    {msg::kNkiUnsupportedFileFormat, "Unsupported NKI file format"},
    {msg::kNkiNextGenerationNotSupported, "NKI files of the newer container format are not supported"},
    {msg::kNkiMonolithNotSupported, "NKI monolith files are not supported"},
    {msg::kNkiUnknownFileId, "Unknown NKI file id"},
    {msg::kNkiCouldNotDetectLayers, "Could not detect any layers"},
    {msg::kNotifyDetecting, "Detecting"},
    {msg::kNotifyErrLoadFile, "Could not load file"},
    {msg::kNotifyAlreadyExists, "The output file already exists"},
    {msg::kNotifyStoring, "Storing"},
    {msg::kNotifyErrSampleCopy, "Could not copy sample"},
    {msg::kNotifyProgressDone, "Done."},
    {msg::kNotifyCancelled, "Cancelled."},
}};

}  // namespace

std::string_view messageText(std::string_view key) {
    for (const auto& [tableKey, text] : kMessageTable) {
        if (tableKey == key) {
            return text;
        }
    }
    return key;
}

std::string renderMessage(std::string_view key, std::string_view detail) {
    std::string text(messageText(key));
    if (!detail.empty()) {
        text += ": ";
        text += detail;
    }
    return text;
}

void ConsoleNotifier::log(std::string_view key, std::string_view detail) {
    const std::string text = renderMessage(key, detail);
    std::lock_guard<std::mutex> lock(mutex_);
    logInfo(text);
    Logger::log(text);
}

void ConsoleNotifier::logError(std::string_view key, std::string_view detail) {
    const std::string text = renderMessage(key, detail);
    std::lock_guard<std::mutex> lock(mutex_);
    ++errorCount_;
    common::logError(text);
    Logger::logError(text);
}

int ConsoleNotifier::errorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errorCount_;
}

}  // namespace sampleconv::common
