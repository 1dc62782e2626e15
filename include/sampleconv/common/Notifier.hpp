#pragma once

#include <mutex>
#include <string>
#include <string_view>

namespace sampleconv::common {

// Symbolic diagnostic keys. The text behind each key comes from messageText().
namespace msg {
inline constexpr std::string_view kNkiUnsupportedFileFormat = "IDS_NKI_UNSUPPORTED_FILE_FORMAT";
inline constexpr std::string_view kNkiNextGenerationNotSupported = "IDS_NKI_KONTAKT5_NOT_SUPPORTED";
inline constexpr std::string_view kNkiMonolithNotSupported = "IDS_NKI_KONTAKT5_MONOLITH_NOT_SUPPORTED";
inline constexpr std::string_view kNkiUnknownFileId = "IDS_NKI_UNKNOWN_FILE_ID";
inline constexpr std::string_view kNkiCouldNotDetectLayers = "IDS_NKI_COULD_NOT_DETECT_LAYERS";
inline constexpr std::string_view kNotifyDetecting = "IDS_NOTIFY_DETECTING";
inline constexpr std::string_view kNotifyErrLoadFile = "IDS_NOTIFY_ERR_LOAD_FILE";
inline constexpr std::string_view kNotifyAlreadyExists = "IDS_NOTIFY_ALREADY_EXISTS";
inline constexpr std::string_view kNotifyStoring = "IDS_NOTIFY_STORING";
inline constexpr std::string_view kNotifyErrSampleCopy = "IDS_NOTIFY_ERR_SAMPLE_COPY";
inline constexpr std::string_view kNotifyProgressDone = "IDS_NOTIFY_PROGRESS_DONE";
inline constexpr std::string_view kNotifyCancelled = "IDS_NOTIFY_CANCELLED";
}  // namespace msg

/// Returns the English text for a diagnostic key, or the key itself when unknown.
std::string_view messageText(std::string_view key);

/// Receives user-facing diagnostics by symbolic key. Implementations decide how keys
/// are rendered; the conversion core never formats user text itself.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void log(std::string_view key, std::string_view detail = {}) = 0;
    virtual void logError(std::string_view key, std::string_view detail = {}) = 0;
};

/// Prints rendered diagnostics to stdout/stderr and mirrors them into the file Logger.
class ConsoleNotifier : public Notifier {
public:
    void log(std::string_view key, std::string_view detail = {}) override;
    void logError(std::string_view key, std::string_view detail = {}) override;

    [[nodiscard]] int errorCount() const;

private:
    mutable std::mutex mutex_;
    int errorCount_ = 0;
};

std::string renderMessage(std::string_view key, std::string_view detail);

}  // namespace sampleconv::common
