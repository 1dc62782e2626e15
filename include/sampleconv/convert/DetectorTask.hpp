#pragma once

#include "sampleconv/common/ConvertConfig.hpp"
#include "sampleconv/common/Notifier.hpp"
#include "sampleconv/convert/DeliverySlot.hpp"
#include "sampleconv/model/MultisampleSource.hpp"
#include "sampleconv/nki/NkiDispatcher.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <thread>
#include <vector>

namespace sampleconv::convert {

inline constexpr std::string_view kNkiExtension = ".nki";

struct InputFile {
    std::filesystem::path file;
    std::filesystem::path sourceFolder;  // Scan root the file was found under
};

struct DetectionResult {
    std::filesystem::path file;
    std::vector<model::MultisampleSource> sources;  // Empty when the file failed to decode
};

/// Expands the command line inputs: files are taken as given, folders are scanned
/// recursively for `.nki` files (extension compared case-insensitively, sorted by path).
/// Inputs that do not exist are reported to `notifier` and skipped.
std::vector<InputFile> collectInputFiles(std::span<const std::filesystem::path> inputs, common::Notifier& notifier);

/// Decodes input files on a worker thread and hands over one result at a time.
class DetectorTask {
public:
    DetectorTask(common::Notifier& notifier, std::vector<InputFile> files, common::MetadataConfig metadata);
    ~DetectorTask();

    DetectorTask(const DetectorTask&) = delete;
    DetectorTask& operator=(const DetectorTask&) = delete;

    void start();

    /// Stops before the next file. A file that is being decoded is finished first.
    void cancel();
    [[nodiscard]] bool isCancelled() const;

    /// Next decoded file, or std::nullopt when all files were processed or the task was cancelled.
    std::optional<DetectionResult> receive();

    /// Waits for the worker thread to exit.
    void join();

private:
    void run();

    common::Notifier& notifier_;
    std::vector<InputFile> files_;
    common::MetadataConfig metadata_;
    nki::NkiDispatcher dispatcher_;
    DeliverySlot<DetectionResult> slot_;
    std::thread worker_;
    std::atomic<bool> started_{false};
};

}  // namespace sampleconv::convert
