#include "sampleconv/convert/DetectorTask.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <string>
#include <system_error>
#include <utility>

namespace sampleconv::convert {
namespace {

namespace msg = common::msg;

std::string lowerCopy(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

bool isNkiFile(const std::filesystem::path& file) {
    return lowerCopy(file.extension().string()) == kNkiExtension;
}

void scanFolder(const std::filesystem::path& folder, std::vector<InputFile>& out, common::Notifier& notifier) {
    std::vector<std::filesystem::path> found;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        folder, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code typeError;
        if (it->is_regular_file(typeError) && isNkiFile(it->path())) {
            found.push_back(it->path());
        }
    }
    if (ec) {
        notifier.logError(msg::kNotifyErrLoadFile, std::format("{}: {}", folder.string(), ec.message()));
    }

    std::sort(found.begin(), found.end());
    for (auto& file : found) {
        out.push_back(InputFile{std::move(file), folder});
    }
}

}  // namespace

std::vector<InputFile> collectInputFiles(std::span<const std::filesystem::path> inputs, common::Notifier& notifier) {
    std::vector<InputFile> files;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (std::filesystem::is_directory(input, ec)) {
            scanFolder(input, files, notifier);
        } else if (std::filesystem::is_regular_file(input, ec)) {
            files.push_back(InputFile{input, input.parent_path()});
        } else {
            notifier.logError(msg::kNotifyErrLoadFile, std::format("{}: no such file or folder", input.string()));
        }
    }
    return files;
}

DetectorTask::DetectorTask(common::Notifier& notifier, std::vector<InputFile> files, common::MetadataConfig metadata)
    : notifier_(notifier), files_(std::move(files)), metadata_(std::move(metadata)), dispatcher_(notifier) {}

DetectorTask::~DetectorTask() {
    cancel();
    join();
}

void DetectorTask::start() {
    if (started_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this] { run(); });
}

void DetectorTask::cancel() {
    slot_.cancel();
}

bool DetectorTask::isCancelled() const {
    return slot_.isCancelled();
}

std::optional<DetectionResult> DetectorTask::receive() {
    return slot_.receive();
}

void DetectorTask::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void DetectorTask::run() {
    for (const auto& input : files_) {
        if (slot_.waitForDelivery()) {
            notifier_.log(msg::kNotifyCancelled);
            break;
        }

        notifier_.log(msg::kNotifyDetecting, input.file.string());
        const nki::NkiDecodeContext context{input.file, input.sourceFolder, metadata_};
        DetectionResult result{input.file, dispatcher_.readFile(input.file, context)};
        if (!slot_.deliver(std::move(result))) {
            notifier_.log(msg::kNotifyCancelled);
            break;
        }
    }
    slot_.finish();
}

}  // namespace sampleconv::convert
