#include "sampleconv/common/ConvertConfig.hpp"
#include "sampleconv/common/Log.hpp"
#include "sampleconv/common/Logger.hpp"
#include "sampleconv/common/Notifier.hpp"
#include "sampleconv/convert/DetectorTask.hpp"
#include "sampleconv/sfz/SfzCreator.hpp"

#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sampleconv::tools {
namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitDiagnostics = 2;

struct ToolOptions {
    std::vector<std::filesystem::path> inputs;
    std::optional<std::filesystem::path> outputDir;
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> logFile;
};

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName << " [--output <dir>] [--config <file>] [--log-file <file>] <file-or-folder>...\n";
    out << "\nConverts NKI instruments into SFZ files with a sibling sample folder.\n";
    out << "Folders are searched recursively for .nki files.\n";
    out << "\nOptions:\n";
    out << "  --output, -o    Destination folder (default: configured outputFolder, else current folder)\n";
    out << "  --config, -c    JSON configuration used instead of the user configuration\n";
    out << "  --log-file      Also write all diagnostics to this file\n";
    out << "  --help, -h      Show this help\n";
}

std::expected<ToolOptions, std::string> parseArgs(int argc, char** argv) {
    ToolOptions options;

    auto require_value = [&](int& index, std::string_view flag) -> std::expected<std::string, std::string> {
        if (index + 1 >= argc) {
            return std::unexpected(std::format("Missing value for {}", flag));
        }
        ++index;
        return std::string(argv[index]);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(std::cout, argc > 0 ? argv[0] : "sampleconv");
            std::exit(kExitOk);
        }
        if (arg == "--output" || arg == "-o") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.outputDir = *value;
            continue;
        }
        if (arg == "--config" || arg == "-c") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.configPath = *value;
            continue;
        }
        if (arg == "--log-file") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.logFile = *value;
            continue;
        }
        if (arg.starts_with("-") && arg.size() > 1) {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
        options.inputs.emplace_back(arg);
    }

    if (options.inputs.empty()) {
        return std::unexpected("No input file or folder given");
    }
    return options;
}

std::expected<int, std::string> run(const ToolOptions& options) {
    auto config = common::loadConvertConfig(options.configPath);
    if (!config.has_value()) {
        return std::unexpected(config.error());
    }

    const auto logFile = options.logFile.value_or(config->logFile);
    if (!logFile.empty() && !common::Logger::init(logFile)) {
        return std::unexpected(std::format("Failed to open log file '{}'", logFile.string()));
    }

    std::filesystem::path outputDir = options.outputDir.value_or(config->outputFolder);
    if (outputDir.empty()) {
        outputDir = std::filesystem::current_path();
    }
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create output folder '{}': {}", outputDir.string(), ec.message()));
    }

    common::ConsoleNotifier notifier;
    auto files = convert::collectInputFiles(options.inputs, notifier);
    common::Logger::log(std::format("Converting {} file(s) into '{}'", files.size(), outputDir.string()));

    int writeFailures = 0;
    convert::DetectorTask task(notifier, std::move(files), config->metadata);
    task.start();

    const sfz::SfzCreator creator(notifier);
    while (auto result = task.receive()) {
        for (const auto& source : result->sources) {
            auto created = creator.create(outputDir, source);
            if (!created.has_value() && created.error().kind == common::ConvertErrorKind::Io) {
                ++writeFailures;
                common::logError(created.error().message);
                common::Logger::logError(created.error().message);
            }
        }
    }
    task.join();

    const bool clean = notifier.errorCount() == 0 && writeFailures == 0;
    common::Logger::log(clean ? "Conversion finished" : "Conversion finished with errors");
    common::Logger::shutdown();
    return clean ? kExitOk : kExitDiagnostics;
}

}  // namespace
}  // namespace sampleconv::tools

int main(int argc, char** argv) {
    auto options = sampleconv::tools::parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        sampleconv::tools::printUsage(std::cerr, argc > 0 ? argv[0] : "sampleconv");
        return sampleconv::tools::kExitUsage;
    }

    try {
        auto result = sampleconv::tools::run(*options);
        if (!result.has_value()) {
            std::cerr << "Error: " << result.error() << '\n';
            return sampleconv::tools::kExitUsage;
        }
        return *result;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
