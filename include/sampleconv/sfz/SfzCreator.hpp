#pragma once

#include "sampleconv/common/ConvertError.hpp"
#include "sampleconv/common/Notifier.hpp"
#include "sampleconv/model/MultisampleSource.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sampleconv::sfz {

using common::ConvertError;

inline constexpr std::string_view kSampleFolderSuffix = " Samples";
inline constexpr std::string_view kSfzExtension = ".sfz";

/// One audio file to copy into the sample folder.
struct SamplePlacement {
    std::filesystem::path source;
    std::string filename;  // Name inside the sample folder
};

struct SfzDocument {
    std::string text;
    std::string sampleFolderName;
    std::vector<SamplePlacement> placements;
};

/// Replaces characters that are not allowed in file names and trims surrounding blanks.
std::string createSafeFilename(std::string_view name);

/// Renders the SFZ text and the sample copy plan for one instrument without touching disk.
SfzDocument buildSfzDocument(const model::MultisampleSource& source);

/// Writes `<name>.sfz` plus a `<name> Samples` folder holding copies of the referenced audio.
class SfzCreator {
public:
    explicit SfzCreator(common::Notifier& notifier) : notifier_(notifier) {}

    /// Returns the written description file. An existing description file is never
    /// overwritten; the call then fails with DestinationCollision and writes nothing.
    std::expected<std::filesystem::path, ConvertError> create(const std::filesystem::path& destinationFolder,
                                                              const model::MultisampleSource& source) const;

private:
    common::Notifier& notifier_;
};

}  // namespace sampleconv::sfz
