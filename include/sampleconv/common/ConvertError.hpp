#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sampleconv::common {

enum class ConvertErrorKind : uint8_t {
    EndOfInput,          // A primitive read ran out of bytes
    TruncatedRead,       // A fixed-length field was cut short
    CorruptFormat,       // Structural inconsistency inside a recognized variant
    UnsupportedVariant,  // Recognized but deliberately not decoded (monolith, next-gen)
    UnknownFormat,       // Magic number not in the dispatch table
    NoRegionsFound,      // Parse succeeded but produced nothing
    DestinationCollision,
    Io,
};

struct ConvertError {
    ConvertErrorKind kind = ConvertErrorKind::CorruptFormat;
    std::string message;
    std::string_view messageKey = {};  // Diagnostic key to report instead of the generic one
};

std::string_view errorKindName(ConvertErrorKind kind);

}  // namespace sampleconv::common
