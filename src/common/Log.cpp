#include "sampleconv/common/Log.hpp"
#include "sampleconv/common/ConvertError.hpp"

#include <iostream>

namespace sampleconv::common {

void logInfo(std::string_view message) {
    std::cout << "[info] " << message << '\n';
}

void logError(std::string_view message) {
    std::cerr << "[error] " << message << '\n';
}

std::string_view errorKindName(ConvertErrorKind kind) {
    switch (kind) {
    case ConvertErrorKind::EndOfInput:
        return "end of input";
    case ConvertErrorKind::TruncatedRead:
        return "truncated read";
    case ConvertErrorKind::CorruptFormat:
        return "corrupt format";
    case ConvertErrorKind::UnsupportedVariant:
        return "unsupported variant";
    case ConvertErrorKind::UnknownFormat:
        return "unknown format";
    case ConvertErrorKind::NoRegionsFound:
        return "no regions found";
    case ConvertErrorKind::DestinationCollision:
        return "destination collision";
    case ConvertErrorKind::Io:
        return "i/o error";
    }
    return "unknown error";
}

}  // namespace sampleconv::common
