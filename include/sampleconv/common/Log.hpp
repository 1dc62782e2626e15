#pragma once

#include <string_view>

namespace sampleconv::common {

void logInfo(std::string_view message);
void logError(std::string_view message);

}  // namespace sampleconv::common
