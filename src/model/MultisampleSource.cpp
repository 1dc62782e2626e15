#include "sampleconv/model/MultisampleSource.hpp"

namespace sampleconv::model {

std::string_view loopTypeName(LoopType type) {
    switch (type) {
    case LoopType::Forward:
        return "forward";
    case LoopType::Backward:
        return "backward";
    case LoopType::Alternating:
        return "alternate";
    }
    return "forward";
}

size_t regionCount(const MultisampleSource& source) {
    size_t count = 0;
    for (const auto& layer : source.layers) {
        count += layer.samples.size();
    }
    return count;
}

}  // namespace sampleconv::model
