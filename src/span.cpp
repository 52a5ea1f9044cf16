#include <attributed-text-cpp/span.hpp>

#include <ostream>

namespace attributed_text_cpp {

auto operator<<(std::ostream& os, const AttributionSpan& span) -> std::ostream& {
    return os << "[AttributionSpan] - " << span.attribution << ", " << span.start << " -> " << span.end;
}

auto operator<<(std::ostream& os, const MultiAttributionSpan& span) -> std::ostream& {
    os << "[MultiAttributionSpan] - attributions: {";
    auto first = true;
    for (const auto& attribution : span.attributions) {
        if (!first) os << ", ";
        os << attribution;
        first = false;
    }
    return os << "}, start: " << span.start << ", end: " << span.end;
}

}  // namespace attributed_text_cpp
