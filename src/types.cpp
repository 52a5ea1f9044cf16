#include <attributed-text-cpp/types.hpp>

#include <ostream>
#include <sstream>

namespace attributed_text_cpp {

auto operator<<(std::ostream& os, const SpanMarker& marker) -> std::ostream& {
    return os << "[SpanMarker] - attribution: " << marker.attribution
              << ", offset: " << marker.offset
              << ", type: " << to_string_view(marker.type);
}

auto to_string(const SpanMarker& marker) -> std::string {
    auto out = std::ostringstream{};
    out << marker;
    return out.str();
}

}  // namespace attributed_text_cpp
