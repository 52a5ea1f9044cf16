#include <attributed-text-cpp/attributed_spans.hpp>
#include <attributed-text-cpp/log.hpp>

namespace attributed_text_cpp {

auto AttributedSpans::collapse_spans(Offset content_length) const -> std::vector<MultiAttributionSpan> {
    detail::Log{LogLevel::debug} << "collapsing spans for content length " << content_length;

    if (content_length <= 0) {
        return {};
    }

    const auto last_unit = content_length - 1;
    if (markers_.empty() || markers_.front().offset > last_unit) {
        return {MultiAttributionSpan{{}, 0, last_unit}};
    }

    auto collapsed = std::vector<MultiAttributionSpan>{};
    auto current = MultiAttributionSpan{{}, 0, last_unit};

    for (const auto& marker : markers_) {
        if (marker.offset > last_unit) {
            // The remaining markers lie past the content; the tail is
            // committed below.
            break;
        }

        if ((marker.is_start() && marker.offset > current.start) ||
            (marker.is_end() && marker.offset >= current.start)) {
            // Boundary between the current segment and the next. An end
            // marker closes the segment on its own offset; a start marker
            // closes it one unit before.
            auto committed = current;
            committed.end = marker.is_end() ? marker.offset : marker.offset - 1;
            detail::Log{LogLevel::trace} << "committed " << committed;
            collapsed.push_back(std::move(committed));

            current.start = marker.is_start() ? marker.offset : marker.offset + 1;
        }

        if (marker.is_start()) {
            current.attributions.insert(marker.attribution);
        } else {
            current.attributions.erase(marker.attribution);
        }
    }

    if (collapsed.empty() || collapsed.back().end < last_unit) {
        // Ran out of markers (or into markers past the content) before the
        // end; `current` already spans the remainder.
        current.end = last_unit;
        collapsed.push_back(std::move(current));
    }

    return collapsed;
}

}  // namespace attributed_text_cpp
