/// @file span.hpp
/// @brief Derived span values: AttributionSpan and MultiAttributionSpan.

#pragma once

#include <attributed-text-cpp/attribution.hpp>
#include <attributed-text-cpp/types.hpp>

#include <algorithm>
#include <functional>
#include <iosfwd>

namespace attributed_text_cpp {

/// One attribution applied from start to end, inclusive.
///
/// Spans are computed from a start/end marker pair on demand and hold no
/// reference back to the AttributedSpans they came from.
struct AttributionSpan {
    AttributionPtr attribution;  ///< The attribution covering the span.
    Offset start{0};             ///< First covered offset (inclusive).
    Offset end{0};               ///< Last covered offset (inclusive).

    /// This span clipped to [range_start, range_end].
    auto constrain(Offset range_start, Offset range_end) const -> AttributionSpan {
        return AttributionSpan{attribution, std::max(start, range_start), std::min(end, range_end)};
    }

    auto operator==(const AttributionSpan& other) const -> bool {
        return start == other.start && end == other.end &&
               AttributionEqual{}(attribution, other.attribution);
    }
};

/// A segment of content with every attribution active on it.
///
/// Produced by AttributedSpans::collapse_spans(). The segments it returns
/// are ordered, contiguous and non-overlapping.
struct MultiAttributionSpan {
    AttributionSet attributions;  ///< Attributions active on the segment.
    Offset start{0};              ///< First offset (inclusive).
    Offset end{0};                ///< Last offset (inclusive).

    auto operator==(const MultiAttributionSpan& other) const -> bool {
        return start == other.start && end == other.end &&
               same_attributions(attributions, other.attributions);
    }
};

/// Selects which attributions a range query reports.
using AttributionFilter = std::function<bool(const Attribution&)>;

auto operator<<(std::ostream& os, const AttributionSpan& span) -> std::ostream&;
auto operator<<(std::ostream& os, const MultiAttributionSpan& span) -> std::ostream&;

}  // namespace attributed_text_cpp
