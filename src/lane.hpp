#pragma once

// Internal header -- not installed.
// Marker predicates shared by the query, mutation and splice code.

#include <attributed-text-cpp/attribution.hpp>
#include <attributed-text-cpp/types.hpp>

#include <unordered_map>

namespace attributed_text_cpp::detail {

/// True if @p marker lies in the lane of @p attribution and can merge with
/// it. A null @p attribution matches every marker.
inline auto in_lane_of(const SpanMarker& marker, const Attribution* attribution) -> bool {
    if (attribution == nullptr) return true;
    return marker.attribution && mergeable(*marker.attribution, *attribution);
}

/// Per-attribution counters keyed by structural equality.
using AttributionCounts =
    std::unordered_map<AttributionPtr, int, AttributionHash, AttributionEqual>;

}  // namespace attributed_text_cpp::detail
