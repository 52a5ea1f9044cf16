#include <attributed-text-cpp/attributed_spans.hpp>
#include <attributed-text-cpp/log.hpp>

#include "lane.hpp"

#include <algorithm>
#include <string>

namespace attributed_text_cpp {

namespace {

void require_attribution(const AttributionPtr& attribution, const char* operation) {
    if (!attribution) {
        throw SpanError{ErrorKind::invalid_attribution,
                        std::string{operation} + "() requires a non-null attribution"};
    }
}

}  // namespace

auto AttributedSpans::has_marker_at(const Attribution& attribution, Offset offset,
                                    MarkerType type) const -> bool {
    return std::ranges::any_of(markers_, [&](const SpanMarker& marker) {
        return marker.offset == offset && marker.type == type && marker.is_for(attribution);
    });
}

auto AttributedSpans::erase_markers_between(const Attribution& attribution, Offset from, Offset to)
    -> std::optional<SpanMarker> {
    auto last_erased = std::optional<SpanMarker>{};
    auto erased = std::erase_if(markers_, [&](const SpanMarker& marker) {
        if (!marker.is_for(attribution) || marker.offset < from || marker.offset > to) {
            return false;
        }
        last_erased = marker;
        return true;
    });
    detail::Log{LogLevel::trace} << "removed " << erased << " markers between " << from << " and " << to;
    return last_erased;
}

auto AttributedSpans::has_own_span_within(const Attribution& attribution, Offset start, Offset end) const
    -> bool {
    auto open = std::optional<Offset>{};
    for (const auto& marker : markers_) {
        if (!marker.is_for(attribution)) continue;
        if (marker.is_start()) {
            if (marker.offset > end) return false;
            open = marker.offset;
        } else if (open) {
            if (marker.offset >= start) return true;
            open.reset();
        }
    }
    return false;
}

auto AttributedSpans::lane_attributions_within(const Attribution& attribution, Offset start, Offset end) const
    -> std::vector<AttributionPtr> {
    auto found = std::vector<AttributionPtr>{};
    for (const auto& marker : markers_) {
        if (!marker.is_start() || !detail::in_lane_of(marker, &attribution)) continue;
        const auto seen = std::ranges::any_of(found, [&](const AttributionPtr& other) {
            return other->equals(*marker.attribution);
        });
        if (!seen && has_own_span_within(*marker.attribution, start, end)) {
            found.push_back(marker.attribution);
        }
    }
    return found;
}

auto AttributedSpans::find_conflict(const AttributionPtr& attribution, Offset start, Offset end) const
    -> std::optional<std::pair<AttributionPtr, Offset>> {
    const auto matching = get_matching_attributions_within(AttributionSet{attribution}, start, end);
    for (const auto& existing : matching) {
        if (attribution->can_merge_with(*existing) && existing->can_merge_with(*attribution)) {
            continue;
        }
        for (auto i = start; i <= end; ++i) {
            if (has_attribution_at(i, *existing)) {
                return std::pair{existing, i};
            }
        }
    }
    return std::nullopt;
}

// -- add ----------------------------------------------------------------------

void AttributedSpans::add_attribution(const AttributionPtr& attribution, Offset start, Offset end) {
    require_attribution(attribution, "add_attribution");
    if (start < 0 || start > end) {
        detail::Log{LogLevel::debug} << "ignoring add_attribution() over invalid range "
                                     << start << " -> " << end;
        return;
    }

    if (auto conflict = find_conflict(attribution, start, end)) {
        throw IncompatibleOverlapError{conflict->first, attribution, conflict->second};
    }

    detail::Log{LogLevel::debug} << "adding " << attribution << " from " << start << " to " << end;

    // Other versions in this lane give way to the new attribution over the
    // range; equal spans are merged below.
    for (const auto& other : lane_attributions_within(*attribution, start, end)) {
        if (!other->equals(*attribution)) {
            detail::Log{LogLevel::trace} << "trimming " << other << " out of the range";
            remove_own_span(other, start, end);
        }
    }

    auto last_deleted = std::optional<SpanMarker>{};
    const auto opened = !has_own_span_within(*attribution, start, start);
    if (opened) {
        detail::Log{LogLevel::trace} << "adding start marker at: " << start;
        insert_marker(SpanMarker{attribution, start, MarkerType::start});
    } else {
        // A span ending exactly at `start` runs on into the new range.
        auto cap = std::ranges::find(markers_, SpanMarker{attribution, start, MarkerType::end});
        if (cap != markers_.end()) {
            last_deleted = *cap;
            markers_.erase(cap);
        }
    }

    // Boundaries inside the range are absorbed into the new span.
    if (auto erased = erase_markers_between(*attribution, start + 1, end)) {
        last_deleted = std::move(erased);
    }

    // The span is left open when the last deletion closed a span, or when
    // nothing was deleted after opening a fresh span. If the last deletion
    // was a start, or an existing span already covered the whole range,
    // `end` sits inside a longer span.
    if (last_deleted ? last_deleted->is_end() : opened) {
        detail::Log{LogLevel::trace} << "inserting end marker at: " << end;
        insert_marker(SpanMarker{attribution, end, MarkerType::end});
    }
}

// -- remove -------------------------------------------------------------------

void AttributedSpans::remove_attribution(const AttributionPtr& attribution, Offset start, Offset end) {
    require_attribution(attribution, "remove_attribution");
    detail::Log{LogLevel::debug} << "removing " << attribution << " from " << start << " to " << end;
    if (start < 0 || start > end) {
        throw SpanError{ErrorKind::invalid_range,
                        "remove_attribution() requires 0 <= start <= end, start: " +
                            std::to_string(start) + ", end: " + std::to_string(end)};
    }

    // Every version in the lane is removed, matching what the queries report.
    const auto present = lane_attributions_within(*attribution, start, end);
    if (present.empty()) {
        detail::Log{LogLevel::trace} << "no such attribution exists in the given range";
        return;
    }
    for (const auto& member : present) {
        remove_own_span(member, start, end);
    }
}

void AttributedSpans::remove_own_span(const AttributionPtr& attribution, Offset start, Offset end) {
    // A span may begin before and/or end after the removal region. Cap
    // those pieces one unit outside the region first:
    //
    //    ---[xxxxx]---[yyyyyy]----      remove |-remove-|
    //    ---[xx]|xxx]---[yy|[yyy]----   caps inserted (temporarily invalid)
    //    ---[xx]--------[yyy]----       interior markers removed
    auto caps = std::vector<SpanMarker>{};
    if (has_own_span_within(*attribution, start - 1, start - 1) &&
        !has_marker_at(*attribution, start - 1, MarkerType::end)) {
        caps.push_back(SpanMarker{attribution, start - 1, MarkerType::end});
    }
    if (has_own_span_within(*attribution, end + 1, end + 1) &&
        !has_marker_at(*attribution, end + 1, MarkerType::start)) {
        caps.push_back(SpanMarker{attribution, end + 1, MarkerType::start});
    }

    for (auto& cap : caps) {
        detail::Log{LogLevel::trace} << "inserting cap marker: " << cap;
        insert_marker(std::move(cap));
    }

    erase_markers_between(*attribution, start, end);
}

// -- toggle -------------------------------------------------------------------

void AttributedSpans::toggle_attribution(const AttributionPtr& attribution, Offset start, Offset end) {
    require_attribution(attribution, "toggle_attribution");
    detail::Log{LogLevel::debug} << "toggling " << attribution << " from " << start << " to " << end;
    if (is_continuous_attribution(*attribution, start, end)) {
        remove_attribution(attribution, start, end);
    } else {
        add_attribution(attribution, start, end);
    }
}

auto AttributedSpans::is_continuous_attribution(const Attribution& attribution,
                                                Offset start, Offset end) const -> bool {
    // Nearest start marker in this attribution's lane at or before `start`.
    auto before = markers_.end();
    for (auto it = markers_.begin(); it != markers_.end(); ++it) {
        if (!it->is_start() || !detail::in_lane_of(*it, &attribution)) continue;
        if (it->offset > start) break;
        before = it;
    }
    if (before == markers_.end()) {
        return false;
    }

    const auto next = std::find_if(before, markers_.end(), [&](const SpanMarker& marker) {
        return detail::in_lane_of(marker, &attribution) && marker != *before;
    });
    if (next == markers_.end()) {
        fail_invariant("Inconsistent attributions state. Found a `start` marker with no matching `end`.");
    }
    if (next->is_start()) {
        fail_invariant("Inconsistent attributions state. Found a `start` marker following a `start` marker.");
    }

    // Any further marker inside the range means the attribution has a break.
    return next->offset >= end;
}

}  // namespace attributed_text_cpp
