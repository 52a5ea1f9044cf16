#include <attributed-text-cpp/attributed_spans.hpp>
#include <attributed-text-cpp/log.hpp>

#include "lane.hpp"

#include <algorithm>
#include <string>

namespace attributed_text_cpp {

namespace {

/// Record a removed marker of @p attribution. A removed start cancels an
/// earlier removed end and vice versa; otherwise it is added to @p same_kind.
void track_removed(std::vector<AttributionPtr>& same_kind,
                   std::vector<AttributionPtr>& opposite_kind,
                   const AttributionPtr& attribution) {
    auto equal = [&](const AttributionPtr& other) { return AttributionEqual{}(other, attribution); };
    if (auto it = std::ranges::find_if(opposite_kind, equal); it != opposite_kind.end()) {
        opposite_kind.erase(it);
        return;
    }
    if (std::ranges::none_of(same_kind, equal)) {
        same_kind.push_back(attribution);
    }
}

/// Join equal attributions that end at merge_point - 1 and start at
/// merge_point, given two sorted marker lists concatenated at merge_point.
void merge_back_to_back(std::vector<SpanMarker>& markers, Offset merge_point) {
    auto ends = std::vector<SpanMarker>{};
    auto starts = std::vector<SpanMarker>{};
    for (const auto& marker : markers) {
        if (marker.is_end() && marker.offset == merge_point - 1) ends.push_back(marker);
        if (marker.is_start() && marker.offset == merge_point) starts.push_back(marker);
    }

    for (const auto& start : starts) {
        auto end = std::ranges::find_if(ends, [&](const SpanMarker& candidate) {
            return AttributionEqual{}(candidate.attribution, start.attribution);
        });
        if (end == ends.end()) {
            continue;
        }
        detail::Log{LogLevel::trace} << "combining spans of " << start.attribution
                                     << " at " << merge_point;
        markers.erase(std::ranges::find(markers, start));
        markers.erase(std::ranges::find(markers, *end));
        ends.erase(end);
    }
}

}  // namespace

void AttributedSpans::push_attributions_back(Offset offset) {
    for (auto& marker : markers_) {
        marker.offset += offset;
    }
}

void AttributedSpans::contract_attributions(Offset start_offset, Offset count) {
    if (start_offset < 0 || count < 0) {
        throw SpanError{ErrorKind::invalid_range,
                        "contract_attributions() requires a non-negative start and count, start: " +
                            std::to_string(start_offset) + ", count: " + std::to_string(count)};
    }
    detail::Log{LogLevel::debug} << "removing " << count << " units starting at " << start_offset;

    const auto cut_end = start_offset + count;
    auto contracted = std::vector<SpanMarker>{};
    contracted.reserve(markers_.size());

    auto need_start = std::vector<AttributionPtr>{};
    auto need_end = std::vector<AttributionPtr>{};
    for (const auto& marker : markers_) {
        if (marker.offset < start_offset) {
            contracted.push_back(marker);
        } else if (marker.offset < cut_end) {
            // Dropped; remember any span left without one of its ends.
            if (marker.is_start()) {
                track_removed(need_start, need_end, marker.attribution);
            } else {
                track_removed(need_end, need_start, marker.attribution);
            }
        }
    }

    for (const auto& attribution : need_start) {
        detail::Log{LogLevel::trace} << "adding back a start marker at " << start_offset;
        contracted.push_back(SpanMarker{attribution, start_offset, MarkerType::start});
    }
    const auto end_offset = std::max<Offset>(start_offset - 1, 0);
    for (const auto& attribution : need_end) {
        detail::Log{LogLevel::trace} << "adding back an end marker at " << end_offset;
        contracted.push_back(SpanMarker{attribution, end_offset, MarkerType::end});
    }

    for (const auto& marker : markers_) {
        if (marker.offset >= cut_end) {
            contracted.push_back(marker.with_offset(marker.offset - count));
        }
    }

    markers_ = std::move(contracted);
    sort_markers();
}

auto AttributedSpans::copy_attribution_region(Offset start_offset) const -> AttributedSpans {
    const auto last = markers_.empty() ? Offset{0} : markers_.back().offset;
    return copy_attribution_region(start_offset, std::max(last, start_offset));
}

auto AttributedSpans::copy_attribution_region(Offset start_offset, Offset end_offset) const
    -> AttributedSpans {
    if (start_offset < 0 || start_offset > end_offset) {
        throw SpanError{ErrorKind::invalid_range,
                        "copy_attribution_region() requires 0 <= start <= end, start: " +
                            std::to_string(start_offset) + ", end: " + std::to_string(end_offset)};
    }
    detail::Log{LogLevel::debug} << "copying region " << start_offset << " -> " << end_offset;

    auto cut = std::vector<SpanMarker>{};

    // Spans still open at start_offset restart at 0 in the copy.
    auto open_before = detail::AttributionCounts{};
    for (const auto& marker : markers_) {
        if (marker.offset >= start_offset) break;
        open_before[marker.attribution] += marker.is_start() ? 1 : -1;
    }
    for (const auto& [attribution, count] : open_before) {
        if (count == 1) {
            cut.push_back(SpanMarker{attribution, 0, MarkerType::start});
        } else if (count != 0) {
            fail_invariant("Found an unbalanced number of `start` and `end` markers before offset: " +
                           std::to_string(start_offset));
        }
    }

    for (const auto& marker : markers_) {
        if (start_offset <= marker.offset && marker.offset <= end_offset) {
            cut.push_back(marker.with_offset(marker.offset - start_offset));
        }
    }

    // Spans still open past end_offset close at the end of the copy.
    auto open_after = detail::AttributionCounts{};
    for (auto it = markers_.rbegin(); it != markers_.rend() && it->offset > end_offset; ++it) {
        open_after[it->attribution] += it->is_end() ? 1 : -1;
    }
    for (const auto& [attribution, count] : open_after) {
        if (count == 1) {
            cut.push_back(SpanMarker{attribution, end_offset - start_offset, MarkerType::end});
        } else if (count != 0) {
            fail_invariant("Found an unbalanced number of `start` and `end` markers after offset: " +
                           std::to_string(end_offset));
        }
    }

    return AttributedSpans{std::move(cut)};
}

void AttributedSpans::add_at(const AttributedSpans& other, Offset index) {
    if (index < 0 || (!markers_.empty() && markers_.back().offset >= index)) {
        auto msg = std::string{"Another AttributedSpans can only be appended after the final marker "
                               "in this AttributedSpans. Index: "} + std::to_string(index);
        if (!markers_.empty()) {
            msg += ", final marker: " + attributed_text_cpp::to_string(markers_.back());
        }
        throw SpanError{ErrorKind::invalid_splice, std::move(msg)};
    }

    auto pushed = other.copy();
    pushed.push_attributions_back(index);

    auto combined = markers_;
    combined.insert(combined.end(), pushed.markers_.begin(), pushed.markers_.end());
    merge_back_to_back(combined, index);

    markers_ = std::move(combined);
    if (log_enabled(LogLevel::trace)) {
        detail::Log{LogLevel::trace} << "combined attributions after merge:\n" << to_string();
    }
}

}  // namespace attributed_text_cpp
