#include <attributed-text-cpp/attributed_spans.hpp>
#include <attributed-text-cpp/log.hpp>

#include "lane.hpp"

#include <algorithm>
#include <ostream>
#include <sstream>

namespace attributed_text_cpp {

AttributedSpans::AttributedSpans(std::vector<SpanMarker> markers)
    : markers_{std::move(markers)} {
    sort_markers();
}

void AttributedSpans::sort_markers() {
    std::stable_sort(markers_.begin(), markers_.end());
}

void AttributedSpans::insert_marker(SpanMarker marker) {
    // After every marker that does not sort after the new one.
    auto pos = std::upper_bound(markers_.begin(), markers_.end(), marker);
    markers_.insert(pos, std::move(marker));
}

void AttributedSpans::fail_invariant(const std::string& message) const {
    detail::Log{LogLevel::warning} << message;
    detail::Log{LogLevel::warning} << to_string();
    throw InvariantViolation{message};
}

// -- Queries ------------------------------------------------------------------

auto AttributedSpans::starting_marker_at_or_before(Offset offset,
                                                   const Attribution* attribution) const
    -> const SpanMarker* {
    // Search from the back so the nearest start wins.
    for (auto it = markers_.rbegin(); it != markers_.rend(); ++it) {
        if (!detail::in_lane_of(*it, attribution)) continue;
        if (it->is_start() && it->offset <= offset) return &*it;
    }
    return nullptr;
}

auto AttributedSpans::ending_marker_at_or_after(Offset offset,
                                                const Attribution* attribution) const
    -> const SpanMarker* {
    for (const auto& marker : markers_) {
        if (!detail::in_lane_of(marker, attribution)) continue;
        if (marker.is_end() && marker.offset >= offset) return &marker;
    }
    return nullptr;
}

auto AttributedSpans::has_attribution_at_impl(Offset offset, const Attribution* attribution) const
    -> bool {
    const auto* before = starting_marker_at_or_before(offset, attribution);
    if (before == nullptr) {
        return false;
    }
    const auto* after = ending_marker_at_or_after(before->offset, attribution);
    if (after == nullptr) {
        fail_invariant("Found an open-ended attribution. It starts with: " + attributed_text_cpp::to_string(*before));
    }
    return before->offset <= offset && offset <= after->offset;
}

auto AttributedSpans::has_attribution_at(Offset offset) const -> bool {
    return has_attribution_at_impl(offset, nullptr);
}

auto AttributedSpans::has_attribution_at(Offset offset, const Attribution& attribution) const -> bool {
    return has_attribution_at_impl(offset, &attribution);
}

auto AttributedSpans::expand_attribution_to_span(const AttributionPtr& attribution, Offset offset) const
    -> AttributionSpan {
    if (!attribution || !has_attribution_at(offset, *attribution)) {
        auto msg = std::ostringstream{};
        msg << "Tried to expand attribution (" << attribution << ") at offset " << offset
            << " but the given attribution does not exist at that offset.";
        throw SpanError{ErrorKind::attribution_not_found, msg.str()};
    }

    // Both lookups succeed: has_attribution_at() just found them.
    const auto* before = starting_marker_at_or_before(offset, attribution.get());
    const auto* after = ending_marker_at_or_after(before->offset, attribution.get());
    return AttributionSpan{attribution, before->offset, after->offset};
}

auto AttributedSpans::get_all_attributions_at(Offset offset) const -> AttributionSet {
    auto all = AttributionSet{};
    for (const auto& marker : markers_) {
        all.insert(marker.attribution);
    }

    auto at_offset = AttributionSet{};
    for (const auto& attribution : all) {
        if (has_attribution_at(offset, *attribution)) {
            at_offset.insert(attribution);
        }
    }
    detail::Log{LogLevel::trace} << "found " << at_offset.size() << " attributions at offset " << offset;
    return at_offset;
}

auto AttributedSpans::has_attributions_within(const AttributionSet& attributions,
                                              Offset start, Offset end) const -> bool {
    auto to_find = std::vector<AttributionPtr>(attributions.begin(), attributions.end());
    for (auto i = start; i <= end && !to_find.empty(); ++i) {
        std::erase_if(to_find, [&](const AttributionPtr& attribution) {
            return has_attribution_at_impl(i, attribution.get());
        });
        if (to_find.empty()) {
            return true;
        }
    }
    return false;
}

auto AttributedSpans::get_matching_attributions_within(const AttributionSet& attributions,
                                                       Offset start, Offset end) const
    -> AttributionSet {
    auto matching = AttributionSet{};
    for (auto i = start; i <= end; ++i) {
        for (const auto& present : get_all_attributions_at(i)) {
            const auto matches_any = std::ranges::any_of(attributions, [&](const AttributionPtr& wanted) {
                return wanted && same_lane(*present, *wanted);
            });
            if (matches_any) {
                matching.insert(present);
            }
        }
    }
    return matching;
}

auto AttributedSpans::get_attribution_spans_in_range(const AttributionFilter& filter,
                                                     Offset start, Offset end,
                                                     bool resize_to_fit) const
    -> std::vector<AttributionSpan> {
    auto spans = std::vector<AttributionSpan>{};
    for (auto i = start; i <= end; ++i) {
        for (const auto& attribution : get_all_attributions_at(i)) {
            if (filter && !filter(*attribution)) {
                continue;
            }
            auto span = expand_attribution_to_span(attribution, i);
            if (resize_to_fit) {
                span = span.constrain(start, end);
            }
            if (std::ranges::find(spans, span) == spans.end()) {
                spans.push_back(std::move(span));
            }
        }
    }
    return spans;
}

// -- Comparison and formatting ------------------------------------------------

auto AttributedSpans::operator==(const AttributedSpans& other) const -> bool {
    return markers_.size() == other.markers_.size() &&
           std::is_permutation(markers_.begin(), markers_.end(), other.markers_.begin());
}

auto AttributedSpans::to_string() const -> std::string {
    auto out = std::ostringstream{};
    out << *this;
    return out.str();
}

auto operator<<(std::ostream& os, const AttributedSpans& spans) -> std::ostream& {
    const auto span_count = (spans.size() + 1) / 2;
    os << "[AttributedSpans] (" << span_count << " spans):";
    for (const auto& marker : spans.markers()) {
        os << "\n - " << marker;
    }
    return os;
}

}  // namespace attributed_text_cpp
