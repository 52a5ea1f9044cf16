/// @file attributed_spans.hpp
/// @brief AttributedSpans -- labeled, possibly overlapping spans over a
///        discrete range.

#pragma once

#include <attributed-text-cpp/attribution.hpp>
#include <attributed-text-cpp/error.hpp>
#include <attributed-text-cpp/span.hpp>
#include <attributed-text-cpp/types.hpp>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace attributed_text_cpp {

/// A set of spans, each with an associated Attribution, over a discrete
/// range such as the character offsets of a string.
///
/// Think of it as a set of lanes, one per attribution id:
///
/// @code
/// Bold    :  {xxxx}                      {xxxxx}
/// Italics :             {xxxxxxxx}
/// Link    :                              {xxxxx}
/// @endcode
///
/// Spans in one lane never overlap; spans in different lanes may. Every
/// span is stored as a start marker and an end marker, both inclusive, in a
/// single list kept sorted by offset (start before end at equal offsets).
/// For each attribution the markers alternate start, end, start, end.
///
/// @code
/// auto spans = AttributedSpans{};
/// auto bold = make_named_attribution("bold");
/// spans.add_attribution(bold, 0, 4);
/// spans.has_attribution_at(2, *bold);        // true
/// auto segments = spans.collapse_spans(10);  // [0,4]{bold}, [5,9]{}
/// @endcode
///
/// Not thread-safe. Concurrent const calls are fine; anything concurrent
/// with a mutation needs external synchronization.
class AttributedSpans {
public:
    /// Construct with no spans.
    AttributedSpans() = default;

    /// Construct from existing markers, which are sorted on entry.
    ///
    /// The markers must already alternate start/end per attribution; this
    /// is not checked.
    explicit AttributedSpans(std::vector<SpanMarker> markers);

    // -- Marker store ---------------------------------------------------------

    /// All markers in sorted order.
    auto markers() const -> std::span<const SpanMarker> { return markers_; }

    auto empty() const -> bool { return markers_.empty(); }

    /// Number of markers (twice the number of spans).
    auto size() const -> std::size_t { return markers_.size(); }

    /// An independent copy of this instance.
    auto copy() const -> AttributedSpans { return *this; }

    // -- Queries --------------------------------------------------------------

    /// True if any attribution covers @p offset.
    auto has_attribution_at(Offset offset) const -> bool;

    /// True if @p attribution, or an attribution it can merge with, covers
    /// @p offset.
    auto has_attribution_at(Offset offset, const Attribution& attribution) const -> bool;

    /// The full span of @p attribution that contains @p offset.
    /// @throws SpanError (attribution_not_found) if @p attribution does not
    ///   cover @p offset.
    auto expand_attribution_to_span(const AttributionPtr& attribution, Offset offset) const
        -> AttributionSpan;

    /// Every attribution whose span covers @p offset.
    auto get_all_attributions_at(Offset offset) const -> AttributionSet;

    /// True if each of @p attributions covers at least one offset in
    /// [start, end].
    auto has_attributions_within(const AttributionSet& attributions,
                                 Offset start, Offset end) const -> bool;

    /// Attributions present somewhere in [start, end] whose id matches the
    /// id of any of @p attributions.
    auto get_matching_attributions_within(const AttributionSet& attributions,
                                          Offset start, Offset end) const -> AttributionSet;

    /// Spans of every attribution accepted by @p filter that appear at least
    /// partially in [start, end], without duplicates.
    ///
    /// The full span is returned unless @p resize_to_fit is true, in which
    /// case each span is clipped to [start, end]. Clipping never changes the
    /// stored markers.
    auto get_attribution_spans_in_range(const AttributionFilter& filter,
                                        Offset start, Offset end,
                                        bool resize_to_fit = false) const
        -> std::vector<AttributionSpan>;

    // -- Mutation -------------------------------------------------------------

    /// Apply @p attribution to [start, end], inclusive.
    ///
    /// Overlapping or adjacent spans of an equal attribution are absorbed
    /// into one span. Other attributions in the lane that can merge with
    /// @p attribution are trimmed out of the range, so the lane holds at most
    /// one span over each offset. Does nothing if start < 0 or start > end.
    /// @throws IncompatibleOverlapError if the range overlaps an attribution
    ///   in the same lane that cannot merge with @p attribution.
    void add_attribution(const AttributionPtr& attribution, Offset start, Offset end);

    /// Remove @p attribution, and every attribution in its lane it can merge
    /// with, from [start, end], inclusive, splitting any span that extends
    /// past either end of the range.
    /// @throws SpanError (invalid_range) if start < 0 or start > end.
    void remove_attribution(const AttributionPtr& attribution, Offset start, Offset end);

    /// Remove @p attribution from [start, end] if it covers the whole range
    /// without a break, otherwise apply it to the whole range.
    void toggle_attribution(const AttributionPtr& attribution, Offset start, Offset end);

    // -- Splicing -------------------------------------------------------------

    /// Move every marker @p offset units later.
    void push_attributions_back(Offset offset);

    /// Cut the units [start_offset, start_offset + count) out of the range
    /// and pull everything after them back by @p count.
    ///
    /// Spans that cross the cut are shortened, not dropped.
    void contract_attributions(Offset start_offset, Offset count);

    /// Copy [start_offset, last marker offset] into a new instance whose
    /// offset 0 corresponds to @p start_offset.
    auto copy_attribution_region(Offset start_offset) const -> AttributedSpans;

    /// Copy [start_offset, end_offset] into a new instance whose offset 0
    /// corresponds to @p start_offset. Spans crossing either boundary are cut
    /// at the boundary.
    auto copy_attribution_region(Offset start_offset, Offset end_offset) const -> AttributedSpans;

    /// Append @p other so that its offset 0 lands at @p index.
    ///
    /// Equal attributions ending at index - 1 and starting at index are
    /// joined into a single span.
    /// @throws SpanError (invalid_splice) if @p index is not after the last
    ///   marker of this instance.
    void add_at(const AttributedSpans& other, Offset index);

    // -- Collapse -------------------------------------------------------------

    /// Flatten every lane into ordered, contiguous segments covering
    /// [0, content_length - 1], each carrying the attributions active on it.
    auto collapse_spans(Offset content_length) const -> std::vector<MultiAttributionSpan>;

    // -- Comparison and formatting --------------------------------------------

    /// True if both instances hold the same markers, in any order among
    /// markers that sort equal.
    auto operator==(const AttributedSpans& other) const -> bool;

    /// A multi-line dump of every marker.
    auto to_string() const -> std::string;

private:
    auto starting_marker_at_or_before(Offset offset, const Attribution* attribution) const
        -> const SpanMarker*;
    auto ending_marker_at_or_after(Offset offset, const Attribution* attribution) const
        -> const SpanMarker*;
    auto has_attribution_at_impl(Offset offset, const Attribution* attribution) const -> bool;
    auto has_marker_at(const Attribution& attribution, Offset offset, MarkerType type) const -> bool;
    auto has_own_span_within(const Attribution& attribution, Offset start, Offset end) const -> bool;
    auto lane_attributions_within(const Attribution& attribution, Offset start, Offset end) const
        -> std::vector<AttributionPtr>;
    auto find_conflict(const AttributionPtr& attribution, Offset start, Offset end) const
        -> std::optional<std::pair<AttributionPtr, Offset>>;
    auto is_continuous_attribution(const Attribution& attribution, Offset start, Offset end) const
        -> bool;
    void insert_marker(SpanMarker marker);
    void remove_own_span(const AttributionPtr& attribution, Offset start, Offset end);
    auto erase_markers_between(const Attribution& attribution, Offset from, Offset to)
        -> std::optional<SpanMarker>;
    void sort_markers();
    [[noreturn]] void fail_invariant(const std::string& message) const;

    std::vector<SpanMarker> markers_;
};

auto operator<<(std::ostream& os, const AttributedSpans& spans) -> std::ostream&;

}  // namespace attributed_text_cpp
