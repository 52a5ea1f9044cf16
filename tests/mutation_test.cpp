#include <attributed-text-cpp/attributed_text.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace attributed_text_cpp;
using namespace attributed_text_cpp::test;

namespace {

const auto bold = make_named_attribution("bold");
const auto italics = make_named_attribution("italics");
const auto link_a = make_link_attribution("https://a.example");
const auto link_b = make_link_attribution("https://b.example");

// Accepts merging only with notes of the same or lower priority, so two
// priorities can merge in one direction but not the other.
class PriorityNote final : public Attribution {
public:
    explicit PriorityNote(int priority) : priority_{priority} {}

    auto id() const -> const std::string& override {
        static const auto note = std::string{"note"};
        return note;
    }

    auto equals(const Attribution& other) const -> bool override {
        const auto* n = dynamic_cast<const PriorityNote*>(&other);
        return n != nullptr && n->priority_ == priority_;
    }

    auto can_merge_with(const Attribution& other) const -> bool override {
        const auto* n = dynamic_cast<const PriorityNote*>(&other);
        return n != nullptr && priority_ >= n->priority_;
    }

private:
    int priority_;
};

// Every revision of a style merges with every other, but only the same
// revision is equal.
class StyleRevision final : public Attribution {
public:
    explicit StyleRevision(int revision) : revision_{revision} {}

    auto id() const -> const std::string& override {
        static const auto style = std::string{"style"};
        return style;
    }

    auto equals(const Attribution& other) const -> bool override {
        const auto* r = dynamic_cast<const StyleRevision*>(&other);
        return r != nullptr && r->revision_ == revision_;
    }

    auto can_merge_with(const Attribution& other) const -> bool override {
        return dynamic_cast<const StyleRevision*>(&other) != nullptr;
    }

private:
    int revision_;
};

const auto rev1 = std::make_shared<const StyleRevision>(1);
const auto rev2 = std::make_shared<const StyleRevision>(2);

auto spans_with(const AttributionPtr& attribution, Offset start, Offset end) -> AttributedSpans {
    auto spans = AttributedSpans{};
    spans.add_attribution(attribution, start, end);
    return spans;
}

auto make_spans(std::vector<SpanMarker> markers) -> AttributedSpans {
    return AttributedSpans{std::move(markers)};
}

}  // namespace

// -- add_attribution ----------------------------------------------------------

TEST(AddAttribution, to_empty_spans) {
    const auto spans = spans_with(link_a, 3, 7);

    EXPECT_EQ(spans, make_spans({start_marker(link_a, 3), end_marker(link_a, 7)}));
    EXPECT_TRUE(spans.has_attribution_at(5, *link_a));
    EXPECT_FALSE(spans.has_attribution_at(8, *link_a));
}

TEST(AddAttribution, single_unit_span) {
    const auto spans = spans_with(bold, 4, 4);
    EXPECT_EQ(spans, make_spans({start_marker(bold, 4), end_marker(bold, 4)}));
}

TEST(AddAttribution, is_idempotent) {
    auto spans = spans_with(bold, 2, 6);
    spans.add_attribution(bold, 2, 6);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 2), end_marker(bold, 6)}));
}

TEST(AddAttribution, extends_existing_span_to_the_right) {
    auto spans = spans_with(bold, 0, 4);
    spans.add_attribution(bold, 2, 8);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 8)}));
}

TEST(AddAttribution, extends_existing_span_to_the_left) {
    auto spans = spans_with(bold, 5, 9);
    spans.add_attribution(bold, 2, 6);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 2), end_marker(bold, 9)}));
}

TEST(AddAttribution, swallows_contained_span) {
    auto spans = spans_with(bold, 3, 4);
    spans.add_attribution(bold, 0, 9);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 9)}));
}

TEST(AddAttribution, inside_existing_span_changes_nothing) {
    auto spans = spans_with(bold, 0, 9);
    spans.add_attribution(bold, 3, 4);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 9)}));
}

TEST(AddAttribution, bridges_two_spans) {
    auto spans = spans_with(bold, 0, 2);
    spans.add_attribution(bold, 6, 8);
    spans.add_attribution(bold, 1, 7);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 8)}));
}

TEST(AddAttribution, starting_on_the_last_unit_of_a_span_joins_it) {
    auto spans = spans_with(bold, 0, 2);
    spans.add_attribution(bold, 2, 4);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 4)}));
    EXPECT_TRUE(markers_alternate(spans));
}

TEST(AddAttribution, touching_both_neighbours_joins_all_three) {
    auto spans = spans_with(bold, 0, 2);
    spans.add_attribution(bold, 5, 6);
    spans.add_attribution(bold, 2, 5);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 6)}));
}

TEST(AddAttribution, adjacent_spans_stay_separate) {
    auto spans = spans_with(bold, 0, 2);
    spans.add_attribution(bold, 3, 5);

    EXPECT_EQ(spans, make_spans({
        start_marker(bold, 0), end_marker(bold, 2), start_marker(bold, 3), end_marker(bold, 5),
    }));
    EXPECT_TRUE(spans.has_attribution_at(2, *bold));
    EXPECT_TRUE(spans.has_attribution_at(3, *bold));
}

TEST(AddAttribution, different_lanes_overlap_freely) {
    auto spans = spans_with(bold, 0, 5);
    spans.add_attribution(italics, 3, 8);

    EXPECT_EQ(spans.size(), 4u);
    EXPECT_TRUE(spans.has_attribution_at(4, *bold));
    EXPECT_TRUE(spans.has_attribution_at(4, *italics));
}

TEST(AddAttribution, invalid_range_is_silently_ignored) {
    auto spans = AttributedSpans{};
    EXPECT_NO_THROW(spans.add_attribution(bold, -1, 3));
    EXPECT_NO_THROW(spans.add_attribution(bold, 5, 2));
    EXPECT_TRUE(spans.empty());
}

TEST(AddAttribution, null_attribution_is_rejected) {
    auto spans = AttributedSpans{};
    try {
        spans.add_attribution(nullptr, 0, 1);
        FAIL() << "expected SpanError";
    } catch (const SpanError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_attribution);
    }
}

TEST(AddAttribution, same_link_merges) {
    auto spans = spans_with(link_a, 0, 3);
    spans.add_attribution(make_link_attribution("https://a.example"), 2, 6);

    EXPECT_EQ(spans, make_spans({start_marker(link_a, 0), end_marker(link_a, 6)}));
}

// -- Conflicts ----------------------------------------------------------------

TEST(AddAttribution, conflicting_link_reports_first_overlap) {
    auto spans = spans_with(link_a, 2, 5);
    const auto before = spans;

    try {
        spans.add_attribution(link_b, 0, 9);
        FAIL() << "expected IncompatibleOverlapError";
    } catch (const IncompatibleOverlapError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::incompatible_overlap);
        EXPECT_EQ(e.conflict_start(), 2);
        EXPECT_TRUE(e.existing_attribution()->equals(*link_a));
        EXPECT_TRUE(e.new_attribution()->equals(*link_b));
    }
    EXPECT_EQ(spans, before);
}

TEST(AddAttribution, conflict_starting_before_range_reports_range_start) {
    auto spans = spans_with(link_a, 0, 5);

    try {
        spans.add_attribution(link_b, 3, 9);
        FAIL() << "expected IncompatibleOverlapError";
    } catch (const IncompatibleOverlapError& e) {
        EXPECT_EQ(e.conflict_start(), 3);
    }
}

TEST(AddAttribution, conflict_is_a_span_error) {
    auto spans = spans_with(link_a, 0, 5);
    EXPECT_THROW(spans.add_attribution(link_b, 4, 4), SpanError);
}

TEST(AddAttribution, non_overlapping_links_coexist) {
    auto spans = spans_with(link_a, 0, 2);
    EXPECT_NO_THROW(spans.add_attribution(link_b, 3, 6));

    EXPECT_TRUE(spans.has_attribution_at(1, *link_a));
    EXPECT_TRUE(spans.has_attribution_at(4, *link_b));
    EXPECT_TRUE(markers_alternate(spans));
}

TEST(AddAttribution, conflict_detected_when_only_existing_refuses_merge) {
    const auto low = std::make_shared<const PriorityNote>(1);
    const auto high = std::make_shared<const PriorityNote>(2);
    ASSERT_TRUE(high->can_merge_with(*low));
    ASSERT_FALSE(low->can_merge_with(*high));

    auto spans = spans_with(low, 0, 3);
    EXPECT_THROW(spans.add_attribution(high, 2, 5), IncompatibleOverlapError);
    EXPECT_EQ(spans, make_spans({start_marker(low, 0), end_marker(low, 3)}));
}

// -- Revisions of one style ---------------------------------------------------

TEST(AddAttribution, newer_revision_takes_over_the_overlap) {
    auto spans = spans_with(rev1, 0, 5);
    spans.add_attribution(rev2, 3, 8);

    EXPECT_TRUE(markers_alternate(spans));
    EXPECT_EQ(spans, make_spans({start_marker(rev1, 0), end_marker(rev1, 2),
                                 start_marker(rev2, 3), end_marker(rev2, 8)}));
    EXPECT_TRUE(spans.has_attribution_at(7, *rev2));

    const auto collapsed = spans.collapse_spans(9);
    ASSERT_EQ(collapsed.size(), 2u);
    EXPECT_EQ(collapsed[0].start, 0);
    EXPECT_EQ(collapsed[0].end, 2);
    EXPECT_TRUE(same_attributions(collapsed[0].attributions, AttributionSet{rev1}));
    EXPECT_EQ(collapsed[1].start, 3);
    EXPECT_EQ(collapsed[1].end, 8);
    EXPECT_TRUE(same_attributions(collapsed[1].attributions, AttributionSet{rev2}));
}

TEST(AddAttribution, revision_inside_another_splits_it) {
    auto spans = spans_with(rev1, 0, 9);
    spans.add_attribution(rev2, 3, 4);

    EXPECT_TRUE(markers_alternate(spans));
    EXPECT_EQ(spans, make_spans({start_marker(rev1, 0), end_marker(rev1, 2),
                                 start_marker(rev2, 3), end_marker(rev2, 4),
                                 start_marker(rev1, 5), end_marker(rev1, 9)}));
}

TEST(RemoveAttribution, other_revision_removes_the_style) {
    auto spans = spans_with(rev1, 0, 5);
    spans.remove_attribution(rev2, 2, 3);

    EXPECT_TRUE(markers_alternate(spans));
    EXPECT_EQ(spans, make_spans({start_marker(rev1, 0), end_marker(rev1, 1),
                                 start_marker(rev1, 4), end_marker(rev1, 5)}));
    EXPECT_FALSE(spans.has_attribution_at(2, *rev1));
    EXPECT_FALSE(spans.has_attribution_at(3, *rev2));

    const auto collapsed = spans.collapse_spans(6);
    ASSERT_EQ(collapsed.size(), 3u);
    EXPECT_TRUE(collapsed[1].attributions.empty());
    EXPECT_EQ(collapsed[1].start, 2);
    EXPECT_EQ(collapsed[1].end, 3);
}

TEST(RemoveAttribution, clears_every_revision_in_the_range) {
    auto spans = spans_with(rev1, 0, 3);
    spans.add_attribution(rev2, 4, 7);
    spans.remove_attribution(rev1, 2, 5);

    EXPECT_TRUE(markers_alternate(spans));
    EXPECT_EQ(spans, make_spans({start_marker(rev1, 0), end_marker(rev1, 1),
                                 start_marker(rev2, 6), end_marker(rev2, 7)}));
}

TEST(ToggleAttribution, other_revision_removes_covered_range) {
    auto spans = spans_with(rev1, 0, 5);
    spans.toggle_attribution(rev2, 0, 0);

    EXPECT_TRUE(markers_alternate(spans));
    EXPECT_EQ(spans, make_spans({start_marker(rev1, 1), end_marker(rev1, 5)}));
}

TEST(ToggleAttribution, other_revision_replaces_partial_coverage) {
    auto spans = spans_with(rev1, 0, 2);
    spans.toggle_attribution(rev2, 0, 5);

    EXPECT_TRUE(markers_alternate(spans));
    EXPECT_EQ(spans, make_spans({start_marker(rev2, 0), end_marker(rev2, 5)}));
    EXPECT_TRUE(markers_of(spans, *rev1).empty());
}

// -- remove_attribution -------------------------------------------------------

TEST(RemoveAttribution, round_trip_leaves_no_markers) {
    auto spans = spans_with(bold, 2, 5);
    spans.remove_attribution(bold, 2, 5);

    EXPECT_TRUE(spans.empty());
}

TEST(RemoveAttribution, from_the_middle_splits_the_span) {
    auto spans = spans_with(bold, 0, 9);
    spans.remove_attribution(bold, 3, 5);

    EXPECT_EQ(spans, make_spans({
        start_marker(bold, 0), end_marker(bold, 2), start_marker(bold, 6), end_marker(bold, 9),
    }));
}

TEST(RemoveAttribution, prefix) {
    auto spans = spans_with(bold, 0, 9);
    spans.remove_attribution(bold, 0, 3);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 4), end_marker(bold, 9)}));
}

TEST(RemoveAttribution, suffix) {
    auto spans = spans_with(bold, 0, 9);
    spans.remove_attribution(bold, 7, 9);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 6)}));
}

TEST(RemoveAttribution, single_unit_span) {
    auto spans = spans_with(bold, 4, 4);
    spans.remove_attribution(bold, 4, 4);

    EXPECT_TRUE(spans.empty());
}

TEST(RemoveAttribution, across_two_spans) {
    auto spans = spans_with(bold, 0, 2);
    spans.add_attribution(bold, 5, 6);
    spans.remove_attribution(bold, 2, 5);

    EXPECT_EQ(spans, make_spans({
        start_marker(bold, 0), end_marker(bold, 1), start_marker(bold, 6), end_marker(bold, 6),
    }));
}

TEST(RemoveAttribution, reuses_existing_end_before_the_region) {
    auto spans = spans_with(bold, 0, 2);
    spans.add_attribution(bold, 5, 8);
    spans.remove_attribution(bold, 3, 6);

    EXPECT_EQ(spans, make_spans({
        start_marker(bold, 0), end_marker(bold, 2), start_marker(bold, 7), end_marker(bold, 8),
    }));
}

TEST(RemoveAttribution, absent_attribution_is_a_no_op) {
    auto spans = spans_with(bold, 0, 2);
    const auto before = spans;

    spans.remove_attribution(bold, 4, 8);
    spans.remove_attribution(italics, 0, 2);

    EXPECT_EQ(spans, before);
}

TEST(RemoveAttribution, leaves_other_lanes_alone) {
    auto spans = spans_with(bold, 0, 5);
    spans.add_attribution(italics, 0, 5);
    spans.remove_attribution(bold, 0, 5);

    EXPECT_EQ(spans, make_spans({start_marker(italics, 0), end_marker(italics, 5)}));
}

TEST(RemoveAttribution, invalid_range_is_reported) {
    auto spans = spans_with(bold, 0, 5);
    const auto before = spans;

    try {
        spans.remove_attribution(bold, 4, 2);
        FAIL() << "expected SpanError";
    } catch (const SpanError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_range);
    }
    EXPECT_THROW(spans.remove_attribution(bold, -1, 2), SpanError);
    EXPECT_EQ(spans, before);
}

// -- toggle_attribution -------------------------------------------------------

TEST(ToggleAttribution, adds_when_absent) {
    auto spans = AttributedSpans{};
    spans.toggle_attribution(bold, 2, 5);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 2), end_marker(bold, 5)}));
}

TEST(ToggleAttribution, twice_returns_to_empty) {
    auto spans = AttributedSpans{};
    spans.toggle_attribution(bold, 2, 5);
    spans.toggle_attribution(bold, 2, 5);

    EXPECT_TRUE(spans.empty());
}

TEST(ToggleAttribution, removes_when_range_fully_covered) {
    auto spans = spans_with(bold, 0, 9);
    spans.toggle_attribution(bold, 3, 4);

    EXPECT_EQ(spans, make_spans({
        start_marker(bold, 0), end_marker(bold, 2), start_marker(bold, 5), end_marker(bold, 9),
    }));
}

TEST(ToggleAttribution, removes_when_range_ends_with_span) {
    auto spans = spans_with(bold, 0, 4);
    spans.toggle_attribution(bold, 2, 4);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 1)}));
}

TEST(ToggleAttribution, adds_when_range_partially_covered) {
    auto spans = spans_with(bold, 0, 3);
    spans.toggle_attribution(bold, 2, 6);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 6)}));
}

TEST(ToggleAttribution, adds_when_range_has_a_break) {
    auto spans = spans_with(bold, 0, 2);
    spans.add_attribution(bold, 4, 6);
    spans.toggle_attribution(bold, 0, 6);

    EXPECT_EQ(spans, make_spans({start_marker(bold, 0), end_marker(bold, 6)}));
}

TEST(ToggleAttribution, start_following_start_is_an_invariant_violation) {
    set_log_sink(nullptr);
    auto spans = make_spans({start_marker(bold, 0), start_marker(bold, 3), end_marker(bold, 5)});

    EXPECT_THROW(spans.toggle_attribution(bold, 1, 2), InvariantViolation);
    reset_log_sink();
}
