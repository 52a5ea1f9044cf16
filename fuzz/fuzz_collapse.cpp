// Fuzz target for collapse_spans() -- builds balanced markers directly from
// the input and checks the segments tile [0, length).

#include <attributed-text-cpp/attributed_text.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace at = attributed_text_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) return 0;
    at::set_log_sink(nullptr);

    static const auto attributions = std::array<at::AttributionPtr, 3>{
        at::make_named_attribution("bold"),
        at::make_named_attribution("italics"),
        at::make_named_attribution("underline"),
    };

    // Each attribution gets its own non-overlapping spans; a cursor per
    // attribution keeps them ordered.
    auto markers = std::vector<at::SpanMarker>{};
    auto cursors = std::array<at::Offset, 3>{};
    for (size_t i = 1; i + 3 <= size; i += 3) {
        const auto which = data[i] % attributions.size();
        const auto start = cursors[which] + data[i + 1] % 8;
        const auto end = start + data[i + 2] % 8;
        markers.push_back(at::SpanMarker{attributions[which], start, at::MarkerType::start});
        markers.push_back(at::SpanMarker{attributions[which], end, at::MarkerType::end});
        cursors[which] = end + 1;
    }

    const auto spans = at::AttributedSpans{std::move(markers)};
    const auto length = static_cast<at::Offset>(data[0]);
    const auto collapsed = spans.collapse_spans(length);

    at::Offset next = 0;
    for (const auto& segment : collapsed) {
        if (segment.start != next || segment.end < segment.start) __builtin_trap();
        for (auto offset = segment.start; offset <= segment.end; ++offset) {
            if (!at::same_attributions(segment.attributions, spans.get_all_attributions_at(offset))) {
                __builtin_trap();
            }
        }
        next = segment.end + 1;
    }
    if (next != (length > 0 ? length : 0)) __builtin_trap();
    return 0;
}
