// Fuzz target for AttributedSpans mutations -- replays a byte stream as a
// sequence of add/remove/toggle/contract/splice operations and checks the
// markers stay queryable after each one.
//
// An InvariantViolation escaping the target is a finding.

#include <attributed-text-cpp/attributed_text.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace at = attributed_text_cpp;

namespace {

constexpr at::Offset max_offset = 63;

const auto g_attributions = std::array<at::AttributionPtr, 4>{
    at::make_named_attribution("bold"),
    at::make_named_attribution("italics"),
    at::make_link_attribution("https://a.example"),
    at::make_link_attribution("https://b.example"),
};

void check(const at::AttributedSpans& spans) {
    for (at::Offset i = 0; i <= max_offset; ++i) {
        (void)spans.get_all_attributions_at(i);
    }
    const auto collapsed = spans.collapse_spans(max_offset + 1);
    at::Offset next = 0;
    for (const auto& segment : collapsed) {
        if (segment.start != next || segment.end < segment.start) __builtin_trap();
        next = segment.end + 1;
    }
    if (next != max_offset + 1) __builtin_trap();
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    at::set_log_sink(nullptr);
    auto spans = at::AttributedSpans{};

    for (size_t i = 0; i + 4 <= size; i += 4) {
        const auto& attribution = g_attributions[data[i + 1] % g_attributions.size()];
        const auto a = static_cast<at::Offset>(data[i + 2] % (max_offset + 1));
        const auto b = static_cast<at::Offset>(data[i + 3] % (max_offset + 1));
        const auto start = a < b ? a : b;
        const auto end = a < b ? b : a;

        try {
            switch (data[i] % 6) {
                case 0: spans.add_attribution(attribution, start, end); break;
                case 1: spans.remove_attribution(attribution, start, end); break;
                case 2: spans.toggle_attribution(attribution, start, end); break;
                case 3: spans.contract_attributions(start, (end - start) % 8); break;
                case 4: {
                    // Split at `end` and rejoin.
                    if (end == 0) break;
                    auto left = spans.copy_attribution_region(0, end - 1);
                    left.add_at(spans.copy_attribution_region(end), end);
                    spans = std::move(left);
                    break;
                }
                default: {
                    auto copy = spans.copy_attribution_region(start, end);
                    check(copy);
                    break;
                }
            }
        } catch (const at::IncompatibleOverlapError&) {
            // Expected when two links overlap.
        }
        check(spans);
    }
    return 0;
}
