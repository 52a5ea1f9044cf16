// rich_text_editor -- styling a paragraph with overlapping attributions
//
// Demonstrates: add/remove/toggle, links that refuse to overlap,
//               collapse_spans for rendering, editing the text under spans

#include <attributed-text-cpp/attributed_text.hpp>

#include <cstddef>
#include <cstdio>
#include <string>

namespace at = attributed_text_cpp;

namespace {

void render(const std::string& text, const at::AttributedSpans& spans) {
    const auto segments = spans.collapse_spans(static_cast<at::Offset>(text.size()));
    for (const auto& segment : segments) {
        auto styles = std::string{};
        for (const auto& attribution : segment.attributions) {
            if (!styles.empty()) styles += ",";
            styles += attribution->to_string();
        }
        const auto piece = text.substr(static_cast<std::size_t>(segment.start),
                                       static_cast<std::size_t>(segment.end - segment.start + 1));
        std::printf("  [%2lld..%2lld] \"%s\" {%s}\n",
                    static_cast<long long>(segment.start), static_cast<long long>(segment.end),
                    piece.c_str(), styles.c_str());
    }
}

}  // namespace

int main() {
    auto text = std::string{"The quick brown fox jumps over the lazy dog"};
    auto spans = at::AttributedSpans{};

    const auto bold = at::make_named_attribution("bold");
    const auto italics = at::make_named_attribution("italics");
    const auto docs = at::make_link_attribution("https://example.com/fox");
    const auto other = at::make_link_attribution("https://example.com/dog");

    // Bold "quick brown", italics "brown fox"
    spans.add_attribution(bold, 4, 14);
    spans.add_attribution(italics, 10, 18);
    std::printf("Styled:\n");
    render(text, spans);

    // Toggle bold across "quick": fully bold, so it comes off
    spans.toggle_attribution(bold, 4, 8);
    std::printf("\nAfter toggling bold on \"quick\":\n");
    render(text, spans);

    // Link "fox", then try to link an overlapping range elsewhere
    spans.add_attribution(docs, 16, 18);
    try {
        spans.add_attribution(other, 18, 24);
    } catch (const at::IncompatibleOverlapError& e) {
        std::printf("\nRejected link: %s\n", e.what());
    }

    // Delete "quick " and pull everything after it back
    text.erase(4, 6);
    spans.contract_attributions(4, 6);
    std::printf("\nAfter deleting \"quick \":\n");
    render(text, spans);

    // Query what applies under the cursor
    const auto cursor = at::Offset{11};
    std::printf("\nAttributions at %lld:", static_cast<long long>(cursor));
    for (const auto& attribution : spans.get_all_attributions_at(cursor)) {
        std::printf(" %s", attribution->to_string().c_str());
    }
    std::printf("\n");

    if (spans.has_attribution_at(cursor, *docs)) {
        const auto link = spans.expand_attribution_to_span(docs, cursor);
        std::printf("Link covers [%lld, %lld]\n",
                    static_cast<long long>(link.start), static_cast<long long>(link.end));
    }

    return 0;
}
