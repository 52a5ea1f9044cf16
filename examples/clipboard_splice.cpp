// clipboard_splice -- cut, copy and paste styled text
//
// Demonstrates: copy_attribution_region, contract_attributions,
//               push_attributions_back, add_at joining spans at the seam
//
// Build: cmake --build build
// Run:   ./build/clipboard_splice

#include <attributed-text-cpp/attributed_text.hpp>

#include <cstdio>
#include <string>

namespace at = attributed_text_cpp;

namespace {

void dump(const char* label, const at::AttributedSpans& spans) {
    std::printf("%s\n%s\n\n", label, spans.to_string().c_str());
}

}  // namespace

int main() {
    const auto bold = at::make_named_attribution("bold");
    const auto code = at::make_named_attribution("code");

    // "Hello bold world" with "bold world" in bold and "world" as code
    auto doc = at::AttributedSpans{};
    doc.add_attribution(bold, 6, 15);
    doc.add_attribution(code, 11, 15);
    dump("Document:", doc);

    // -- Copy "bold wo" to the clipboard --------------------------------------
    const auto clipboard = doc.copy_attribution_region(6, 12);
    dump("Clipboard (offset 0 is the start of the selection):", clipboard);

    // -- Cut "Hello " -----------------------------------------------------------
    doc.contract_attributions(0, 6);
    dump("After cutting the first 6 units:", doc);

    // -- Paste the clipboard at the end ---------------------------------------
    // The document ends at 9; bold runs to the end, so the pasted bold joins it.
    doc.add_at(clipboard, 10);
    dump("After pasting at 10:", doc);

    for (const auto& span : doc.get_attribution_spans_in_range(
             [](const at::Attribution& a) { return a.id() == "bold"; }, 0, 16)) {
        std::printf("bold span: [%lld, %lld]\n",
                    static_cast<long long>(span.start), static_cast<long long>(span.end));
    }

    // -- Pasting over existing content is refused -------------------------------
    try {
        doc.add_at(clipboard, 3);
    } catch (const at::SpanError& e) {
        std::printf("\npaste refused (%s): %s\n",
                    std::string{at::to_string_view(e.kind())}.c_str(), e.what());
    }

    // -- Insert two units at the front by pushing everything back --------------
    auto shifted = doc.copy();
    shifted.push_attributions_back(2);
    std::printf("\nFirst bold unit after inserting 2 units at the front: %s\n",
                shifted.has_attribution_at(2, *bold) ? "2" : "none");

    return 0;
}
