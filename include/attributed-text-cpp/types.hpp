/// @file types.hpp
/// @brief Core marker types: Offset, MarkerType, SpanMarker.

#pragma once

#include <attributed-text-cpp/attribution.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace attributed_text_cpp {

/// A position in some discrete content, e.g. a character index.
///
/// Signed so that the unit before offset 0 can be probed without wrapping.
using Offset = std::int64_t;

/// Whether a marker opens or closes a span.
enum class MarkerType : std::uint8_t {
    start,  ///< First unit of a span (inclusive).
    end,    ///< Last unit of a span (inclusive).
};

/// Convert a MarkerType to its string representation.
constexpr auto to_string_view(MarkerType type) noexcept -> std::string_view {
    switch (type) {
        case MarkerType::start: return "start";
        case MarkerType::end:   return "end";
    }
    return "unknown";
}

/// One boundary of an attributed span.
///
/// Markers are totally ordered by offset and, at equal offsets, start
/// markers sort before end markers, so a span of width one at offset N is
/// stored as `start@N, end@N` and a linear scan never sees an empty gap.
/// The ordering ignores the attribution; equality does not.
struct SpanMarker {
    AttributionPtr attribution;          ///< The attribution this marker bounds.
    Offset offset{0};                    ///< Position within the content.
    MarkerType type{MarkerType::start};  ///< Start or end of the span.

    auto is_start() const -> bool { return type == MarkerType::start; }
    auto is_end() const -> bool { return type == MarkerType::end; }

    /// Copy of this marker moved to @p new_offset.
    auto with_offset(Offset new_offset) const -> SpanMarker {
        return SpanMarker{attribution, new_offset, type};
    }

    auto operator<=>(const SpanMarker& other) const -> std::weak_ordering {
        if (auto cmp = offset <=> other.offset; cmp != 0) {
            return cmp;
        }
        return type <=> other.type;
    }

    auto operator==(const SpanMarker& other) const -> bool {
        return offset == other.offset && type == other.type &&
               AttributionEqual{}(attribution, other.attribution);
    }

    /// Whether this marker belongs to @p other's attribution (structurally).
    auto is_for(const Attribution& other) const -> bool {
        return attribution && attribution->equals(other);
    }
};

auto operator<<(std::ostream& os, const SpanMarker& marker) -> std::ostream&;

/// Format a marker as `[SpanMarker] - attribution: bold, offset: 3, type: start`.
auto to_string(const SpanMarker& marker) -> std::string;

}  // namespace attributed_text_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<attributed_text_cpp::SpanMarker> {
    auto operator()(const attributed_text_cpp::SpanMarker& m) const noexcept -> std::size_t {
        auto h = attributed_text_cpp::AttributionHash{}(m.attribution);
        h ^= std::hash<std::int64_t>{}(m.offset) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h ^ static_cast<std::size_t>(m.type);
    }
};

/// @endcond
