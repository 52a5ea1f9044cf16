/// @file attribution.hpp
/// @brief The Attribution capability and the stock attributions.

#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace attributed_text_cpp {

/// A label applied to a range of content (bold, a hyperlink, a custom tag).
///
/// Attributions answer two different questions, kept as two separate
/// operations:
///
/// - id() groups attributions into lanes. Spans in one lane cannot overlap.
/// - equals() is full structural equality, used to match markers.
///
/// can_merge_with() decides whether two attributions with the same id may
/// occupy the same span. Identity match does not imply mergeability, so
/// parameterized attributions (e.g. links to different URLs) can share a
/// lane yet refuse to overlap. can_merge_with() must be reflexive.
class Attribution {
public:
    virtual ~Attribution() = default;

    /// Lane identity.
    virtual auto id() const -> const std::string& = 0;

    /// Structural equality.
    virtual auto equals(const Attribution& other) const -> bool = 0;

    /// Whether this attribution may share a span with @p other.
    virtual auto can_merge_with(const Attribution& other) const -> bool = 0;

    /// Hash consistent with equals(). Defaults to hashing id().
    virtual auto hash() const -> std::size_t {
        return std::hash<std::string>{}(id());
    }

    /// Human-readable form used in diagnostics.
    virtual auto to_string() const -> std::string { return id(); }

protected:
    Attribution() = default;
    Attribution(const Attribution&) = default;
    auto operator=(const Attribution&) -> Attribution& = default;
};

/// Attributions are immutable and shared between markers.
using AttributionPtr = std::shared_ptr<const Attribution>;

inline auto operator==(const Attribution& a, const Attribution& b) -> bool {
    return a.equals(b);
}

/// True when @p a and @p b belong to the same lane.
inline auto same_lane(const Attribution& a, const Attribution& b) -> bool {
    return a.id() == b.id();
}

/// True when @p a and @p b share a lane and @p a accepts merging with @p b.
inline auto mergeable(const Attribution& a, const Attribution& b) -> bool {
    return same_lane(a, b) && a.can_merge_with(b);
}

auto operator<<(std::ostream& os, const Attribution& attribution) -> std::ostream&;
auto operator<<(std::ostream& os, const AttributionPtr& attribution) -> std::ostream&;

// -- Sets ---------------------------------------------------------------------

/// Hashes the pointee, not the pointer.
struct AttributionHash {
    auto operator()(const AttributionPtr& a) const noexcept -> std::size_t {
        return a ? a->hash() : 0;
    }
};

/// Compares the pointees structurally.
struct AttributionEqual {
    auto operator()(const AttributionPtr& a, const AttributionPtr& b) const -> bool {
        if (a == b) return true;
        if (!a || !b) return false;
        return a->equals(*b);
    }
};

/// A set of attributions with structural uniqueness.
using AttributionSet = std::unordered_set<AttributionPtr, AttributionHash, AttributionEqual>;

/// Check whether @p set contains an attribution equal to @p attribution.
auto contains(const AttributionSet& set, const Attribution& attribution) -> bool;

/// Structural set equality (std::unordered_set::operator== compares pointers).
auto same_attributions(const AttributionSet& a, const AttributionSet& b) -> bool;

// -- Stock attributions -------------------------------------------------------

/// An attribution identified only by its name, e.g. "bold" or "italics".
///
/// Two NamedAttributions are equal, share a lane, and merge iff their names
/// are equal.
class NamedAttribution final : public Attribution {
public:
    explicit NamedAttribution(std::string name) : name_{std::move(name)} {}

    auto id() const -> const std::string& override { return name_; }
    auto equals(const Attribution& other) const -> bool override;
    auto can_merge_with(const Attribution& other) const -> bool override;
    auto to_string() const -> std::string override;

    auto name() const -> const std::string& { return name_; }

private:
    std::string name_;
};

/// A hyperlink. Every link shares the "link" lane, but links to different
/// URLs never merge, so they cannot overlap each other.
class LinkAttribution final : public Attribution {
public:
    static constexpr std::string_view lane_id = "link";

    explicit LinkAttribution(std::string url) : url_{std::move(url)} {}

    auto id() const -> const std::string& override;
    auto equals(const Attribution& other) const -> bool override;
    auto can_merge_with(const Attribution& other) const -> bool override;
    auto hash() const -> std::size_t override;
    auto to_string() const -> std::string override;

    auto url() const -> const std::string& { return url_; }

private:
    std::string url_;
};

/// Create a shared NamedAttribution.
inline auto make_named_attribution(std::string name) -> AttributionPtr {
    return std::make_shared<const NamedAttribution>(std::move(name));
}

/// Create a shared LinkAttribution.
inline auto make_link_attribution(std::string url) -> AttributionPtr {
    return std::make_shared<const LinkAttribution>(std::move(url));
}

}  // namespace attributed_text_cpp
