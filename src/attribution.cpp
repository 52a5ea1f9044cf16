#include <attributed-text-cpp/attribution.hpp>

#include <ostream>

namespace attributed_text_cpp {

auto operator<<(std::ostream& os, const Attribution& attribution) -> std::ostream& {
    return os << attribution.to_string();
}

auto operator<<(std::ostream& os, const AttributionPtr& attribution) -> std::ostream& {
    if (!attribution) return os << "<null>";
    return os << *attribution;
}

auto contains(const AttributionSet& set, const Attribution& attribution) -> bool {
    for (const auto& candidate : set) {
        if (candidate && candidate->equals(attribution)) return true;
    }
    return false;
}

auto same_attributions(const AttributionSet& a, const AttributionSet& b) -> bool {
    if (a.size() != b.size()) return false;
    for (const auto& attribution : a) {
        if (!b.contains(attribution)) return false;
    }
    return true;
}

// -- NamedAttribution ---------------------------------------------------------

auto NamedAttribution::equals(const Attribution& other) const -> bool {
    const auto* named = dynamic_cast<const NamedAttribution*>(&other);
    return named != nullptr && named->name_ == name_;
}

auto NamedAttribution::can_merge_with(const Attribution& other) const -> bool {
    return equals(other);
}

auto NamedAttribution::to_string() const -> std::string {
    return "NamedAttribution(" + name_ + ")";
}

// -- LinkAttribution ----------------------------------------------------------

auto LinkAttribution::id() const -> const std::string& {
    static const auto link_id = std::string{lane_id};
    return link_id;
}

auto LinkAttribution::equals(const Attribution& other) const -> bool {
    const auto* link = dynamic_cast<const LinkAttribution*>(&other);
    return link != nullptr && link->url_ == url_;
}

auto LinkAttribution::can_merge_with(const Attribution& other) const -> bool {
    return equals(other);
}

auto LinkAttribution::hash() const -> std::size_t {
    return std::hash<std::string>{}(url_) ^ (Attribution::hash() << 1);
}

auto LinkAttribution::to_string() const -> std::string {
    return "LinkAttribution(" + url_ + ")";
}

}  // namespace attributed_text_cpp
