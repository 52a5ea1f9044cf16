/// @file error.hpp
/// @brief Error types for the attributed-text-cpp library.

#pragma once

#include <attributed-text-cpp/attribution.hpp>
#include <attributed-text-cpp/types.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace attributed_text_cpp {

/// Categories of caller-visible errors.
enum class ErrorKind : std::uint8_t {
    invalid_range,          ///< A range had start < 0 or start > end.
    incompatible_overlap,   ///< A new attribution overlaps a non-mergeable one.
    attribution_not_found,  ///< The attribution does not cover the offset.
    invalid_splice,         ///< Spans cannot be joined at the requested index.
    invalid_attribution,    ///< A null attribution was passed to a mutation.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_range:         return "invalid_range";
        case ErrorKind::incompatible_overlap:  return "incompatible_overlap";
        case ErrorKind::attribution_not_found: return "attribution_not_found";
        case ErrorKind::invalid_splice:        return "invalid_splice";
        case ErrorKind::invalid_attribution:   return "invalid_attribution";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Thrown when a call is rejected because of its arguments.
///
/// The AttributedSpans that threw is left exactly as it was before the call.
class SpanError : public std::runtime_error {
public:
    explicit SpanError(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    SpanError(ErrorKind kind, std::string message)
        : SpanError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// Thrown by AttributedSpans::add_attribution() when the new attribution
/// would overlap an attribution in the same lane that it cannot merge with.
class IncompatibleOverlapError : public SpanError {
public:
    IncompatibleOverlapError(AttributionPtr existing, AttributionPtr added, Offset conflict_start);

    /// The attribution already present in the requested range.
    auto existing_attribution() const noexcept -> const AttributionPtr& { return existing_; }

    /// The attribution the caller tried to add.
    auto new_attribution() const noexcept -> const AttributionPtr& { return new_; }

    /// The first offset in the requested range covered by the existing attribution.
    auto conflict_start() const noexcept -> Offset { return conflict_start_; }

private:
    AttributionPtr existing_;
    AttributionPtr new_;
    Offset conflict_start_;
};

/// Thrown when the marker list is found in a state that correct mutations
/// can never produce (an open-ended span, a start following a start, or
/// unbalanced markers around a copy region). Not a caller error.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace attributed_text_cpp
