/// @file attributed_text.hpp
/// @brief Umbrella header for the attributed-text-cpp library.
///
/// Include this single header for access to all public types:
/// AttributedSpans, Attribution, SpanMarker, AttributionSpan,
/// MultiAttributionSpan, the error types and the logging controls.

#pragma once

#include <attributed-text-cpp/attributed_spans.hpp>
#include <attributed-text-cpp/attribution.hpp>
#include <attributed-text-cpp/error.hpp>
#include <attributed-text-cpp/log.hpp>
#include <attributed-text-cpp/span.hpp>
#include <attributed-text-cpp/types.hpp>
