#include <attributed-text-cpp/error.hpp>

#include <ostream>
#include <sstream>
#include <utility>

namespace attributed_text_cpp {

namespace {

auto describe_overlap(const AttributionPtr& existing, const AttributionPtr& added,
                      Offset conflict_start) -> std::string {
    auto out = std::ostringstream{};
    out << "Tried to insert attribution (" << added
        << ") over a conflicting existing attribution (" << existing
        << "). The overlap began at index " << conflict_start;
    return out.str();
}

}  // namespace

IncompatibleOverlapError::IncompatibleOverlapError(AttributionPtr existing, AttributionPtr added,
                                                   Offset conflict_start)
    : SpanError{ErrorKind::incompatible_overlap, describe_overlap(existing, added, conflict_start)},
      existing_{std::move(existing)},
      new_{std::move(added)},
      conflict_start_{conflict_start} {}

}  // namespace attributed_text_cpp
