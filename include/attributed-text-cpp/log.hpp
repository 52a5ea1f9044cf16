/// @file log.hpp
/// @brief Diagnostic logging: levels, threshold and a replaceable sink.
///
/// The library traces what its algorithms do at debug/trace level and
/// reports corrupted marker lists at warning level. Logging is purely
/// observational; no return value or error depends on it.

#pragma once

#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace attributed_text_cpp {

/// Severity of a log message.
enum class LogLevel : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::trace:   return "TRACE";
        case LogLevel::debug:   return "DEBUG";
        case LogLevel::info:    return "INFO";
        case LogLevel::warning: return "WARNING";
        case LogLevel::error:   return "ERROR";
    }
    return "UNKNOWN";
}

/// Receives every message at or above the threshold.
using LogSink = std::function<void(LogLevel, std::string_view)>;

/// Replace the sink. An empty sink discards all messages.
void set_log_sink(LogSink sink);

/// Restore the default sink, which writes `attributed-text LEVEL: msg` to stderr.
void reset_log_sink();

/// Messages below @p threshold are dropped without being formatted.
/// The default threshold is LogLevel::warning.
void set_log_threshold(LogLevel threshold);

auto log_threshold() -> LogLevel;

/// True if a message at @p level would reach the sink.
auto log_enabled(LogLevel level) -> bool;

/// Send one message to the sink, subject to the threshold.
void log_message(LogLevel level, std::string_view message);

namespace detail {

/// Stream-style log statement; the message is sent when it goes out of scope.
///
/// @code
/// detail::Log{LogLevel::debug} << "adding start marker at: " << start;
/// @endcode
class Log {
public:
    explicit Log(LogLevel level = LogLevel::info)
        : level_{level}, enabled_{log_enabled(level)} {}

    ~Log() {
        if (enabled_) {
            log_message(level_, buffer_.str());
        }
    }

    Log(const Log&) = delete;
    auto operator=(const Log&) -> Log& = delete;

    template <typename T>
    auto operator<<(const T& value) -> Log& {
        if (enabled_) {
            buffer_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    bool enabled_;
    std::ostringstream buffer_;
};

}  // namespace detail

}  // namespace attributed_text_cpp
