#include <attributed-text-cpp/log.hpp>

#include <iostream>
#include <utility>

namespace attributed_text_cpp {

namespace {

void log_to_stderr(LogLevel level, std::string_view message) {
    std::cerr << "attributed-text " << to_string_view(level) << ": " << message << std::endl;
}

auto sink() -> LogSink& {
    static auto instance = LogSink{log_to_stderr};
    return instance;
}

auto threshold() -> LogLevel& {
    static auto instance = LogLevel::warning;
    return instance;
}

}  // namespace

void set_log_sink(LogSink new_sink) {
    sink() = std::move(new_sink);
}

void reset_log_sink() {
    sink() = log_to_stderr;
}

void set_log_threshold(LogLevel new_threshold) {
    threshold() = new_threshold;
}

auto log_threshold() -> LogLevel {
    return threshold();
}

auto log_enabled(LogLevel level) -> bool {
    return level >= threshold() && static_cast<bool>(sink());
}

void log_message(LogLevel level, std::string_view message) {
    if (!log_enabled(level)) {
        return;
    }
    sink()(level, message);
}

}  // namespace attributed_text_cpp
