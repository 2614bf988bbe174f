#ifndef MINHYPR_LOGGING_HPP
#define MINHYPR_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

namespace minhypr {

    enum class LogLevel {
        kDebug,
        kError,
    };

    using LogSink = void (*)(std::string_view line);

    // "[minhypr] context: message", debug lines tagged "[minhypr][debug]".
    std::string format_log_line(LogLevel level, std::string_view context, std::string_view message);
    // Same, followed by " @file.cpp:line function".
    std::string format_log_line(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location);

    // nullptr drops messages of that level.
    void        set_log_sink(LogLevel level, LogSink sink);

    void        debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());
    void        error_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        stderr_log_sink(std::string_view line);

} // namespace minhypr

#endif // MINHYPR_LOGGING_HPP
