#include "minhypr/logging.hpp"

#include <array>
#include <cstdio>

namespace minhypr {

    namespace {

        std::array<LogSink, 2> sinks = {nullptr, nullptr};

        LogSink&               sink_for(LogLevel level) {
            return sinks[level == LogLevel::kDebug ? 0 : 1];
        }

        std::string_view prefix_for(LogLevel level) {
            return level == LogLevel::kDebug ? "[minhypr][debug] " : "[minhypr] ";
        }

        std::string_view file_basename(std::string_view path) {
            const auto slash = path.rfind('/');
            return slash == std::string_view::npos ? path : path.substr(slash + 1);
        }

        void emit(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location) {
            if (const auto sink = sink_for(level)) {
                sink(format_log_line(level, context, message, location));
            }
        }

    } // namespace

    std::string format_log_line(LogLevel level, std::string_view context, std::string_view message) {
        std::string line(prefix_for(level));
        if (!context.empty()) {
            line += context;
            line += ": ";
        }
        line += message;
        return line;
    }

    std::string format_log_line(LogLevel level, std::string_view context, std::string_view message, const std::source_location& location) {
        auto line = format_log_line(level, context, message);
        line += " @";
        line += file_basename(location.file_name());
        line += ':';
        line += std::to_string(location.line());
        if (const std::string_view function = location.function_name(); !function.empty()) {
            line += ' ';
            line += function;
        }
        return line;
    }

    void set_log_sink(LogLevel level, LogSink sink) {
        sink_for(level) = sink;
    }

    void debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location) {
        if (enabled) {
            emit(LogLevel::kDebug, context, message, location);
        }
    }

    void error_log(std::string_view context, std::string_view message, const std::source_location& location) {
        emit(LogLevel::kError, context, message, location);
    }

    void stderr_log_sink(std::string_view line) {
        std::fprintf(stderr, "%.*s\n", static_cast<int>(line.size()), line.data());
    }

} // namespace minhypr
