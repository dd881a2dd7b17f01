#ifndef MAYBE_LOGGING_HPP
#define MAYBE_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

namespace maybe {

    enum class LogLevel {
        kDebug,
        kError,
    };

    using LogSink = void (*)(std::string_view message);

    std::string format_log_entry(LogLevel level, std::string_view context, std::string_view message);
    std::string format_log_entry_with_location(LogLevel level, std::string_view context, std::string_view message,
                                               const std::source_location& location = std::source_location::current());

    LogSink     set_log_sink(LogLevel level, LogSink sink);
    void        clear_log_sink(LogLevel level);

    void        debug_log(bool enabled, std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());
    void        error_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    // Swaps a sink in for the lifetime of the guard.
    class ScopedLogSink {
      public:
        ScopedLogSink(LogLevel level, LogSink sink) : level_(level), previous_(set_log_sink(level, sink)) {}
        ~ScopedLogSink() {
            set_log_sink(level_, previous_);
        }

        ScopedLogSink(const ScopedLogSink&)            = delete;
        ScopedLogSink& operator=(const ScopedLogSink&) = delete;

      private:
        LogLevel level_;
        LogSink  previous_;
    };

} // namespace maybe

#endif // MAYBE_LOGGING_HPP
