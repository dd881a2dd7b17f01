#ifndef MAYBE_ERROR_CHANNEL_HPP
#define MAYBE_ERROR_CHANNEL_HPP

#include <cstddef>
#include <functional>
#include <source_location>
#include <stdexcept>
#include <string>

#include "maybe/severity.hpp"
#include "maybe/types.hpp"

namespace maybe {

    struct ErrorEvent {
        Severity             severity;
        std::string          message;
        std::source_location location;
        Value                context;
    };

    // Returns true when the event was handled; false falls through to default handling.
    using ErrorHandler = std::function<bool(const ErrorEvent&)>;

    // Thrown when a fatal severity reaches default handling.
    class FatalError : public std::runtime_error {
      public:
        explicit FatalError(ErrorEvent event);

        const ErrorEvent& event() const {
            return event_;
        }

      private:
        ErrorEvent event_;
    };

    /**
     * Process-wide error channel.
     *
     * Handlers form a stack. Only the innermost handler sees an event, and only
     * when the event's severity is within the mask it was installed with. An
     * empty handler restores default handling for its scope. Events raised while
     * a handler is running skip that handler and go to default handling.
     */
    ErrorHandler set_error_handler(ErrorHandler handler, int mask = kAllSeverities);
    bool         restore_error_handler();
    std::size_t  error_handler_depth();

    bool         report_error(Severity severity, std::string message, Value context = {}, const std::source_location& location = std::source_location::current());

    bool         reporting_suppressed();

    class ScopedErrorHandler {
      public:
        explicit ScopedErrorHandler(ErrorHandler handler, int mask = kAllSeverities);
        ~ScopedErrorHandler();

        ScopedErrorHandler(const ScopedErrorHandler&)            = delete;
        ScopedErrorHandler& operator=(const ScopedErrorHandler&) = delete;
        ScopedErrorHandler(ScopedErrorHandler&&)                 = delete;
        ScopedErrorHandler& operator=(ScopedErrorHandler&&)      = delete;

      private:
        std::size_t depth_;
    };

    // Silences default display of unhandled events while alive. Nestable.
    class ScopedSuppression {
      public:
        ScopedSuppression();
        ~ScopedSuppression();

        ScopedSuppression(const ScopedSuppression&)            = delete;
        ScopedSuppression& operator=(const ScopedSuppression&) = delete;
    };

} // namespace maybe

#endif // MAYBE_ERROR_CHANNEL_HPP
