#ifndef MAYBE_CAPTURE_HPP
#define MAYBE_CAPTURE_HPP

#include <functional>
#include <optional>
#include <utility>

#include "maybe/error_channel.hpp"

namespace maybe {

    /**
     * Per-invocation record behind an interceptor's error handler.
     *
     * `sink` runs the recovery for every event it receives and keeps the value
     * of the last one. Exceptions from the recovery leave the record untouched
     * and propagate to the reporter.
     */
    template <typename R>
    class Capture {
      public:
        using Recovery = std::function<R(const ErrorEvent&)>;

        explicit Capture(Recovery recovery) : recovery_(std::move(recovery)) {}

        bool sink(const ErrorEvent& event) {
            captured_ = recovery_(event);
            invoked_  = true;
            return true;
        }

        bool invoked() const {
            return invoked_;
        }

        const std::optional<R>& captured_value() const {
            return captured_;
        }

      private:
        Recovery         recovery_;
        bool             invoked_ = false;
        std::optional<R> captured_;
    };

} // namespace maybe

#endif // MAYBE_CAPTURE_HPP
