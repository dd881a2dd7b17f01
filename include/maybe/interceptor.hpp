#ifndef MAYBE_INTERCEPTOR_HPP
#define MAYBE_INTERCEPTOR_HPP

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include "maybe/capture.hpp"
#include "maybe/error_channel.hpp"

namespace maybe {

    namespace detail {

        // Accepts recoveries written as R(), R(const ErrorEvent&) or R(Severity, std::string_view).
        template <typename R, typename F>
        std::function<R(const ErrorEvent&)> adapt_recovery(F&& recovery) {
            using Fn = std::decay_t<F>;
            if constexpr (std::is_same_v<Fn, std::nullptr_t>) {
                return {};
            } else if constexpr (std::is_invocable_r_v<R, Fn&, const ErrorEvent&>) {
                return std::function<R(const ErrorEvent&)>(std::forward<F>(recovery));
            } else if constexpr (std::is_invocable_r_v<R, Fn&, Severity, std::string_view>) {
                std::function<R(Severity, std::string_view)> fn(std::forward<F>(recovery));
                if (!fn) {
                    return {};
                }
                return [fn = std::move(fn)](const ErrorEvent& event) -> R { return fn(event.severity, event.message); };
            } else {
                static_assert(std::is_invocable_r_v<R, Fn&>, "recovery must accept (), (const ErrorEvent&) or (Severity, std::string_view)");
                std::function<R()> fn(std::forward<F>(recovery));
                if (!fn) {
                    return {};
                }
                return [fn = std::move(fn)](const ErrorEvent&) -> R { return fn(); };
            }
        }

    } // namespace detail

    template <typename Signature>
    class Interceptor;

    /**
     * Calls a generator with the error channel redirected to a recovery.
     *
     * Each `invoke` installs a fresh Capture as the innermost handler and
     * suppresses default display until the generator returns or throws. If
     * the generator reported anything through the channel, the recovery's
     * value for the last event replaces the generator's own result.
     */
    template <typename R, typename... Args>
    class Interceptor<R(Args...)> {
        static_assert(!std::is_void_v<R>, "generator must produce a value");

      public:
        using Generator = std::function<R(Args...)>;
        using Recovery  = std::function<R(const ErrorEvent&)>;

        template <typename G, typename F>
        Interceptor(G&& generator, F&& recovery) {
            set_generator(std::forward<G>(generator));
            set_recovery(std::forward<F>(recovery));
        }

        template <typename G>
        Interceptor& set_generator(G&& generator) {
            Generator wrapped;
            if constexpr (!std::is_same_v<std::decay_t<G>, std::nullptr_t>) {
                wrapped = Generator(std::forward<G>(generator));
            }
            if (!wrapped) {
                throw std::invalid_argument("Invalid generator given, needs to be callable");
            }
            generator_ = std::move(wrapped);
            return *this;
        }

        template <typename F>
        Interceptor& set_recovery(F&& recovery) {
            auto wrapped = detail::adapt_recovery<R>(std::forward<F>(recovery));
            if (!wrapped) {
                throw std::invalid_argument("Invalid recovery given, needs to be callable");
            }
            recovery_ = std::move(wrapped);
            return *this;
        }

        const Generator& generator() const {
            return generator_;
        }

        const Recovery& recovery() const {
            return recovery_;
        }

        R invoke(Args... args) const {
            Capture<R> capture(recovery_);
            R          result = [&]() -> R {
                ScopedErrorHandler handler([&capture](const ErrorEvent& event) { return capture.sink(event); });
                ScopedSuppression  suppression;
                return generator_(std::forward<Args>(args)...);
            }();
            if (capture.invoked()) {
                return *capture.captured_value();
            }
            return result;
        }

      private:
        Generator generator_;
        Recovery  recovery_;
    };

} // namespace maybe

#endif // MAYBE_INTERCEPTOR_HPP
