#include "maybe/error_channel.hpp"

#include <string>
#include <utility>
#include <vector>

#include "maybe/config.hpp"
#include "maybe/logging.hpp"

namespace maybe {

    namespace {

        struct HandlerEntry {
            ErrorHandler handler;
            int          mask;
            bool         running = false;
        };

        std::vector<HandlerEntry> handlers;
        int                       suppression_depth = 0;

        // Marks a stack slot busy while its handler runs. Slots only change in LIFO order,
        // so the index outlives any nested install/restore made by the handler itself.
        class RunningMark {
          public:
            explicit RunningMark(std::size_t index) : index_(index) {
                handlers[index_].running = true;
            }
            ~RunningMark() {
                if (index_ < handlers.size()) {
                    handlers[index_].running = false;
                }
            }

            RunningMark(const RunningMark&)            = delete;
            RunningMark& operator=(const RunningMark&) = delete;

          private:
            std::size_t index_;
        };

        void display_unhandled(const ErrorEvent& event) {
            const auto& config = reporting_config();
            if (suppression_depth > 0 || !config.display_unhandled || !severity_in_mask(event.severity, config.reporting_mask)) {
                return;
            }
            error_log(severity_name(event.severity), event.message, event.location);
        }

        bool dispatch_error(const ErrorEvent& event) {
            if (!handlers.empty()) {
                const std::size_t index = handlers.size() - 1;
                const auto&       entry = handlers[index];
                if (entry.handler && !entry.running && severity_in_mask(event.severity, entry.mask)) {
                    // Copy so the callable survives the handler restoring its own slot.
                    const ErrorHandler handler = entry.handler;
                    RunningMark        mark(index);
                    if (handler(event)) {
                        return true;
                    }
                }
            }
            display_unhandled(event);
            if (is_fatal(event.severity)) {
                throw FatalError(event);
            }
            return false;
        }

    } // namespace

    FatalError::FatalError(ErrorEvent event) : std::runtime_error(event.message), event_(std::move(event)) {}

    ErrorHandler set_error_handler(ErrorHandler handler, int mask) {
        ErrorHandler previous = handlers.empty() ? ErrorHandler{} : handlers.back().handler;
        handlers.push_back(HandlerEntry{.handler = std::move(handler), .mask = mask});
        if (reporting_config().debug_logging) {
            debug_log(true, "error channel", "handler installed depth=" + std::to_string(handlers.size()));
        }
        return previous;
    }

    bool restore_error_handler() {
        if (handlers.empty()) {
            return false;
        }
        handlers.pop_back();
        if (reporting_config().debug_logging) {
            debug_log(true, "error channel", "handler restored depth=" + std::to_string(handlers.size()));
        }
        return true;
    }

    std::size_t error_handler_depth() {
        return handlers.size();
    }

    bool report_error(Severity severity, std::string message, Value context, const std::source_location& location) {
        const ErrorEvent event{.severity = severity, .message = std::move(message), .location = location, .context = std::move(context)};
        return dispatch_error(event);
    }

    bool reporting_suppressed() {
        return suppression_depth > 0;
    }

    ScopedErrorHandler::ScopedErrorHandler(ErrorHandler handler, int mask) : depth_(handlers.size() + 1) {
        set_error_handler(std::move(handler), mask);
    }

    ScopedErrorHandler::~ScopedErrorHandler() {
        if (handlers.size() != depth_) {
            error_log("error channel", "handler scopes released out of order depth=" + std::to_string(handlers.size()) + " expected=" + std::to_string(depth_));
        }
        if (!restore_error_handler()) {
            error_log("error channel", "no handler left to restore");
        }
    }

    ScopedSuppression::ScopedSuppression() {
        ++suppression_depth;
    }

    ScopedSuppression::~ScopedSuppression() {
        --suppression_depth;
    }

} // namespace maybe
