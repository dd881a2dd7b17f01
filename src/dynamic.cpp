#include "maybe/dynamic.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "maybe/interceptor.hpp"

namespace maybe::dynamic {

    namespace {

        std::optional<Function> as_function(Argument& argument) {
            auto* fn = std::get_if<Function>(&argument);
            if (!fn || !*fn) {
                return std::nullopt;
            }
            return std::move(*fn);
        }

    } // namespace

    std::vector<Value> event_arguments(const ErrorEvent& event) {
        return {
            Value(static_cast<int>(event.severity)),
            Value(event.message),
            Value(event.location.file_name()),
            Value(event.location.line()),
            event.context,
        };
    }

    Value call(std::vector<Argument> params) {
        if (params.size() < 2) {
            throw std::invalid_argument("Both a generator and a recovery function need to be specified");
        }
        auto generator = as_function(params.front());
        if (!generator) {
            throw std::invalid_argument("Invalid generator given, needs to be callable");
        }
        auto recovery = as_function(params.back());
        if (!recovery) {
            throw std::invalid_argument("Invalid recovery given, needs to be callable");
        }

        std::vector<Value> arguments;
        arguments.reserve(params.size() - 2);
        for (std::size_t i = 1; i + 1 < params.size(); ++i) {
            auto* value = std::get_if<Value>(&params[i]);
            if (!value) {
                throw std::invalid_argument("Invalid argument at position " + std::to_string(i) + ", expected a value");
            }
            arguments.push_back(std::move(*value));
        }

        const Interceptor<Value(const std::vector<Value>&)> interceptor(std::move(*generator),
                                                                        [recovery = std::move(*recovery)](const ErrorEvent& event) { return recovery(event_arguments(event)); });
        return interceptor.invoke(arguments);
    }

} // namespace maybe::dynamic
