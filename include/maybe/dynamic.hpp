#ifndef MAYBE_DYNAMIC_HPP
#define MAYBE_DYNAMIC_HPP

#include <functional>
#include <variant>
#include <vector>

#include "maybe/error_channel.hpp"
#include "maybe/types.hpp"

namespace maybe::dynamic {

    using Function = std::function<Value(const std::vector<Value>&)>;
    using Argument = std::variant<Value, Function>;

    // Handler argument list passed to dynamic recoveries: [severity, message, file, line, context].
    std::vector<Value> event_arguments(const ErrorEvent& event);

    /**
     * Runtime-checked form of maybe(): the first parameter is the generator,
     * the last the recovery, everything in between is the generator's argument
     * list. Throws std::invalid_argument when fewer than two parameters are
     * given, when either end is not a non-empty Function, or when a Function
     * appears among the arguments.
     */
    Value call(std::vector<Argument> params);

} // namespace maybe::dynamic

#endif // MAYBE_DYNAMIC_HPP
