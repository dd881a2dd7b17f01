#ifndef MAYBE_SERIALIZE_HPP
#define MAYBE_SERIALIZE_HPP

#include <string>
#include <string_view>

#include "maybe/types.hpp"

namespace maybe {

    std::string serialize(const Value& value);

    // Malformed input is reported as a notice through the error channel and yields `false`.
    Value       unserialize(std::string_view text);

} // namespace maybe

#endif // MAYBE_SERIALIZE_HPP
