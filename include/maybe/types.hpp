#ifndef MAYBE_TYPES_HPP
#define MAYBE_TYPES_HPP

#include <nlohmann/json.hpp>

namespace maybe {

    using Value = nlohmann::json;

} // namespace maybe

#endif // MAYBE_TYPES_HPP
