#include "maybe/json_utils.hpp"

#include <cstdint>
#include <limits>

namespace maybe {

    std::optional<std::string> optional_string(const nlohmann::json& value) {
        if (!value.is_string()) {
            return std::nullopt;
        }
        auto str = value.get<std::string>();
        if (str.empty()) {
            return std::nullopt;
        }
        return str;
    }

    std::optional<bool> optional_bool_field(const nlohmann::json& obj, const char* key) {
        if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_boolean()) {
            return std::nullopt;
        }
        return obj.at(key).get<bool>();
    }

    // Integers outside the int range are rejected rather than narrowed.
    std::optional<int> optional_int(const nlohmann::json& value) {
        if (value.is_number_unsigned()) {
            const auto raw = value.get<std::uint64_t>();
            if (raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                return std::nullopt;
            }
            return static_cast<int>(raw);
        }
        if (!value.is_number_integer()) {
            return std::nullopt;
        }
        const auto raw = value.get<std::int64_t>();
        if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }

}
