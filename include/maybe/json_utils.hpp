#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace maybe {

    std::optional<std::string> optional_string(const nlohmann::json& value);
    std::optional<bool>        optional_bool_field(const nlohmann::json& obj, const char* key);
    std::optional<int>         optional_int(const nlohmann::json& value);

}
