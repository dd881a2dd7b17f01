#pragma once

#include <string>
#include <string_view>

namespace maybe {

    std::string_view trim_view(std::string_view value);
    std::string      lower_copy(std::string_view value);

}
