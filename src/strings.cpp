#include "maybe/strings.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace maybe {

    namespace {

        bool is_space(char ch) {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        }

    } // namespace

    std::string_view trim_view(std::string_view value) {
        const auto first = std::find_if_not(value.begin(), value.end(), is_space);
        const auto last  = std::find_if_not(value.rbegin(), std::make_reverse_iterator(first), is_space).base();
        return value.substr(static_cast<std::size_t>(first - value.begin()), static_cast<std::size_t>(last - first));
    }

    std::string lower_copy(std::string_view value) {
        std::string lowered(value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); });
        return lowered;
    }

}
