#ifndef MAYBE_SEVERITY_HPP
#define MAYBE_SEVERITY_HPP

#include <string_view>

namespace maybe {

    enum class Severity : int {
        kError          = 1,
        kWarning        = 2,
        kParse          = 4,
        kNotice         = 8,
        kUserError      = 256,
        kUserWarning    = 512,
        kUserNotice     = 1024,
        kDeprecated     = 8192,
        kUserDeprecated = 16384,
    };

    inline constexpr int kAllSeverities = static_cast<int>(Severity::kError) | static_cast<int>(Severity::kWarning) | static_cast<int>(Severity::kParse) |
        static_cast<int>(Severity::kNotice) | static_cast<int>(Severity::kUserError) | static_cast<int>(Severity::kUserWarning) |
        static_cast<int>(Severity::kUserNotice) | static_cast<int>(Severity::kDeprecated) | static_cast<int>(Severity::kUserDeprecated);

    std::string_view severity_name(Severity severity);
    bool             is_fatal(Severity severity);
    bool             severity_in_mask(Severity severity, int mask);

} // namespace maybe

#endif // MAYBE_SEVERITY_HPP
