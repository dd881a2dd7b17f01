#include "maybe/severity.hpp"

#include <array>
#include <utility>

namespace maybe {

    namespace {

        constexpr std::array<std::pair<Severity, std::string_view>, 9> kSeverityNames = {{
            {Severity::kError, "error"},
            {Severity::kWarning, "warning"},
            {Severity::kParse, "parse"},
            {Severity::kNotice, "notice"},
            {Severity::kUserError, "user_error"},
            {Severity::kUserWarning, "user_warning"},
            {Severity::kUserNotice, "user_notice"},
            {Severity::kDeprecated, "deprecated"},
            {Severity::kUserDeprecated, "user_deprecated"},
        }};

    } // namespace

    std::string_view severity_name(Severity severity) {
        for (const auto& [value, name] : kSeverityNames) {
            if (value == severity) {
                return name;
            }
        }
        return "unknown";
    }

    bool is_fatal(Severity severity) {
        return severity == Severity::kError || severity == Severity::kUserError;
    }

    bool severity_in_mask(Severity severity, int mask) {
        return (static_cast<int>(severity) & mask) != 0;
    }

} // namespace maybe
