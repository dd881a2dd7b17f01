#include "maybe/config.hpp"

#include <string>

#include "maybe/json_utils.hpp"
#include "maybe/strings.hpp"

namespace maybe {

    namespace {

        ReportingConfig active_config;

        std::optional<int> parse_mask_name(std::string_view value) {
            if (lower_copy(trim_view(value)) == "all") {
                return kAllSeverities;
            }
            if (const auto severity = parse_severity(value)) {
                return static_cast<int>(*severity);
            }
            return std::nullopt;
        }

    } // namespace

    std::optional<Severity> parse_severity(std::string_view value) {
        auto normalized = lower_copy(trim_view(value));
        if (normalized.starts_with("e_")) {
            normalized.erase(0, 2);
        }
        if (normalized == "error") {
            return Severity::kError;
        }
        if (normalized == "warning") {
            return Severity::kWarning;
        }
        if (normalized == "parse") {
            return Severity::kParse;
        }
        if (normalized == "notice") {
            return Severity::kNotice;
        }
        if (normalized == "user_error") {
            return Severity::kUserError;
        }
        if (normalized == "user_warning") {
            return Severity::kUserWarning;
        }
        if (normalized == "user_notice") {
            return Severity::kUserNotice;
        }
        if (normalized == "deprecated") {
            return Severity::kDeprecated;
        }
        if (normalized == "user_deprecated") {
            return Severity::kUserDeprecated;
        }
        return std::nullopt;
    }

    std::optional<int> parse_severity_mask(const nlohmann::json& value) {
        if (value.is_number_integer()) {
            const auto mask = optional_int(value);
            if (!mask || *mask < 0) {
                return std::nullopt;
            }
            return *mask & kAllSeverities;
        }
        if (value.is_string()) {
            return parse_mask_name(value.get<std::string>());
        }
        if (value.is_array()) {
            int mask = 0;
            for (const auto& item : value) {
                const auto name = optional_string(item);
                if (!name) {
                    return std::nullopt;
                }
                const auto parsed = parse_mask_name(*name);
                if (!parsed) {
                    return std::nullopt;
                }
                mask |= *parsed;
            }
            return mask;
        }
        return std::nullopt;
    }

    ReportingOverrides overrides_from_json(const nlohmann::json& obj) {
        ReportingOverrides overrides;
        if (obj.is_object() && obj.contains("reporting")) {
            overrides.reporting_mask = parse_severity_mask(obj.at("reporting"));
        }
        overrides.display_unhandled = optional_bool_field(obj, "display_unhandled");
        overrides.debug_logging     = optional_bool_field(obj, "debug_logging");
        return overrides;
    }

    ReportingConfig apply_overrides(const ReportingConfig& base, const ReportingOverrides& overrides) {
        ReportingConfig merged = base;
        if (overrides.reporting_mask) {
            merged.reporting_mask = *overrides.reporting_mask;
        }
        if (overrides.display_unhandled) {
            merged.display_unhandled = *overrides.display_unhandled;
        }
        if (overrides.debug_logging) {
            merged.debug_logging = *overrides.debug_logging;
        }
        return merged;
    }

    void configure_reporting(const ReportingConfig& config) {
        active_config = config;
    }

    const ReportingConfig& reporting_config() {
        return active_config;
    }

} // namespace maybe
