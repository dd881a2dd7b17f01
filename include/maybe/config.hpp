#ifndef MAYBE_CONFIG_HPP
#define MAYBE_CONFIG_HPP

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "maybe/severity.hpp"

namespace maybe {

    struct ReportingConfig {
        int  reporting_mask    = kAllSeverities;
        bool display_unhandled = true;
        bool debug_logging     = false;
    };

    struct ReportingOverrides {
        std::optional<int>  reporting_mask;
        std::optional<bool> display_unhandled;
        std::optional<bool> debug_logging;
    };

    std::optional<Severity> parse_severity(std::string_view value);
    std::optional<int>      parse_severity_mask(const nlohmann::json& value);
    ReportingOverrides      overrides_from_json(const nlohmann::json& obj);
    ReportingConfig         apply_overrides(const ReportingConfig& base, const ReportingOverrides& overrides);

    void                    configure_reporting(const ReportingConfig& config);
    const ReportingConfig&  reporting_config();

} // namespace maybe

#endif // MAYBE_CONFIG_HPP
