#ifndef NEXUS_BRIDGE_TRANSLATOR_PARAM_VALUE_HPP
#define NEXUS_BRIDGE_TRANSLATOR_PARAM_VALUE_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "../registry/widget.hpp"

namespace bridge::translator {

    struct Date {
        std::chrono::year_month_day ymd_;
        bool operator==(const Date&) const = default;
    };

    struct EnumValue {
        std::string value_;
        bool operator==(const EnumValue&) const = default;
    };

    // One alternative per declared parameter type; values never change alternative after parsing.
    using ParamValue = std::variant<std::string, double, Date, EnumValue, bool>;

    // YYYY-MM-DD, must be a real calendar date.
    std::optional<Date> parse_date(std::string_view s);

    std::optional<double> parse_number(std::string_view s);

    std::optional<bool> parse_boolean(std::string_view s);

    // Parses raw text according to spec.type_. Returns std::nullopt when the text is not a valid value of that type.
    std::optional<ParamValue> parse_param_value(const registry::ParamSpec& spec, const std::string& raw);

    // Canonical text sent to the provider.
    std::string to_upstream_string(const ParamValue& value);

}  // namespace bridge::translator

#endif
