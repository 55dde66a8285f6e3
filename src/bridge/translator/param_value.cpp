#include "param_value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

#include "../../utils/overloaded.hpp"
#include "../../utils/string_utils.hpp"

namespace bridge::translator {
    namespace {
        constexpr size_t DATE_LENGTH = 10;
        constexpr size_t YEAR_DASH = 4;
        constexpr size_t MONTH_DASH = 7;
    }  // namespace

    std::optional<Date> parse_date(std::string_view s) {
        if (s.size() != DATE_LENGTH || s[YEAR_DASH] != '-' || s[MONTH_DASH] != '-') {
            return std::nullopt;
        }
        for (size_t i = 0; i < s.size(); ++i) {
            if (i != YEAR_DASH && i != MONTH_DASH && std::isdigit(static_cast<unsigned char>(s[i])) == 0) {
                return std::nullopt;
            }
        }

        const int y = std::stoi(std::string(s.substr(0, 4)));
        const auto m = static_cast<unsigned>(std::stoi(std::string(s.substr(5, 2))));
        const auto d = static_cast<unsigned>(std::stoi(std::string(s.substr(8, 2))));

        const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
        if (!ymd.ok()) {
            return std::nullopt;
        }
        return Date{ymd};
    }

    std::optional<double> parse_number(std::string_view s) {
        // Plain decimal notation only: strtod would also take hex, "inf" and "nan".
        if (s.empty() || s.find_first_not_of("0123456789+-.eE") != std::string_view::npos) {
            return std::nullopt;
        }

        const std::string text(s);
        char* end = nullptr;
        const double value = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<bool> parse_boolean(std::string_view s) {
        if (string_utils::iequals(s, "true") || s == "1") {
            return true;
        }
        if (string_utils::iequals(s, "false") || s == "0") {
            return false;
        }
        return std::nullopt;
    }

    std::optional<ParamValue> parse_param_value(const registry::ParamSpec& spec, const std::string& raw) {
        switch (spec.type_) {
            case registry::ParamType::STRING: {
                std::string text = string_utils::trim(raw);
                if (text.empty()) {
                    return std::nullopt;
                }
                return ParamValue{spec.uppercase_ ? string_utils::to_upper(std::move(text)) : std::move(text)};
            }
            case registry::ParamType::NUMBER: {
                auto number = parse_number(raw);
                return number ? std::optional<ParamValue>(*number) : std::nullopt;
            }
            case registry::ParamType::DATE: {
                auto date = parse_date(raw);
                return date ? std::optional<ParamValue>(*date) : std::nullopt;
            }
            case registry::ParamType::ENUM: {
                const bool allowed = std::any_of(spec.options_.begin(), spec.options_.end(), [&raw](const auto& o) { return o.value_ == raw; });
                return allowed ? std::optional<ParamValue>(EnumValue{raw}) : std::nullopt;
            }
            case registry::ParamType::BOOLEAN: {
                auto flag = parse_boolean(raw);
                return flag ? std::optional<ParamValue>(*flag) : std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::string to_upstream_string(const ParamValue& value) {
        return std::visit(utils::overloaded{
                              [](const std::string& s) { return s; },
                              [](double d) { return fmt::format("{}", d); },
                              [](const Date& d) {
                                  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(d.ymd_.year()), static_cast<unsigned>(d.ymd_.month()),
                                                     static_cast<unsigned>(d.ymd_.day()));
                              },
                              [](const EnumValue& e) { return e.value_; },
                              [](bool b) { return std::string(b ? "true" : "false"); },
                          },
                          value);
    }

}  // namespace bridge::translator
