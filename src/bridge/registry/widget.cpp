#include "widget.hpp"

#include <stdexcept>
#include <string>

namespace bridge::registry {

    const ParamSpec* WidgetDescriptor::find_param(const std::string& name) const {
        for (const auto& param : params_) {
            if (param.name_ == name) {
                return &param;
            }
        }
        return nullptr;
    }

    const char* to_string(ParamType type) {
        switch (type) {
            case ParamType::STRING:
                return "string";
            case ParamType::NUMBER:
                return "number";
            case ParamType::DATE:
                return "date";
            case ParamType::ENUM:
                return "enum";
            case ParamType::BOOLEAN:
                return "boolean";
        }
        return "string";
    }

    const char* to_string(ColumnType type) {
        switch (type) {
            case ColumnType::STRING:
                return "string";
            case ColumnType::NUMBER:
                return "number";
            case ColumnType::INTEGER:
                return "integer";
            case ColumnType::DATE:
                return "date";
            case ColumnType::BOOLEAN:
                return "boolean";
        }
        return "string";
    }

    const char* to_string(ColumnFormat format) {
        switch (format) {
            case ColumnFormat::NONE:
                return "none";
            case ColumnFormat::CURRENCY:
                return "currency";
            case ColumnFormat::PERCENT:
                return "percent";
            case ColumnFormat::COMPACT:
                return "compact";
        }
        return "none";
    }

    const char* to_string(WidgetType type) { return type == WidgetType::METRIC ? "metric" : "table"; }

    ParamType param_type_from_string(const std::string& s) {
        if (s == "string") {
            return ParamType::STRING;
        }
        if (s == "number") {
            return ParamType::NUMBER;
        }
        if (s == "date") {
            return ParamType::DATE;
        }
        if (s == "enum") {
            return ParamType::ENUM;
        }
        if (s == "boolean") {
            return ParamType::BOOLEAN;
        }
        throw std::invalid_argument("Unknown parameter type: " + s);
    }

    ColumnType column_type_from_string(const std::string& s) {
        if (s == "string") {
            return ColumnType::STRING;
        }
        if (s == "number") {
            return ColumnType::NUMBER;
        }
        if (s == "integer") {
            return ColumnType::INTEGER;
        }
        if (s == "date") {
            return ColumnType::DATE;
        }
        if (s == "boolean") {
            return ColumnType::BOOLEAN;
        }
        throw std::invalid_argument("Unknown column type: " + s);
    }

    ColumnFormat column_format_from_string(const std::string& s) {
        if (s == "none") {
            return ColumnFormat::NONE;
        }
        if (s == "currency") {
            return ColumnFormat::CURRENCY;
        }
        if (s == "percent") {
            return ColumnFormat::PERCENT;
        }
        if (s == "compact") {
            return ColumnFormat::COMPACT;
        }
        throw std::invalid_argument("Unknown column format: " + s);
    }

    WidgetType widget_type_from_string(const std::string& s) {
        if (s == "table") {
            return WidgetType::TABLE;
        }
        if (s == "metric") {
            return WidgetType::METRIC;
        }
        throw std::invalid_argument("Unknown widget type: " + s);
    }

    ParamBinding param_binding_from_string(const std::string& s) {
        if (s == "path") {
            return ParamBinding::PATH;
        }
        if (s == "query") {
            return ParamBinding::QUERY;
        }
        throw std::invalid_argument("Unknown parameter binding: " + s);
    }

}  // namespace bridge::registry
