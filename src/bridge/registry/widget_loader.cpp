#include "widget_loader.hpp"

#include <simdjson.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>
#include <utility>

#include "../../utils/string_utils.hpp"
#include "../translator/param_value.hpp"

namespace bridge::registry {
    namespace parser {
        template <typename T>
        static T parse_value(simdjson::simdjson_result<T> result, const ParserOptions<T>& options, const std::string& context) {
            if (result.error() == simdjson::error_code::NO_SUCH_FIELD && !options.is_required_) {
                return options.fallback_value_;
            }
            if (result.error() != simdjson::error_code::SUCCESS) {
                throw RegistryError(context + ": " + options.error_message_);
            }

            auto value = result.value();

            if (options.allowed_values_.empty()) {
                return T(value);
            }

            if (!std::ranges::any_of(options.allowed_values_, [value](const T& allowed_value) { return allowed_value == value; })) {
                throw RegistryError(context + ": " + options.error_message_);
            }

            return T(value);
        }

        static std::string parse_string(simdjson::simdjson_result<std::string_view> result, const ParserOptions<std::string_view>& options,
                                        const std::string& context) {
            return std::string(parse_value(std::move(result), options, context));
        }

        // Ids and parameter names end up in URLs, so they are restricted to [A-Za-z0-9_-].
        static bool is_identifier(const std::string& s) {
            return !s.empty() && std::ranges::all_of(s, [](unsigned char c) { return std::isalnum(c) != 0 || c == '_' || c == '-'; });
        }

        // A default may be written as a JSON string, number or boolean; it is kept as the text a terminal would send.
        static std::optional<std::string> parse_default(simdjson::ondemand::object& obj, const std::string& context) {
            auto field = obj["default"];
            if (field.error() == simdjson::error_code::NO_SUCH_FIELD) {
                return std::nullopt;
            }

            simdjson::ondemand::value value;
            if (std::move(field).get(value) != simdjson::error_code::SUCCESS) {
                throw RegistryError(context + ": Invalid default");
            }

            simdjson::ondemand::json_type type;
            if (value.type().get(type) != simdjson::error_code::SUCCESS) {
                throw RegistryError(context + ": Invalid default");
            }

            switch (type) {
                case simdjson::ondemand::json_type::string: {
                    std::string_view s;
                    if (value.get_string().get(s) != simdjson::error_code::SUCCESS) {
                        throw RegistryError(context + ": Invalid default");
                    }
                    return std::string(s);
                }
                case simdjson::ondemand::json_type::number:
                    return string_utils::trim(std::string(value.raw_json_token()));
                case simdjson::ondemand::json_type::boolean: {
                    bool b = false;
                    if (value.get_bool().get(b) != simdjson::error_code::SUCCESS) {
                        throw RegistryError(context + ": Invalid default");
                    }
                    return std::string(b ? "true" : "false");
                }
                case simdjson::ondemand::json_type::null:
                    return std::nullopt;
                default:
                    throw RegistryError(context + ": Invalid default, expected a string, number or boolean");
            }
        }
    }  // namespace parser

    WidgetRegistry WidgetLoader::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw RegistryError("Widget registry file not found: " + path.string());
        }

        simdjson::padded_string json;
        if (simdjson::padded_string::load(path.string()).get(json) != simdjson::error_code::SUCCESS) {
            throw RegistryError("Could not read widget registry file: " + path.string());
        }

        return parse_json(std::string_view(json));
    }

    WidgetRegistry WidgetLoader::parse_json(std::string_view json) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(json);

        simdjson::ondemand::document doc;
        if (parser.iterate(padded).get(doc) != simdjson::error_code::SUCCESS) {
            throw RegistryError("Widget registry is not valid JSON");
        }

        simdjson::ondemand::array raw_widgets;
        if (doc["widgets"].get_array().get(raw_widgets) != simdjson::error_code::SUCCESS) {
            throw RegistryError("Widget registry must be an object with a \"widgets\" array");
        }

        WidgetRegistry registry;
        for (auto raw_widget : raw_widgets) {
            simdjson::ondemand::object obj;
            if (raw_widget.get_object().get(obj) != simdjson::error_code::SUCCESS) {
                throw RegistryError("Invalid widget object");
            }

            auto widget = parse_widget(obj);
            validate(widget);

            if (registry.find(widget.id_) != nullptr) {
                throw RegistryError("Duplicate widget id: " + widget.id_);
            }
            registry.add(std::move(widget));
        }

        return registry;
    }

    WidgetDescriptor WidgetLoader::parse_widget(simdjson::ondemand::object& obj) {
        WidgetDescriptor widget;
        widget.id_ = parser::parse_string(obj["id"].get_string(), WIDGET_ID_PARSER_OPTIONS, "widget");

        const std::string context = "widget '" + widget.id_ + "'";
        if (!parser::is_identifier(widget.id_)) {
            throw RegistryError(context + ": id may only contain letters, digits, '_' and '-'");
        }

        widget.name_ = parser::parse_string(obj["name"].get_string(), WIDGET_NAME_PARSER_OPTIONS, context);
        widget.type_ = widget_type_from_string(parser::parse_string(obj["type"].get_string(), WIDGET_TYPE_PARSER_OPTIONS, context));
        widget.description_ = parser::parse_string(obj["description"].get_string(), DESCRIPTION_PARSER_OPTIONS, context);
        widget.category_ = parser::parse_string(obj["category"].get_string(), CATEGORY_PARSER_OPTIONS, context);

        simdjson::ondemand::object provider;
        if (obj["provider"].get_object().get(provider) != simdjson::error_code::SUCCESS) {
            throw RegistryError(context + ": Invalid provider");
        }
        widget.target_.namespace_ = parser::parse_string(provider["namespace"].get_string(), NAMESPACE_PARSER_OPTIONS, context);
        widget.target_.dataset_ = parser::parse_string(provider["dataset"].get_string(), DATASET_PARSER_OPTIONS, context);
        const int64_t last = parser::parse_value(provider["last"].get_int64(), LAST_PARSER_OPTIONS, context);
        if (last < 0) {
            throw RegistryError(context + ": provider.last must be positive");
        }
        if (last > 0) {
            widget.target_.last_ = static_cast<long>(last);
        }

        auto grid_field = obj["grid"];
        if (grid_field.error() != simdjson::error_code::NO_SUCH_FIELD) {
            simdjson::ondemand::object grid;
            if (grid_field.get_object().get(grid) != simdjson::error_code::SUCCESS) {
                throw RegistryError(context + ": Invalid grid");
            }
            widget.grid_.w_ = static_cast<int>(parser::parse_value(grid["w"].get_int64(), GRID_W_PARSER_OPTIONS, context));
            widget.grid_.h_ = static_cast<int>(parser::parse_value(grid["h"].get_int64(), GRID_H_PARSER_OPTIONS, context));
        }

        auto params_field = obj["params"];
        if (params_field.error() != simdjson::error_code::NO_SUCH_FIELD) {
            simdjson::ondemand::array raw_params;
            if (params_field.get_array().get(raw_params) != simdjson::error_code::SUCCESS) {
                throw RegistryError(context + ": Invalid params");
            }
            for (auto raw_param : raw_params) {
                simdjson::ondemand::object param;
                if (raw_param.get_object().get(param) != simdjson::error_code::SUCCESS) {
                    throw RegistryError(context + ": Invalid param object");
                }
                widget.params_.emplace_back(parse_param(param, widget.id_));
            }
        }

        simdjson::ondemand::array raw_columns;
        if (obj["columns"].get_array().get(raw_columns) != simdjson::error_code::SUCCESS) {
            throw RegistryError(context + ": Invalid columns");
        }
        for (auto raw_column : raw_columns) {
            simdjson::ondemand::object column;
            if (raw_column.get_object().get(column) != simdjson::error_code::SUCCESS) {
                throw RegistryError(context + ": Invalid column object");
            }
            widget.columns_.emplace_back(parse_column(column, widget.id_));
        }

        return widget;
    }

    ParamSpec WidgetLoader::parse_param(simdjson::ondemand::object& obj, const std::string& widget_id) {
        ParamSpec spec;
        spec.name_ = parser::parse_string(obj["name"].get_string(), PARAM_NAME_PARSER_OPTIONS, "widget '" + widget_id + "'");

        const std::string context = "widget '" + widget_id + "' param '" + spec.name_ + "'";
        if (!parser::is_identifier(spec.name_)) {
            throw RegistryError(context + ": name may only contain letters, digits, '_' and '-'");
        }

        spec.label_ = parser::parse_string(obj["label"].get_string(), PARAM_LABEL_PARSER_OPTIONS, context);
        if (spec.label_.empty()) {
            spec.label_ = spec.name_;
        }
        spec.description_ = parser::parse_string(obj["description"].get_string(), DESCRIPTION_PARSER_OPTIONS, context);
        spec.type_ = param_type_from_string(parser::parse_string(obj["type"].get_string(), PARAM_TYPE_PARSER_OPTIONS, context));
        spec.required_ = parser::parse_value(obj["required"].get_bool(), PARAM_REQUIRED_PARSER_OPTIONS, context);
        spec.default_ = parser::parse_default(obj, context);
        spec.binding_ = param_binding_from_string(parser::parse_string(obj["binding"].get_string(), PARAM_BINDING_PARSER_OPTIONS, context));
        spec.upstream_name_ = parser::parse_string(obj["upstream_name"].get_string(), PARAM_UPSTREAM_NAME_PARSER_OPTIONS, context);
        spec.uppercase_ = parser::parse_value(obj["uppercase"].get_bool(), PARAM_UPPERCASE_PARSER_OPTIONS, context);

        auto options_field = obj["options"];
        if (options_field.error() != simdjson::error_code::NO_SUCH_FIELD) {
            simdjson::ondemand::array raw_options;
            if (options_field.get_array().get(raw_options) != simdjson::error_code::SUCCESS) {
                throw RegistryError(context + ": Invalid options");
            }
            for (auto raw_option : raw_options) {
                simdjson::ondemand::object option;
                if (raw_option.get_object().get(option) != simdjson::error_code::SUCCESS) {
                    throw RegistryError(context + ": Invalid option object");
                }
                EnumOption parsed;
                parsed.value_ = parser::parse_string(option["value"].get_string(), OPTION_VALUE_PARSER_OPTIONS, context);
                parsed.label_ = parser::parse_string(option["label"].get_string(), OPTION_LABEL_PARSER_OPTIONS, context);
                if (parsed.label_.empty()) {
                    parsed.label_ = parsed.value_;
                }
                spec.options_.emplace_back(std::move(parsed));
            }
        }

        return spec;
    }

    ColumnSpec WidgetLoader::parse_column(simdjson::ondemand::object& obj, const std::string& widget_id) {
        ColumnSpec column;
        column.field_ = parser::parse_string(obj["field"].get_string(), COLUMN_FIELD_PARSER_OPTIONS, "widget '" + widget_id + "'");

        const std::string context = "widget '" + widget_id + "' column '" + column.field_ + "'";
        if (column.field_.empty()) {
            throw RegistryError(context + ": field must not be empty");
        }

        column.header_name_ = parser::parse_string(obj["header_name"].get_string(), COLUMN_HEADER_PARSER_OPTIONS, context);
        if (column.header_name_.empty()) {
            column.header_name_ = column.field_;
        }
        column.type_ = column_type_from_string(parser::parse_string(obj["type"].get_string(), COLUMN_TYPE_PARSER_OPTIONS, context));
        column.format_ = column_format_from_string(parser::parse_string(obj["format"].get_string(), COLUMN_FORMAT_PARSER_OPTIONS, context));
        column.description_ = parser::parse_string(obj["description"].get_string(), DESCRIPTION_PARSER_OPTIONS, context);

        return column;
    }

    void WidgetLoader::validate(const WidgetDescriptor& widget) {
        const std::string context = "widget '" + widget.id_ + "'";

        if (widget.columns_.empty()) {
            throw RegistryError(context + ": at least one column is required");
        }

        std::unordered_set<std::string> fields;
        for (const auto& column : widget.columns_) {
            if (!fields.insert(column.field_).second) {
                throw RegistryError(context + ": duplicate column '" + column.field_ + "'");
            }
        }

        std::unordered_set<std::string> names;
        size_t path_params = 0;
        for (const auto& spec : widget.params_) {
            if (!names.insert(spec.name_).second) {
                throw RegistryError(context + ": duplicate param '" + spec.name_ + "'");
            }
            if (spec.type_ == ParamType::ENUM && spec.options_.empty()) {
                throw RegistryError(context + ": enum param '" + spec.name_ + "' has no options");
            }
            if (spec.binding_ == ParamBinding::PATH) {
                ++path_params;
            }
            if (spec.default_ && !translator::parse_param_value(spec, *spec.default_)) {
                throw RegistryError(context + ": default of param '" + spec.name_ + "' is not a valid " + to_string(spec.type_));
            }
        }

        if (path_params > 1) {
            throw RegistryError(context + ": at most one param may be bound to the path");
        }
    }

}  // namespace bridge::registry
