#ifndef NEXUS_BRIDGE_REGISTRY_WIDGET_LOADER_HPP
#define NEXUS_BRIDGE_REGISTRY_WIDGET_LOADER_HPP

#include <simdjson.h>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "widget_registry.hpp"

namespace bridge::registry {

    template <typename T>
    struct ParserOptions {
        bool is_required_ = true;
        std::vector<T> allowed_values_;
        T fallback_value_;
        std::string error_message_;
    };

    // See: config/widgets.json for a complete example.
    const ParserOptions<std::string_view> WIDGET_ID_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid widget id"};
    const ParserOptions<std::string_view> WIDGET_NAME_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid widget name"};
    const ParserOptions<std::string_view> WIDGET_TYPE_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {"table", "metric"}, .fallback_value_ = "", .error_message_ = "Invalid widget type"};
    const ParserOptions<std::string_view> DESCRIPTION_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid description"};
    const ParserOptions<std::string_view> CATEGORY_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "Vianexus", .error_message_ = "Invalid category"};
    const ParserOptions<std::string_view> NAMESPACE_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid provider namespace"};
    const ParserOptions<std::string_view> DATASET_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid provider dataset"};
    const ParserOptions<int64_t> LAST_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid last"};
    const ParserOptions<int64_t> GRID_W_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 12, .error_message_ = "Invalid grid width"};
    const ParserOptions<int64_t> GRID_H_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 8, .error_message_ = "Invalid grid height"};

    const ParserOptions<std::string_view> PARAM_NAME_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid parameter name"};
    const ParserOptions<std::string_view> PARAM_LABEL_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid parameter label"};
    const ParserOptions<std::string_view> PARAM_TYPE_PARSER_OPTIONS = {.is_required_ = false,
                                                                       .allowed_values_ = {"string", "number", "date", "enum", "boolean"},
                                                                       .fallback_value_ = "string",
                                                                       .error_message_ = "Invalid parameter type"};
    const ParserOptions<bool> PARAM_REQUIRED_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = false, .error_message_ = "Invalid parameter required flag"};
    const ParserOptions<std::string_view> PARAM_BINDING_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {"path", "query"}, .fallback_value_ = "query", .error_message_ = "Invalid parameter binding"};
    const ParserOptions<std::string_view> PARAM_UPSTREAM_NAME_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid parameter upstream name"};
    const ParserOptions<bool> PARAM_UPPERCASE_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = false, .error_message_ = "Invalid parameter uppercase flag"};
    const ParserOptions<std::string_view> OPTION_VALUE_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid option value"};
    const ParserOptions<std::string_view> OPTION_LABEL_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid option label"};

    const ParserOptions<std::string_view> COLUMN_FIELD_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid column field"};
    const ParserOptions<std::string_view> COLUMN_HEADER_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid column header name"};
    const ParserOptions<std::string_view> COLUMN_TYPE_PARSER_OPTIONS = {.is_required_ = false,
                                                                        .allowed_values_ = {"string", "number", "integer", "date", "boolean"},
                                                                        .fallback_value_ = "string",
                                                                        .error_message_ = "Invalid column type"};
    const ParserOptions<std::string_view> COLUMN_FORMAT_PARSER_OPTIONS = {.is_required_ = false,
                                                                          .allowed_values_ = {"none", "currency", "percent", "compact"},
                                                                          .fallback_value_ = "none",
                                                                          .error_message_ = "Invalid column format"};

    struct RegistryError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Reads the widget registry file: {"widgets": [ ... ]}.
    // Every check that can fail at query time because of a bad descriptor is done here instead, so a
    // registry that loads is one the translator can serve. Throws RegistryError.
    class WidgetLoader {
       public:
        [[nodiscard]] static WidgetRegistry load_from_file(const std::filesystem::path& path);
        [[nodiscard]] static WidgetRegistry parse_json(std::string_view json);

       private:
        static WidgetDescriptor parse_widget(simdjson::ondemand::object& obj);
        static ParamSpec parse_param(simdjson::ondemand::object& obj, const std::string& widget_id);
        static ColumnSpec parse_column(simdjson::ondemand::object& obj, const std::string& widget_id);
        static void validate(const WidgetDescriptor& widget);
    };

}  // namespace bridge::registry

#endif
