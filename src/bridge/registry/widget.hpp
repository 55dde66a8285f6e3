#ifndef NEXUS_BRIDGE_REGISTRY_WIDGET_HPP
#define NEXUS_BRIDGE_REGISTRY_WIDGET_HPP

#include <optional>
#include <string>
#include <vector>

namespace bridge::registry {

    enum class ParamType { STRING, NUMBER, DATE, ENUM, BOOLEAN };

    // Where a validated parameter ends up in the provider request.
    enum class ParamBinding { PATH, QUERY };

    enum class ColumnType { STRING, NUMBER, INTEGER, DATE, BOOLEAN };

    enum class ColumnFormat { NONE, CURRENCY, PERCENT, COMPACT };

    enum class WidgetType { TABLE, METRIC };

    struct EnumOption {
        std::string label_;
        std::string value_;
    };

    struct ParamSpec {
        std::string name_;
        std::string label_;
        std::string description_;
        ParamType type_ = ParamType::STRING;
        bool required_ = false;
        std::optional<std::string> default_;
        std::vector<EnumOption> options_;
        ParamBinding binding_ = ParamBinding::QUERY;
        std::string upstream_name_;
        bool uppercase_ = false;
    };

    struct ColumnSpec {
        std::string field_;
        std::string header_name_;
        ColumnType type_ = ColumnType::STRING;
        ColumnFormat format_ = ColumnFormat::NONE;
        std::string description_;
    };

    struct ProviderTarget {
        std::string namespace_;
        std::string dataset_;
        std::optional<long> last_;
    };

    struct GridData {
        int w_ = 12;
        int h_ = 8;
    };

    struct WidgetDescriptor {
        std::string id_;
        std::string name_;
        std::string description_;
        std::string category_;
        WidgetType type_ = WidgetType::TABLE;
        GridData grid_;
        std::vector<ParamSpec> params_;
        std::vector<ColumnSpec> columns_;
        ProviderTarget target_;

        [[nodiscard]] const ParamSpec* find_param(const std::string& name) const;
    };

    const char* to_string(ParamType type);
    const char* to_string(ColumnType type);
    const char* to_string(ColumnFormat format);
    const char* to_string(WidgetType type);

    // Throw std::invalid_argument on unknown names.
    ParamType param_type_from_string(const std::string& s);
    ColumnType column_type_from_string(const std::string& s);
    ColumnFormat column_format_from_string(const std::string& s);
    WidgetType widget_type_from_string(const std::string& s);
    ParamBinding param_binding_from_string(const std::string& s);

}  // namespace bridge::registry

#endif
