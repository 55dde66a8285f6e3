#include "response_writer.hpp"

#include <fmt/format.h>

#include <cmath>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/overloaded.hpp"

namespace bridge::dispatch {
    namespace {
        const char* openbb_param_type(registry::ParamType type) {
            switch (type) {
                case registry::ParamType::NUMBER:
                    return "number";
                case registry::ParamType::DATE:
                    return "date";
                case registry::ParamType::BOOLEAN:
                    return "boolean";
                case registry::ParamType::STRING:
                case registry::ParamType::ENUM:
                    return "text";
            }
            return "text";
        }

        const char* openbb_cell_type(registry::ColumnType type) {
            switch (type) {
                case registry::ColumnType::NUMBER:
                case registry::ColumnType::INTEGER:
                    return "number";
                case registry::ColumnType::DATE:
                    return "date";
                case registry::ColumnType::BOOLEAN:
                    return "boolean";
                case registry::ColumnType::STRING:
                    return "text";
            }
            return "text";
        }

        json cell_to_json(const translator::Cell& cell) {
            return std::visit(utils::overloaded{
                                  [](std::monostate) { return json(nullptr); },
                                  [](bool b) { return json(b); },
                                  [](std::int64_t i) { return json(i); },
                                  [](double d) { return json(d); },
                                  [](const std::string& s) { return json(s); },
                              },
                              cell);
        }

        std::optional<double> cell_number(const translator::Cell& cell) {
            if (const auto* i = std::get_if<std::int64_t>(&cell)) {
                return static_cast<double>(*i);
            }
            if (const auto* d = std::get_if<double>(&cell)) {
                return *d;
            }
            return std::nullopt;
        }

        std::string compact(double value) {
            const double magnitude = std::fabs(value);
            if (magnitude >= constants::BILLION) {
                return fmt::format("{:.2f}B", value / constants::BILLION);
            }
            if (magnitude >= constants::MILLION) {
                return fmt::format("{:.2f}M", value / constants::MILLION);
            }
            if (magnitude >= constants::THOUSAND) {
                return fmt::format("{:.2f}K", value / constants::THOUSAND);
            }
            return std::trunc(value) == value ? fmt::format("{:.0f}", value) : fmt::format("{:.2f}", value);
        }
    }  // namespace

    json widget_entry(const registry::WidgetDescriptor& widget) {
        json params = json::array();
        for (const auto& spec : widget.params_) {
            json param = {
                {"paramName", spec.name_},
                {"label", spec.label_},
                {"type", openbb_param_type(spec.type_)},
                {"description", spec.description_},
            };
            if (spec.default_) {
                param["value"] = *spec.default_;
            }
            if (!spec.options_.empty()) {
                json options = json::array();
                for (const auto& option : spec.options_) {
                    options.push_back({{"label", option.label_}, {"value", option.value_}});
                }
                param["options"] = std::move(options);
            }
            params.push_back(std::move(param));
        }

        json columns = json::array();
        for (const auto& column : widget.columns_) {
            json def = {
                {"field", column.field_},
                {"headerName", column.header_name_},
                {"cellDataType", openbb_cell_type(column.type_)},
            };
            if (!column.description_.empty()) {
                def["headerTooltip"] = column.description_;
            }
            columns.push_back(std::move(def));
        }

        return json{
            {"widgetId", widget.id_},
            {"name", widget.name_},
            {"description", widget.description_},
            {"category", widget.category_},
            {"type", registry::to_string(widget.type_)},
            {"endpoint", widget.id_},
            {"gridData", {{"w", widget.grid_.w_}, {"h", widget.grid_.h_}}},
            {"params", std::move(params)},
            {"data", {{"table", {{"columnsDefs", std::move(columns)}}}}},
        };
    }

    json discovery_body(const registry::WidgetRegistry& registry) {
        json body = json::object();
        for (const auto& widget : registry.widgets()) {
            body[widget.id_] = widget_entry(widget);
        }
        return body;
    }

    json table_body(const translator::TranslatedResponse& response) {
        json rows = json::array();
        for (const auto& row : response.rows_) {
            json obj = json::object();
            for (size_t i = 0; i < response.columns_.size(); ++i) {
                obj[response.columns_[i].field_] = i < row.size() ? cell_to_json(row[i]) : json(nullptr);
            }
            rows.push_back(std::move(obj));
        }
        return rows;
    }

    std::string format_metric_value(const registry::ColumnSpec& column, const translator::Cell& cell) {
        const auto number = cell_number(cell);

        if (number) {
            switch (column.format_) {
                case registry::ColumnFormat::CURRENCY:
                    return fmt::format("${:.2f}", *number);
                case registry::ColumnFormat::PERCENT:
                    return fmt::format("{:+.2f}%", *number * constants::PERCENT);
                case registry::ColumnFormat::COMPACT:
                    return compact(*number);
                case registry::ColumnFormat::NONE:
                    break;
            }
            if (std::holds_alternative<std::int64_t>(cell)) {
                return fmt::format("{}", std::get<std::int64_t>(cell));
            }
            return fmt::format("{:.2f}", *number);
        }

        return std::visit(utils::overloaded{
                              [](std::monostate) { return std::string(); },
                              [](bool b) { return std::string(b ? "true" : "false"); },
                              [](std::int64_t i) { return fmt::format("{}", i); },
                              [](double d) { return fmt::format("{:.2f}", d); },
                              [](const std::string& s) { return s; },
                          },
                          cell);
    }

    json metric_body(const translator::TranslatedResponse& response) {
        json metrics = json::array();
        if (response.rows_.empty()) {
            return metrics;
        }

        const auto& row = response.rows_.front();
        for (size_t i = 0; i < response.columns_.size() && i < row.size(); ++i) {
            const auto& column = response.columns_[i];
            if (std::holds_alternative<std::monostate>(row[i])) {
                continue;
            }

            json metric = {
                {"label", column.header_name_},
                {"value", format_metric_value(column, row[i])},
            };
            if (column.format_ == registry::ColumnFormat::PERCENT) {
                if (auto number = cell_number(row[i])) {
                    metric["delta"] = fmt::format("{:.4f}", *number);
                }
            }
            if (!column.description_.empty()) {
                metric["description"] = column.description_;
            }
            metrics.push_back(std::move(metric));
        }
        return metrics;
    }

    json error_body(error::ErrorKind kind, const std::string& message, const std::optional<std::string>& field) {
        json body = {
            {"kind", error::to_string(kind)},
            {"message", message},
        };
        if (field) {
            body["field"] = *field;
        }
        return body;
    }

    json info_body() {
        return json{
            {"Info", "Vianexus connector backend for OpenBB Workspace"},
            {"service", constants::SERVICE_NAME},
            {"version", constants::SERVICE_VERSION},
        };
    }

}  // namespace bridge::dispatch
