#ifndef NEXUS_BRIDGE_DISPATCH_RESPONSE_WRITER_HPP
#define NEXUS_BRIDGE_DISPATCH_RESPONSE_WRITER_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

#include "../error/connector_error.hpp"
#include "../registry/widget.hpp"
#include "../registry/widget_registry.hpp"
#include "../translator/translated_response.hpp"

namespace bridge::dispatch {

    using json = nlohmann::ordered_json;

    // Object keyed by widget id, in registry order, in the shape OpenBB Workspace reads from /widgets.json.
    json discovery_body(const registry::WidgetRegistry& registry);

    json widget_entry(const registry::WidgetDescriptor& widget);

    // One object per row; keys follow the declared column order and missing values are null.
    json table_body(const translator::TranslatedResponse& response);

    // [{label, value, delta?, description?}] from the first row. Null cells are skipped.
    json metric_body(const translator::TranslatedResponse& response);

    json error_body(error::ErrorKind kind, const std::string& message, const std::optional<std::string>& field = std::nullopt);

    json info_body();

    // Display text for a metric cell according to the column's format.
    std::string format_metric_value(const registry::ColumnSpec& column, const translator::Cell& cell);

}  // namespace bridge::dispatch

#endif
