#ifndef NEXUS_BRIDGE_TRANSLATOR_TRANSLATED_RESPONSE_HPP
#define NEXUS_BRIDGE_TRANSLATOR_TRANSLATED_RESPONSE_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "../registry/widget.hpp"

namespace bridge::translator {

    // std::monostate is the explicit null marker for fields the provider left out or sent as null.
    using Cell = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    using Row = std::vector<Cell>;

    // Rows are aligned with columns_, which follow the widget's declared column order.
    struct TranslatedResponse {
        std::vector<registry::ColumnSpec> columns_;
        std::vector<Row> rows_;
    };

}  // namespace bridge::translator

#endif
