#ifndef NEXUS_BRIDGE_TRANSLATOR_SCHEMA_TRANSLATOR_HPP
#define NEXUS_BRIDGE_TRANSLATOR_SCHEMA_TRANSLATOR_HPP

#pragma once

#include <utility>
#include <vector>

#include "../../http/api/data_api.hpp"
#include "../../http/model/model.hpp"
#include "../../utils/string_utils.hpp"
#include "../registry/widget.hpp"
#include "param_value.hpp"
#include "translated_response.hpp"

namespace bridge::translator {

    struct UpstreamTimeouts {
        long timeout_ms_ = constants::DEFAULT_UPSTREAM_TIMEOUT_MS;
        long connect_timeout_ms_ = constants::DEFAULT_UPSTREAM_CONNECT_TIMEOUT_MS;
    };

    using ValidatedParams = std::vector<std::pair<const registry::ParamSpec*, ParamValue>>;

    // Maps terminal parameters onto a provider request and provider records back onto the widget's columns.
    class SchemaTranslator {
       public:
        SchemaTranslator(const http::data_api::IDataProvider* provider, UpstreamTimeouts timeouts);

        // Throws error::ValidationError naming the offending parameter. Result follows declared parameter order.
        [[nodiscard]] static ValidatedParams validate_params(const registry::WidgetDescriptor& widget, const string_utils::QueryPairs& raw);

        [[nodiscard]] static http::data_api::ProviderQuery build_provider_query(const registry::WidgetDescriptor& widget, const ValidatedParams& params);

        // Throws error::ValidationError.
        [[nodiscard]] http::model::Request build_upstream_request(const registry::WidgetDescriptor& widget, const string_utils::QueryPairs& raw) const;

        // Throws error::TranslationError naming the offending field.
        [[nodiscard]] static TranslatedResponse translate_response(const registry::WidgetDescriptor& widget,
                                                                   const http::data_api::ProviderResponse& response);

       private:
        const http::data_api::IDataProvider* provider_;
        UpstreamTimeouts timeouts_;
    };

}  // namespace bridge::translator

#endif
