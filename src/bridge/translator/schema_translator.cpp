#include "schema_translator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "../../utils/overloaded.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/connector_error.hpp"

namespace bridge::translator {
    namespace {
        constexpr const char* LAST_PARAM = "last";
        constexpr size_t DATE_PREFIX_LENGTH = 10;

        const char* provider_type_name(const http::data_api::ProviderValue& value) {
            return std::visit(utils::overloaded{
                                  [](std::monostate) { return "null"; },
                                  [](bool) { return "boolean"; },
                                  [](std::int64_t) { return "integer"; },
                                  [](double) { return "number"; },
                                  [](const std::string&) { return "string"; },
                                  [](const http::data_api::RawJson&) { return "object"; },
                              },
                              value);
        }

        [[noreturn]] void mismatch(const registry::ColumnSpec& column, const http::data_api::ProviderValue& value) {
            throw error::TranslationError(column.field_, "Field '" + column.field_ + "' is declared " + registry::to_string(column.type_) +
                                                             " but the provider sent " + provider_type_name(value));
        }

        Cell convert(const registry::ColumnSpec& column, const http::data_api::ProviderValue& value) {
            if (std::holds_alternative<std::monostate>(value)) {
                return std::monostate{};
            }

            switch (column.type_) {
                case registry::ColumnType::STRING:
                    if (const auto* s = std::get_if<std::string>(&value)) {
                        return *s;
                    }
                    break;
                case registry::ColumnType::NUMBER:
                    if (const auto* i = std::get_if<std::int64_t>(&value)) {
                        return static_cast<double>(*i);
                    }
                    if (const auto* d = std::get_if<double>(&value)) {
                        return *d;
                    }
                    break;
                case registry::ColumnType::INTEGER:
                    if (const auto* i = std::get_if<std::int64_t>(&value)) {
                        return *i;
                    }
                    if (const auto* d = std::get_if<double>(&value)) {
                        if (std::trunc(*d) == *d && std::fabs(*d) < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
                            return static_cast<std::int64_t>(*d);
                        }
                    }
                    break;
                case registry::ColumnType::DATE:
                    // Accepts a bare date or an ISO-8601 timestamp that starts with one.
                    if (const auto* s = std::get_if<std::string>(&value)) {
                        if (s->size() >= DATE_PREFIX_LENGTH && parse_date(std::string_view(*s).substr(0, DATE_PREFIX_LENGTH))) {
                            return *s;
                        }
                    }
                    break;
                case registry::ColumnType::BOOLEAN:
                    if (const auto* b = std::get_if<bool>(&value)) {
                        return *b;
                    }
                    break;
            }

            mismatch(column, value);
        }
    }  // namespace

    SchemaTranslator::SchemaTranslator(const http::data_api::IDataProvider* provider, UpstreamTimeouts timeouts) : provider_(provider), timeouts_(timeouts) {
        if (provider_ == nullptr) {
            throw std::invalid_argument("SchemaTranslator requires a data provider");
        }
    }

    ValidatedParams SchemaTranslator::validate_params(const registry::WidgetDescriptor& widget, const string_utils::QueryPairs& raw) {
        std::unordered_set<std::string> seen;
        for (const auto& [name, value] : raw) {
            if (widget.find_param(name) == nullptr) {
                throw error::ValidationError(name, "Unknown parameter '" + name + "' for widget '" + widget.id_ + "'");
            }
            if (!seen.insert(name).second) {
                throw error::ValidationError(name, "Parameter '" + name + "' was given more than once");
            }
        }

        ValidatedParams out;
        out.reserve(widget.params_.size());

        for (const auto& spec : widget.params_) {
            std::optional<std::string> supplied;
            for (const auto& [name, value] : raw) {
                if (name == spec.name_ && !string_utils::trim(value).empty()) {
                    supplied = value;
                }
            }

            if (!supplied) {
                if (spec.default_) {
                    supplied = spec.default_;
                } else if (spec.required_) {
                    throw error::ValidationError(spec.name_, "Missing required parameter '" + spec.name_ + "'");
                } else {
                    continue;
                }
            }

            auto parsed = parse_param_value(spec, *supplied);
            if (!parsed) {
                throw error::ValidationError(spec.name_, "Parameter '" + spec.name_ + "' is not a valid " + registry::to_string(spec.type_));
            }
            out.emplace_back(&spec, std::move(*parsed));
        }

        return out;
    }

    http::data_api::ProviderQuery SchemaTranslator::build_provider_query(const registry::WidgetDescriptor& widget, const ValidatedParams& params) {
        http::data_api::ProviderQuery q;
        q.namespace_ = widget.target_.namespace_;
        q.dataset_ = widget.target_.dataset_;

        bool has_last = false;
        for (const auto& [spec, value] : params) {
            const std::string text = to_upstream_string(value);

            if (spec->binding_ == registry::ParamBinding::PATH) {
                for (auto& element : string_utils::split_comma_delimited_string(text)) {
                    q.path_values_.emplace_back(std::move(element));
                }
                if (q.path_values_.empty()) {
                    throw error::ValidationError(spec->name_, "Parameter '" + spec->name_ + "' has no usable value");
                }
                continue;
            }

            const std::string& upstream = spec->upstream_name_.empty() ? spec->name_ : spec->upstream_name_;
            has_last = has_last || upstream == LAST_PARAM;
            q.query_params_.emplace_back(upstream, text);
        }

        if (!has_last && widget.target_.last_) {
            q.query_params_.emplace_back(LAST_PARAM, std::to_string(*widget.target_.last_));
        }

        return q;
    }

    http::model::Request SchemaTranslator::build_upstream_request(const registry::WidgetDescriptor& widget, const string_utils::QueryPairs& raw) const {
        auto query = build_provider_query(widget, validate_params(widget, raw));
        query.timeout_ms_ = timeouts_.timeout_ms_;
        query.connect_timeout_ms_ = timeouts_.connect_timeout_ms_;
        return provider_->build_request(query);
    }

    TranslatedResponse SchemaTranslator::translate_response(const registry::WidgetDescriptor& widget, const http::data_api::ProviderResponse& response) {
        TranslatedResponse out;
        out.columns_ = widget.columns_;
        out.rows_.reserve(response.records_.size());

        for (const auto& record : response.records_) {
            Row row;
            row.reserve(widget.columns_.size());

            for (const auto& column : widget.columns_) {
                const auto* value = http::data_api::find_field(record, column.field_);
                row.emplace_back(value == nullptr ? Cell{std::monostate{}} : convert(column, *value));
            }

            out.rows_.emplace_back(std::move(row));
        }

        return out;
    }

}  // namespace bridge::translator
