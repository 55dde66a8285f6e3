#include "vianexus.hpp"

#include <simdjson.h>

#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../api/data_api.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"
using namespace simdjson;

namespace http::provider {
    namespace {
        http::data_api::ProviderValue parse_value(ondemand::value value) {
            const ondemand::json_type type = value.type();
            switch (type) {
                case ondemand::json_type::null:
                    return std::monostate{};
                case ondemand::json_type::boolean:
                    return bool(value);
                case ondemand::json_type::string:
                    return std::string(std::string_view(value));
                case ondemand::json_type::number: {
                    const ondemand::number_type number_type = value.get_number_type();
                    if (number_type == ondemand::number_type::signed_integer) {
                        return int64_t(value);
                    }
                    return double(value);
                }
                case ondemand::json_type::object:
                case ondemand::json_type::array:
                    return http::data_api::RawJson{std::string(simdjson::to_json_string(value).value())};
                default:
                    break;
            }
            return std::monostate{};
        }

        http::data_api::ProviderRecord parse_record(ondemand::object object) {
            http::data_api::ProviderRecord record;
            for (auto field : object) {
                std::string key(std::string_view(field.unescaped_key()));
                record.emplace_back(std::move(key), parse_value(field.value()));
            }
            return record;
        }
    }  // namespace

    VianexusProvider::VianexusProvider(std::string base_url, std::string api_key) : base_url_(std::move(base_url)), api_key_(std::move(api_key)) {
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
    }

    http::model::Request VianexusProvider::build_request(const http::data_api::ProviderQuery& q) const {
        std::string symbols;
        for (const auto& value : q.path_values_) {
            if (!symbols.empty()) {
                symbols.push_back(',');
            }
            symbols += string_utils::url_encode(value);
        }

        string_utils::QueryPairs params;
        params.emplace_back("token", api_key_);
        params.insert(params.end(), q.query_params_.begin(), q.query_params_.end());

        http::model::Request r;
        r.url_ = base_url_ + "/data/" + string_utils::url_encode(q.namespace_) + "/" + string_utils::url_encode(q.dataset_);
        if (!symbols.empty()) {
            r.url_ += "/" + symbols;
        }
        r.url_ += "?" + string_utils::build_query_string(params);
        r.headers_ = {"Accept: application/json"};
        r.method_ = "GET";
        r.timeout_ms_ = q.timeout_ms_;
        r.connect_timeout_ms_ = q.connect_timeout_ms_;
        r.idempotent_ = true;
        return r;
    }

    http::data_api::ProviderResponse VianexusProvider::parse_response(const http::model::Response& resp) const {
        http::data_api::ProviderResponse out{};
        out.status_ = resp.status_;

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);

            const ondemand::json_type root_type = doc.type();
            switch (root_type) {
                case ondemand::json_type::array:
                    for (auto element : doc.get_array()) {
                        out.records_.emplace_back(parse_record(element.get_object()));
                    }
                    break;
                case ondemand::json_type::object:
                    out.records_.emplace_back(parse_record(doc.get_object()));
                    break;
                default:
                    throw http::http_error::UpstreamError(http::http_error::UpstreamErrorKind::UNAVAILABLE, resp.status_,
                                                          string_utils::redact_query_param(resp.effective_url_, "token"),
                                                          resp.body_.substr(0, constants::ERROR_BODY_PREVIEW_LENGTH),
                                                          "Provider payload is neither an array nor an object");
            }
        } catch (const simdjson::simdjson_error& e) {
            throw http::http_error::UpstreamError(http::http_error::UpstreamErrorKind::UNAVAILABLE, resp.status_,
                                                  string_utils::redact_query_param(resp.effective_url_, "token"),
                                                  resp.body_.substr(0, constants::ERROR_BODY_PREVIEW_LENGTH),
                                                  "Failed to parse JSON response: " + std::string(e.what()));
        }

        return out;
    }
}  // namespace http::provider
