#include "dispatcher.hpp"

#include <fmt/format.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "../../http/error/http_error.hpp"
#include "../../utils/logging.hpp"
#include "../error/connector_error.hpp"
#include "../translator/schema_translator.hpp"

using namespace std::chrono;

namespace bridge::dispatch {
    namespace {
        constexpr unsigned HTTP_OK = 200;
        constexpr unsigned HTTP_NO_CONTENT = 204;
        constexpr const char* DISCOVERY_PATH = "/widgets.json";
        constexpr const char* APPS_PATH = "/apps.json";
        constexpr const char* ALLOWED_METHODS = "GET, OPTIONS";
        constexpr const char* JSON_CONTENT_TYPE = "application/json";

        error::ErrorKind error_kind_for(http::http_error::UpstreamErrorKind kind) {
            switch (kind) {
                case http::http_error::UpstreamErrorKind::TIMEOUT:
                    return error::ErrorKind::UPSTREAM_TIMEOUT;
                case http::http_error::UpstreamErrorKind::UNAVAILABLE:
                    return error::ErrorKind::UPSTREAM_UNAVAILABLE;
                case http::http_error::UpstreamErrorKind::REJECTED:
                    return error::ErrorKind::UPSTREAM_REJECTED;
                case http::http_error::UpstreamErrorKind::CANCELLED:
                    break;
            }
            return error::ErrorKind::INTERNAL_ERROR;
        }

        OutboundResponse json_response(unsigned status, const json& body) {
            OutboundResponse response;
            response.status_ = status;
            // Parameter names echoed into errors may carry arbitrary percent-decoded bytes.
            response.body_ = body.dump(-1, ' ', false, json::error_handler_t::replace);
            response.headers_.emplace_back("Content-Type", JSON_CONTENT_TYPE);
            return response;
        }

        OutboundResponse error_response(error::ErrorKind kind, const std::string& message, const std::optional<std::string>& field) {
            return json_response(error::http_status_for(kind), error_body(kind, message, field));
        }
    }  // namespace

    DispatcherBuilder::DispatcherBuilder() : dispatcher_(std::make_unique<Dispatcher>()) {}

    DispatcherBuilder& DispatcherBuilder::with_registry(std::shared_ptr<const registry::WidgetRegistry> registry) {
        dispatcher_->set_registry(std::move(registry));
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_apps(std::shared_ptr<const registry::AppsDocument> apps) {
        dispatcher_->set_apps(std::move(apps));
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_settings(std::shared_ptr<const config::Settings> settings) {
        dispatcher_->set_settings(std::move(settings));
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_data_provider(std::unique_ptr<http::data_api::IDataProvider> provider) {
        dispatcher_->set_data_provider(std::move(provider));
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_http_client_factory(http::client::HttpClientFactory http_client_factory) {
        dispatcher_->set_http_client_factory(std::move(http_client_factory));
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::with_sleeper(http::client::Sleeper sleeper) {
        dispatcher_->set_sleeper(std::move(sleeper));
        return *this;
    }

    DispatcherBuilder& DispatcherBuilder::validate() {
        if (dispatcher_->get_registry() == nullptr) {
            throw std::runtime_error("Widget registry is required");
        }
        if (dispatcher_->get_settings() == nullptr) {
            throw std::runtime_error("Settings are required");
        }
        if (dispatcher_->get_data_provider() == nullptr) {
            throw std::runtime_error("Data provider is required");
        }
        if (dispatcher_->get_http_client_factory() == nullptr) {
            throw std::runtime_error("HTTP client factory is required");
        }
        return *this;
    }

    std::unique_ptr<Dispatcher> DispatcherBuilder::build() {
        const auto& settings = *dispatcher_->get_settings();
        dispatcher_->set_credential_guard(std::make_unique<auth::CredentialGuard>(settings.connector_api_key_, settings.auth_header_));
        return std::move(dispatcher_);
    }

    //
    // Dispatcher implementation
    //

    void Dispatcher::set_registry(std::shared_ptr<const registry::WidgetRegistry> registry) { registry_ = std::move(registry); }

    void Dispatcher::set_apps(std::shared_ptr<const registry::AppsDocument> apps) { apps_ = std::move(apps); }

    void Dispatcher::set_settings(std::shared_ptr<const config::Settings> settings) { settings_ = std::move(settings); }

    void Dispatcher::set_credential_guard(std::unique_ptr<auth::CredentialGuard> guard) { guard_ = std::move(guard); }

    void Dispatcher::set_data_provider(std::unique_ptr<http::data_api::IDataProvider> data_provider) { data_provider_ = std::move(data_provider); }

    void Dispatcher::set_http_client_factory(http::client::HttpClientFactory http_client_factory) {
        http_client_factory_ = std::move(http_client_factory);
    }

    void Dispatcher::set_sleeper(http::client::Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    OutboundResponse Dispatcher::handle(const InboundRequest& request) const {
        auto log = logging::get(logging::DISPATCH);
        const auto start = steady_clock::now();

        const auto question = request.target_.find('?');
        const std::string path = request.target_.substr(0, question);
        const std::string query = question == std::string::npos ? "" : request.target_.substr(question + 1);

        OutboundResponse response;
        try {
            response = route(request, path, query);
        } catch (const error::ConnectorError& e) {
            response = error_response(e.kind_, e.what(), e.field_);
        } catch (const http::http_error::UpstreamError& e) {
            if (e.kind_ == http::http_error::UpstreamErrorKind::CANCELLED) {
                log->info("{} {} abandoned by caller", request.method_, path);
                response = error_response(error::ErrorKind::INTERNAL_ERROR, "Request cancelled", std::nullopt);
                response.dropped_ = true;
                return response;
            }

            std::string message = fmt::format("Provider call failed: {}", http::http_error::to_string(e.kind_));
            if (e.status_ > 0) {
                message += fmt::format(" (HTTP {})", e.status_);
            }
            response = error_response(error_kind_for(e.kind_), message, std::nullopt);
        } catch (const std::exception& e) {
            log->error("{} {} failed: {}", request.method_, path, e.what());
            response = error_response(error::ErrorKind::INTERNAL_ERROR, "Internal error", std::nullopt);
        }

        apply_cors(request, response);

        const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start).count();
        log->info("{} {} {} {}ms", request.method_, path, response.status_, elapsed);
        return response;
    }

    OutboundResponse Dispatcher::route(const InboundRequest& request, const std::string& path, const std::string& query) const {
        if (request.method_ == "OPTIONS") {
            OutboundResponse response;
            response.status_ = HTTP_NO_CONTENT;
            response.headers_.emplace_back("Access-Control-Allow-Methods", ALLOWED_METHODS);
            response.headers_.emplace_back("Access-Control-Allow-Headers", guard_->header_name() + ", Authorization, Content-Type");
            response.headers_.emplace_back("Access-Control-Max-Age", "600");
            return response;
        }

        if (guard_->authorize(guard_->presented_credential(request.headers_)) != auth::AuthDecision::AUTHORIZED) {
            throw error::ConnectorError(error::ErrorKind::UNAUTHORIZED, "Missing or invalid credential");
        }

        if (request.method_ != "GET") {
            auto response = error_response(error::ErrorKind::METHOD_NOT_ALLOWED, "Method " + request.method_ + " is not allowed", std::nullopt);
            response.headers_.emplace_back("Allow", ALLOWED_METHODS);
            return response;
        }

        if (path == "/" || path.empty()) {
            return json_response(HTTP_OK, info_body());
        }

        if (path == DISCOVERY_PATH) {
            return json_response(HTTP_OK, discovery_body(*registry_));
        }

        if (path == APPS_PATH) {
            return json_response(HTTP_OK, apps_ == nullptr ? json::array() : *apps_);
        }

        std::string id = path.substr(1);
        if (!id.empty() && id.back() == '/') {
            id.pop_back();
        }

        const auto* widget = registry_->find(id);
        if (widget == nullptr) {
            throw error::ConnectorError(error::ErrorKind::UNKNOWN_WIDGET, "Unknown widget '" + id + "'");
        }

        return json_response(HTTP_OK, query_widget(*widget, query, request.is_cancelled_));
    }

    json Dispatcher::query_widget(const registry::WidgetDescriptor& widget, const std::string& query, const http::model::CancelCheck& cancelled) const {
        string_utils::QueryPairs raw;
        try {
            raw = string_utils::parse_query_string(query);
        } catch (const std::invalid_argument& e) {
            throw error::ConnectorError(error::ErrorKind::VALIDATION_ERROR, std::string("Malformed query string: ") + e.what());
        }

        const translator::SchemaTranslator translator(data_provider_.get(), settings_->upstream_timeouts());
        const auto upstream_request = translator.build_upstream_request(widget, raw);

        http::data_api::DataAPI api(data_provider_.get(), http_client_factory_(), settings_->retry_policy(), sleeper_);
        const auto provider_response = api.call(upstream_request, cancelled);

        logging::get(logging::DISPATCH)->debug("{}: {} record(s) in {} attempt(s)", widget.id_, provider_response.records_.size(), api.last_attempts());

        const auto translated = translator::SchemaTranslator::translate_response(widget, provider_response);
        return widget.type_ == registry::WidgetType::METRIC ? metric_body(translated) : table_body(translated);
    }

    void Dispatcher::apply_cors(const InboundRequest& request, OutboundResponse& response) const {
        auto origin = string_utils::find_header(request.headers_, "Origin");
        if (!origin || !settings_->is_allowed_origin(*origin)) {
            return;
        }
        response.headers_.emplace_back("Access-Control-Allow-Origin", *origin);
        response.headers_.emplace_back("Access-Control-Allow-Credentials", "true");
        response.headers_.emplace_back("Vary", "Origin");
    }

}  // namespace bridge::dispatch
