#ifndef NEXUS_BRIDGE_DISPATCH_DISPATCHER_HPP
#define NEXUS_BRIDGE_DISPATCH_DISPATCHER_HPP

#pragma once

#include <memory>
#include <string>

#include "../../http/api/data_api.hpp"
#include "../../http/client/interface.hpp"
#include "../../http/client/retry_policy.hpp"
#include "../../http/model/model.hpp"
#include "../../utils/string_utils.hpp"
#include "../auth/credential_guard.hpp"
#include "../config/settings.hpp"
#include "../registry/apps_document.hpp"
#include "../registry/widget_registry.hpp"
#include "response_writer.hpp"

namespace bridge::dispatch {

    struct InboundRequest {
        std::string method_;
        // Path plus optional query string, exactly as received.
        std::string target_;
        string_utils::HeaderPairs headers_;
        // Polled during the provider call; true once the terminal has gone away.
        http::model::CancelCheck is_cancelled_;
    };

    struct OutboundResponse {
        unsigned status_ = 200;
        std::string body_;
        string_utils::HeaderPairs headers_;
        // Set when the caller disconnected mid-request and nothing should be written back.
        bool dropped_ = false;
    };

    // Routes terminal requests. Safe to share between handler threads: all state is read-only and each
    // query gets its own HTTP client from the factory.
    class Dispatcher {
       public:
        Dispatcher() = default;

        ~Dispatcher() = default;
        Dispatcher(const Dispatcher&) = delete;
        Dispatcher& operator=(const Dispatcher&) = delete;
        Dispatcher(Dispatcher&&) = delete;
        Dispatcher& operator=(Dispatcher&&) = delete;

        void set_registry(std::shared_ptr<const registry::WidgetRegistry> registry);
        void set_apps(std::shared_ptr<const registry::AppsDocument> apps);
        void set_settings(std::shared_ptr<const config::Settings> settings);
        void set_credential_guard(std::unique_ptr<auth::CredentialGuard> guard);
        void set_data_provider(std::unique_ptr<http::data_api::IDataProvider> data_provider);
        void set_http_client_factory(http::client::HttpClientFactory http_client_factory);
        void set_sleeper(http::client::Sleeper sleeper);

        [[nodiscard]] const std::shared_ptr<const registry::WidgetRegistry>& get_registry() const { return registry_; }
        [[nodiscard]] const std::shared_ptr<const config::Settings>& get_settings() const { return settings_; }
        [[nodiscard]] const auth::CredentialGuard* get_credential_guard() const { return guard_.get(); }
        [[nodiscard]] const http::data_api::IDataProvider* get_data_provider() const { return data_provider_.get(); }
        [[nodiscard]] const http::client::HttpClientFactory& get_http_client_factory() const { return http_client_factory_; }

        // Never throws. Every failure becomes an error body with the mapped status.
        [[nodiscard]] OutboundResponse handle(const InboundRequest& request) const;

       private:
        [[nodiscard]] OutboundResponse route(const InboundRequest& request, const std::string& path, const std::string& query) const;
        [[nodiscard]] json query_widget(const registry::WidgetDescriptor& widget, const std::string& query, const http::model::CancelCheck& cancelled) const;
        void apply_cors(const InboundRequest& request, OutboundResponse& response) const;

        std::shared_ptr<const registry::WidgetRegistry> registry_;
        std::shared_ptr<const registry::AppsDocument> apps_;
        std::shared_ptr<const config::Settings> settings_;
        std::unique_ptr<auth::CredentialGuard> guard_;
        std::unique_ptr<http::data_api::IDataProvider> data_provider_;
        http::client::HttpClientFactory http_client_factory_;
        http::client::Sleeper sleeper_;
    };

    class DispatcherBuilder {
       public:
        DispatcherBuilder();

        DispatcherBuilder& with_registry(std::shared_ptr<const registry::WidgetRegistry> registry);
        // Optional; /apps.json answers [] without it.
        DispatcherBuilder& with_apps(std::shared_ptr<const registry::AppsDocument> apps);
        DispatcherBuilder& with_settings(std::shared_ptr<const config::Settings> settings);
        DispatcherBuilder& with_data_provider(std::unique_ptr<http::data_api::IDataProvider> provider);
        DispatcherBuilder& with_http_client_factory(http::client::HttpClientFactory http_client_factory);
        // Replaces the real sleep between retries; tests pass a no-op.
        DispatcherBuilder& with_sleeper(http::client::Sleeper sleeper);
        DispatcherBuilder& validate();
        std::unique_ptr<Dispatcher> build();

       private:
        std::unique_ptr<Dispatcher> dispatcher_;
    };

}  // namespace bridge::dispatch

#endif
