#include <iostream>
#include <memory>

#include "src/bridge/config/settings.hpp"
#include "src/bridge/dispatch/dispatcher.hpp"
#include "src/bridge/registry/apps_document.hpp"
#include "src/bridge/registry/widget_loader.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/provider/vianexus.hpp"
#include "src/server/http_server.hpp"
#include "src/utils/logging.hpp"

int main() {
    //
    // Configure
    //

    bridge::config::Settings settings;
    try {
        settings = bridge::config::Settings::from_env();
        logging::configure(settings.log_level_, settings.module_log_levels_);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    auto log = logging::get(logging::CONFIG);

    try {
        http::client::CurlGlobal curl_global;

        auto registry = std::make_shared<const bridge::registry::WidgetRegistry>(bridge::registry::WidgetLoader::load_from_file(settings.widgets_file_));
        log->info("Loaded {} widget(s) from {}", registry->size(), settings.widgets_file_.string());
        if (registry->empty()) {
            log->warn("Widget registry is empty, only discovery will answer");
        }

        auto apps = std::make_shared<const bridge::registry::AppsDocument>(bridge::registry::AppsLoader::load_from_file(settings.apps_file_));
        log->info("Loaded {} app(s) from {}", apps->size(), settings.apps_file_.string());

        const auto shared_settings = std::make_shared<const bridge::config::Settings>(settings);

        //
        // Assemble
        //

        auto dispatcher = bridge::dispatch::DispatcherBuilder()
                              .with_registry(registry)
                              .with_apps(apps)
                              .with_settings(shared_settings)
                              .with_data_provider(std::make_unique<http::provider::VianexusProvider>(settings.vianexus_base_url_, settings.vianexus_api_key_))
                              .with_http_client_factory(http::client::curl_client_factory())
                              .validate()
                              .build();

        //
        // Serve
        //

        bridge::server::HttpServer server(
            bridge::server::ServerOptions{
                .host_ = settings.host_,
                .port_ = settings.port_,
                .worker_threads_ = settings.worker_threads_,
            },
            std::move(dispatcher));

        server.run();
    } catch (const bridge::registry::RegistryError& e) {
        log->critical("Invalid widget registry or apps file: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        log->critical("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
