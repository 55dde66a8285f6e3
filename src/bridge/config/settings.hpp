#ifndef NEXUS_BRIDGE_CONFIG_SETTINGS_HPP
#define NEXUS_BRIDGE_CONFIG_SETTINGS_HPP

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../http/client/retry_policy.hpp"
#include "../translator/schema_translator.hpp"

namespace bridge::config {

    inline constexpr const char* DEFAULT_VIANEXUS_BASE_URL = "https://api.blueskyapi.com/v1";
    inline constexpr const char* DEFAULT_HOST = "0.0.0.0";
    inline constexpr const char* DEFAULT_WIDGETS_FILE = "config/widgets.json";
    inline constexpr const char* DEFAULT_APPS_FILE = "config/apps.json";
    inline constexpr const char* DEFAULT_ALLOWED_ORIGINS = "https://pro.openbb.co,https://pro.openbb.dev,http://localhost:1420";
    inline constexpr const char* DEFAULT_LOG_LEVEL = "info";

    // Returns the variable's value, or std::nullopt when it is unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    std::optional<std::string> process_env(const std::string& name);

    struct ConfigError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Everything the process reads from its environment. Built once at startup, read-only afterwards.
    struct Settings {
        std::string connector_api_key_;
        std::string auth_header_;
        std::string vianexus_api_key_;
        std::string vianexus_base_url_;

        std::string host_;
        unsigned short port_ = constants::DEFAULT_PORT;
        std::filesystem::path widgets_file_;
        std::filesystem::path apps_file_;
        size_t worker_threads_ = 1;
        std::vector<std::string> allowed_origins_;

        long upstream_timeout_ms_ = constants::DEFAULT_UPSTREAM_TIMEOUT_MS;
        long upstream_connect_timeout_ms_ = constants::DEFAULT_UPSTREAM_CONNECT_TIMEOUT_MS;
        size_t max_retries_ = constants::DEFAULT_MAX_RETRIES;
        long backoff_base_ms_ = constants::DEFAULT_BACKOFF_BASE_MS;
        long backoff_max_ms_ = constants::DEFAULT_BACKOFF_MAX_MS;

        std::string log_level_;
        std::string module_log_levels_;

        // Throws ConfigError on a missing required key, a malformed number or an out-of-range value.
        [[nodiscard]] static Settings from_env(const EnvLookup& lookup = process_env);

        [[nodiscard]] http::client::RetryPolicy retry_policy() const;
        [[nodiscard]] translator::UpstreamTimeouts upstream_timeouts() const;
        [[nodiscard]] bool is_allowed_origin(const std::string& origin) const;
    };

}  // namespace bridge::config

#endif
