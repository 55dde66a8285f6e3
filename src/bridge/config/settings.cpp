#include "settings.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <thread>

#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"

namespace bridge::config {
    namespace {
        constexpr long MAX_PORT = std::numeric_limits<unsigned short>::max();
        constexpr long MAX_WORKER_THREADS = 1024;

        std::optional<std::string> lookup_trimmed(const EnvLookup& lookup, const std::string& name) {
            auto value = lookup(name);
            if (!value) {
                return std::nullopt;
            }
            std::string trimmed = string_utils::trim(std::move(*value));
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return trimmed;
        }

        std::string require(const EnvLookup& lookup, const std::string& name) {
            auto value = lookup_trimmed(lookup, name);
            if (!value) {
                throw ConfigError(name + " is required but not set");
            }
            return *value;
        }

        std::string optional_string(const EnvLookup& lookup, const std::string& name, const std::string& fallback) {
            return lookup_trimmed(lookup, name).value_or(fallback);
        }

        long optional_long(const EnvLookup& lookup, const std::string& name, long fallback, long min, long max) {
            auto value = lookup_trimmed(lookup, name);
            if (!value) {
                return fallback;
            }

            long parsed = 0;
            const char* first = value->data();
            const char* last = first + value->size();
            auto [ptr, ec] = std::from_chars(first, last, parsed);
            if (ec != std::errc() || ptr != last) {
                throw ConfigError(name + " must be an integer, got '" + *value + "'");
            }
            if (parsed < min || parsed > max) {
                throw ConfigError(name + " must be between " + std::to_string(min) + " and " + std::to_string(max));
            }
            return parsed;
        }

        long default_worker_threads() {
            const auto hw = std::thread::hardware_concurrency();
            return hw == 0 ? 1 : static_cast<long>(hw);
        }
    }  // namespace

    std::optional<std::string> process_env(const std::string& name) {
        const char* value = std::getenv(name.c_str());  // NOLINT(concurrency-mt-unsafe)
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

    Settings Settings::from_env(const EnvLookup& lookup) {
        Settings s;

        s.connector_api_key_ = require(lookup, "CONNECTOR_API_KEY");
        s.vianexus_api_key_ = require(lookup, "VIANEXUS_API_KEY");
        s.auth_header_ = optional_string(lookup, "CONNECTOR_AUTH_HEADER", "X-API-Key");

        s.vianexus_base_url_ = optional_string(lookup, "VIANEXUS_BASE_URL", DEFAULT_VIANEXUS_BASE_URL);
        if (!s.vianexus_base_url_.starts_with("http://") && !s.vianexus_base_url_.starts_with("https://")) {
            throw ConfigError("VIANEXUS_BASE_URL must be an http or https URL");
        }

        s.host_ = optional_string(lookup, "CONNECTOR_HOST", DEFAULT_HOST);
        s.port_ = static_cast<unsigned short>(optional_long(lookup, "CONNECTOR_PORT", constants::DEFAULT_PORT, 1, MAX_PORT));
        s.widgets_file_ = optional_string(lookup, "CONNECTOR_WIDGETS_FILE", DEFAULT_WIDGETS_FILE);
        s.apps_file_ = optional_string(lookup, "CONNECTOR_APPS_FILE", DEFAULT_APPS_FILE);
        s.worker_threads_ = static_cast<size_t>(optional_long(lookup, "CONNECTOR_WORKER_THREADS", default_worker_threads(), 1, MAX_WORKER_THREADS));
        s.allowed_origins_ = string_utils::split_comma_delimited_string(optional_string(lookup, "CONNECTOR_ALLOWED_ORIGINS", DEFAULT_ALLOWED_ORIGINS));

        s.upstream_timeout_ms_ = optional_long(lookup, "UPSTREAM_TIMEOUT_MS", constants::DEFAULT_UPSTREAM_TIMEOUT_MS, 1, std::numeric_limits<long>::max());
        s.upstream_connect_timeout_ms_ =
            optional_long(lookup, "UPSTREAM_CONNECT_TIMEOUT_MS", constants::DEFAULT_UPSTREAM_CONNECT_TIMEOUT_MS, 1, std::numeric_limits<long>::max());
        s.max_retries_ = static_cast<size_t>(optional_long(lookup, "UPSTREAM_MAX_RETRIES", static_cast<long>(constants::DEFAULT_MAX_RETRIES), 0,
                                                           static_cast<long>(constants::MAX_ALLOWED_RETRIES)));
        s.backoff_base_ms_ = optional_long(lookup, "UPSTREAM_BACKOFF_BASE_MS", constants::DEFAULT_BACKOFF_BASE_MS, 0, std::numeric_limits<int>::max());
        s.backoff_max_ms_ = optional_long(lookup, "UPSTREAM_BACKOFF_MAX_MS", constants::DEFAULT_BACKOFF_MAX_MS, 0, std::numeric_limits<int>::max());
        if (s.backoff_base_ms_ > s.backoff_max_ms_) {
            throw ConfigError("UPSTREAM_BACKOFF_BASE_MS must not exceed UPSTREAM_BACKOFF_MAX_MS");
        }

        s.log_level_ = optional_string(lookup, "LOG_LEVEL", DEFAULT_LOG_LEVEL);
        s.module_log_levels_ = optional_string(lookup, "MODULE_LOG_LEVELS", "");
        try {
            static_cast<void>(logging::parse_level(s.log_level_));
            for (const auto& entry : string_utils::split_comma_delimited_string(s.module_log_levels_)) {
                const auto pos = entry.find(':');
                if (pos == std::string::npos || pos == 0) {
                    throw ConfigError("MODULE_LOG_LEVELS entries must look like module:level, got '" + entry + "'");
                }
                static_cast<void>(logging::parse_level(entry.substr(pos + 1)));
            }
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }

        return s;
    }

    http::client::RetryPolicy Settings::retry_policy() const {
        return http::client::RetryPolicy{
            .max_retries_ = max_retries_,
            .base_delay_ = std::chrono::milliseconds{backoff_base_ms_},
            .max_delay_ = std::chrono::milliseconds{backoff_max_ms_},
        };
    }

    translator::UpstreamTimeouts Settings::upstream_timeouts() const {
        return translator::UpstreamTimeouts{
            .timeout_ms_ = upstream_timeout_ms_,
            .connect_timeout_ms_ = upstream_connect_timeout_ms_,
        };
    }

    bool Settings::is_allowed_origin(const std::string& origin) const {
        return std::ranges::any_of(allowed_origins_, [&origin](const std::string& allowed) { return allowed == "*" || allowed == origin; });
    }

}  // namespace bridge::config
