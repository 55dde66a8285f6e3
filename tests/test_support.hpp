#ifndef NEXUS_BRIDGE_TESTS_TEST_SUPPORT_HPP
#define NEXUS_BRIDGE_TESTS_TEST_SUPPORT_HPP

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../src/bridge/config/settings.hpp"
#include "../src/http/client/interface.hpp"
#include "../src/http/model/model.hpp"

namespace test_support {

    inline constexpr const char* CONNECTOR_KEY = "connector-secret";
    inline constexpr const char* PROVIDER_TOKEN = "provider-secret";
    inline constexpr const char* PROVIDER_BASE_URL = "https://provider.test/v1";

    // Stands in for the provider. The handler sees every request and may return a response or throw
    // http_error::UpstreamError to simulate a transport failure.
    struct FakeUpstream {
        using Handler = std::function<http::model::Response(const http::model::Request&, size_t call_no)>;

        Handler handler_;
        std::atomic<size_t> calls_ = 0;
        std::mutex mutex_;
        std::vector<http::model::Request> seen_;

        explicit FakeUpstream(Handler handler) : handler_(std::move(handler)) {}

        [[nodiscard]] std::string last_url() {
            std::lock_guard<std::mutex> lock(mutex_);
            return seen_.empty() ? "" : seen_.back().url_;
        }
    };

    class FakeHttpClient : public http::client::IHttpClient {
       public:
        explicit FakeHttpClient(std::shared_ptr<FakeUpstream> upstream) : upstream_(std::move(upstream)) {}

        http::model::Response get(const http::model::Request& req, const http::model::CancelCheck& /*cancelled*/) override {
            const size_t call_no = ++upstream_->calls_;
            {
                std::lock_guard<std::mutex> lock(upstream_->mutex_);
                upstream_->seen_.push_back(req);
            }
            return upstream_->handler_(req, call_no);
        }

       private:
        std::shared_ptr<FakeUpstream> upstream_;
    };

    inline http::client::HttpClientFactory factory_for(const std::shared_ptr<FakeUpstream>& upstream) {
        return [upstream]() { return std::make_unique<FakeHttpClient>(upstream); };
    }

    inline http::model::Response json_response(std::string body, long status = 200) {
        http::model::Response r;
        r.status_ = status;
        r.body_ = std::move(body);
        return r;
    }

    inline std::shared_ptr<FakeUpstream> always(std::string body, long status = 200) {
        return std::make_shared<FakeUpstream>([body = std::move(body), status](const http::model::Request& req, size_t) {
            auto r = json_response(body, status);
            r.effective_url_ = req.url_;
            return r;
        });
    }

    inline bridge::config::EnvLookup env_from(std::map<std::string, std::string> vars) {
        return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
            auto it = vars.find(name);
            if (it == vars.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }

    inline std::map<std::string, std::string> minimal_env() {
        return {
            {"CONNECTOR_API_KEY", CONNECTOR_KEY},
            {"VIANEXUS_API_KEY", PROVIDER_TOKEN},
            {"VIANEXUS_BASE_URL", PROVIDER_BASE_URL},
            {"UPSTREAM_BACKOFF_BASE_MS", "0"},
            {"UPSTREAM_BACKOFF_MAX_MS", "0"},
        };
    }

    inline std::shared_ptr<const bridge::config::Settings> test_settings() {
        return std::make_shared<const bridge::config::Settings>(bridge::config::Settings::from_env(env_from(minimal_env())));
    }

    // Two small widgets covering path and query parameters, both column kinds and a metric.
    inline constexpr const char* TEST_REGISTRY_JSON = R"({
      "widgets": [
        {
          "id": "quote",
          "name": "Quote",
          "type": "table",
          "provider": { "namespace": "CORE", "dataset": "STOCK_STATS_US", "last": 1 },
          "params": [
            { "name": "symbol", "type": "string", "required": true, "binding": "path", "uppercase": true }
          ],
          "columns": [
            { "field": "symbol", "header_name": "Symbol", "type": "string" },
            { "field": "date", "header_name": "Date", "type": "date" },
            { "field": "peRatioTtm", "header_name": "P/E", "type": "number" },
            { "field": "sharesOutstanding", "header_name": "Shares", "type": "integer" }
          ]
        },
        {
          "id": "stats",
          "name": "Stats",
          "type": "metric",
          "provider": { "namespace": "CORE", "dataset": "STOCK_STATS_US" },
          "params": [
            { "name": "symbol", "type": "string", "default": "AAPL", "binding": "path", "uppercase": true },
            { "name": "rows", "type": "number", "default": 1, "upstream_name": "last" },
            { "name": "view", "type": "enum", "default": "full",
              "options": [ { "label": "Full", "value": "full" }, { "label": "Brief", "value": "brief" } ] },
            { "name": "since", "type": "date", "default": "2024-01-02" },
            { "name": "adjusted", "type": "boolean", "default": false }
          ],
          "columns": [
            { "field": "issuerName", "header_name": "Company", "type": "string" },
            { "field": "epsTtm", "header_name": "EPS", "type": "number", "format": "currency" },
            { "field": "ytdChange", "header_name": "YTD", "type": "number", "format": "percent" },
            { "field": "sharesOutstanding", "header_name": "Shares", "type": "integer", "format": "compact", "description": "Float" }
          ]
        }
      ]
    })";

    inline constexpr const char* AAPL_RECORD = R"([{
        "symbol": "AAPL",
        "date": "2025-11-21",
        "issuerName": "Apple Inc",
        "peRatioTtm": 35.2,
        "epsTtm": 6.5,
        "ytdChange": 0.1234,
        "sharesOutstanding": 15000000000
    }])";

}  // namespace test_support

#endif
