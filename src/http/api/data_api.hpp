#ifndef NEXUS_BRIDGE_DATA_API_HPP
#define NEXUS_BRIDGE_DATA_API_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "../client/interface.hpp"
#include "../client/retry_policy.hpp"
#include "../model/model.hpp"

namespace http::data_api {

    // Nested objects and arrays are kept as their raw JSON text.
    struct RawJson {
        std::string text_;
        bool operator==(const RawJson&) const = default;
    };

    using ProviderValue = std::variant<std::monostate, bool, std::int64_t, double, std::string, RawJson>;

    // Field order follows the provider payload.
    using ProviderRecord = std::vector<std::pair<std::string, ProviderValue>>;

    const ProviderValue* find_field(const ProviderRecord& record, const std::string& field);

    struct ProviderResponse {
        long status_ = 0;
        std::vector<ProviderRecord> records_;
        std::string error_detail_;
    };

    // Dataset coordinates plus already-validated parameter strings.
    struct ProviderQuery {
        std::string namespace_;
        std::string dataset_;
        std::vector<std::string> path_values_;
        std::vector<std::pair<std::string, std::string>> query_params_;
        long timeout_ms_ = constants::DEFAULT_UPSTREAM_TIMEOUT_MS;
        long connect_timeout_ms_ = constants::DEFAULT_UPSTREAM_CONNECT_TIMEOUT_MS;
    };

    class IDataProvider {
       public:
        IDataProvider() = default;
        virtual ~IDataProvider() = default;
        IDataProvider(const IDataProvider&) = delete;
        IDataProvider& operator=(const IDataProvider&) = delete;
        IDataProvider(IDataProvider&&) = delete;
        IDataProvider& operator=(IDataProvider&&) = delete;

        [[nodiscard]] virtual http::model::Request build_request(const ProviderQuery& q) const = 0;

        // Throws http_error::UpstreamError(UNAVAILABLE) when the body is not the expected JSON.
        [[nodiscard]] virtual ProviderResponse parse_response(const http::model::Response& resp) const = 0;

        [[nodiscard]] virtual std::string name() const = 0;
    };

    // The outbound side of a query: one provider call with bounded, idempotency-aware retries.
    class DataAPI {
       public:
        DataAPI(const IDataProvider* p, std::unique_ptr<http::client::IHttpClient> client, http::client::RetryPolicy policy,
                http::client::Sleeper sleep = {});

        ProviderResponse call(const http::model::Request& req, const http::model::CancelCheck& cancelled);

        [[nodiscard]] size_t last_attempts() const { return last_attempts_; }

       private:
        ProviderResponse attempt(const http::model::Request& req, const http::model::CancelCheck& cancelled);

        const IDataProvider* provider_;
        std::unique_ptr<http::client::IHttpClient> http_;
        http::client::RetryPolicy policy_;
        http::client::Sleeper sleep_;
        size_t last_attempts_ = 0;
    };

}  // namespace http::data_api

#endif
