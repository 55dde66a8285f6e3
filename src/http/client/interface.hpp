#ifndef NEXUS_BRIDGE_CLIENT_INTERFACE_HPP
#define NEXUS_BRIDGE_CLIENT_INTERFACE_HPP

#include <functional>
#include <memory>

#include "../model/model.hpp"

namespace http::client {
    // A single outbound transfer. Implementations throw http_error::UpstreamError on transport failure
    // and return any HTTP status, leaving status interpretation to the caller.
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response get(const http::model::Request& req, const http::model::CancelCheck& cancelled) = 0;
    };

    using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;
}  // namespace http::client

#endif
