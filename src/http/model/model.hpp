#ifndef NEXUS_BRIDGE_MODEL_HPP
#define NEXUS_BRIDGE_MODEL_HPP

#include <functional>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"

namespace http::model {
    // Polled while a transfer is in flight; returning true aborts it.
    using CancelCheck = std::function<bool()>;

    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::string body_;

        std::vector<std::string> headers_;

        long timeout_ms_ = constants::DEFAULT_UPSTREAM_TIMEOUT_MS;
        long connect_timeout_ms_ = constants::DEFAULT_UPSTREAM_CONNECT_TIMEOUT_MS;

        // Only idempotent requests are ever retried.
        bool idempotent_ = true;
    };

    struct Response {
        long rate_limit_remaining_ = -1;
        long status_ = 0;

        std::string body_;
        std::string effective_url_;
    };
}  // namespace http::model

#endif
