#ifndef NEXUS_BRIDGE_RETRY_POLICY_HPP
#define NEXUS_BRIDGE_RETRY_POLICY_HPP

#include <chrono>
#include <cstddef>
#include <functional>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

namespace http::client {
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // Bounded exponential backoff with jitter. Only transient failures of idempotent requests are retried.
    struct RetryPolicy {
        size_t max_retries_ = constants::DEFAULT_MAX_RETRIES;
        std::chrono::milliseconds base_delay_{constants::DEFAULT_BACKOFF_BASE_MS};
        std::chrono::milliseconds max_delay_{constants::DEFAULT_BACKOFF_MAX_MS};

        [[nodiscard]] size_t max_attempts() const { return max_retries_ + 1; }

        // attempt is 1-based and counts the attempt that just failed.
        [[nodiscard]] bool should_retry(http::http_error::UpstreamErrorKind kind, size_t attempt, bool idempotent) const;

        // Waits for delay plus jitter and returns the delay to use next time.
        std::chrono::milliseconds backoff(std::chrono::milliseconds delay, const Sleeper& sleep) const;
    };
}  // namespace http::client

#endif
