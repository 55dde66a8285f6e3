#include "retry_policy.hpp"

#include <algorithm>
#include <random>

using namespace std::chrono;

namespace http::client {
    bool RetryPolicy::should_retry(http::http_error::UpstreamErrorKind kind, size_t attempt, bool idempotent) const {
        if (!idempotent || attempt >= max_attempts()) {
            return false;
        }

        return kind == http::http_error::UpstreamErrorKind::TIMEOUT || kind == http::http_error::UpstreamErrorKind::UNAVAILABLE;
    }

    milliseconds RetryPolicy::backoff(milliseconds delay, const Sleeper& sleep) const {
        std::minstd_rand rng{std::random_device{}()};

        auto jitter = [&](milliseconds base) {
            std::uniform_int_distribution<int> d(0, static_cast<int>(base.count()));
            return milliseconds{d(rng)};
        };

        sleep(std::min(delay + jitter(base_delay_), max_delay_));
        return std::min(delay * 2, max_delay_);
    }
}  // namespace http::client
