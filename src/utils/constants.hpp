#ifndef NEXUS_BRIDGE_CONSTANTS_HPP
#define NEXUS_BRIDGE_CONSTANTS_HPP

#include <cstddef>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int BASE_16 = 16;

    inline constexpr const char* SERVICE_NAME = "nexus_bridge";
    inline constexpr const char* SERVICE_VERSION = "0.1.0";

    inline constexpr long DEFAULT_UPSTREAM_TIMEOUT_MS = 30'000L;
    inline constexpr long DEFAULT_UPSTREAM_CONNECT_TIMEOUT_MS = 10'000L;
    inline constexpr long DEFAULT_BACKOFF_BASE_MS = 300L;
    inline constexpr long DEFAULT_BACKOFF_MAX_MS = 1'500L;
    inline constexpr std::size_t DEFAULT_MAX_RETRIES = 2;
    inline constexpr std::size_t MAX_ALLOWED_RETRIES = 2;

    inline constexpr unsigned short DEFAULT_PORT = 8000;
    inline constexpr long IDLE_CONNECTION_TIMEOUT_S = 15L;
    inline constexpr std::size_t MAX_REQUEST_HEADER_BYTES = 16 * 1024;

    inline constexpr std::size_t ERROR_BODY_PREVIEW_LENGTH = 512;

    inline constexpr double THOUSAND = 1'000.0;
    inline constexpr double MILLION = 1'000'000.0;
    inline constexpr double BILLION = 1'000'000'000.0;
    inline constexpr double PERCENT = 100.0;
}  // namespace constants

#endif
