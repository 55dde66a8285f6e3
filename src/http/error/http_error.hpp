#ifndef NEXUS_BRIDGE_HTTP_ERROR_HPP
#define NEXUS_BRIDGE_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    enum class UpstreamErrorKind {
        TIMEOUT,
        UNAVAILABLE,
        REJECTED,
        CANCELLED,
    };

    const char* to_string(UpstreamErrorKind kind);

    // Raised by the transport and the upstream client. url_ never carries the provider token.
    struct UpstreamError : public std::runtime_error {
        UpstreamErrorKind kind_;
        long status_;
        std::string url_;
        std::string body_preview_;

        explicit UpstreamError(UpstreamErrorKind kind, long s, std::string u, std::string preview, const std::string &msg);
    };
}  // namespace http::http_error

#endif
