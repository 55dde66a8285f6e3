#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::http_error {
    const char *to_string(UpstreamErrorKind kind) {
        switch (kind) {
            case UpstreamErrorKind::TIMEOUT:
                return "timeout";
            case UpstreamErrorKind::UNAVAILABLE:
                return "unavailable";
            case UpstreamErrorKind::REJECTED:
                return "rejected";
            case UpstreamErrorKind::CANCELLED:
                return "cancelled";
        }
        return "unknown";
    }

    UpstreamError::UpstreamError(UpstreamErrorKind kind, long s, std::string u,
                                 std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                                 const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), kind_(kind), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}
};  // namespace http::http_error
