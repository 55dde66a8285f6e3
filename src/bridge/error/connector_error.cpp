#include "connector_error.hpp"

#include <string>

namespace bridge::error {

    const char* to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::UNAUTHORIZED:
                return "Unauthorized";
            case ErrorKind::UNKNOWN_WIDGET:
                return "UnknownWidget";
            case ErrorKind::METHOD_NOT_ALLOWED:
                return "MethodNotAllowed";
            case ErrorKind::VALIDATION_ERROR:
                return "ValidationError";
            case ErrorKind::UPSTREAM_TIMEOUT:
                return "UpstreamTimeout";
            case ErrorKind::UPSTREAM_UNAVAILABLE:
                return "UpstreamUnavailable";
            case ErrorKind::UPSTREAM_REJECTED:
                return "UpstreamRejected";
            case ErrorKind::TRANSLATION_ERROR:
                return "TranslationError";
            case ErrorKind::INTERNAL_ERROR:
                return "InternalError";
        }
        return "InternalError";
    }

    unsigned http_status_for(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::UNAUTHORIZED:
                return 401;
            case ErrorKind::UNKNOWN_WIDGET:
                return 404;
            case ErrorKind::METHOD_NOT_ALLOWED:
                return 405;
            case ErrorKind::VALIDATION_ERROR:
                return 422;
            case ErrorKind::UPSTREAM_REJECTED:
                return 502;
            case ErrorKind::UPSTREAM_UNAVAILABLE:
                return 503;
            case ErrorKind::UPSTREAM_TIMEOUT:
                return 504;
            case ErrorKind::TRANSLATION_ERROR:
            case ErrorKind::INTERNAL_ERROR:
                return 500;
        }
        return 500;
    }

    ConnectorError::ConnectorError(ErrorKind kind, const std::string& msg, std::optional<std::string> field)
        : std::runtime_error(msg), kind_(kind), field_(std::move(field)) {}

    ValidationError::ValidationError(const std::string& field, const std::string& msg) : ConnectorError(ErrorKind::VALIDATION_ERROR, msg, field) {}

    TranslationError::TranslationError(const std::string& field, const std::string& msg) : ConnectorError(ErrorKind::TRANSLATION_ERROR, msg, field) {}

}  // namespace bridge::error
