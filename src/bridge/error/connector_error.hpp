#ifndef NEXUS_BRIDGE_CONNECTOR_ERROR_HPP
#define NEXUS_BRIDGE_CONNECTOR_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace bridge::error {

    enum class ErrorKind {
        UNAUTHORIZED,
        UNKNOWN_WIDGET,
        METHOD_NOT_ALLOWED,
        VALIDATION_ERROR,
        UPSTREAM_TIMEOUT,
        UPSTREAM_UNAVAILABLE,
        UPSTREAM_REJECTED,
        TRANSLATION_ERROR,
        INTERNAL_ERROR,
    };

    // Machine-readable name used in error bodies, e.g. "ValidationError".
    const char* to_string(ErrorKind kind);

    unsigned http_status_for(ErrorKind kind);

    // Every failure a caller can see. field_ names the offending parameter or column when there is one.
    struct ConnectorError : public std::runtime_error {
        ErrorKind kind_;
        std::optional<std::string> field_;

        ConnectorError(ErrorKind kind, const std::string& msg, std::optional<std::string> field = std::nullopt);
    };

    struct ValidationError : public ConnectorError {
        ValidationError(const std::string& field, const std::string& msg);
    };

    struct TranslationError : public ConnectorError {
        TranslationError(const std::string& field, const std::string& msg);
    };

}  // namespace bridge::error

#endif
