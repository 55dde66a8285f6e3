#ifndef NEXUS_BRIDGE_AUTH_CREDENTIAL_GUARD_HPP
#define NEXUS_BRIDGE_AUTH_CREDENTIAL_GUARD_HPP

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "../../utils/string_utils.hpp"

namespace bridge::auth {

    enum class AuthDecision { AUTHORIZED, REJECTED };

    inline constexpr const char* DEFAULT_AUTH_HEADER = "X-API-Key";

    // Both strings are compared over their full length regardless of where they first differ.
    bool constant_time_equals(std::string_view a, std::string_view b);

    // Holds the connector's inbound credential. Neither the expected nor the presented value is ever logged.
    class CredentialGuard {
       public:
        // Throws std::invalid_argument when the expected credential or header name is empty.
        CredentialGuard(std::string expected, std::string header_name = DEFAULT_AUTH_HEADER);

        ~CredentialGuard() = default;
        CredentialGuard(const CredentialGuard&) = delete;
        CredentialGuard& operator=(const CredentialGuard&) = delete;
        CredentialGuard(CredentialGuard&&) = delete;
        CredentialGuard& operator=(CredentialGuard&&) = delete;

        [[nodiscard]] AuthDecision authorize(const std::optional<std::string>& presented) const;

        // The configured header wins; "Authorization: Bearer <key>" is the fallback. Header names match case-insensitively.
        [[nodiscard]] std::optional<std::string> presented_credential(const string_utils::HeaderPairs& headers) const;

        [[nodiscard]] const std::string& header_name() const { return header_name_; }

       private:
        std::string expected_;
        std::string header_name_;
    };

}  // namespace bridge::auth

#endif
