#include "credential_guard.hpp"

#include <algorithm>
#include <stdexcept>

namespace bridge::auth {
    namespace {
        constexpr std::string_view AUTHORIZATION = "Authorization";
        constexpr std::string_view BEARER_PREFIX = "Bearer ";
    }  // namespace

    bool constant_time_equals(std::string_view a, std::string_view b) {
        const size_t n = std::max(a.size(), b.size());
        unsigned diff = a.size() == b.size() ? 0U : 1U;

        for (size_t i = 0; i < n; ++i) {
            const auto x = static_cast<unsigned char>(i < a.size() ? a[i] : 0);
            const auto y = static_cast<unsigned char>(i < b.size() ? b[i] : 0);
            diff |= static_cast<unsigned>(x ^ y);
        }

        return diff == 0;
    }

    CredentialGuard::CredentialGuard(std::string expected, std::string header_name) : expected_(std::move(expected)), header_name_(std::move(header_name)) {
        if (expected_.empty()) {
            throw std::invalid_argument("Inbound credential must not be empty");
        }
        if (header_name_.empty()) {
            throw std::invalid_argument("Credential header name must not be empty");
        }
    }

    AuthDecision CredentialGuard::authorize(const std::optional<std::string>& presented) const {
        if (!presented || presented->empty()) {
            return AuthDecision::REJECTED;
        }
        return constant_time_equals(*presented, expected_) ? AuthDecision::AUTHORIZED : AuthDecision::REJECTED;
    }

    std::optional<std::string> CredentialGuard::presented_credential(const string_utils::HeaderPairs& headers) const {
        if (auto value = string_utils::find_header(headers, header_name_)) {
            return string_utils::trim(*value);
        }

        auto authorization = string_utils::find_header(headers, AUTHORIZATION);
        if (!authorization) {
            return std::nullopt;
        }

        const std::string value = string_utils::trim(*authorization);
        if (value.size() <= BEARER_PREFIX.size() || !string_utils::iequals(std::string_view(value).substr(0, BEARER_PREFIX.size()), BEARER_PREFIX)) {
            return std::nullopt;
        }
        return string_utils::trim(value.substr(BEARER_PREFIX.size()));
    }

}  // namespace bridge::auth
