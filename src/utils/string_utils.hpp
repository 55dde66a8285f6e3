#ifndef NEXUS_BRIDGE_STRING_UTILS_HPP
#define NEXUS_BRIDGE_STRING_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace string_utils {
    using QueryPairs = std::vector<std::pair<std::string, std::string>>;
    using HeaderPairs = std::vector<std::pair<std::string, std::string>>;

    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool iequals(std::string_view a, std::string_view b);

    std::string trim(std::string s);

    std::string to_upper(std::string s);

    std::string to_lower(std::string s);

    // First header whose name matches case-insensitively.
    std::optional<std::string> find_header(const HeaderPairs& headers, std::string_view name);

    std::vector<std::string> split_comma_delimited_string(std::string_view sv);

    // RFC 3986 unreserved characters pass through, everything else is %XX.
    std::string url_encode(std::string_view sv);

    // Decodes %XX escapes and '+' as space. Throws std::invalid_argument on a broken escape.
    std::string url_decode(std::string_view sv);

    QueryPairs parse_query_string(std::string_view query);

    std::string build_query_string(const QueryPairs& pairs);

    // Replaces the value of a query parameter with "***" so URLs can be logged.
    std::string redact_query_param(const std::string& url, std::string_view key);
}  // namespace string_utils

#endif
