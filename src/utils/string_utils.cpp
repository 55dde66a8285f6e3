#include "string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

#include "constants.hpp"

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool iequals(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::optional<std::string> find_header(const HeaderPairs &headers, std::string_view name) {
        for (const auto &[key, value] : headers) {
            if (iequals(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::string to_upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::vector<std::string> split_comma_delimited_string(std::string_view sv) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(',', start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;

            std::string_view token = sv.substr(start, end - start);
            const auto first = token.find_first_not_of(" \t");
            if (first != std::string_view::npos) {
                const auto last = token.find_last_not_of(" \t");
                out.emplace_back(token.substr(first, last - first + 1));
            }

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }

    std::string url_encode(std::string_view sv) {
        static constexpr std::array<char, 16> HEX = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

        std::string out;
        out.reserve(sv.size());
        for (const char ch : sv) {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
                out.push_back(ch);
            } else {
                out.push_back('%');
                out.push_back(HEX[c >> 4U]);
                out.push_back(HEX[c & 0x0FU]);
            }
        }
        return out;
    }

    std::string url_decode(std::string_view sv) {
        auto hex_value = [](char c) -> int {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + constants::BASE_10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + constants::BASE_10;
            }
            return -1;
        };

        std::string out;
        out.reserve(sv.size());
        for (size_t i = 0; i < sv.size(); ++i) {
            if (sv[i] == '+') {
                out.push_back(' ');
            } else if (sv[i] == '%') {
                if (i + 2 >= sv.size()) {
                    throw std::invalid_argument("truncated percent escape");
                }
                const int hi = hex_value(sv[i + 1]);
                const int lo = hex_value(sv[i + 2]);
                if (hi < 0 || lo < 0) {
                    throw std::invalid_argument("invalid percent escape");
                }
                out.push_back(static_cast<char>(hi * constants::BASE_16 + lo));
                i += 2;
            } else {
                out.push_back(sv[i]);
            }
        }
        return out;
    }

    QueryPairs parse_query_string(std::string_view query) {
        QueryPairs out;
        size_t start = 0;
        while (start <= query.size()) {
            size_t amp = query.find('&', start);
            size_t end = (amp == std::string_view::npos) ? query.size() : amp;
            std::string_view token = query.substr(start, end - start);

            if (!token.empty()) {
                const auto eq = token.find('=');
                if (eq == std::string_view::npos) {
                    out.emplace_back(url_decode(token), std::string{});
                } else {
                    out.emplace_back(url_decode(token.substr(0, eq)), url_decode(token.substr(eq + 1)));
                }
            }

            if (amp == std::string_view::npos) {
                break;
            }
            start = amp + 1;
        }
        return out;
    }

    std::string build_query_string(const QueryPairs &pairs) {
        std::string out;
        for (const auto &[key, value] : pairs) {
            if (!out.empty()) {
                out.push_back('&');
            }
            out += url_encode(key);
            out.push_back('=');
            out += url_encode(value);
        }
        return out;
    }

    std::string redact_query_param(const std::string &url, std::string_view key) {
        const auto query_start = url.find('?');
        if (query_start == std::string::npos) {
            return url;
        }

        std::string out = url.substr(0, query_start + 1);
        std::string_view query(url);
        query.remove_prefix(query_start + 1);

        size_t start = 0;
        bool first = true;
        for (;;) {
            size_t amp = query.find('&', start);
            size_t end = (amp == std::string_view::npos) ? query.size() : amp;
            std::string_view token = query.substr(start, end - start);

            if (!first) {
                out.push_back('&');
            }
            first = false;

            const auto eq = token.find('=');
            if (eq != std::string_view::npos && token.substr(0, eq) == key) {
                out.append(token.substr(0, eq + 1));
                out += "***";
            } else {
                out.append(token);
            }

            if (amp == std::string_view::npos) {
                break;
            }
            start = amp + 1;
        }
        return out;
    }
}  // namespace string_utils
