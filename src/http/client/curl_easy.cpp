#include "curl_easy.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 5L;
        static constexpr const char* USER_AGENT = "nexus-bridge/0.1";
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 0L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long POST = 0L;
        static constexpr long UPLOAD = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr long HTTP_GET = 1L;
    };

    struct HeaderKeys {
        static constexpr const char* X_RATELIMIT_REMAINING = "x-ratelimit-remaining:";
    };

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_timeouts(long total_ms, long connect_ms) {
        setopt(CURLOPT_TIMEOUT_MS, total_ms);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, connect_ms);
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_XFERINFOFUNCTION, &CurlEasy::progress_cb);
        set_timeouts(constants::DEFAULT_UPSTREAM_TIMEOUT_MS, constants::DEFAULT_UPSTREAM_CONNECT_TIMEOUT_MS);
    }

    void CurlEasy::enable_keepalive() {
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
    }

    void CurlEasy::enable_compression() {
        // Empty string => accept all supported encodings (gzip/deflate/br)
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
    }

    void CurlEasy::prepare_for_new_request(std::string& body, const http::model::CancelCheck* cancelled) {
        last_rl_remaining_ = -1;
        error_buf_[0] = '\0';
        body.clear();

        // Always set these per request (don't rely on old values)
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
        setopt(CURLOPT_XFERINFODATA, const_cast<http::model::CancelCheck*>(cancelled));  // NOLINT(cppcoreguidelines-pro-type-const-cast)

        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_UPLOAD, CurlDefaults::UPLOAD);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);  // clears any previous custom verb
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        extract_header_value(buffer, bytes, HeaderKeys::X_RATELIMIT_REMAINING, self->last_rl_remaining_);

        return bytes;
    }

    int CurlEasy::progress_cb(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
        const auto* cancelled = static_cast<const http::model::CancelCheck*>(clientp);
        if (cancelled != nullptr && *cancelled && (*cancelled)()) {
            return 1;  // CURLE_ABORTED_BY_CALLBACK
        }
        return 0;
    }

    http::model::Response CurlEasy::get(const http::model::Request& req, const http::model::CancelCheck& cancelled) {
        set_url(req.url_);
        set_headers(req.headers_);
        set_timeouts(req.timeout_ms_, req.connect_timeout_ms_);

        std::string body;
        prepare_for_new_request(body, &cancelled);

        perform_throw(req.url_);
        return make_response(body);
    }

    HttpClientFactory curl_client_factory() {
        return []() -> std::unique_ptr<IHttpClient> {
            auto client = std::make_unique<CurlEasy>();
            client->enable_keepalive();
            client->enable_compression();
            return client;
        };
    }

    http::http_error::UpstreamErrorKind CurlEasy::classify(CURLcode rc) {
        switch (rc) {
            case CURLE_OPERATION_TIMEDOUT:
                return http::http_error::UpstreamErrorKind::TIMEOUT;
            case CURLE_ABORTED_BY_CALLBACK:
                return http::http_error::UpstreamErrorKind::CANCELLED;
            case CURLE_URL_MALFORMAT:
            case CURLE_UNSUPPORTED_PROTOCOL:
                return http::http_error::UpstreamErrorKind::REJECTED;
            default:
                // Connection refused, DNS, TLS, reset, malformed reply: all transient from our side.
                return http::http_error::UpstreamErrorKind::UNAVAILABLE;
        }
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http::http_error::UpstreamError(classify(rc), 0, string_utils::redact_query_param(url, "token"), "", err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.rate_limit_remaining_ = last_rl_remaining_;
        return r;
    }

    bool CurlEasy::extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property) {
        const size_t key_len = std::char_traits<char>::length(key);
        if (!string_utils::ieq_prefix(buffer, bytes, key)) {
            return false;
        }
        const char* start = buffer + key_len;
        const char* end = buffer + bytes;
        while (start < end && (*start == ' ' || *start == '\t')) {
            ++start;
        }
        while (end > start && (end[-1] == '\r' || end[-1] == '\n' || end[-1] == ' ' || end[-1] == '\t')) {
            --end;
        }
        out_property.assign(start, end);
        return true;
    }

    bool CurlEasy::extract_header_value(const char* buffer, size_t bytes, const char* key, long& out_property) {
        std::string tmp;
        if (!extract_header_value(buffer, bytes, key, tmp)) {
            return false;
        }
        char* end_ptr = nullptr;
        const long val = std::strtol(tmp.c_str(), &end_ptr, constants::BASE_10);
        if (end_ptr == tmp.c_str()) {
            return false;
        }
        out_property = val;
        return true;
    }

}  // namespace http::client
