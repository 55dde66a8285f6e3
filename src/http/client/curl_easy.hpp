#ifndef NEXUS_BRIDGE_CURL_EASY_HPP
#define NEXUS_BRIDGE_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <string>
#include <vector>

#include "../error/http_error.hpp"
#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    enum class HttpStatusCode : long {
        OK = 200,
        REQUEST_TIMEOUT = 408,
        TOO_MANY_REQUESTS = 429,
        GATEWAY_TIMEOUT = 504,
    };

    // One libcurl easy handle. Not thread-safe: each request handler owns its own instance.
    class CurlEasy : public IHttpClient {
       public:
        CurlEasy();

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response get(const http::model::Request& req, const http::model::CancelCheck& cancelled) override;
        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void set_timeouts(long total_ms, long connect_ms);
        void enable_keepalive();
        void enable_compression();

        static http::http_error::UpstreamErrorKind classify(CURLcode rc);

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw(const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(std::string& body, const http::model::CancelCheck* cancelled);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static int progress_cb(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);
        static bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property);
        static bool extract_header_value(const char* buffer, size_t bytes, const char* key, long& out_property);

        long last_rl_remaining_ = -1;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };

    // Keep-alive and compressed transfers; one fresh handle per call of the returned factory.
    HttpClientFactory curl_client_factory();
}  // namespace http::client

#endif
