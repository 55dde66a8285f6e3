#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>

#include "../../utils/logging.hpp"

namespace http::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
        }

        version_ = curl_version();
        logging::get(logging::UPSTREAM)->debug("libcurl initialized ({})", version_);
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace http::client
