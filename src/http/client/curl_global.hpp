#ifndef NEXUS_BRIDGE_CURL_GLOBAL_HPP
#define NEXUS_BRIDGE_CURL_GLOBAL_HPP

#include <string>

namespace http::client {

    // Owns curl_global_init/cleanup. Construct exactly once in main() before any worker thread starts.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] const std::string& version() const { return version_; }

       private:
        std::string version_;
    };

}  // namespace http::client

#endif
