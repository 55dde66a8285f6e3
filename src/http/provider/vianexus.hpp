#ifndef NEXUS_BRIDGE_VIANEXUS_HPP
#define NEXUS_BRIDGE_VIANEXUS_HPP

#include <string>

#include "../api/data_api.hpp"
#include "../model/model.hpp"

namespace http::provider {
    // Dataset-style REST API: GET {base}/data/{namespace}/{dataset}/{symbols}?token=...&last=...
    class VianexusProvider : public http::data_api::IDataProvider {
       public:
        VianexusProvider(std::string base_url, std::string api_key);
        [[nodiscard]] http::model::Request build_request(const http::data_api::ProviderQuery& q) const override;
        [[nodiscard]] http::data_api::ProviderResponse parse_response(const http::model::Response& resp) const override;
        [[nodiscard]] std::string name() const override { return "vianexus"; }

       private:
        std::string base_url_;
        std::string api_key_;
    };
}  // namespace http::provider

#endif
