#include "data_api.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../client/curl_easy.hpp"
#include "../error/http_error.hpp"

using namespace std::chrono;

namespace http::data_api {
    namespace {
        constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
        constexpr long HTTP_CLIENT_ERROR_LOWER_BOUNDARY = 400;
        constexpr long HTTP_SERVER_ERROR_LOWER_BOUNDARY = 500;

        http::http_error::UpstreamErrorKind kind_for_status(long status) {
            using http::client::HttpStatusCode;
            using http::http_error::UpstreamErrorKind;

            if (status == static_cast<long>(HttpStatusCode::REQUEST_TIMEOUT) || status == static_cast<long>(HttpStatusCode::GATEWAY_TIMEOUT)) {
                return UpstreamErrorKind::TIMEOUT;
            }
            if (status == static_cast<long>(HttpStatusCode::TOO_MANY_REQUESTS) || status >= HTTP_SERVER_ERROR_LOWER_BOUNDARY) {
                return UpstreamErrorKind::UNAVAILABLE;
            }
            if (status >= HTTP_CLIENT_ERROR_LOWER_BOUNDARY) {
                return UpstreamErrorKind::REJECTED;
            }
            return UpstreamErrorKind::UNAVAILABLE;
        }
    }  // namespace

    const ProviderValue* find_field(const ProviderRecord& record, const std::string& field) {
        for (const auto& [key, value] : record) {
            if (key == field) {
                return &value;
            }
        }
        return nullptr;
    }

    DataAPI::DataAPI(const IDataProvider* p, std::unique_ptr<http::client::IHttpClient> client, http::client::RetryPolicy policy,
                     http::client::Sleeper sleep)
        : provider_(p), http_(std::move(client)), policy_(policy), sleep_(std::move(sleep)) {
        if (provider_ == nullptr || http_ == nullptr) {
            throw std::invalid_argument("DataAPI requires a provider and an HTTP client");
        }
        if (!sleep_) {
            sleep_ = [](milliseconds d) { std::this_thread::sleep_for(d); };
        }
    }

    ProviderResponse DataAPI::attempt(const http::model::Request& req, const http::model::CancelCheck& cancelled) {
        const http::model::Response resp = http_->get(req, cancelled);

        if (resp.rate_limit_remaining_ >= 0) {
            logging::get(logging::UPSTREAM)->debug("{} rate limit remaining: {}", provider_->name(), resp.rate_limit_remaining_);
        }

        if (resp.status_ < static_cast<long>(http::client::HttpStatusCode::OK) || resp.status_ >= HTTP_SUCCESS_UPPER_BOUNDARY) {
            throw http::http_error::UpstreamError(kind_for_status(resp.status_), resp.status_, string_utils::redact_query_param(req.url_, "token"),
                                                  resp.body_.substr(0, constants::ERROR_BODY_PREVIEW_LENGTH),
                                                  "Provider returned HTTP " + std::to_string(resp.status_));
        }

        return provider_->parse_response(resp);
    }

    ProviderResponse DataAPI::call(const http::model::Request& req, const http::model::CancelCheck& cancelled) {
        auto log = logging::get(logging::UPSTREAM);
        milliseconds delay = policy_.base_delay_;
        last_attempts_ = 0;

        for (size_t attempt_no = 1;; ++attempt_no) {
            if (cancelled && cancelled()) {
                throw http::http_error::UpstreamError(http::http_error::UpstreamErrorKind::CANCELLED, 0, string_utils::redact_query_param(req.url_, "token"),
                                                      "", "Caller went away before the provider call");
            }

            last_attempts_ = attempt_no;

            try {
                return attempt(req, cancelled);
            } catch (const http::http_error::UpstreamError& e) {
                if (!policy_.should_retry(e.kind_, attempt_no, req.idempotent_)) {
                    log->warn("{} upstream call failed after {} attempt(s): {} [{}]", provider_->name(), attempt_no, e.what(), e.url_);
                    throw;
                }

                log->info("{} upstream {} on attempt {}/{}, backing off: {}", provider_->name(), http::http_error::to_string(e.kind_), attempt_no,
                          policy_.max_attempts(), e.url_);

                delay = policy_.backoff(delay, sleep_);
            }
        }
    }

}  // namespace http::data_api
