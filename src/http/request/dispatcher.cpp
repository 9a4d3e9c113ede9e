#include "dispatcher.hpp"

#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../error/http_error.hpp"

namespace http::request {
    bool is_success(long status) { return status >= constants::HTTP_SUCCESS_LOWER_BOUNDARY && status < constants::HTTP_SUCCESS_UPPER_BOUNDARY; }

    void require_success(const http::model::Response& resp) {
        if (!is_success(resp.status_)) {
            throw http::error::HttpError(resp.status_, resp.effective_url_, resp.body_.substr(0, http::error::ERROR_MESSAGE_LENGTH),
                                         "Request failed with status code: " + std::to_string(resp.status_));
        }
    }

    probe::StageResult<http::model::Response> dispatch(http::client::IHttpClient& client, const http::model::Request& req) {
        http::model::Response resp;

        try {
            resp = client.send(req);
        } catch (const http::error::TransportError& e) {
            logging::get().debug("transport error (curl code {}): {}", e.curl_code_, e.what());
            if (e.is_connect()) {
                return probe::Failure{.kind_ = probe::ErrorKind::TRANSPORT_CONNECT, .message_ = CONNECT_ERROR_MESSAGE};
            }
            return probe::Failure{.kind_ = probe::ErrorKind::TRANSPORT_OTHER, .message_ = UNEXPECTED_ERROR_MESSAGE};
        }

        logging::get().debug("response: status {} from {} ({} bytes, content-type '{}')", resp.status_, resp.effective_url_, resp.body_.size(),
                             resp.content_type_);

        try {
            require_success(resp);
        } catch (const http::error::HttpError& e) {
            logging::get().debug("status error for {}: {} (body preview: {})", e.url_, e.what(), e.body_preview_);
            return probe::Failure{.kind_ = probe::ErrorKind::HTTP_STATUS, .message_ = e.what(), .status_ = e.status_};
        }

        return resp;
    }
}  // namespace http::request
