#ifndef REQ_PROBE_DISPATCHER_HPP
#define REQ_PROBE_DISPATCHER_HPP

#include "../../probe/outcome/outcome.hpp"
#include "../client/interface.hpp"
#include "../model/model.hpp"

namespace http::request {
    inline constexpr const char* CONNECT_ERROR_MESSAGE =
        "Unable to connect to the server. Perhaps the network is offline or the server hostname cannot be resolved.";
    inline constexpr const char* UNEXPECTED_ERROR_MESSAGE = "An unexpected error occurred";

    [[nodiscard]] bool is_success(long status);

    // Throws http::error::HttpError for anything outside 2xx.
    void require_success(const http::model::Response& resp);

    // Sends exactly one request. Transport failures come back as TRANSPORT_CONNECT or
    // TRANSPORT_OTHER; a non-2xx answer as HTTP_STATUS.
    [[nodiscard]] probe::StageResult<http::model::Response> dispatch(http::client::IHttpClient& client, const http::model::Request& req);
}  // namespace http::request

#endif
