#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::error {
    HttpError::HttpError(long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}

    TransportError::TransportError(TransportErrorKind kind, int curl_code, const std::string &msg)
        : std::runtime_error(msg), kind_(kind), curl_code_(curl_code) {}
};  // namespace http::error
