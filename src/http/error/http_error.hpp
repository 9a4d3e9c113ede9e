#ifndef REQ_PROBE_HTTP_ERROR_HPP
#define REQ_PROBE_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::error {
    const long ERROR_MESSAGE_LENGTH = 512;

    struct HttpError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpError(long s, std::string u, std::string preview, const std::string &msg);
    };

    enum class TransportErrorKind {
        CONNECT,  // resolve, connect or timeout
        OTHER,
    };

    struct TransportError : public std::runtime_error {
        TransportErrorKind kind_;
        int curl_code_;
        explicit TransportError(TransportErrorKind kind, int curl_code, const std::string &msg);

        [[nodiscard]] bool is_connect() const { return kind_ == TransportErrorKind::CONNECT; }
    };
}  // namespace http::error

#endif
