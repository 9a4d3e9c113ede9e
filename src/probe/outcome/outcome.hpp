#ifndef REQ_PROBE_OUTCOME_HPP
#define REQ_PROBE_OUTCOME_HPP

#include <optional>
#include <string>
#include <variant>

#include "../../http/model/model.hpp"
#include "../../http/url/url_validator.hpp"

namespace probe {
    enum class ErrorKind {
        INVALID_PROTOCOL,
        URL_PARSE,
        TRANSPORT_CONNECT,
        TRANSPORT_OTHER,
        INVALID_JSON_PAYLOAD,  // the only fatal kind
        HTTP_STATUS,
    };

    struct Failure {
        ErrorKind kind_;
        std::string message_;
        std::optional<http::url::UrlErrorKind> url_error_;
        std::optional<long> status_;

        [[nodiscard]] bool is_fatal() const { return kind_ == ErrorKind::INVALID_JSON_PAYLOAD; }
    };

    // Each pipeline stage hands the next one its value, or stops the run with a Failure.
    template <typename T>
    using StageResult = std::variant<T, Failure>;

    template <typename T>
    bool failed(const StageResult<T>& r) {
        return std::holds_alternative<Failure>(r);
    }

    enum class BodyKind { NONE, JSON, TEXT };

    struct OutcomeReport {
        std::string url_;
        std::string method_;
        std::optional<std::string> echoed_payload_;  // JSON or form data, POST only
        std::optional<long> status_;
        BodyKind body_kind_ = BodyKind::NONE;
        std::string rendered_body_;
        std::optional<Failure> error_;

        [[nodiscard]] bool ok() const { return !error_.has_value(); }
    };

    const char* to_string(ErrorKind kind);
}  // namespace probe

#endif
