#ifndef REQ_PROBE_MODEL_HPP
#define REQ_PROBE_MODEL_HPP

#include <map>
#include <string>
#include <variant>
#include <vector>

namespace http::model {
    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::string body_;

        std::vector<std::string> headers_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;
        std::string content_type_;
    };

    struct NoBody {};

    struct FormBody {
        std::string raw_;  // as typed on the command line, echoed on display
        std::map<std::string, std::string> fields_;
    };

    struct RawJsonBody {
        std::string json_;
    };

    using BodyMode = std::variant<NoBody, FormBody, RawJsonBody>;

    // Built once from the command line; the method is already the effective one.
    struct RequestSpec {
        std::string url_;
        std::string method_ = "GET";
        BodyMode body_ = NoBody{};

        [[nodiscard]] bool is_post() const { return method_ == "POST"; }
        [[nodiscard]] bool has_json() const { return std::holds_alternative<RawJsonBody>(body_); }
        [[nodiscard]] bool has_form() const { return std::holds_alternative<FormBody>(body_); }
    };
}  // namespace http::model

#endif
