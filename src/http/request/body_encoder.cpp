#include "body_encoder.hpp"

#include <map>
#include <string>
#include <variant>

#include "../../utils/constants.hpp"
#include "../../utils/json_utils.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../client/curl_easy.hpp"
#include "method_resolver.hpp"

namespace http::request {
    std::map<std::string, std::string> parse_form_data(std::string_view data) {
        std::map<std::string, std::string> fields;

        for (const auto& pair : string_utils::split(data, '&')) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            fields.insert_or_assign(pair.substr(0, eq), pair.substr(eq + 1));
        }

        return fields;
    }

    std::string encode_form(const std::map<std::string, std::string>& fields) {
        std::string out;
        for (const auto& [key, value] : fields) {
            if (!out.empty()) {
                out += '&';
            }
            out += http::client::CurlEasy::escape(key);
            out += '=';
            out += http::client::CurlEasy::escape(value);
        }
        return out;
    }

    http::model::RequestSpec build_request_spec(const std::string& url, const std::optional<std::string>& method_flag,
                                                const std::optional<std::string>& data, const std::optional<std::string>& json) {
        http::model::RequestSpec spec;
        spec.url_ = url;
        spec.method_ = resolve_method(method_flag, json.has_value());

        if (json) {
            spec.body_ = http::model::RawJsonBody{.json_ = *json};
        } else if (spec.is_post() && data) {
            spec.body_ = http::model::FormBody{.raw_ = *data, .fields_ = parse_form_data(*data)};
        }

        return spec;
    }

    probe::StageResult<http::model::Request> encode_body(const http::model::RequestSpec& spec) {
        http::model::Request req;
        req.url_ = spec.url_;
        req.method_ = spec.method_;

        if (const auto* json = std::get_if<http::model::RawJsonBody>(&spec.body_)) {
            if (!json_utils::is_valid_json(json->json_)) {
                return probe::Failure{.kind_ = probe::ErrorKind::INVALID_JSON_PAYLOAD, .message_ = "Invalid JSON format: " + json->json_};
            }
            // Sent exactly as typed, never re-serialized.
            req.body_ = json->json_;
            req.headers_.emplace_back(constants::CONTENT_TYPE_JSON);
            logging::get().debug("body: raw json, {} bytes", req.body_.size());
        } else if (const auto* form = std::get_if<http::model::FormBody>(&spec.body_)) {
            req.body_ = encode_form(form->fields_);
            logging::get().debug("body: form, {} fields, {} bytes", form->fields_.size(), req.body_.size());
        } else {
            logging::get().debug("body: none");
        }

        return req;
    }
}  // namespace http::request
