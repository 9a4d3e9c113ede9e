#ifndef REQ_PROBE_BODY_ENCODER_HPP
#define REQ_PROBE_BODY_ENCODER_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "../../probe/outcome/outcome.hpp"
#include "../model/model.hpp"

namespace http::request {
    // "a=1&b=2" -> {a:1, b:2}. Pairs are split on the first '=' only; pairs without one are
    // dropped and a repeated key keeps its last value.
    [[nodiscard]] std::map<std::string, std::string> parse_form_data(std::string_view data);

    // k=v&k2=v2 with both sides escaped by the transport.
    [[nodiscard]] std::string encode_form(const std::map<std::string, std::string>& fields);

    [[nodiscard]] http::model::RequestSpec build_request_spec(const std::string& url, const std::optional<std::string>& method_flag,
                                                              const std::optional<std::string>& data, const std::optional<std::string>& json);

    // Produces the transport request, or INVALID_JSON_PAYLOAD when --json is not well-formed.
    [[nodiscard]] probe::StageResult<http::model::Request> encode_body(const http::model::RequestSpec& spec);
}  // namespace http::request

#endif
