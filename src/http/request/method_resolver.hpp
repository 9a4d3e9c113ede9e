#ifndef REQ_PROBE_METHOD_RESOLVER_HPP
#define REQ_PROBE_METHOD_RESOLVER_HPP

#include <optional>
#include <string>

namespace http::request {
    // A JSON payload always means POST; otherwise the flag upper-cased, GET when absent.
    [[nodiscard]] std::string resolve_method(const std::optional<std::string>& method_flag, bool has_json);
}  // namespace http::request

#endif
