#ifndef REQ_PROBE_JSON_UTILS_HPP
#define REQ_PROBE_JSON_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace json_utils {
    // Any JSON value is accepted, scalars included.
    [[nodiscard]] bool is_valid_json(std::string_view text);

    // Re-serializes `text` with two-space indentation and object keys in byte order.
    // Returns std::nullopt when `text` is not a JSON document.
    [[nodiscard]] std::optional<std::string> to_sorted_pretty_json(std::string_view text);

    void append_escaped(std::string& out, std::string_view s);

    std::string format_double(double d);
}  // namespace json_utils

#endif
