#include "method_resolver.hpp"

#include <optional>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace http::request {
    std::string resolve_method(const std::optional<std::string>& method_flag, bool has_json) {
        if (has_json) {
            return constants::POST;
        }

        if (!method_flag) {
            return constants::DEFAULT_METHOD;
        }

        std::string method = string_utils::to_upper(string_utils::trim(*method_flag));
        return method.empty() ? std::string(constants::DEFAULT_METHOD) : method;
    }
}  // namespace http::request
