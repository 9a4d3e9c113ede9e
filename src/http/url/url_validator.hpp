#ifndef REQ_PROBE_URL_VALIDATOR_HPP
#define REQ_PROBE_URL_VALIDATOR_HPP

#include <optional>
#include <string>
#include <string_view>

namespace http::url {
    enum class UrlErrorKind {
        MISSING_PROTOCOL,  // no http:// or https:// prefix
        RELATIVE_WITHOUT_BASE,
        INVALID_PORT,
        INVALID_IPV4,
        INVALID_IPV6,
        OTHER,
    };

    struct UrlError {
        UrlErrorKind kind_;
        std::string detail_;  // parser wording, for the debug log only
    };

    struct ParsedUrl {
        std::string scheme_;
        std::string host_;
        std::string port_;
        std::string path_;
    };

    [[nodiscard]] bool has_http_protocol(std::string_view url);

    // Checks the scheme prefix first and only then runs the full parse; no I/O either way.
    [[nodiscard]] std::optional<UrlError> validate_url(const std::string& url);

    // Full parse through the libcurl URL API. Does not check the scheme prefix.
    [[nodiscard]] std::optional<UrlError> parse_url(const std::string& url, ParsedUrl& out);

    [[nodiscard]] bool looks_like_ipv4(std::string_view host);
    [[nodiscard]] bool is_valid_ipv4(std::string_view host);

    [[nodiscard]] const char* describe(UrlErrorKind kind);
}  // namespace http::url

#endif
