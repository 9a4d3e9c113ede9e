#include "url_validator.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"

namespace http::url {
    namespace {
        const int HEX_BASE = 16;
        const int OCTAL_BASE = 8;
        const uint64_t IPV4_MAX = 0xFFFFFFFFULL;
        const size_t MAX_PART_DIGITS = 16;  // anything longer cannot fit in 32 bits in any base

        using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

        bool is_hex_prefixed(std::string_view part) { return part.size() >= 2 && part[0] == '0' && (part[1] == 'x' || part[1] == 'X'); }

        std::optional<uint64_t> parse_ipv4_number(std::string_view part) {
            if (part.empty()) {
                return std::nullopt;
            }

            int base = constants::BASE_10;
            if (is_hex_prefixed(part)) {
                base = HEX_BASE;
                part.remove_prefix(2);
            } else if (part.size() > 1 && part[0] == '0') {
                base = OCTAL_BASE;
                part.remove_prefix(1);
            }

            if (part.empty()) {
                return 0;
            }
            if (part.size() > MAX_PART_DIGITS) {
                return std::nullopt;
            }

            uint64_t value = 0;
            for (const char c : part) {
                int digit = -1;
                if (c >= '0' && c <= '9') {
                    digit = c - '0';
                } else if (base == HEX_BASE && c >= 'a' && c <= 'f') {
                    digit = c - 'a' + constants::BASE_10;
                } else if (base == HEX_BASE && c >= 'A' && c <= 'F') {
                    digit = c - 'A' + constants::BASE_10;
                }
                if (digit < 0 || digit >= base) {
                    return std::nullopt;
                }
                value = value * static_cast<uint64_t>(base) + static_cast<uint64_t>(digit);
            }
            return value;
        }

        std::vector<std::string> host_labels(std::string_view host) {
            std::vector<std::string> labels = string_utils::split(host, '.');
            if (labels.size() > 1 && labels.back().empty()) {
                labels.pop_back();
            }
            return labels;
        }

        // Host as written: after "://", before any path, query or fragment, without userinfo or port.
        std::string raw_host(std::string_view url) {
            const auto scheme_end = url.find("://");
            if (scheme_end == std::string_view::npos) {
                return {};
            }

            std::string_view authority = url.substr(scheme_end + 3);
            authority = authority.substr(0, authority.find_first_of("/?#"));

            const auto at = authority.rfind('@');
            if (at != std::string_view::npos) {
                authority.remove_prefix(at + 1);
            }

            if (!authority.empty() && authority.front() == '[') {
                return std::string(authority.substr(0, authority.find(']') + 1));
            }

            return std::string(authority.substr(0, authority.rfind(':')));
        }

        UrlErrorKind from_curl(CURLUcode rc) {
            switch (rc) {
                case CURLUE_BAD_PORT_NUMBER:
                    return UrlErrorKind::INVALID_PORT;
                case CURLUE_BAD_IPV6:
                    return UrlErrorKind::INVALID_IPV6;
                case CURLUE_NO_SCHEME:
                case CURLUE_BAD_SCHEME:
                case CURLUE_UNSUPPORTED_SCHEME:
                    return UrlErrorKind::RELATIVE_WITHOUT_BASE;
                default:
                    return UrlErrorKind::OTHER;
            }
        }

        std::string get_part(CURLU* handle, CURLUPart what) {
            char* part = nullptr;
            if (curl_url_get(handle, what, &part, 0) != CURLUE_OK || part == nullptr) {
                return {};
            }
            std::string out(part);
            curl_free(part);
            return out;
        }
    }  // namespace

    bool has_http_protocol(std::string_view url) { return string_utils::starts_with_any(url, {constants::HTTP_PREFIX, constants::HTTPS_PREFIX}); }

    // A host is an IPv4 literal when its last label is a number.
    bool looks_like_ipv4(std::string_view host) {
        const auto labels = host_labels(host);
        if (labels.empty() || labels.back().empty()) {
            return false;
        }

        std::string_view last = labels.back();
        if (is_hex_prefixed(last)) {
            last.remove_prefix(2);
            return last.find_first_not_of("0123456789abcdefABCDEF") == std::string_view::npos;
        }
        return last.find_first_not_of("0123456789") == std::string_view::npos;
    }

    bool is_valid_ipv4(std::string_view host) {
        const auto labels = host_labels(host);
        if (labels.empty() || labels.size() > static_cast<size_t>(constants::IPV4_PARTS)) {
            return false;
        }

        std::vector<uint64_t> numbers;
        for (const auto& label : labels) {
            auto n = parse_ipv4_number(label);
            if (!n) {
                return false;
            }
            numbers.push_back(*n);
        }

        for (size_t i = 0; i + 1 < numbers.size(); ++i) {
            if (numbers[i] > static_cast<uint64_t>(constants::IPV4_OCTET_MAX)) {
                return false;
            }
        }

        // The last number fills the remaining bytes: 1.2.3 leaves two bytes, 1.2.3.4 one.
        const size_t remaining_bytes = static_cast<size_t>(constants::IPV4_PARTS) - numbers.size() + 1;
        const uint64_t limit = remaining_bytes >= 4 ? IPV4_MAX : ((1ULL << (remaining_bytes * 8)) - 1);
        return numbers.back() <= limit;
    }

    std::optional<UrlError> parse_url(const std::string& url, ParsedUrl& out) {
        const std::string host = raw_host(url);
        if (looks_like_ipv4(host) && !is_valid_ipv4(host)) {
            return UrlError{.kind_ = UrlErrorKind::INVALID_IPV4, .detail_ = "host '" + host + "' is not a valid IPv4 address"};
        }

        CurlUrlHandle handle(curl_url(), &curl_url_cleanup);
        if (handle == nullptr) {
            throw std::runtime_error("Failed to create CURLU handle");
        }

        const CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
        if (rc != CURLUE_OK) {
            return UrlError{.kind_ = from_curl(rc), .detail_ = curl_url_strerror(rc)};
        }

        out.scheme_ = get_part(handle.get(), CURLUPART_SCHEME);
        out.host_ = get_part(handle.get(), CURLUPART_HOST);
        out.port_ = get_part(handle.get(), CURLUPART_PORT);
        out.path_ = get_part(handle.get(), CURLUPART_PATH);
        return std::nullopt;
    }

    std::optional<UrlError> validate_url(const std::string& url) {
        if (!has_http_protocol(url)) {
            return UrlError{.kind_ = UrlErrorKind::MISSING_PROTOCOL, .detail_ = "expected an http:// or https:// prefix"};
        }

        ParsedUrl parsed;
        auto error = parse_url(url, parsed);
        if (error) {
            return error;
        }

        logging::get().debug("validated url: scheme={} host={} port={} path={}", parsed.scheme_, parsed.host_, parsed.port_, parsed.path_);
        return std::nullopt;
    }

    const char* describe(UrlErrorKind kind) {
        switch (kind) {
            case UrlErrorKind::MISSING_PROTOCOL:
            case UrlErrorKind::RELATIVE_WITHOUT_BASE:
                return "The URL does not have a valid base protocol.";
            case UrlErrorKind::INVALID_PORT:
                return "The URL contains an invalid port number.";
            case UrlErrorKind::INVALID_IPV4:
                return "The URL contains an invalid IPv4 address.";
            case UrlErrorKind::INVALID_IPV6:
                return "The URL contains an invalid IPv6 address.";
            case UrlErrorKind::OTHER:
                break;
        }
        return "Some error occurred while parsing the URL.";
    }
}  // namespace http::url
