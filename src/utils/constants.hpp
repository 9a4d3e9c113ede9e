#ifndef REQ_PROBE_CONSTANTS_HPP
#define REQ_PROBE_CONSTANTS_HPP

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr const char* HTTP_PREFIX = "http://";
    inline constexpr const char* HTTPS_PREFIX = "https://";
    inline constexpr const char* DEFAULT_METHOD = "GET";
    inline constexpr const char* POST = "POST";
    inline constexpr const char* CONTENT_TYPE_JSON = "Content-Type: application/json";
    inline constexpr long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
    inline constexpr int JSON_INDENT = 2;
    inline constexpr int IPV4_OCTET_MAX = 255;
    inline constexpr int IPV4_PARTS = 4;
    inline constexpr const char* LOGGER_NAME = "req_probe";
    inline constexpr int EXIT_USAGE = 2;
}  // namespace constants

#endif
