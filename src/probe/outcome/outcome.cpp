#include "outcome.hpp"

namespace probe {
    const char* to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::INVALID_PROTOCOL:
                return "invalid_protocol";
            case ErrorKind::URL_PARSE:
                return "url_parse";
            case ErrorKind::TRANSPORT_CONNECT:
                return "transport_connect";
            case ErrorKind::TRANSPORT_OTHER:
                return "transport_other";
            case ErrorKind::INVALID_JSON_PAYLOAD:
                return "invalid_json_payload";
            case ErrorKind::HTTP_STATUS:
                return "http_status";
        }
        return "unknown";
    }
}  // namespace probe
