#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

#include "../../utils/logging.hpp"

namespace http::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
        }
        logging::get().debug("libcurl initialized ({})", version());
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

    std::string CurlGlobal::version() {
        const char* v = curl_version();
        return v != nullptr ? std::string(v) : std::string{};
    }

}  // namespace http::client
