#ifndef REQ_PROBE_CURL_GLOBAL_HPP
#define REQ_PROBE_CURL_GLOBAL_HPP

#include <string>

namespace http::client {

    // Scoped curl_global_init / curl_global_cleanup. Construct once, before any CurlEasy.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] static std::string version();
    };

}  // namespace http::client

#endif
