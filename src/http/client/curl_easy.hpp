#ifndef REQ_PROBE_CURL_EASY_HPP
#define REQ_PROBE_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "../error/http_error.hpp"
#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    class CurlEasy : public IHttpClient {
       public:
        CurlEasy();

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response send(const http::model::Request& req) override;
        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);

        // application/x-www-form-urlencoded escaping of a single key or value.
        static std::string escape(std::string_view raw);
        static http::error::TransportErrorKind classify(CURLcode rc);
        static bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property);

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void perform_throw();
        void set_method(const http::model::Request& req);
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(std::string& body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        std::string last_content_type_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
