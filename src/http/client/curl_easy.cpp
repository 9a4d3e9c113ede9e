#include "curl_easy.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr const char* USER_AGENT = "req_probe/1.0";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long POST = 0L;
        static constexpr long UPLOAD = 0L;
        static constexpr long NO_BODY = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr long HTTP_GET = 1L;
    };

    struct MethodNames {
        static constexpr const char* HEAD = "HEAD";
    };

    struct HeaderKeys {
        static constexpr const char* CONTENT_TYPE = "content-type:";
    };

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
    }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        // Clear per-request scratch
        last_content_type_.clear();
        error_buf_[0] = '\0';
        body.clear();

        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);

        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_UPLOAD, CurlDefaults::UPLOAD);
        setopt(CURLOPT_NOBODY, CurlDefaults::NO_BODY);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);  // clears any previous custom verb
    }

    void CurlEasy::set_method(const http::model::Request& req) {
        if (req.method_ == constants::DEFAULT_METHOD) {
            return;
        }

        if (req.method_ == constants::POST) {
            setopt(CURLOPT_POST, 1L);
        } else if (req.method_ == MethodNames::HEAD) {
            // A HEAD reply advertises a length but carries no body.
            setopt(CURLOPT_NOBODY, 1L);
            return;
        } else {
            setopt(CURLOPT_CUSTOMREQUEST, req.method_.c_str());
        }

        // Size first: COPYPOSTFIELDS copies exactly POSTFIELDSIZE bytes.
        if (req.method_ == constants::POST || !req.body_.empty()) {
            setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body_.size()));
            setopt(CURLOPT_COPYPOSTFIELDS, req.body_.c_str());
        }
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        CurlEasy::extract_header_value(buffer, bytes, HeaderKeys::CONTENT_TYPE, self->last_content_type_);

        return bytes;
    }

    http::model::Response CurlEasy::send(const http::model::Request& req) {
        set_url(req.url_);
        set_headers(req.headers_);

        std::string body;
        prepare_for_new_request(body);
        set_method(req);

        logging::get().debug("curl: {} {} ({} body bytes, {} headers)", req.method_, req.url_, req.body_.size(), req.headers_.size());

        perform_throw();
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);

    http::error::TransportErrorKind CurlEasy::classify(CURLcode rc) {
        switch (rc) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_PEER_FAILED_VERIFICATION:
                return http::error::TransportErrorKind::CONNECT;
            default:
                return http::error::TransportErrorKind::OTHER;
        }
    }

    void CurlEasy::perform_throw() {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http::error::TransportError(classify(rc), static_cast<int>(rc), err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.content_type_ = std::move(last_content_type_);
        return r;
    }

    std::string CurlEasy::escape(std::string_view raw) {
        std::unique_ptr<char, decltype(&curl_free)> escaped(curl_easy_escape(nullptr, raw.data(), static_cast<int>(raw.size())), &curl_free);

        if (escaped == nullptr) {
            throw std::runtime_error("curl_easy_escape failed");
        }

        return {escaped.get()};
    }

    bool CurlEasy::extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property) {
        size_t key_len = std::char_traits<char>::length(key);
        if (bytes < key_len) {
            return false;
        }
        for (size_t i = 0; i < key_len; ++i) {
            const char a = buffer[i];
            const char b = key[i];
            if ((a | constants::ASCII_LOWERCASE_BIT) != (b | constants::ASCII_LOWERCASE_BIT)) {
                return false;
            }  // ASCII-only fold
        }
        const char* start = buffer + key_len;
        const char* end = buffer + bytes;
        while (start < end && (*start == ' ' || *start == '\t')) {
            ++start;
        }
        while (end > start && (end[-1] == '\r' || end[-1] == '\n' || end[-1] == ' ' || end[-1] == '\t')) {
            --end;
        }
        out_property.assign(start, end);
        return true;
    }

}  // namespace http::client
