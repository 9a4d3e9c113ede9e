#ifndef REQ_PROBE_FAKE_HTTP_CLIENT_HPP
#define REQ_PROBE_FAKE_HTTP_CLIENT_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../src/http/client/interface.hpp"
#include "../src/http/error/http_error.hpp"
#include "../src/http/model/model.hpp"

namespace test_support {
    // What the fake transport saw; shared so it outlives the client the pipeline destroys.
    struct ClientLog {
        std::vector<http::model::Request> requests_;
        size_t clients_created_ = 0;
    };

    class FakeHttpClient : public http::client::IHttpClient {
       public:
        FakeHttpClient(std::shared_ptr<ClientLog> log, http::model::Response canned, std::optional<http::error::TransportErrorKind> failure)
            : log_(std::move(log)), canned_(std::move(canned)), failure_(failure) {}

        http::model::Response send(const http::model::Request& req) override {
            log_->requests_.push_back(req);
            if (failure_) {
                throw http::error::TransportError(*failure_, 0, "simulated transport failure");
            }
            return canned_;
        }

       private:
        std::shared_ptr<ClientLog> log_;
        http::model::Response canned_;
        std::optional<http::error::TransportErrorKind> failure_;
    };

    inline http::model::Response make_response(long status, std::string body) {
        http::model::Response r;
        r.status_ = status;
        r.body_ = std::move(body);
        r.effective_url_ = "https://example.com/";
        return r;
    }
}  // namespace test_support

#endif
