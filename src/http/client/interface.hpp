#ifndef REQ_PROBE_CLIENT_INTERFACE_HPP
#define REQ_PROBE_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Throws http::error::TransportError when no response could be obtained.
        virtual http::model::Response send(const http::model::Request& req) = 0;
    };
}  // namespace http::client

#endif
