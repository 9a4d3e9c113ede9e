#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "../src/http/client/curl_easy.hpp"
#include "../src/http/error/http_error.hpp"
#include "../src/http/request/dispatcher.hpp"
#include "fake_http_client.hpp"

using http::error::TransportErrorKind;
using test_support::ClientLog;
using test_support::FakeHttpClient;
using test_support::make_response;

namespace {
    http::model::Request get_request() {
        http::model::Request req;
        req.url_ = "https://example.com";
        return req;
    }
}  // namespace

TEST(dispatcher, success_passes_response_through) {
    auto log = std::make_shared<ClientLog>();
    FakeHttpClient client(log, make_response(200, "hello"), std::nullopt);

    auto result = http::request::dispatch(client, get_request());

    ASSERT_FALSE(probe::failed(result));
    ASSERT_EQ("hello", std::get<http::model::Response>(result).body_);
    ASSERT_EQ(1U, log->requests_.size());
}

TEST(dispatcher, connect_failure) {
    auto log = std::make_shared<ClientLog>();
    FakeHttpClient client(log, {}, TransportErrorKind::CONNECT);

    auto result = http::request::dispatch(client, get_request());

    ASSERT_TRUE(probe::failed(result));
    const auto& failure = std::get<probe::Failure>(result);
    ASSERT_EQ(probe::ErrorKind::TRANSPORT_CONNECT, failure.kind_);
    ASSERT_EQ(http::request::CONNECT_ERROR_MESSAGE, failure.message_);
    ASSERT_FALSE(failure.status_.has_value());
}

TEST(dispatcher, other_transport_failure) {
    auto log = std::make_shared<ClientLog>();
    FakeHttpClient client(log, {}, TransportErrorKind::OTHER);

    auto result = http::request::dispatch(client, get_request());

    ASSERT_TRUE(probe::failed(result));
    ASSERT_EQ(probe::ErrorKind::TRANSPORT_OTHER, std::get<probe::Failure>(result).kind_);
    ASSERT_EQ("An unexpected error occurred", std::get<probe::Failure>(result).message_);
}

TEST(dispatcher, non_success_status) {
    auto log = std::make_shared<ClientLog>();
    FakeHttpClient client(log, make_response(404, "not here"), std::nullopt);

    auto result = http::request::dispatch(client, get_request());

    ASSERT_TRUE(probe::failed(result));
    const auto& failure = std::get<probe::Failure>(result);
    ASSERT_EQ(probe::ErrorKind::HTTP_STATUS, failure.kind_);
    ASSERT_EQ(404, *failure.status_);
    ASSERT_EQ("Request failed with status code: 404", failure.message_);
}

TEST(dispatcher, success_boundaries) {
    ASSERT_FALSE(http::request::is_success(199));
    ASSERT_TRUE(http::request::is_success(200));
    ASSERT_TRUE(http::request::is_success(299));
    ASSERT_FALSE(http::request::is_success(300));
}

TEST(dispatcher, require_success_throws_http_error) {
    auto resp = make_response(503, std::string(2000, 'x'));
    try {
        http::request::require_success(resp);
        FAIL() << "expected HttpError";
    } catch (const http::error::HttpError& e) {
        ASSERT_EQ(503, e.status_);
        ASSERT_EQ(static_cast<size_t>(http::error::ERROR_MESSAGE_LENGTH), e.body_preview_.size());
    }
}

TEST(curl_easy, classifies_connect_errors) {
    ASSERT_EQ(TransportErrorKind::CONNECT, http::client::CurlEasy::classify(CURLE_COULDNT_RESOLVE_HOST));
    ASSERT_EQ(TransportErrorKind::CONNECT, http::client::CurlEasy::classify(CURLE_COULDNT_CONNECT));
    ASSERT_EQ(TransportErrorKind::CONNECT, http::client::CurlEasy::classify(CURLE_OPERATION_TIMEDOUT));
    ASSERT_EQ(TransportErrorKind::CONNECT, http::client::CurlEasy::classify(CURLE_SSL_CONNECT_ERROR));
    ASSERT_EQ(TransportErrorKind::CONNECT, http::client::CurlEasy::classify(CURLE_PEER_FAILED_VERIFICATION));
    ASSERT_EQ(TransportErrorKind::OTHER, http::client::CurlEasy::classify(CURLE_RECV_ERROR));
}

TEST(curl_easy, extracts_header_values) {
    std::string value;
    const std::string line = "Content-Type:  application/json; charset=utf-8\r\n";
    ASSERT_TRUE(http::client::CurlEasy::extract_header_value(line.data(), line.size(), "content-type:", value));
    ASSERT_EQ("application/json; charset=utf-8", value);

    const std::string other = "Etag: abc\r\n";
    ASSERT_FALSE(http::client::CurlEasy::extract_header_value(other.data(), other.size(), "content-type:", value));
}
