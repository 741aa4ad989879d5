#include "chatpool/util/HttpClient.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace {

using namespace std::chrono_literals;
using chatpool::util::HttpClient;
using chatpool::util::HttpStatusError;
using tcp = boost::asio::ip::tcp;
namespace http = boost::beast::http;

// Accepts one connection on a loopback port and hands it to the session. The socket
// stays open until the server is destroyed, so an empty session never answers.
class LocalServer {
public:
    using Session = std::function<void(tcp::socket&)>;

    explicit LocalServer(Session session = {})
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
        , port_(acceptor_.local_endpoint().port())
        , session_(std::move(session)) {
        acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            held_ = std::make_unique<tcp::socket>(std::move(socket));
            if (session_) {
                session_(*held_);
            }
        });
        thread_ = std::thread([this] { io_.run(); });
    }

    ~LocalServer() {
        io_.stop();
        thread_.join();
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port_) + target;
    }

private:
    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
    unsigned short port_;
    Session session_;
    std::unique_ptr<tcp::socket> held_;
    std::thread thread_;
};

LocalServer::Session reply(http::status status, std::string prefix) {
    return [status, prefix = std::move(prefix)](tcp::socket& socket) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> request;
        boost::system::error_code ec;
        http::read(socket, buffer, request, ec);
        if (ec) {
            return;
        }
        http::response<http::string_body> response{status, 11};
        response.body() = prefix + request.body();
        response.prepare_payload();
        http::write(socket, response, ec);
    };
}

TEST(HttpClientTest, FetchReturnsBufferedResponse) {
    LocalServer server(reply(http::status::ok, "echo:"));
    HttpClient client;
    auto response = client.fetch("POST", server.url("/v1/echo"), {{"Content-Type", "text/plain"}}, "hello", 5s);
    EXPECT_EQ(response.result_int(), 200u);
    EXPECT_EQ(response.body(), "echo:hello");
}

TEST(HttpClientTest, StreamDeliversBodyPieces) {
    LocalServer server(reply(http::status::ok, "data: "));
    HttpClient client;
    std::string received;
    client.stream("POST", server.url("/v1/stream"), {}, "chunk", 5s,
                  [&](std::string_view piece) { received.append(piece); });
    EXPECT_EQ(received, "data: chunk");
}

TEST(HttpClientTest, StreamNonOkStatusThrowsWithErrorBody) {
    LocalServer server(reply(http::status::too_many_requests, "slow down "));
    HttpClient client;
    bool called = false;
    try {
        client.stream("POST", server.url("/v1/stream"), {}, "now", 5s, [&](std::string_view) { called = true; });
        FAIL() << "expected HttpStatusError";
    } catch (const HttpStatusError& ex) {
        EXPECT_EQ(ex.status(), 429);
        EXPECT_NE(std::string(ex.what()).find("slow down now"), std::string::npos);
    }
    EXPECT_FALSE(called);
}

TEST(HttpClientTest, FetchTimesOutWhenServerNeverAnswers) {
    LocalServer server;
    HttpClient client;
    const auto started = std::chrono::steady_clock::now();
    try {
        client.fetch("POST", server.url("/api/v1/auths/signin"), {}, "{}", 1s);
        FAIL() << "expected a timeout";
    } catch (const boost::system::system_error& ex) {
        EXPECT_TRUE(ex.code() == boost::beast::error::timeout) << ex.code().message();
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_GE(elapsed, 900ms);
    EXPECT_LT(elapsed, 5s);
}

TEST(HttpClientTest, StreamTimesOutWhenServerNeverAnswers) {
    LocalServer server;
    HttpClient client;
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(client.stream("POST", server.url("/api/chat/completions"), {}, "{}", 1s, [](std::string_view) {}),
                 boost::system::system_error);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

} // namespace
