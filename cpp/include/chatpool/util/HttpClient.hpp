#pragma once

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace chatpool::util {

// Non-success status from a streamed request; carries a snippet of the error body.
class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(int status, const std::string& message)
        : std::runtime_error(message)
        , status_(status) {}

    [[nodiscard]] int status() const noexcept { return status_; }

private:
    int status_;
};

class HttpClient {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
    using BodyHandler = std::function<void(std::string_view)>;

    struct Header {
        std::string name;
        std::string value;
    };

    // Each call runs on its own io_context; timeout bounds connect, TLS handshake,
    // write and read together, and expiry fails the call with beast::error::timeout.
    HttpClient();

    HttpResponse fetch(const std::string& method,
                       const std::string& url,
                       const std::vector<Header>& headers,
                       const std::string& body,
                       std::chrono::seconds timeout,
                       bool followRedirects = false,
                       unsigned int maxRedirects = 5,
                       std::string* effectiveUrl = nullptr);

    // Reads the body incrementally and hands each received piece to onBody.
    // A status other than 200 throws HttpStatusError after draining part of the error body.
    void stream(const std::string& method,
                const std::string& url,
                const std::vector<Header>& headers,
                const std::string& body,
                std::chrono::seconds timeout,
                const BodyHandler& onBody);

private:
    HttpRequest buildRequest(const std::string& method,
                             const std::string& url,
                             const std::vector<Header>& headers,
                             const std::string& body) const;

    boost::asio::ssl::context sslContext_;
};

} // namespace chatpool::util
