#include "chatpool/util/HttpClient.hpp"
#include "chatpool/util/Logging.hpp"
#include "chatpool/util/Url.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <chrono>
#include <array>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace chatpool::util {
namespace {
constexpr unsigned kHttpVersion = 11;
constexpr std::uint64_t kMaxBufferedBody = 32ull * 1024 * 1024;
constexpr std::size_t kMaxErrorSnippet = 2048;

namespace http = boost::beast::http;

bool isRedirect(http::status status) {
    switch (status) {
    case http::status::moved_permanently:
    case http::status::found:
    case http::status::see_other:
    case http::status::temporary_redirect:
    case http::status::permanent_redirect:
        return true;
    default:
        return false;
    }
}

std::string combineLocation(const ParsedUrl& base, const std::string& location) {
    if (location.empty()) {
        return base.scheme + "://" + authorityFrom(base) + base.target;
    }
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    std::string prefix = base.scheme + "://" + authorityFrom(base);
    if (location.front() == '/') {
        return prefix + location;
    }
    auto slashPos = base.target.find_last_of('/');
    std::string basePath = slashPos == std::string::npos ? "/" : base.target.substr(0, slashPos + 1);
    return prefix + basePath + location;
}

http::verb toVerb(const std::string& method) {
    std::string upper;
    upper.reserve(method.size());
    std::transform(method.begin(), method.end(), std::back_inserter(upper), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "GET") return http::verb::get;
    if (upper == "POST") return http::verb::post;
    if (upper == "PUT") return http::verb::put;
    if (upper == "DELETE") return http::verb::delete_;
    if (upper == "PATCH") return http::verb::patch;
    if (upper == "HEAD") return http::verb::head;
    if (upper == "OPTIONS") return http::verb::options;
    throw std::invalid_argument("Unsupported HTTP method: " + method);
}

void throwOnError(const boost::system::error_code& ec) {
    if (ec) {
        throw boost::system::system_error(ec);
    }
}

// One request/response exchange on a private io_context. Every step is an asynchronous
// operation run to completion here, so the stream expiry turns a silent peer into
// beast::error::timeout instead of a blocked thread.
class Exchange {
public:
    explicit Exchange(std::chrono::seconds timeout)
        : deadline_(std::chrono::steady_clock::now() + timeout) {}

    boost::asio::io_context& context() noexcept { return ioc_; }

    template <class Stream, class Initiation>
    boost::system::error_code run(Stream& stream, Initiation&& initiate) {
        boost::beast::get_lowest_layer(stream).expires_at(deadline_);
        boost::system::error_code result = boost::asio::error::would_block;
        initiate([&result](const boost::system::error_code& ec, auto&&...) { result = ec; });
        ioc_.restart();
        ioc_.run();
        return result;
    }

private:
    boost::asio::io_context ioc_;
    std::chrono::steady_clock::time_point deadline_;
};

// Connects (TLS when the scheme asks for it), hands the stream to the handler and
// closes the connection afterwards. The timeout bounds the whole exchange.
template <class Handler>
void withConnection(boost::asio::ssl::context& sslContext,
                    const ParsedUrl& parsed,
                    std::chrono::seconds timeout,
                    Handler&& handler) {
    Exchange exchange(timeout);
    // name lookup goes through the system resolver and its own timeouts
    boost::asio::ip::tcp::resolver resolver(exchange.context());
    auto results = resolver.resolve(parsed.host, parsed.port);

    if (parsed.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(exchange.context(), sslContext);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name");
        }
        stream.set_verify_callback(boost::asio::ssl::host_name_verification(parsed.host));
        auto& lowest = boost::beast::get_lowest_layer(stream);
        throwOnError(exchange.run(stream, [&](auto done) { lowest.async_connect(results, std::move(done)); }));
        throwOnError(exchange.run(stream, [&](auto done) {
            stream.async_handshake(boost::asio::ssl::stream_base::client, std::move(done));
        }));

        handler(exchange, stream);

        auto ec = exchange.run(stream, [&](auto done) { stream.async_shutdown(std::move(done)); });
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::ssl::error::stream_truncated) {
            log(LogLevel::debug, "TLS shutdown with " + parsed.host + " reported: " + ec.message());
        }
        return;
    }

    boost::beast::tcp_stream stream(exchange.context());
    throwOnError(exchange.run(stream, [&](auto done) { stream.async_connect(results, std::move(done)); }));

    handler(exchange, stream);

    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        log(LogLevel::debug, "TCP shutdown with " + parsed.host + " reported: " + ec.message());
    }
}

template <class Stream>
void writeRequest(Exchange& exchange, Stream& stream, HttpClient::HttpRequest& request) {
    throwOnError(exchange.run(stream, [&](auto done) { http::async_write(stream, request, std::move(done)); }));
}

template <class Stream>
HttpClient::HttpResponse readBuffered(Exchange& exchange, Stream& stream, bool headOnly) {
    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxBufferedBody);
    if (headOnly) {
        parser.skip(true);
    }
    throwOnError(exchange.run(stream, [&](auto done) { http::async_read(stream, buffer, parser, std::move(done)); }));
    return parser.release();
}

template <class Stream>
void readStreamed(Exchange& exchange, Stream& stream, const HttpClient::BodyHandler& onBody) {
    boost::beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    throwOnError(
        exchange.run(stream, [&](auto done) { http::async_read_header(stream, buffer, parser, std::move(done)); }));

    const auto status = static_cast<int>(parser.get().result_int());
    std::string errorBody;
    std::array<char, 8192> chunk{};

    while (!parser.is_done()) {
        parser.get().body().data = chunk.data();
        parser.get().body().size = chunk.size();
        auto ec = exchange.run(stream, [&](auto done) { http::async_read(stream, buffer, parser, std::move(done)); });
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        throwOnError(ec);
        const auto used = chunk.size() - parser.get().body().size;
        if (used == 0) {
            continue;
        }
        std::string_view piece(chunk.data(), used);
        if (status != 200) {
            errorBody.append(piece);
            if (errorBody.size() >= kMaxErrorSnippet) {
                break;
            }
            continue;
        }
        onBody(piece);
    }

    if (status != 200) {
        if (errorBody.size() > kMaxErrorSnippet) {
            errorBody.resize(kMaxErrorSnippet);
        }
        throw HttpStatusError(status, "HTTP " + std::to_string(status) + ": " + errorBody);
    }
}

} // namespace

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_peer);
}

HttpClient::HttpRequest HttpClient::buildRequest(const std::string& method,
                                                 const std::string& url,
                                                 const std::vector<Header>& headers,
                                                 const std::string& body) const {
    ParsedUrl parsed = parseUrl(url);
    HttpRequest request{toVerb(method), parsed.target, kHttpVersion};
    request.set(http::field::host, authorityFrom(parsed));
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);

    for (const auto& header : headers) {
        request.set(header.name, header.value);
    }

    if (!body.empty() && request.method() != http::verb::get && request.method() != http::verb::head) {
        request.body() = body;
    }
    request.prepare_payload();
    return request;
}

HttpClient::HttpResponse HttpClient::fetch(const std::string& method,
                                           const std::string& url,
                                           const std::vector<Header>& headers,
                                           const std::string& body,
                                           std::chrono::seconds timeout,
                                           bool followRedirects,
                                           unsigned int maxRedirects,
                                           std::string* effectiveUrl) {
    std::string currentUrl = url;
    std::string currentMethod = method;
    std::string currentBody = body;
    HttpResponse response;

    for (unsigned int redirect = 0; redirect <= maxRedirects; ++redirect) {
        ParsedUrl parsed = parseUrl(currentUrl);
        HttpRequest request = buildRequest(currentMethod, currentUrl, headers, currentBody);
        const bool headOnly = request.method() == http::verb::head;

        withConnection(sslContext_, parsed, timeout, [&](Exchange& exchange, auto& stream) {
            writeRequest(exchange, stream, request);
            response = readBuffered(exchange, stream, headOnly);
        });

        if (effectiveUrl) {
            *effectiveUrl = currentUrl;
        }

        if (!followRedirects || !isRedirect(response.result())) {
            return response;
        }

        auto locationIt = response.base().find(http::field::location);
        if (locationIt == response.base().end()) {
            return response;
        }

        currentUrl = combineLocation(parsed, std::string(locationIt->value()));

        if (response.result() == http::status::see_other && currentMethod != "GET" && currentMethod != "HEAD") {
            currentMethod = "GET";
            currentBody.clear();
        }
    }

    throw std::runtime_error("Maximum redirect count exceeded");
}

void HttpClient::stream(const std::string& method,
                        const std::string& url,
                        const std::vector<Header>& headers,
                        const std::string& body,
                        std::chrono::seconds timeout,
                        const BodyHandler& onBody) {
    ParsedUrl parsed = parseUrl(url);
    HttpRequest request = buildRequest(method, url, headers, body);

    withConnection(sslContext_, parsed, timeout, [&](Exchange& exchange, auto& stream) {
        writeRequest(exchange, stream, request);
        readStreamed(exchange, stream, onBody);
    });
}

} // namespace chatpool::util
