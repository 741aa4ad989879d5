#include "chatpool/api/HttpChatBackend.hpp"

#include "chatpool/api/ChatError.hpp"
#include "chatpool/api/Payloads.hpp"
#include "chatpool/util/Crypto.hpp"
#include "chatpool/util/JsonUtil.hpp"
#include "chatpool/util/Logging.hpp"
#include "chatpool/util/TimeUtil.hpp"
#include "chatpool/util/Url.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>

#include <array>
#include <exception>
#include <stdexcept>
#include <string_view>

namespace chatpool::api {
namespace {
constexpr char kBrowserUA[] =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
constexpr std::size_t kSnippetLength = 300;

std::string snippet(const std::string& body) {
    return body.size() > kSnippetLength ? body.substr(0, kSnippetLength) + "..." : body;
}

std::string trimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string originOf(const std::string& url) {
    auto parsed = util::parseUrl(url);
    return parsed.scheme + "://" + util::authorityFrom(parsed);
}

} // namespace

HttpChatBackend::HttpChatBackend(util::HttpClient& httpClient, std::string baseUrl)
    : httpClient_(httpClient)
    , baseUrl_(trimTrailingSlash(std::move(baseUrl)))
    , origin_(originOf(baseUrl_)) {}

std::vector<util::HttpClient::Header> HttpChatBackend::authorizedHeaders(const std::string& token,
                                                                         const std::string& accept) const {
    return {
        {"Authorization", "Bearer " + token},
        {"Content-Type", "application/json; charset=UTF-8"},
        {"Accept", accept},
        {"Accept-Language", "zh-CN,zh;q=0.9,en;q=0.8"},
        {"Source", "web"},
        {"User-Agent", kBrowserUA},
        {"Origin", origin_},
        {"Referer", origin_ + "/"},
        {"X-Request-Id", util::makeUuid()},
    };
}

SigninResponse HttpChatBackend::signin(const SigninRequest& request, std::chrono::seconds timeout) {
    std::vector<util::HttpClient::Header> headers{
        {"Content-Type", "application/json; charset=UTF-8"},
        {"Accept", "*/*"},
        {"User-Agent", kBrowserUA},
        {"Origin", origin_},
        {"Referer", origin_ + "/auth?action=signin"},
    };

    auto response = httpClient_.fetch("POST",
                                      baseUrl_ + "/v1/auths/signin",
                                      headers,
                                      util::stringifyJson(toJson(request)),
                                      timeout);
    if (response.result() != boost::beast::http::status::ok) {
        throw ChatError(ChatError::Kind::authentication_failure,
                        "signin rejected with status " + std::to_string(response.result_int()) + ": " +
                            snippet(response.body()),
                        static_cast<int>(response.result_int()));
    }

    auto parsed = parseSigninResponse(util::parseJson(response.body()));
    if (parsed.token.empty()) {
        throw ChatError(ChatError::Kind::authentication_failure, "signin response carried no token");
    }
    return parsed;
}

NewChatResponse HttpChatBackend::createChat(const std::string& token,
                                            const NewChatRequest& request,
                                            std::chrono::seconds timeout) {
    auto response = httpClient_.fetch("POST",
                                      baseUrl_ + "/v2/chats/new",
                                      authorizedHeaders(token, "application/json"),
                                      util::stringifyJson(toJson(request)),
                                      timeout);
    if (response.result() != boost::beast::http::status::ok) {
        throw ChatError(ChatError::Kind::session_create_failure,
                        "chat creation failed with status " + std::to_string(response.result_int()) + ": " +
                            snippet(response.body()),
                        static_cast<int>(response.result_int()));
    }

    NewChatResponse parsed;
    try {
        parsed = parseNewChatResponse(util::parseJson(response.body()));
    } catch (const std::exception& ex) {
        throw ChatError(ChatError::Kind::session_create_failure,
                        std::string{"chat creation returned malformed body: "} + ex.what());
    }
    if (!parsed.success) {
        throw ChatError(ChatError::Kind::session_create_failure,
                        "chat creation unsuccessful: " + snippet(response.body()));
    }
    if (parsed.chatId.empty()) {
        throw ChatError(ChatError::Kind::session_create_failure,
                        "chat creation response missing chat id: " + snippet(response.body()));
    }
    return parsed;
}

UploadCredential HttpChatBackend::requestUploadCredential(const std::string& token,
                                                          const UploadCredentialRequest& request,
                                                          std::chrono::seconds timeout) {
    static constexpr std::array<std::string_view, 2> kEndpoints{"/v2/files/getstsToken", "/v1/files/getstsToken"};
    const auto body = util::stringifyJson(toJson(request));

    std::string lastError = "no endpoint attempted";
    for (auto endpoint : kEndpoints) {
        try {
            auto response = httpClient_.fetch("POST",
                                              baseUrl_ + std::string(endpoint),
                                              authorizedHeaders(token, "*/*"),
                                              body,
                                              timeout);
            if (response.result() != boost::beast::http::status::ok) {
                lastError = std::string(endpoint) + " returned status " + std::to_string(response.result_int()) +
                            ": " + snippet(response.body());
                util::log(util::LogLevel::warn, "Upload credential request failed: " + lastError);
                continue;
            }
            return parseUploadCredential(util::parseJson(response.body()));
        } catch (const std::exception& ex) {
            lastError = std::string(endpoint) + ": " + ex.what();
            util::log(util::LogLevel::warn, "Upload credential request failed: " + lastError);
        }
    }
    throw ChatError(ChatError::Kind::upload_failure, "no upload credential issued: " + lastError);
}

int HttpChatBackend::putObject(const ObjectPut& put, std::chrono::seconds timeout) {
    std::vector<util::HttpClient::Header> headers;
    headers.reserve(put.headers.size() + 3);
    for (const auto& [name, value] : put.headers) {
        headers.push_back({name, value});
    }
    headers.push_back({"User-Agent", kBrowserUA});
    headers.push_back({"Origin", origin_});
    headers.push_back({"Referer", origin_ + "/"});

    auto response = httpClient_.fetch("PUT", put.url, headers, put.body, timeout);
    return static_cast<int>(response.result_int());
}

RemoteFileHead HttpChatBackend::headRemote(const std::string& url, std::chrono::seconds timeout) {
    std::vector<util::HttpClient::Header> headers{
        {"User-Agent", kBrowserUA},
        {"Accept", "*/*"},
    };
    auto response = httpClient_.fetch("HEAD", url, headers, "", timeout, true, 5);

    RemoteFileHead head;
    head.status = static_cast<int>(response.result_int());
    if (auto it = response.base().find(boost::beast::http::field::content_type); it != response.base().end()) {
        head.contentType = std::string(it->value());
    }
    if (auto it = response.base().find(boost::beast::http::field::content_length); it != response.base().end()) {
        try {
            head.contentLength = std::stoull(std::string(it->value()));
        } catch (const std::exception&) {
            util::log(util::LogLevel::debug, "Ignoring malformed Content-Length from " + url);
        }
    }
    return head;
}

void HttpChatBackend::streamCompletion(const std::string& token,
                                       const CompletionRequest& request,
                                       std::chrono::seconds timeout,
                                       const BodyHandler& onBody) {
    auto headers = authorizedHeaders(token, "text/event-stream");
    headers.push_back({"X-Accel-Buffering", "no"});
    headers.push_back({"Accept-Charset", "utf-8"});

    const auto payload = util::stringifyJson(buildCompletionPayload(request, util::epochMillis()));
    const auto url = baseUrl_ + "/v2/chat/completions?chat_id=" + util::urlEncode(request.chatId);

    try {
        httpClient_.stream("POST", url, headers, payload, timeout, onBody);
    } catch (const util::HttpStatusError& ex) {
        throw ChatError(ChatError::Kind::remote_api_error, ex.what(), ex.status());
    }
}

} // namespace chatpool::api
