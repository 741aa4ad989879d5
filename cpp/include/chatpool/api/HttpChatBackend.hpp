#pragma once

#include "chatpool/api/ChatBackend.hpp"
#include "chatpool/util/HttpClient.hpp"

#include <string>
#include <vector>

namespace chatpool::api {

class HttpChatBackend : public ChatBackend {
public:
    // baseUrl is the API root, e.g. "https://chat.qwen.ai/api".
    HttpChatBackend(util::HttpClient& httpClient, std::string baseUrl);

    SigninResponse signin(const SigninRequest& request, std::chrono::seconds timeout) override;
    NewChatResponse createChat(const std::string& token,
                               const NewChatRequest& request,
                               std::chrono::seconds timeout) override;
    UploadCredential requestUploadCredential(const std::string& token,
                                             const UploadCredentialRequest& request,
                                             std::chrono::seconds timeout) override;
    int putObject(const ObjectPut& put, std::chrono::seconds timeout) override;
    RemoteFileHead headRemote(const std::string& url, std::chrono::seconds timeout) override;
    void streamCompletion(const std::string& token,
                          const CompletionRequest& request,
                          std::chrono::seconds timeout,
                          const BodyHandler& onBody) override;

private:
    std::vector<util::HttpClient::Header> authorizedHeaders(const std::string& token,
                                                            const std::string& accept) const;

    util::HttpClient& httpClient_;
    std::string baseUrl_;
    std::string origin_;
};

} // namespace chatpool::api
