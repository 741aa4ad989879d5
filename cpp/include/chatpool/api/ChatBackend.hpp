#pragma once

#include "chatpool/api/ApiModels.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace chatpool::api {

// Remote endpoints the client talks to. HttpChatBackend is the network implementation;
// tests substitute an in-memory one.
class ChatBackend {
public:
    using BodyHandler = std::function<void(std::string_view)>;

    virtual ~ChatBackend() = default;

    // Throws ChatError(authentication_failure) when the credentials are rejected.
    virtual SigninResponse signin(const SigninRequest& request, std::chrono::seconds timeout) = 0;

    // Throws ChatError(session_create_failure) unless a chat id comes back.
    virtual NewChatResponse createChat(const std::string& token,
                                       const NewChatRequest& request,
                                       std::chrono::seconds timeout) = 0;

    // Throws ChatError(upload_failure) when no endpoint version issues a credential.
    virtual UploadCredential requestUploadCredential(const std::string& token,
                                                     const UploadCredentialRequest& request,
                                                     std::chrono::seconds timeout) = 0;

    // Returns the HTTP status of the PUT.
    virtual int putObject(const ObjectPut& put, std::chrono::seconds timeout) = 0;

    virtual RemoteFileHead headRemote(const std::string& url, std::chrono::seconds timeout) = 0;

    // Delivers raw event-stream bytes as they arrive. Non-200 throws ChatError(remote_api_error).
    virtual void streamCompletion(const std::string& token,
                                  const CompletionRequest& request,
                                  std::chrono::seconds timeout,
                                  const BodyHandler& onBody) = 0;
};

} // namespace chatpool::api
