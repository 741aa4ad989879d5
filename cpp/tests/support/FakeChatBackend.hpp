#pragma once

#include "chatpool/api/ChatBackend.hpp"
#include "chatpool/api/ChatError.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace chatpool::test {

// In-memory ChatBackend. Every endpoint has a default happy-path behaviour that a test
// can replace through the public hooks.
class FakeChatBackend : public api::ChatBackend {
public:
    std::function<api::SigninResponse(const api::SigninRequest&)> signinHook;
    std::function<api::NewChatResponse(const std::string& token)> createChatHook;
    std::function<api::UploadCredential(const api::UploadCredentialRequest&)> uploadCredentialHook;
    std::function<int(const api::ObjectPut&)> putHook;
    std::function<api::RemoteFileHead(const std::string& url)> headHook;
    std::function<void(const std::string& token, const BodyHandler& onBody)> streamHook;

    // Body written by the default stream hook, one chunk per element.
    std::vector<std::string> streamChunks{
        "data: {\"choices\":[{\"delta\":{\"phase\":\"answer\",\"content\":\"Hi\"}}]}\n",
        "data: [DONE]\n",
    };

    std::atomic<int> signinCalls{0};
    std::atomic<int> createChatCalls{0};
    std::atomic<int> uploadCredentialCalls{0};
    std::atomic<int> putCalls{0};
    std::atomic<int> headCalls{0};
    std::atomic<int> streamCalls{0};

    api::SigninResponse signin(const api::SigninRequest& request, std::chrono::seconds) override {
        ++signinCalls;
        {
            std::scoped_lock lock(mutex_);
            signins_.push_back(request);
        }
        if (signinHook) {
            return signinHook(request);
        }
        api::SigninResponse response;
        response.token = "token-" + request.email;
        response.userId = "user-" + request.email;
        response.expiresAt = std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count() +
                             3600;
        return response;
    }

    api::NewChatResponse createChat(const std::string& token,
                                    const api::NewChatRequest& request,
                                    std::chrono::seconds) override {
        const int call = ++createChatCalls;
        {
            std::scoped_lock lock(mutex_);
            newChats_.push_back(request);
        }
        if (createChatHook) {
            return createChatHook(token);
        }
        return api::NewChatResponse{true, "chat-" + std::to_string(call)};
    }

    api::UploadCredential requestUploadCredential(const std::string&,
                                                  const api::UploadCredentialRequest& request,
                                                  std::chrono::seconds) override {
        ++uploadCredentialCalls;
        if (uploadCredentialHook) {
            return uploadCredentialHook(request);
        }
        api::UploadCredential credential;
        credential.accessKeyId = "key-id";
        credential.accessKeySecret = "secret";
        credential.securityToken = "sts-token";
        credential.fileUrl = "https://bucket.oss.example.com/user/abc/" + request.filename;
        credential.filePath = "user/abc/" + request.filename;
        credential.fileId = "file-1";
        return credential;
    }

    int putObject(const api::ObjectPut& put, std::chrono::seconds) override {
        ++putCalls;
        {
            std::scoped_lock lock(mutex_);
            puts_.push_back(put);
        }
        return putHook ? putHook(put) : 200;
    }

    api::RemoteFileHead headRemote(const std::string& url, std::chrono::seconds) override {
        ++headCalls;
        if (headHook) {
            return headHook(url);
        }
        return api::RemoteFileHead{200, "image/png", 2048};
    }

    void streamCompletion(const std::string& token,
                          const api::CompletionRequest& request,
                          std::chrono::seconds,
                          const BodyHandler& onBody) override {
        ++streamCalls;
        {
            std::scoped_lock lock(mutex_);
            completions_.push_back(request);
        }
        if (streamHook) {
            streamHook(token, onBody);
            return;
        }
        for (const auto& chunk : streamChunks) {
            onBody(chunk);
        }
    }

    std::vector<api::SigninRequest> signins() const {
        std::scoped_lock lock(mutex_);
        return signins_;
    }

    std::vector<api::NewChatRequest> newChats() const {
        std::scoped_lock lock(mutex_);
        return newChats_;
    }

    std::vector<api::ObjectPut> puts() const {
        std::scoped_lock lock(mutex_);
        return puts_;
    }

    std::vector<api::CompletionRequest> completions() const {
        std::scoped_lock lock(mutex_);
        return completions_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<api::SigninRequest> signins_;
    std::vector<api::NewChatRequest> newChats_;
    std::vector<api::ObjectPut> puts_;
    std::vector<api::CompletionRequest> completions_;
};

} // namespace chatpool::test
