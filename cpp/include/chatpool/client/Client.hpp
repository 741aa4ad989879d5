#pragma once

#include "chatpool/account/AccountPool.hpp"
#include "chatpool/api/ChatBackend.hpp"
#include "chatpool/config/ClientConfig.hpp"
#include "chatpool/upload/SignedUploader.hpp"
#include "chatpool/util/HttpClient.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <vector>

namespace chatpool::client {

inline constexpr const char* kEmptyReply = "Sorry, no valid reply content was received.";

struct ChatRequest {
    std::string message;
    // Local paths or http(s) URLs.
    std::vector<std::string> attachments;
    // Empty selects the configured model.
    std::string model;
    std::optional<int> maxRetries;
    // Expected reply size for account selection; 0 uses the message length.
    std::uint64_t lengthHint{};
};

class Client {
public:
    using ChunkHandler = std::function<void(const std::string&)>;

    Client(boost::asio::io_context& io, config::ClientConfig config);
    // Uses the given backend instead of creating an HTTP one. backend must outlive the client.
    Client(boost::asio::io_context& io, config::ClientConfig config, api::ChatBackend& backend);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Creates the backend and starts the account pool on first call.
    void ensureInitialized();

    // Streams answer deltas to onChunk. Failed attempts are retried on another account;
    // the last failure is thrown as ChatError once retries run out. An exception thrown by
    // onChunk cancels the request and propagates unchanged.
    void chatStream(const ChatRequest& request, const ChunkHandler& onChunk);

    std::string chatCompletion(const ChatRequest& request);

    account::PoolStatus accountStatus();
    account::PerformanceReport performanceReport();

    void shutdown();

    const config::ClientConfig& config() const noexcept { return config_; }

private:
    void runAttempt(const ChatRequest& request,
                    const std::string& model,
                    std::uint64_t lengthHint,
                    bool isRetry,
                    const ChunkHandler& onChunk,
                    bool& callerFailed);

    api::FileInfo resolveAttachment(const std::string& attachment, const account::AccountHandle& account);
    api::FileInfo uploadLocalFile(const std::string& path, const account::AccountHandle& account);
    api::UploadCredential fetchUploadCredential(const std::string& token, const api::UploadCredentialRequest& request);

    boost::asio::io_context& io_;
    config::ClientConfig config_;
    std::counting_semaphore<> permits_;

    std::mutex initMutex_;
    bool initialized_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<util::HttpClient> httpClient_;
    std::unique_ptr<api::ChatBackend> ownedBackend_;
    api::ChatBackend* backend_{};
    std::unique_ptr<account::AccountPool> pool_;
    std::unique_ptr<upload::SignedUploader> uploader_;
};

// Collects a full reply from client.
std::string quickChat(Client& client, const std::string& message, const std::vector<std::string>& attachments = {});

void quickStream(Client& client,
                 const std::string& message,
                 const std::vector<std::string>& attachments,
                 const Client::ChunkHandler& onChunk);

} // namespace chatpool::client
