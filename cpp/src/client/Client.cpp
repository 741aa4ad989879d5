#include "chatpool/client/Client.hpp"
#include "chatpool/api/ChatError.hpp"
#include "chatpool/api/HttpChatBackend.hpp"
#include "chatpool/stream/CompletionStream.hpp"
#include "chatpool/upload/FileUtils.hpp"
#include "chatpool/util/Crypto.hpp"
#include "chatpool/util/Logging.hpp"
#include "chatpool/util/TimeUtil.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>

namespace chatpool::client {
namespace {

using api::ChatError;

class PermitGuard {
public:
    explicit PermitGuard(std::counting_semaphore<>& semaphore)
        : semaphore_(semaphore) {
        semaphore_.acquire();
    }
    ~PermitGuard() { semaphore_.release(); }

    PermitGuard(const PermitGuard&) = delete;
    PermitGuard& operator=(const PermitGuard&) = delete;

private:
    std::counting_semaphore<>& semaphore_;
};

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::ptrdiff_t permitCount(const config::ClientConfig& config) {
    return static_cast<std::ptrdiff_t>(std::max<std::size_t>(config.maxConcurrentRequests, 1));
}

} // namespace

Client::Client(boost::asio::io_context& io, config::ClientConfig config)
    : io_(io)
    , config_(std::move(config))
    , permits_(permitCount(config_)) {}

Client::Client(boost::asio::io_context& io, config::ClientConfig config, api::ChatBackend& backend)
    : io_(io)
    , config_(std::move(config))
    , permits_(permitCount(config_))
    , backend_(&backend) {}

Client::~Client() {
    shutdown();
}

void Client::ensureInitialized() {
    std::scoped_lock lock(initMutex_);
    if (shutdown_) {
        throw ChatError(ChatError::Kind::shutting_down, "Client has been shut down");
    }
    if (initialized_) {
        return;
    }

    if (!backend_) {
        httpClient_ = std::make_unique<util::HttpClient>();
        ownedBackend_ = std::make_unique<api::HttpChatBackend>(*httpClient_, config_.baseUrl);
        backend_ = ownedBackend_.get();
    }

    upload::SignedUploader::Settings uploadSettings;
    uploadSettings.maxRetries = config_.uploadRetries;
    uploadSettings.baseDelay = config_.uploadBaseDelay;
    uploadSettings.maxDelay = config_.uploadMaxDelay;
    uploadSettings.timeout = config_.timeouts.upload;
    uploader_ = std::make_unique<upload::SignedUploader>(*backend_, uploadSettings);

    pool_ = std::make_unique<account::AccountPool>(io_, *backend_, config_.accounts, config_.poolSettings());
    pool_->initialize();

    initialized_ = true;
    util::log(util::LogLevel::info, "Chat client initialized with " + std::to_string(pool_->size()) + " accounts");
}

void Client::chatStream(const ChatRequest& request, const ChunkHandler& onChunk) {
    ensureInitialized();

    for (const auto& attachment : request.attachments) {
        if (!isBlank(attachment) && !upload::isUrl(attachment)) {
            upload::validateLocalFile(attachment);
        }
    }

    PermitGuard permit(permits_);

    const int retries = std::max(request.maxRetries.value_or(config_.maxRetries), 0);
    const std::string& model = request.model.empty() ? config_.model : request.model;
    const std::uint64_t lengthHint = request.lengthHint > 0 ? request.lengthHint : request.message.size();

    for (int attempt = 0; attempt <= retries; ++attempt) {
        const bool last = attempt == retries;
        bool callerFailed = false;
        std::string failure;
        try {
            runAttempt(request, model, lengthHint, attempt > 0, onChunk, callerFailed);
            return;
        } catch (const ChatError& ex) {
            if (callerFailed) {
                throw;
            }
            if (!ex.retryable() || last) {
                util::log(util::LogLevel::error, "Chat request failed after " + std::to_string(attempt + 1) +
                                                     " attempt(s) [" + api::toString(ex.kind()) + "]: " + ex.what());
                throw ChatError(ex.kind(),
                                "Chat request failed after " + std::to_string(attempt + 1) + " attempt(s): " + ex.what(),
                                ex.status());
            }
            failure = std::string{"["} + api::toString(ex.kind()) + "] " + ex.what();
        } catch (const std::exception& ex) {
            if (callerFailed) {
                throw;
            }
            if (last) {
                util::log(util::LogLevel::error, "Chat request failed after " + std::to_string(attempt + 1) +
                                                     " attempt(s): " + ex.what());
                throw ChatError(ChatError::Kind::transport_failure,
                                "Chat request failed after " + std::to_string(attempt + 1) + " attempt(s): " + ex.what());
            }
            failure = ex.what();
        }

        util::log(util::LogLevel::warn, "Attempt " + std::to_string(attempt + 1) + "/" + std::to_string(retries + 1) +
                                            " failed, retrying: " + failure);
        if (config_.retryDelay.count() > 0) {
            std::this_thread::sleep_for(config_.retryDelay);
        }
    }
}

void Client::runAttempt(const ChatRequest& request,
                        const std::string& model,
                        std::uint64_t lengthHint,
                        bool isRetry,
                        const ChunkHandler& onChunk,
                        bool& callerFailed) {
    const auto startedAt = stream::CompletionStream::Clock::now();
    auto lease = pool_->acquire(lengthHint, isRetry, config_.acquireTimeout);
    const auto& account = lease.account();

    account::ResultMetrics metrics;
    metrics.messageLength = request.message.size();

    api::CompletionRequest completion;
    completion.model = model;
    completion.message = request.message;
    for (const auto& attachment : request.attachments) {
        if (isBlank(attachment)) {
            continue;
        }
        try {
            completion.files.push_back(resolveAttachment(attachment, account));
        } catch (const std::exception& ex) {
            throw ChatError(ChatError::Kind::attachment_error,
                            "Attachment " + attachment + " could not be prepared: " + ex.what());
        }
    }

    api::NewChatRequest newChat;
    newChat.models.push_back(model);
    newChat.timestamp = util::epochMillis();
    completion.chatId = backend_->createChat(account.token, newChat, config_.timeouts.sessionCreate).chatId;

    stream::CompletionStream stream(
        [&onChunk, &callerFailed](const std::string& delta) {
            try {
                onChunk(delta);
            } catch (...) {
                callerFailed = true;
                throw;
            }
        },
        startedAt);

    try {
        backend_->streamCompletion(account.token, completion, config_.timeouts.stream,
                                   [&stream](std::string_view bytes) { stream.consume(bytes); });
        stream.finish();
    } catch (const std::exception&) {
        stream.abort();
        throw;
    }

    if (!stream.receivedContent()) {
        util::log(util::LogLevel::warn, "Completion on account " + account.id + " finished without reply content");
    }
    const auto& measured = stream.metrics();
    metrics.firstPacketDelay = measured.firstPacketDelay;
    metrics.generatedTokens = measured.generatedTokens;
    metrics.generationTime = measured.generationTime;
    lease.complete(metrics);
}

api::FileInfo Client::resolveAttachment(const std::string& attachment, const account::AccountHandle& account) {
    if (upload::isUrl(attachment)) {
        return upload::inspectRemoteFile(*backend_, attachment, account.userId, config_.timeouts.remoteInspect);
    }
    return uploadLocalFile(attachment, account);
}

api::FileInfo Client::uploadLocalFile(const std::string& path, const account::AccountHandle& account) {
    const std::filesystem::path file(path);
    const auto size = upload::validateLocalFile(file);
    const auto filename = file.filename().string();
    const auto contentType = upload::mimeTypeFor(filename);
    const auto category = upload::categorize(contentType);

    auto credential = fetchUploadCredential(account.token, api::UploadCredentialRequest{filename, size, category.fileType});
    if (auto missing = credential.missingFields(); !missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            names += names.empty() ? name : ", " + name;
        }
        throw ChatError(ChatError::Kind::upload_failure, "Upload credential is missing fields: " + names);
    }

    api::FileInfo info;
    info.fileId = credential.fileId.empty() ? util::makeUuid() : credential.fileId;
    info.fileUrl = uploader_->upload(file, credential);
    info.filename = filename;
    info.size = size;
    info.contentType = contentType;
    info.userId = account.userId;
    info.fileType = category.fileType;
    info.fileClass = category.fileClass;
    util::log(util::LogLevel::info, "Prepared attachment " + filename + " (" + std::to_string(size) + " bytes)");
    return info;
}

api::UploadCredential Client::fetchUploadCredential(const std::string& token,
                                                    const api::UploadCredentialRequest& request) {
    const int attempts = std::max(config_.uploadCredentialAttempts, 1);
    for (int attempt = 1;; ++attempt) {
        try {
            return backend_->requestUploadCredential(token, request, config_.timeouts.uploadCredential);
        } catch (const std::exception& ex) {
            if (attempt >= attempts) {
                throw;
            }
            util::log(util::LogLevel::warn, "Upload credential attempt " + std::to_string(attempt) + " for " +
                                                request.filename + " failed: " + ex.what());
        }
        if (config_.uploadCredentialRetryDelay.count() > 0) {
            std::this_thread::sleep_for(config_.uploadCredentialRetryDelay);
        }
    }
}

std::string Client::chatCompletion(const ChatRequest& request) {
    std::string reply;
    chatStream(request, [&reply](const std::string& chunk) { reply += chunk; });
    if (reply.empty()) {
        return kEmptyReply;
    }
    return reply;
}

account::PoolStatus Client::accountStatus() {
    ensureInitialized();
    return pool_->status();
}

account::PerformanceReport Client::performanceReport() {
    ensureInitialized();
    return pool_->report();
}

void Client::shutdown() {
    std::scoped_lock lock(initMutex_);
    if (shutdown_.exchange(true)) {
        return;
    }
    if (pool_) {
        pool_->shutdown();
    }
    util::log(util::LogLevel::info, "Chat client shut down");
}

std::string quickChat(Client& client, const std::string& message, const std::vector<std::string>& attachments) {
    ChatRequest request;
    request.message = message;
    request.attachments = attachments;
    return client.chatCompletion(request);
}

void quickStream(Client& client,
                 const std::string& message,
                 const std::vector<std::string>& attachments,
                 const Client::ChunkHandler& onChunk) {
    ChatRequest request;
    request.message = message;
    request.attachments = attachments;
    client.chatStream(request, onChunk);
}

} // namespace chatpool::client
