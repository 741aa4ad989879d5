#pragma once

#include "chatpool/account/Account.hpp"
#include "chatpool/account/BanditOptimizer.hpp"
#include "chatpool/account/StatsStore.hpp"
#include "chatpool/api/ChatBackend.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatpool::account {

struct PoolSettings {
    std::size_t loginConcurrency{3};
    std::chrono::seconds refreshInterval{30};
    std::chrono::seconds refreshErrorBackoff{10};
    std::chrono::seconds tokenRefreshMargin{600};
    std::chrono::seconds loginTimeout{10};
    int loginTries{2};
    std::chrono::milliseconds loginRetryDelay{1000};
    int maxLoginAttempts{3};
    std::size_t refreshRetryBatch{3};
    KlUcbSettings klUcb{};
    std::uint64_t snapshotEvery{5};
    std::filesystem::path statsFile;
};

struct PoolStatus {
    std::size_t total{};
    std::size_t loggedIn{};
    std::size_t available{};
    std::size_t busy{};
    std::size_t initializing{};
    std::size_t initializedCount{};
};

class AccountPool;

// Exclusive use of one account. Destruction hands the account back, as a failure unless
// complete() was called first.
class AccountLease {
public:
    AccountLease(AccountLease&& other) noexcept;
    AccountLease& operator=(AccountLease&& other) noexcept;
    AccountLease(const AccountLease&) = delete;
    AccountLease& operator=(const AccountLease&) = delete;
    ~AccountLease();

    const AccountHandle& account() const noexcept { return handle_; }

    void complete(const ResultMetrics& metrics);
    void fail(const ResultMetrics& metrics = {});

    // Returns the account now instead of at scope exit.
    void release() noexcept;

private:
    friend class AccountPool;
    AccountLease(AccountPool* pool, AccountHandle handle);

    AccountPool* pool_{};
    AccountHandle handle_;
    bool success_{};
    ResultMetrics metrics_{};
};

class AccountPool {
public:
    AccountPool(boost::asio::io_context& io,
                api::ChatBackend& backend,
                std::vector<Credential> credentials,
                PoolSettings settings);
    ~AccountPool();

    AccountPool(const AccountPool&) = delete;
    AccountPool& operator=(const AccountPool&) = delete;

    // Starts warm-up logins and the refresh timer. Later calls do nothing.
    void initialize();

    // Throws ChatError(pool_empty) when no account is configured,
    // ChatError(no_account_available) once waitTimeout passes,
    // ChatError(shutting_down) after shutdown().
    AccountLease acquire(std::uint64_t lengthHint, bool isRetry, std::chrono::milliseconds waitTimeout);

    void release(const AccountHandle& account, bool success, const ResultMetrics& metrics);

    // Re-logs expiring tokens and retries a batch of failed logins.
    void runRefreshCycle();

    PoolStatus status() const;
    PerformanceReport report() const;
    bool isFailed(const std::string& accountId) const;
    std::size_t size() const noexcept { return accounts_.size(); }

    // Stops background work, waits for it, then writes the final snapshot.
    void shutdown();

private:
    bool login(std::size_t index);
    void warmUp(std::size_t index);
    void scheduleRefresh(std::chrono::seconds delay);
    void refreshTick();
    void makeAvailable(std::size_t index);
    void markInitialized(std::size_t index);
    void persist(const StatsSnapshot& snapshot);

    boost::asio::io_context& io_;
    api::ChatBackend& backend_;
    PoolSettings settings_;

    std::vector<Account> accounts_;
    std::unordered_map<std::string, std::size_t> indexById_;
    std::vector<std::size_t> available_;
    BanditOptimizer optimizer_;
    std::size_t initializedCount_{};

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    StatsStore store_;
    std::mutex storeMutex_;

    // Shared with pending timer handlers, which may run after the pool is gone.
    // A handler only touches the pool while holding mutex and seeing open.
    struct RefreshGate {
        std::mutex mutex;
        bool open{true};
    };

    boost::asio::thread_pool workers_;
    std::shared_ptr<RefreshGate> refreshGate_;
    std::unique_ptr<boost::asio::steady_timer> refreshTimer_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
};

} // namespace chatpool::account
