#include "chatpool/account/AccountPool.hpp"
#include "chatpool/api/ChatError.hpp"
#include "chatpool/util/Crypto.hpp"
#include "chatpool/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <optional>
#include <thread>
#include <utility>

namespace chatpool::account {
namespace {

std::chrono::system_clock::time_point fromEpochSeconds(std::int64_t seconds) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

} // namespace

AccountLease::AccountLease(AccountPool* pool, AccountHandle handle)
    : pool_(pool)
    , handle_(std::move(handle)) {}

AccountLease::AccountLease(AccountLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , handle_(std::move(other.handle_))
    , success_(other.success_)
    , metrics_(other.metrics_) {}

AccountLease& AccountLease::operator=(AccountLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        handle_ = std::move(other.handle_);
        success_ = other.success_;
        metrics_ = other.metrics_;
    }
    return *this;
}

AccountLease::~AccountLease() {
    release();
}

void AccountLease::complete(const ResultMetrics& metrics) {
    success_ = true;
    metrics_ = metrics;
}

void AccountLease::fail(const ResultMetrics& metrics) {
    success_ = false;
    metrics_ = metrics;
}

void AccountLease::release() noexcept {
    auto* pool = std::exchange(pool_, nullptr);
    if (!pool) {
        return;
    }
    try {
        pool->release(handle_, success_, metrics_);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Releasing account " + handle_.id + " failed: " + ex.what());
    }
}

AccountPool::AccountPool(boost::asio::io_context& io,
                         api::ChatBackend& backend,
                         std::vector<Credential> credentials,
                         PoolSettings settings)
    : io_(io)
    , backend_(backend)
    , settings_(std::move(settings))
    , optimizer_(settings_.klUcb, settings_.snapshotEvery)
    , store_(settings_.statsFile)
    , workers_(std::max<std::size_t>(settings_.loginConcurrency, 1))
    , refreshGate_(std::make_shared<RefreshGate>()) {
    accounts_.reserve(credentials.size());
    for (auto& credential : credentials) {
        if (credential.email.empty()) {
            util::log(util::LogLevel::warn, "Skipping account without email");
            continue;
        }
        if (indexById_.count(credential.email) != 0) {
            util::log(util::LogLevel::warn, "Skipping duplicate account " + credential.email);
            continue;
        }
        Account account;
        account.id = credential.email;
        account.email = credential.email;
        account.passwordHash = util::sha256Hex(credential.password);
        indexById_.emplace(account.id, accounts_.size());
        accounts_.push_back(std::move(account));
    }
    optimizer_.restore(store_.load());
}

AccountPool::~AccountPool() {
    shutdown();
}

void AccountPool::initialize() {
    if (started_.exchange(true)) {
        return;
    }
    if (accounts_.empty()) {
        util::log(util::LogLevel::warn, "Account pool has no configured accounts");
        return;
    }

    util::log(util::LogLevel::info, "Warming up " + std::to_string(accounts_.size()) + " accounts with concurrency " +
                                        std::to_string(std::max<std::size_t>(settings_.loginConcurrency, 1)));
    {
        std::scoped_lock lock(mutex_);
        for (auto& account : accounts_) {
            account.initializing = true;
        }
    }
    for (std::size_t index = 0; index < accounts_.size(); ++index) {
        boost::asio::post(workers_, [this, index]() { warmUp(index); });
    }
    scheduleRefresh(settings_.refreshInterval);
}

void AccountPool::warmUp(std::size_t index) {
    bool ok = !stopping_ && login(index);
    std::size_t ready = 0;
    {
        std::scoped_lock lock(mutex_);
        accounts_[index].initializing = false;
        if (ok) {
            markInitialized(index);
            makeAvailable(index);
        }
        ready = initializedCount_;
    }
    if (ok) {
        cv_.notify_all();
        util::log(util::LogLevel::info, "Account pool warm-up: " + std::to_string(ready) + "/" +
                                            std::to_string(accounts_.size()) + " ready");
    }
}

bool AccountPool::login(std::size_t index) {
    // email and passwordHash never change after construction
    const std::string& email = accounts_[index].email;
    const std::string& passwordHash = accounts_[index].passwordHash;
    const int tries = std::max(settings_.loginTries, 1);

    for (int attempt = 0; attempt < tries && !stopping_; ++attempt) {
        try {
            auto response = backend_.signin(api::SigninRequest{email, passwordHash}, settings_.loginTimeout);
            {
                std::scoped_lock lock(mutex_);
                auto& account = accounts_[index];
                account.token = std::move(response.token);
                account.tokenExpires = fromEpochSeconds(response.expiresAt);
                account.userId = std::move(response.userId);
                account.loggedIn = true;
                account.loginFailures = 0;
            }
            util::log(util::LogLevel::info, "Account " + email + " logged in");
            return true;
        } catch (const api::ChatError& ex) {
            util::log(util::LogLevel::warn, "Login attempt " + std::to_string(attempt + 1) + " for " + email +
                                                " failed [" + api::toString(ex.kind()) + "]: " + ex.what());
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, "Login attempt " + std::to_string(attempt + 1) + " for " + email +
                                                " failed: " + ex.what());
        }
        if (attempt + 1 < tries && settings_.loginRetryDelay.count() > 0) {
            std::this_thread::sleep_for(settings_.loginRetryDelay);
        }
    }

    int failures = 0;
    {
        std::scoped_lock lock(mutex_);
        auto& account = accounts_[index];
        account.loggedIn = false;
        failures = ++account.loginFailures;
    }
    util::log(util::LogLevel::warn, "Account " + email + " unavailable after " + std::to_string(failures) +
                                        " failed login round(s)");
    return false;
}

void AccountPool::markInitialized(std::size_t index) {
    auto& account = accounts_[index];
    if (!account.initialized) {
        account.initialized = true;
        ++initializedCount_;
    }
}

void AccountPool::makeAvailable(std::size_t index) {
    if (std::find(available_.begin(), available_.end(), index) == available_.end()) {
        available_.push_back(index);
    }
}

AccountLease AccountPool::acquire(std::uint64_t lengthHint, bool isRetry, std::chrono::milliseconds waitTimeout) {
    if (accounts_.empty()) {
        throw api::ChatError(api::ChatError::Kind::pool_empty, "No accounts are configured");
    }

    const auto deadline = std::chrono::steady_clock::now() + waitTimeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (stopping_) {
            throw api::ChatError(api::ChatError::Kind::shutting_down, "Account pool is shutting down");
        }

        std::vector<std::size_t> idle;
        std::vector<std::string> ids;
        for (auto index : available_) {
            const auto& account = accounts_[index];
            if (!account.busy && account.loggedIn) {
                idle.push_back(index);
                ids.push_back(account.id);
            }
        }

        if (!idle.empty()) {
            if (isRetry && optimizer_.allFailed(ids)) {
                optimizer_.resetFailed();
                util::log(util::LogLevel::info, "Every idle account was marked failed, clearing the failed set");
            }
            const auto choice = optimizer_.select(ids, lengthHint).value_or(0);
            auto& account = accounts_[idle[choice]];
            account.busy = true;
            account.lastUsed = std::chrono::steady_clock::now();
            util::log(util::LogLevel::debug, "Acquired account " + account.id);
            return AccountLease(this, AccountHandle{account.id, account.token, account.userId});
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            throw api::ChatError(api::ChatError::Kind::no_account_available,
                                 "No account became available within " + std::to_string(waitTimeout.count()) + "ms");
        }
        cv_.wait_until(lock, deadline);
    }
}

void AccountPool::release(const AccountHandle& handle, bool success, const ResultMetrics& metrics) {
    auto it = indexById_.find(handle.id);
    if (it == indexById_.end()) {
        util::log(util::LogLevel::warn, "Release of unknown account " + handle.id);
        return;
    }

    std::optional<StatsSnapshot> snapshot;
    {
        std::scoped_lock lock(mutex_);
        auto& account = accounts_[it->second];
        if (!account.busy) {
            util::log(util::LogLevel::warn, "Account " + handle.id + " released while not in use");
            return;
        }
        account.busy = false;
        optimizer_.recordResult(account.id, success, metrics);
        if (optimizer_.snapshotDue()) {
            snapshot = optimizer_.snapshot();
        }
    }
    cv_.notify_all();

    util::log(util::LogLevel::debug, "Released account " + handle.id + (success ? " (success)" : " (failure)"));
    if (snapshot) {
        persist(*snapshot);
    }
}

void AccountPool::runRefreshCycle() {
    const auto threshold = std::chrono::system_clock::now() + settings_.tokenRefreshMargin;

    std::vector<std::size_t> expiring;
    {
        std::scoped_lock lock(mutex_);
        for (auto index : available_) {
            const auto& account = accounts_[index];
            if (account.loggedIn && account.tokenExpires <= threshold) {
                expiring.push_back(index);
            }
        }
    }

    for (auto index : expiring) {
        if (stopping_) {
            return;
        }
        util::log(util::LogLevel::info, "Refreshing token for " + accounts_[index].email);
        if (!login(index)) {
            std::scoped_lock lock(mutex_);
            available_.erase(std::remove(available_.begin(), available_.end(), index), available_.end());
        }
    }

    std::vector<std::size_t> retry;
    {
        std::scoped_lock lock(mutex_);
        for (std::size_t index = 0; index < accounts_.size() && retry.size() < settings_.refreshRetryBatch; ++index) {
            const auto& account = accounts_[index];
            const bool listed = std::find(available_.begin(), available_.end(), index) != available_.end();
            if (!account.loggedIn && !account.initializing && !listed &&
                account.loginFailures < settings_.maxLoginAttempts) {
                retry.push_back(index);
            }
        }
    }

    for (auto index : retry) {
        if (stopping_) {
            return;
        }
        util::log(util::LogLevel::info, "Retrying login for " + accounts_[index].email);
        if (login(index)) {
            {
                std::scoped_lock lock(mutex_);
                markInitialized(index);
                makeAvailable(index);
            }
            cv_.notify_all();
        }
    }
}

void AccountPool::scheduleRefresh(std::chrono::seconds delay) {
    std::scoped_lock lock(refreshGate_->mutex);
    if (!refreshGate_->open) {
        return;
    }
    if (!refreshTimer_) {
        refreshTimer_ = std::make_unique<boost::asio::steady_timer>(io_);
    }
    refreshTimer_->expires_after(delay);
    refreshTimer_->async_wait([this, gate = refreshGate_](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        // shutdown() closes the gate under the same lock before the pool can be destroyed
        std::scoped_lock gateLock(gate->mutex);
        if (!gate->open) {
            return;
        }
        boost::asio::post(workers_, [this]() { refreshTick(); });
    });
}

void AccountPool::refreshTick() {
    auto next = settings_.refreshInterval;
    try {
        runRefreshCycle();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, std::string{"Account refresh cycle failed: "} + ex.what());
        next = settings_.refreshErrorBackoff;
    }
    scheduleRefresh(next);
}

PoolStatus AccountPool::status() const {
    std::scoped_lock lock(mutex_);
    PoolStatus status;
    status.total = accounts_.size();
    status.initializedCount = initializedCount_;
    for (const auto& account : accounts_) {
        if (account.loggedIn) {
            ++status.loggedIn;
        }
        if (account.busy) {
            ++status.busy;
        }
        if (account.initializing) {
            ++status.initializing;
        }
    }
    for (auto index : available_) {
        if (!accounts_[index].busy && accounts_[index].loggedIn) {
            ++status.available;
        }
    }
    return status;
}

PerformanceReport AccountPool::report() const {
    std::scoped_lock lock(mutex_);
    auto report = optimizer_.report();
    report.totalAccounts = std::max(report.totalAccounts, accounts_.size());
    return report;
}

bool AccountPool::isFailed(const std::string& accountId) const {
    std::scoped_lock lock(mutex_);
    return optimizer_.isFailed(accountId);
}

void AccountPool::persist(const StatsSnapshot& snapshot) {
    std::scoped_lock lock(storeMutex_);
    if (!store_.save(snapshot)) {
        util::log(util::LogLevel::warn, "Account stats snapshot was not saved");
    }
}

void AccountPool::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }
    {
        std::scoped_lock lock(refreshGate_->mutex);
        refreshGate_->open = false;
        if (refreshTimer_) {
            refreshTimer_->cancel();
        }
    }
    cv_.notify_all();

    workers_.stop();
    workers_.join();

    StatsSnapshot snapshot;
    {
        std::scoped_lock lock(mutex_);
        snapshot = optimizer_.snapshot();
    }
    persist(snapshot);
    util::log(util::LogLevel::info, "Account pool stopped");
}

} // namespace chatpool::account
