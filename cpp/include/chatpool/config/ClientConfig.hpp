#pragma once

#include "chatpool/account/Account.hpp"
#include "chatpool/account/AccountPool.hpp"
#include "chatpool/account/BanditOptimizer.hpp"
#include "chatpool/util/Logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chatpool::config {

struct Timeouts {
    std::chrono::seconds login{10};
    std::chrono::seconds sessionCreate{15};
    std::chrono::seconds uploadCredential{15};
    std::chrono::seconds upload{60};
    std::chrono::seconds stream{120};
    std::chrono::seconds remoteInspect{10};
};

struct ClientConfig {
    std::vector<account::Credential> accounts;
    std::string baseUrl{"https://chat.qwen.ai/api"};
    std::string model{"qwen3-coder-plus"};
    std::size_t maxConcurrentRequests{100};

    std::chrono::seconds accountRefreshInterval{30};
    std::chrono::seconds refreshErrorBackoff{10};
    std::chrono::seconds tokenRefreshMargin{600};
    std::chrono::milliseconds acquireTimeout{15000};

    int maxRetries{2};
    std::chrono::milliseconds retryDelay{1000};

    int uploadRetries{3};
    std::chrono::milliseconds uploadBaseDelay{1000};
    std::chrono::milliseconds uploadMaxDelay{3000};
    int uploadCredentialAttempts{3};
    std::chrono::milliseconds uploadCredentialRetryDelay{1000};

    std::size_t loginConcurrency{3};
    int maxLoginAttempts{3};
    int loginRetries{2};
    std::chrono::milliseconds loginRetryDelay{1000};
    std::size_t refreshRetryBatch{3};

    Timeouts timeouts;
    std::filesystem::path statsFile{"data/account_stats.json"};
    std::uint64_t snapshotEvery{5};
    account::KlUcbSettings klUcb;
    util::LogLevel logLevel{util::LogLevel::info};

    account::PoolSettings poolSettings() const;
};

// Overlays the keys present in json onto config. Unknown keys are ignored.
void applyJson(ClientConfig& config, const boost::json::object& json);

// Reads a JSON config file, then CHATPOOL_* environment overrides. A missing file keeps
// the defaults; a malformed one is logged and ignored.
ClientConfig loadClientConfig(const std::filesystem::path& path);

// Accepts an array of {"email", "password"} objects or bare strings (used as both).
std::vector<account::Credential> parseAccounts(const boost::json::value& json);
std::vector<account::Credential> loadAccounts(const std::filesystem::path& path);

} // namespace chatpool::config
