#include "chatpool/config/ClientConfig.hpp"
#include "chatpool/util/JsonUtil.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

namespace chatpool::config {
namespace {

std::optional<std::string> readFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

template <typename Duration>
void readDuration(const boost::json::object& json, std::string_view key, Duration& target) {
    if (json.if_contains(key)) {
        auto value = util::readInt(json, key, target.count());
        target = Duration{std::max<std::int64_t>(value, 0)};
    }
}

void readCount(const boost::json::object& json, std::string_view key, std::size_t& target) {
    if (json.if_contains(key)) {
        target = static_cast<std::size_t>(std::max<std::int64_t>(util::readInt(json, key, 0), 0));
    }
}

void readCount(const boost::json::object& json, std::string_view key, int& target) {
    if (json.if_contains(key)) {
        target = static_cast<int>(std::max<std::int64_t>(util::readInt(json, key, target), 0));
    }
}

} // namespace

account::PoolSettings ClientConfig::poolSettings() const {
    account::PoolSettings settings;
    settings.loginConcurrency = loginConcurrency;
    settings.refreshInterval = accountRefreshInterval;
    settings.refreshErrorBackoff = refreshErrorBackoff;
    settings.tokenRefreshMargin = tokenRefreshMargin;
    settings.loginTimeout = timeouts.login;
    settings.loginTries = loginRetries;
    settings.loginRetryDelay = loginRetryDelay;
    settings.maxLoginAttempts = maxLoginAttempts;
    settings.refreshRetryBatch = refreshRetryBatch;
    settings.klUcb = klUcb;
    settings.snapshotEvery = snapshotEvery;
    settings.statsFile = statsFile;
    return settings;
}

void applyJson(ClientConfig& config, const boost::json::object& json) {
    if (auto* accounts = json.if_contains("accounts")) {
        config.accounts = parseAccounts(*accounts);
    }
    config.baseUrl = util::readString(json, "baseUrl", config.baseUrl);
    config.model = util::readString(json, "model", config.model);
    readCount(json, "maxConcurrentRequests", config.maxConcurrentRequests);

    readDuration(json, "accountRefreshIntervalSeconds", config.accountRefreshInterval);
    readDuration(json, "refreshErrorBackoffSeconds", config.refreshErrorBackoff);
    readDuration(json, "tokenRefreshMarginSeconds", config.tokenRefreshMargin);
    readDuration(json, "acquireTimeoutMs", config.acquireTimeout);

    readCount(json, "maxRetries", config.maxRetries);
    readDuration(json, "retryDelayMs", config.retryDelay);

    readCount(json, "uploadRetries", config.uploadRetries);
    readDuration(json, "uploadBaseDelayMs", config.uploadBaseDelay);
    readDuration(json, "uploadMaxDelayMs", config.uploadMaxDelay);
    readCount(json, "uploadCredentialAttempts", config.uploadCredentialAttempts);
    readDuration(json, "uploadCredentialRetryDelayMs", config.uploadCredentialRetryDelay);

    readCount(json, "loginConcurrency", config.loginConcurrency);
    readCount(json, "maxLoginAttempts", config.maxLoginAttempts);
    readCount(json, "loginRetries", config.loginRetries);
    readDuration(json, "loginRetryDelayMs", config.loginRetryDelay);
    readCount(json, "refreshRetryBatch", config.refreshRetryBatch);

    if (auto* timeouts = json.if_contains("timeouts"); timeouts && timeouts->is_object()) {
        const auto& obj = timeouts->as_object();
        readDuration(obj, "login", config.timeouts.login);
        readDuration(obj, "sessionCreate", config.timeouts.sessionCreate);
        readDuration(obj, "uploadCredential", config.timeouts.uploadCredential);
        readDuration(obj, "upload", config.timeouts.upload);
        readDuration(obj, "stream", config.timeouts.stream);
        readDuration(obj, "remoteInspect", config.timeouts.remoteInspect);
    }

    if (json.if_contains("statsFile")) {
        config.statsFile = util::readString(json, "statsFile", config.statsFile.string());
    }
    if (json.if_contains("snapshotEvery")) {
        config.snapshotEvery = static_cast<std::uint64_t>(std::max<std::int64_t>(util::readInt(json, "snapshotEvery"), 0));
    }
    if (auto* kl = json.if_contains("klUcb"); kl && kl->is_object()) {
        const auto& obj = kl->as_object();
        config.klUcb.maxIterations = static_cast<int>(util::readInt(obj, "maxIterations", config.klUcb.maxIterations));
        config.klUcb.precision = util::readDouble(obj, "precision", config.klUcb.precision);
    }
    if (json.if_contains("logLevel")) {
        config.logLevel = util::parseLogLevel(util::readString(json, "logLevel", "info"));
    }
}

ClientConfig loadClientConfig(const std::filesystem::path& path) {
    ClientConfig config;

    if (auto content = readFile(path); content && !content->empty()) {
        try {
            auto json = util::parseJson(*content);
            if (json.is_object()) {
                applyJson(config, json.as_object());
            } else {
                util::log(util::LogLevel::warn, "Config " + path.string() + " is not a JSON object, using defaults");
            }
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, "Failed to parse config " + path.string() + ": " + ex.what());
        }
    }

    if (const char* value = std::getenv("CHATPOOL_BASE_URL")) config.baseUrl = value;
    if (const char* value = std::getenv("CHATPOOL_MODEL")) config.model = value;
    if (const char* value = std::getenv("CHATPOOL_MAX_CONCURRENT")) {
        config.maxConcurrentRequests = std::max<std::size_t>(1, std::strtoul(value, nullptr, 10));
    }
    if (const char* value = std::getenv("CHATPOOL_MAX_RETRIES")) {
        config.maxRetries = static_cast<int>(std::strtol(value, nullptr, 10));
        config.maxRetries = std::max(config.maxRetries, 0);
    }
    if (const char* value = std::getenv("CHATPOOL_STATS_FILE")) config.statsFile = value;
    if (const char* value = std::getenv("CHATPOOL_ACCOUNTS_FILE")) {
        auto accounts = loadAccounts(value);
        if (!accounts.empty()) {
            config.accounts = std::move(accounts);
        }
    }
    if (const char* value = std::getenv("CHATPOOL_LOG_LEVEL")) config.logLevel = util::parseLogLevel(value);

    if (config.maxConcurrentRequests == 0) {
        config.maxConcurrentRequests = 1;
    }
    return config;
}

std::vector<account::Credential> parseAccounts(const boost::json::value& json) {
    if (!json.is_array()) {
        throw std::invalid_argument("Account list must be a JSON array");
    }
    std::vector<account::Credential> accounts;
    for (const auto& item : json.as_array()) {
        if (item.is_string()) {
            std::string value(item.as_string().c_str());
            accounts.push_back(account::Credential{value, value});
        } else if (item.is_object()) {
            const auto& obj = item.as_object();
            account::Credential credential{util::readString(obj, "email"), util::readString(obj, "password")};
            if (credential.email.empty()) {
                util::log(util::LogLevel::warn, "Skipping account entry without email");
                continue;
            }
            accounts.push_back(std::move(credential));
        }
    }
    return accounts;
}

std::vector<account::Credential> loadAccounts(const std::filesystem::path& path) {
    auto content = readFile(path);
    if (!content) {
        util::log(util::LogLevel::warn, "Accounts file " + path.string() + " not found");
        return {};
    }
    try {
        auto accounts = parseAccounts(util::parseJson(*content));
        util::log(util::LogLevel::info, "Loaded " + std::to_string(accounts.size()) + " accounts from " + path.string());
        return accounts;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Failed to load accounts from " + path.string() + ": " + ex.what());
        return {};
    }
}

} // namespace chatpool::config
