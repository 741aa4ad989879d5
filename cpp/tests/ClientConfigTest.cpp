#include "chatpool/config/ClientConfig.hpp"
#include "chatpool/util/Crypto.hpp"
#include "chatpool/util/JsonUtil.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace {

using namespace chatpool;
using namespace std::chrono_literals;

class ClientConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("chatpool-config-" + util::makeUuid());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        unsetenv("CHATPOOL_MODEL");
        unsetenv("CHATPOOL_MAX_RETRIES");
        unsetenv("CHATPOOL_ACCOUNTS_FILE");
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

TEST(ClientConfigTest, DefaultsMatchDocumentedValues) {
    config::ClientConfig config;
    EXPECT_EQ(config.model, "qwen3-coder-plus");
    EXPECT_EQ(config.maxConcurrentRequests, 100u);
    EXPECT_EQ(config.maxRetries, 2);
    EXPECT_EQ(config.accountRefreshInterval, 30s);
    EXPECT_EQ(config.tokenRefreshMargin, 600s);
    EXPECT_EQ(config.timeouts.stream, 120s);
    EXPECT_EQ(config.snapshotEvery, 5u);
    EXPECT_EQ(config.klUcb.maxIterations, 100);
}

TEST(ClientConfigTest, ApplyJsonOverlaysPresentKeys) {
    config::ClientConfig config;
    auto json = util::parseJson(R"({
        "model": "qwen-max",
        "maxConcurrentRequests": 4,
        "retryDelayMs": 250,
        "accountRefreshIntervalSeconds": 60,
        "maxRetries": -3,
        "timeouts": {"stream": 30, "login": 5},
        "klUcb": {"maxIterations": 50, "precision": 0.001},
        "statsFile": "",
        "snapshotEvery": 10,
        "logLevel": "debug",
        "accounts": ["a@example.com", {"email": "b@example.com", "password": "pw"}],
        "unknownKey": true
    })");
    config::applyJson(config, json.as_object());

    EXPECT_EQ(config.model, "qwen-max");
    EXPECT_EQ(config.baseUrl, "https://chat.qwen.ai/api");
    EXPECT_EQ(config.maxConcurrentRequests, 4u);
    EXPECT_EQ(config.retryDelay, 250ms);
    EXPECT_EQ(config.accountRefreshInterval, 60s);
    EXPECT_EQ(config.maxRetries, 0);
    EXPECT_EQ(config.timeouts.stream, 30s);
    EXPECT_EQ(config.timeouts.login, 5s);
    EXPECT_EQ(config.timeouts.upload, 60s);
    EXPECT_EQ(config.klUcb.maxIterations, 50);
    EXPECT_DOUBLE_EQ(config.klUcb.precision, 0.001);
    EXPECT_TRUE(config.statsFile.empty());
    EXPECT_EQ(config.snapshotEvery, 10u);
    EXPECT_EQ(config.logLevel, util::LogLevel::debug);
    ASSERT_EQ(config.accounts.size(), 2u);
    EXPECT_EQ(config.accounts[0].email, "a@example.com");
    EXPECT_EQ(config.accounts[0].password, "a@example.com");
    EXPECT_EQ(config.accounts[1].password, "pw");
}

TEST(ClientConfigTest, PoolSettingsMirrorClientValues) {
    config::ClientConfig config;
    config.loginConcurrency = 7;
    config.loginRetries = 4;
    config.timeouts.login = 3s;
    config.snapshotEvery = 9;
    config.statsFile = "stats.json";
    auto settings = config.poolSettings();
    EXPECT_EQ(settings.loginConcurrency, 7u);
    EXPECT_EQ(settings.loginTries, 4);
    EXPECT_EQ(settings.loginTimeout, 3s);
    EXPECT_EQ(settings.snapshotEvery, 9u);
    EXPECT_EQ(settings.statsFile, std::filesystem::path("stats.json"));
    EXPECT_EQ(settings.refreshInterval, config.accountRefreshInterval);
}

TEST(ClientConfigTest, ParseAccountsRejectsNonArraysAndSkipsBadEntries) {
    EXPECT_THROW(config::parseAccounts(util::parseJson(R"({"email":"a"})")), std::invalid_argument);

    auto accounts = config::parseAccounts(
        util::parseJson(R"([{"password":"no-email"}, 12, {"email":"c@example.com","password":"x"}])"));
    ASSERT_EQ(accounts.size(), 1u);
    EXPECT_EQ(accounts[0].email, "c@example.com");
}

TEST_F(ClientConfigFileTest, MissingOrMalformedFileKeepsDefaults) {
    auto missing = config::loadClientConfig(dir_ / "absent.json");
    EXPECT_EQ(missing.model, "qwen3-coder-plus");

    auto malformed = config::loadClientConfig(write("bad.json", "{ not json"));
    EXPECT_EQ(malformed.maxRetries, 2);

    EXPECT_TRUE(config::loadAccounts(dir_ / "absent-accounts.json").empty());
}

TEST_F(ClientConfigFileTest, EnvironmentOverridesFileValues) {
    auto accounts = write("accounts.json", R"(["env@example.com"])");
    auto path = write("config.json", R"({"model": "from-file", "maxRetries": 4})");
    setenv("CHATPOOL_MODEL", "from-env", 1);
    setenv("CHATPOOL_ACCOUNTS_FILE", accounts.c_str(), 1);

    auto config = config::loadClientConfig(path);
    EXPECT_EQ(config.model, "from-env");
    EXPECT_EQ(config.maxRetries, 4);
    ASSERT_EQ(config.accounts.size(), 1u);
    EXPECT_EQ(config.accounts[0].email, "env@example.com");

    setenv("CHATPOOL_MAX_RETRIES", "-1", 1);
    EXPECT_EQ(config::loadClientConfig(path).maxRetries, 0);
}

} // namespace
