#include "chatpool/account/Reports.hpp"
#include "chatpool/account/StatsStore.hpp"
#include "chatpool/util/Crypto.hpp"
#include "chatpool/util/JsonUtil.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace {

using namespace chatpool::account;
namespace fs = std::filesystem;

class StatsStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("chatpool-stats-" + chatpool::util::makeUuid());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

StatsSnapshot sampleSnapshot() {
    BanditOptimizer optimizer;
    optimizer.recordResult("a@example.com", true, ResultMetrics{120, 0.4, 80, 1.6});
    optimizer.recordResult("a@example.com", false, {});
    optimizer.recordResult("b@example.com", true, ResultMetrics{30, 0.2, 20, 0.5});
    return optimizer.snapshot();
}

TEST_F(StatsStoreTest, SaveThenLoadKeepsCounters) {
    StatsStore store(dir_ / "nested" / "stats.json");
    const auto snapshot = sampleSnapshot();
    ASSERT_TRUE(store.save(snapshot));
    EXPECT_TRUE(fs::exists(store.path()));
    EXPECT_FALSE(fs::exists(dir_ / "nested" / "stats.json.tmp"));

    const auto loaded = store.load();
    EXPECT_EQ(loaded.globalAttempts, 3u);
    ASSERT_EQ(loaded.accountStats.size(), 2u);
    const auto& a = loaded.accountStats.at("a@example.com");
    EXPECT_EQ(a.successCount, 1u);
    EXPECT_EQ(a.totalAttempts, 2u);
    EXPECT_EQ(a.totalMessageLength, 120u);
    EXPECT_DOUBLE_EQ(a.totalFirstPacketDelay, 0.4);
    EXPECT_EQ(a.totalGenerationTokens, 80u);
    EXPECT_EQ(loaded.failedAccounts.count("a@example.com"), 1u);
    EXPECT_EQ(loaded.failedAccounts.count("b@example.com"), 0u);
}

TEST_F(StatsStoreTest, MissingFileYieldsEmptySnapshot) {
    StatsStore store(dir_ / "absent.json");
    const auto loaded = store.load();
    EXPECT_TRUE(loaded.accountStats.empty());
    EXPECT_EQ(loaded.globalAttempts, 0u);
}

TEST_F(StatsStoreTest, CorruptFileYieldsEmptySnapshot) {
    const auto path = dir_ / "corrupt.json";
    {
        std::ofstream out(path);
        out << "{\"version\":1,\"account_stats\":";
    }
    StatsStore store(path);
    const auto loaded = store.load();
    EXPECT_TRUE(loaded.accountStats.empty());
    EXPECT_TRUE(loaded.failedAccounts.empty());
}

TEST_F(StatsStoreTest, EmptyPathDisablesPersistence) {
    StatsStore store{fs::path{}};
    EXPECT_FALSE(store.enabled());
    EXPECT_TRUE(store.save(sampleSnapshot()));
    EXPECT_TRUE(store.load().accountStats.empty());
}

TEST(StatsSnapshotJsonTest, MissingFieldsDefaultToZero) {
    auto document = chatpool::util::parseJson(
        R"({"account_stats":{"x":{"total_attempts":4}},"failed_accounts":["x",7]})");
    const auto snapshot = snapshotFromJson(document);
    EXPECT_EQ(snapshot.globalAttempts, 0u);
    const auto& stats = snapshot.accountStats.at("x");
    EXPECT_EQ(stats.accountId, "x");
    EXPECT_EQ(stats.totalAttempts, 4u);
    EXPECT_EQ(stats.successCount, 0u);
    EXPECT_DOUBLE_EQ(stats.totalGenerationTime, 0.0);
    EXPECT_EQ(snapshot.failedAccounts.size(), 1u);
}

TEST(StatsSnapshotJsonTest, SuccessCountIsClampedToAttempts) {
    auto document = chatpool::util::parseJson(R"({"account_stats":{"x":{"success_count":9,"total_attempts":3}}})");
    EXPECT_EQ(snapshotFromJson(document).accountStats.at("x").successCount, 3u);
    EXPECT_THROW(snapshotFromJson(chatpool::util::parseJson("[1,2]")), std::invalid_argument);
}

TEST(StatsSnapshotJsonTest, DocumentCarriesVersion) {
    auto json = snapshotToJson(sampleSnapshot());
    EXPECT_EQ(json.at("version").as_int64(), kSnapshotVersion);
    EXPECT_EQ(json.at("global_attempts").as_uint64(), 3u);
    EXPECT_TRUE(json.at("account_stats").as_object().contains("b@example.com"));
}

TEST(ReportJsonTest, InfiniteScoreIsWrittenAsNull) {
    PerformanceReport report;
    report.totalAccounts = 1;
    AccountReport entry;
    entry.accountId = "fresh";
    entry.score = std::numeric_limits<double>::infinity();
    report.accounts.push_back(entry);

    auto json = toJson(report);
    const auto& accounts = json.at("accounts").as_array();
    ASSERT_EQ(accounts.size(), 1u);
    EXPECT_TRUE(accounts[0].as_object().at("score").is_null());
    EXPECT_EQ(json.at("total_accounts").as_uint64(), 1u);
}

} // namespace
