#pragma once

#include "chatpool/account/AccountStats.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chatpool::account {

struct KlUcbSettings {
    int maxIterations{100};
    double precision{1e-6};
};

// Bernoulli KL divergence KL(p || q).
double klDivergence(double p, double q);

// Largest q in [p, 1) with KL(p || q) <= level, found by bisection.
double klUpperBound(double p, double level, const KlUcbSettings& settings = {});

struct StatsSnapshot {
    std::map<std::string, AccountStats> accountStats;
    std::uint64_t globalAttempts{};
    std::set<std::string> failedAccounts;
};

struct AccountReport {
    std::string accountId;
    double successRatePercent{};
    std::uint64_t successCount{};
    std::uint64_t totalAttempts{};
    double avgFirstPacketDelay{};
    double generationSpeed{};
    double avgMessageLength{};
    double score{};
    bool failedThisRound{};
};

struct PerformanceReport {
    std::size_t totalAccounts{};
    std::uint64_t globalAttempts{};
    std::size_t failedAccounts{};
    double efficiencyPercent{};
    std::vector<AccountReport> accounts;
};

// KL-UCB account scoring. Not synchronized; AccountPool calls it under its own mutex.
class BanditOptimizer {
public:
    static constexpr double kSuccessWeight = 0.4;
    static constexpr double kDelayWeight = 0.25;
    static constexpr double kSpeedWeight = 0.25;
    static constexpr double kLengthWeight = 0.10;
    static constexpr double kFailedPenalty = 0.1;
    static constexpr double kReferenceSpeed = 50.0;
    static constexpr double kScoreCap = 2.0;

    explicit BanditOptimizer(KlUcbSettings settings = {}, std::uint64_t snapshotEvery = 5);

    // +infinity for accounts that have never been tried.
    double score(const std::string& accountId, std::uint64_t lengthHint = 0) const;

    // Index of the best candidate, first one on ties; nullopt for an empty list.
    std::optional<std::size_t> select(const std::vector<std::string>& candidates,
                                      std::uint64_t lengthHint = 0) const;

    void recordResult(const std::string& accountId, bool success, const ResultMetrics& metrics);

    // True right after every snapshotEvery-th recorded result.
    bool snapshotDue() const noexcept;

    void resetFailed();
    bool isFailed(const std::string& accountId) const;
    bool allFailed(const std::vector<std::string>& accountIds) const;

    const AccountStats* stats(const std::string& accountId) const;
    std::uint64_t globalAttempts() const noexcept { return globalAttempts_; }

    StatsSnapshot snapshot() const;
    void restore(StatsSnapshot snapshot);

    PerformanceReport report() const;

private:
    KlUcbSettings settings_;
    std::uint64_t snapshotEvery_;
    std::map<std::string, AccountStats> stats_;
    std::uint64_t globalAttempts_{};
    std::set<std::string> failed_;
};

} // namespace chatpool::account
