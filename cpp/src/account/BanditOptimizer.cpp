#include "chatpool/account/BanditOptimizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace chatpool::account {

double klDivergence(double p, double q) {
    constexpr double kEpsilon = 1e-12;
    p = std::clamp(p, 0.0, 1.0);
    q = std::clamp(q, kEpsilon, 1.0 - kEpsilon);
    double result = 0.0;
    if (p > 0.0) {
        result += p * std::log(p / q);
    }
    if (p < 1.0) {
        result += (1.0 - p) * std::log((1.0 - p) / (1.0 - q));
    }
    return result;
}

double klUpperBound(double p, double level, const KlUcbSettings& settings) {
    const double precision = settings.precision;
    if (p >= 1.0 - precision) {
        return 1.0;
    }
    if (level <= precision) {
        return p;
    }

    double low = std::max(p, 0.0);
    double high = 1.0;
    for (int i = 0; i < settings.maxIterations; ++i) {
        const double mid = (low + high) / 2.0;
        if (mid <= precision || mid >= 1.0 - precision) {
            break;
        }
        if (klDivergence(p, mid) <= level) {
            low = mid;
        } else {
            high = mid;
        }
        if (high - low < precision) {
            break;
        }
    }
    return (low + high) / 2.0;
}

BanditOptimizer::BanditOptimizer(KlUcbSettings settings, std::uint64_t snapshotEvery)
    : settings_(settings), snapshotEvery_(snapshotEvery) {}

double BanditOptimizer::score(const std::string& accountId, std::uint64_t lengthHint) const {
    auto it = stats_.find(accountId);
    if (it == stats_.end() || it->second.totalAttempts == 0) {
        return std::numeric_limits<double>::infinity();
    }
    const AccountStats& stats = it->second;

    const double confidence = std::log(static_cast<double>(std::max<std::uint64_t>(globalAttempts_, 1))) /
                              static_cast<double>(stats.totalAttempts);
    const double ucb = klUpperBound(stats.successRate(), confidence, settings_);

    double delayScore = 0.5;
    double speedScore = 0.5;
    double lengthFit = 1.0;
    if (stats.successCount > 0) {
        delayScore = 1.0 / (1.0 + stats.avgFirstPacketDelay());
        if (stats.totalGenerationTime > 0.0) {
            speedScore = std::min(stats.generationSpeed() / kReferenceSpeed, kScoreCap);
        }
        if (lengthHint > 0) {
            lengthFit = std::min(stats.avgMessageLength() / static_cast<double>(lengthHint), kScoreCap);
        }
    }

    double total = kSuccessWeight * ucb + kDelayWeight * delayScore + kSpeedWeight * speedScore +
                   kLengthWeight * lengthFit;
    if (failed_.count(accountId) != 0) {
        total *= kFailedPenalty;
    }
    return total;
}

std::optional<std::size_t> BanditOptimizer::select(const std::vector<std::string>& candidates,
                                                   std::uint64_t lengthHint) const {
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::size_t best = 0;
    double bestScore = score(candidates.front(), lengthHint);
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        const double candidateScore = score(candidates[i], lengthHint);
        if (candidateScore > bestScore) {
            best = i;
            bestScore = candidateScore;
        }
    }
    return best;
}

void BanditOptimizer::recordResult(const std::string& accountId, bool success, const ResultMetrics& metrics) {
    AccountStats& stats = stats_[accountId];
    stats.accountId = accountId;
    if (success) {
        stats.recordSuccess(metrics);
        failed_.erase(accountId);
    } else {
        stats.recordFailure();
        failed_.insert(accountId);
    }
    ++globalAttempts_;
}

bool BanditOptimizer::snapshotDue() const noexcept {
    return snapshotEvery_ > 0 && globalAttempts_ > 0 && globalAttempts_ % snapshotEvery_ == 0;
}

void BanditOptimizer::resetFailed() {
    failed_.clear();
}

bool BanditOptimizer::isFailed(const std::string& accountId) const {
    return failed_.count(accountId) != 0;
}

bool BanditOptimizer::allFailed(const std::vector<std::string>& accountIds) const {
    if (accountIds.empty()) {
        return false;
    }
    return std::all_of(accountIds.begin(), accountIds.end(),
                       [this](const std::string& id) { return failed_.count(id) != 0; });
}

const AccountStats* BanditOptimizer::stats(const std::string& accountId) const {
    auto it = stats_.find(accountId);
    return it == stats_.end() ? nullptr : &it->second;
}

StatsSnapshot BanditOptimizer::snapshot() const {
    StatsSnapshot snapshot;
    snapshot.accountStats = stats_;
    snapshot.globalAttempts = globalAttempts_;
    snapshot.failedAccounts = failed_;
    return snapshot;
}

void BanditOptimizer::restore(StatsSnapshot snapshot) {
    stats_ = std::move(snapshot.accountStats);
    for (auto& [id, stats] : stats_) {
        stats.accountId = id;
        stats.successCount = std::min(stats.successCount, stats.totalAttempts);
    }
    globalAttempts_ = snapshot.globalAttempts;
    failed_ = std::move(snapshot.failedAccounts);
}

PerformanceReport BanditOptimizer::report() const {
    PerformanceReport report;
    report.totalAccounts = stats_.size();
    report.globalAttempts = globalAttempts_;
    report.failedAccounts = failed_.size();

    std::uint64_t successes = 0;
    for (const auto& [id, stats] : stats_) {
        successes += stats.successCount;

        AccountReport entry;
        entry.accountId = id;
        entry.successRatePercent = stats.successRate() * 100.0;
        entry.successCount = stats.successCount;
        entry.totalAttempts = stats.totalAttempts;
        entry.avgFirstPacketDelay = stats.avgFirstPacketDelay();
        entry.generationSpeed = stats.generationSpeed();
        entry.avgMessageLength = stats.avgMessageLength();
        entry.score = score(id);
        entry.failedThisRound = failed_.count(id) != 0;
        report.accounts.push_back(std::move(entry));
    }
    if (globalAttempts_ > 0) {
        report.efficiencyPercent = static_cast<double>(successes) / static_cast<double>(globalAttempts_) * 100.0;
    }

    std::stable_sort(report.accounts.begin(), report.accounts.end(),
                     [](const AccountReport& lhs, const AccountReport& rhs) { return lhs.score > rhs.score; });
    return report;
}

} // namespace chatpool::account
