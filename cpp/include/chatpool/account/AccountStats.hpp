#pragma once

#include <cstdint>
#include <string>

namespace chatpool::account {

// Measurements reported when an account is handed back to the pool.
struct ResultMetrics {
    std::uint64_t messageLength{};
    double firstPacketDelay{};
    std::uint64_t generatedTokens{};
    double generationTime{};
};

// Rolling counters for one account. Derived figures are computed on read.
struct AccountStats {
    std::string accountId;
    std::uint64_t successCount{};
    std::uint64_t totalAttempts{};
    std::uint64_t totalMessageLength{};
    double totalFirstPacketDelay{};
    std::uint64_t totalGenerationTokens{};
    double totalGenerationTime{};
    double lastUpdated{};

    double successRate() const;
    double avgMessageLength() const;
    double avgFirstPacketDelay() const;
    double generationSpeed() const;

    void recordSuccess(const ResultMetrics& metrics);
    void recordFailure();
};

} // namespace chatpool::account
