#include "chatpool/account/AccountStats.hpp"
#include "chatpool/util/TimeUtil.hpp"

#include <algorithm>

namespace chatpool::account {

double AccountStats::successRate() const {
    return static_cast<double>(successCount) / static_cast<double>(std::max<std::uint64_t>(totalAttempts, 1));
}

double AccountStats::avgMessageLength() const {
    return static_cast<double>(totalMessageLength) / static_cast<double>(std::max<std::uint64_t>(successCount, 1));
}

double AccountStats::avgFirstPacketDelay() const {
    return totalFirstPacketDelay / static_cast<double>(std::max<std::uint64_t>(successCount, 1));
}

double AccountStats::generationSpeed() const {
    return static_cast<double>(totalGenerationTokens) / std::max(totalGenerationTime, 0.001);
}

void AccountStats::recordSuccess(const ResultMetrics& metrics) {
    ++successCount;
    ++totalAttempts;
    totalMessageLength += metrics.messageLength;
    totalFirstPacketDelay += metrics.firstPacketDelay;
    totalGenerationTokens += metrics.generatedTokens;
    totalGenerationTime += metrics.generationTime;
    lastUpdated = util::epochSeconds();
}

void AccountStats::recordFailure() {
    ++totalAttempts;
    lastUpdated = util::epochSeconds();
}

} // namespace chatpool::account
