#include "chatpool/account/Reports.hpp"
#include "chatpool/util/TimeUtil.hpp"

#include <cmath>

namespace chatpool::account {
namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

boost::json::object toJson(const PoolStatus& status) {
    boost::json::object json;
    json["total_accounts"] = status.total;
    json["logged_in"] = status.loggedIn;
    json["available"] = status.available;
    json["busy"] = status.busy;
    json["initializing"] = status.initializing;
    json["initialized_count"] = status.initializedCount;
    return json;
}

boost::json::object toJson(const PerformanceReport& report) {
    boost::json::array accounts;
    for (const auto& entry : report.accounts) {
        boost::json::object item;
        item["account"] = entry.accountId;
        item["success_rate"] = round2(entry.successRatePercent);
        item["success_count"] = entry.successCount;
        item["total_attempts"] = entry.totalAttempts;
        item["avg_first_packet_delay"] = round2(entry.avgFirstPacketDelay);
        item["generation_speed"] = round2(entry.generationSpeed);
        item["avg_message_length"] = round2(entry.avgMessageLength);
        if (std::isfinite(entry.score)) {
            item["score"] = std::round(entry.score * 1000.0) / 1000.0;
        } else {
            item["score"] = nullptr;
        }
        item["failed"] = entry.failedThisRound;
        accounts.emplace_back(std::move(item));
    }

    boost::json::object json;
    json["generated_at"] = util::isoTimestamp(std::chrono::system_clock::now());
    json["total_accounts"] = report.totalAccounts;
    json["global_attempts"] = report.globalAttempts;
    json["failed_accounts_count"] = report.failedAccounts;
    json["efficiency"] = round2(report.efficiencyPercent);
    json["accounts"] = std::move(accounts);
    return json;
}

} // namespace chatpool::account
