#include "chatpool/account/StatsStore.hpp"
#include "chatpool/util/JsonUtil.hpp"
#include "chatpool/util/Logging.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace chatpool::account {
namespace {

std::uint64_t readCount(const boost::json::object& obj, std::string_view key) {
    auto value = util::readInt(obj, key, 0);
    return value < 0 ? 0 : static_cast<std::uint64_t>(value);
}

} // namespace

boost::json::object snapshotToJson(const StatsSnapshot& snapshot) {
    boost::json::object accounts;
    for (const auto& [id, stats] : snapshot.accountStats) {
        boost::json::object entry;
        entry["success_count"] = stats.successCount;
        entry["total_attempts"] = stats.totalAttempts;
        entry["total_message_length"] = stats.totalMessageLength;
        entry["total_first_packet_delay"] = stats.totalFirstPacketDelay;
        entry["total_generation_tokens"] = stats.totalGenerationTokens;
        entry["total_generation_time"] = stats.totalGenerationTime;
        entry["last_updated"] = stats.lastUpdated;
        accounts[id] = std::move(entry);
    }

    boost::json::array failed;
    for (const auto& id : snapshot.failedAccounts) {
        failed.emplace_back(id);
    }

    boost::json::object document;
    document["version"] = kSnapshotVersion;
    document["global_attempts"] = snapshot.globalAttempts;
    document["failed_accounts"] = std::move(failed);
    document["account_stats"] = std::move(accounts);
    return document;
}

StatsSnapshot snapshotFromJson(const boost::json::value& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Stats snapshot must be a JSON object");
    }
    const auto& root = document.as_object();

    const auto version = util::readInt(root, "version", kSnapshotVersion);
    if (version > kSnapshotVersion) {
        util::log(util::LogLevel::warn,
                  "Stats snapshot version " + std::to_string(version) + " is newer than supported, reading known fields");
    }

    StatsSnapshot snapshot;
    snapshot.globalAttempts = readCount(root, "global_attempts");

    if (const auto* failed = root.if_contains("failed_accounts"); failed && failed->is_array()) {
        for (const auto& item : failed->as_array()) {
            if (item.is_string()) {
                snapshot.failedAccounts.emplace(item.as_string().c_str());
            }
        }
    }

    if (const auto* accounts = root.if_contains("account_stats"); accounts && accounts->is_object()) {
        for (const auto& entry : accounts->as_object()) {
            if (!entry.value().is_object()) {
                continue;
            }
            const auto& fields = entry.value().as_object();
            AccountStats stats;
            stats.accountId = std::string(entry.key());
            stats.successCount = readCount(fields, "success_count");
            stats.totalAttempts = readCount(fields, "total_attempts");
            stats.totalMessageLength = readCount(fields, "total_message_length");
            stats.totalFirstPacketDelay = util::readDouble(fields, "total_first_packet_delay");
            stats.totalGenerationTokens = readCount(fields, "total_generation_tokens");
            stats.totalGenerationTime = util::readDouble(fields, "total_generation_time");
            stats.lastUpdated = util::readDouble(fields, "last_updated");
            if (stats.successCount > stats.totalAttempts) {
                stats.successCount = stats.totalAttempts;
            }
            snapshot.accountStats.emplace(stats.accountId, std::move(stats));
        }
    }
    return snapshot;
}

StatsStore::StatsStore(std::filesystem::path path)
    : path_(std::move(path)) {}

StatsSnapshot StatsStore::load() const {
    if (!enabled()) {
        return {};
    }
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        util::log(util::LogLevel::info, "No stats snapshot at " + path_.string() + ", starting fresh");
        return {};
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        util::log(util::LogLevel::warn, "Unable to open stats snapshot " + path_.string());
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    try {
        auto snapshot = snapshotFromJson(util::parseJson(buffer.str()));
        util::log(util::LogLevel::info, "Loaded stats for " + std::to_string(snapshot.accountStats.size()) +
                                            " accounts from " + path_.string());
        return snapshot;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn,
                  "Ignoring corrupt stats snapshot " + path_.string() + ": " + ex.what());
        return {};
    }
}

bool StatsStore::save(const StatsSnapshot& snapshot) const {
    if (!enabled()) {
        return true;
    }
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            util::log(util::LogLevel::warn, "Unable to create " + path_.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    auto temp = path_;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            util::log(util::LogLevel::warn, "Unable to write stats snapshot " + temp.string());
            return false;
        }
        output << util::stringifyJson(snapshotToJson(snapshot));
        output.flush();
        if (!output) {
            util::log(util::LogLevel::warn, "Short write on stats snapshot " + temp.string());
            return false;
        }
    }

    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        util::log(util::LogLevel::warn, "Unable to replace stats snapshot " + path_.string() + ": " + ec.message());
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

} // namespace chatpool::account
