#pragma once

#include "chatpool/account/BanditOptimizer.hpp"

#include <boost/json.hpp>

#include <filesystem>

namespace chatpool::account {

inline constexpr std::int64_t kSnapshotVersion = 1;

boost::json::object snapshotToJson(const StatsSnapshot& snapshot);
// Missing fields default to zero; throws std::invalid_argument on a non-object document.
StatsSnapshot snapshotFromJson(const boost::json::value& document);

// Persists optimizer state as a JSON document. An empty path disables persistence.
class StatsStore {
public:
    explicit StatsStore(std::filesystem::path path);

    // Absent or unreadable files yield an empty snapshot.
    StatsSnapshot load() const;
    // Writes <path>.tmp and renames it over <path>. Returns false on I/O failure.
    bool save(const StatsSnapshot& snapshot) const;

    const std::filesystem::path& path() const noexcept { return path_; }
    bool enabled() const noexcept { return !path_.empty(); }

private:
    std::filesystem::path path_;
};

} // namespace chatpool::account
