#pragma once

#include "chatpool/account/AccountPool.hpp"
#include "chatpool/account/BanditOptimizer.hpp"

#include <boost/json.hpp>

namespace chatpool::account {

boost::json::object toJson(const PoolStatus& status);

// Figures are rounded to two decimals; an untried account's infinite score becomes null.
boost::json::object toJson(const PerformanceReport& report);

} // namespace chatpool::account
