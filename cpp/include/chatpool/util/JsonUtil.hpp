#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace chatpool::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// Lenient readers: absent keys and mismatched types yield the fallback.
std::string readString(const boost::json::object& obj, std::string_view key, std::string fallback = {});
std::int64_t readInt(const boost::json::object& obj, std::string_view key, std::int64_t fallback = 0);
double readDouble(const boost::json::object& obj, std::string_view key, double fallback = 0.0);
bool readBool(const boost::json::object& obj, std::string_view key, bool fallback = false);

} // namespace chatpool::util
