#include "chatpool/util/JsonUtil.hpp"

#include <cmath>
#include <stdexcept>

namespace chatpool::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::string readString(const boost::json::object& obj, std::string_view key, std::string fallback) {
    const auto* value = obj.if_contains(key);
    if (!value) {
        return fallback;
    }
    if (value->is_string()) {
        const auto& str = value->as_string();
        return std::string(str.c_str(), str.size());
    }
    if (value->is_int64()) {
        return std::to_string(value->as_int64());
    }
    if (value->is_uint64()) {
        return std::to_string(value->as_uint64());
    }
    return fallback;
}

std::int64_t readInt(const boost::json::object& obj, std::string_view key, std::int64_t fallback) {
    const auto* value = obj.if_contains(key);
    if (!value) {
        return fallback;
    }
    if (value->is_int64()) {
        return value->as_int64();
    }
    if (value->is_uint64()) {
        return static_cast<std::int64_t>(value->as_uint64());
    }
    if (value->is_double()) {
        return static_cast<std::int64_t>(std::llround(value->as_double()));
    }
    if (value->is_string()) {
        try {
            return std::stoll(std::string(value->as_string().c_str()));
        } catch (const std::exception&) {
        }
    }
    return fallback;
}

double readDouble(const boost::json::object& obj, std::string_view key, double fallback) {
    const auto* value = obj.if_contains(key);
    if (!value) {
        return fallback;
    }
    if (value->is_double()) {
        return value->as_double();
    }
    if (value->is_int64()) {
        return static_cast<double>(value->as_int64());
    }
    if (value->is_uint64()) {
        return static_cast<double>(value->as_uint64());
    }
    return fallback;
}

bool readBool(const boost::json::object& obj, std::string_view key, bool fallback) {
    const auto* value = obj.if_contains(key);
    if (!value) {
        return fallback;
    }
    if (value->is_bool()) {
        return value->as_bool();
    }
    if (value->is_int64()) {
        return value->as_int64() != 0;
    }
    return fallback;
}

} // namespace chatpool::util
