#pragma once

#include <string>

namespace chatpool::util {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Throws std::invalid_argument when the scheme is missing.
ParsedUrl parseUrl(const std::string& url);

// Host with the port appended unless it is the scheme default.
std::string authorityFrom(const ParsedUrl& parsed);

std::string urlEncode(const std::string& value);

} // namespace chatpool::util
