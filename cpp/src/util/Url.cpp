#include "chatpool/util/Url.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace chatpool::util {
namespace {

std::string lowercase(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

} // namespace

ParsedUrl parseUrl(const std::string& url) {
    const std::string_view view(url);
    const auto schemeEnd = view.find("://");
    if (schemeEnd == std::string_view::npos || schemeEnd == 0) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }

    ParsedUrl parsed;
    parsed.scheme = lowercase(view.substr(0, schemeEnd));

    auto rest = view.substr(schemeEnd + 3);
    const auto authorityEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authorityEnd);
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    if (const auto colon = authority.find(':'); colon != std::string_view::npos) {
        parsed.host = std::string(authority.substr(0, colon));
        parsed.port = std::string(authority.substr(colon + 1));
    } else {
        parsed.host = std::string(authority);
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    if (parsed.port.empty()) {
        parsed.port = parsed.scheme == "https" ? "443" : "80";
    }

    parsed.target = authorityEnd == std::string_view::npos ? "/" : std::string(rest.substr(authorityEnd));
    if (parsed.target.front() != '/') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
}

std::string authorityFrom(const ParsedUrl& parsed) {
    const bool defaultPort = (parsed.scheme == "http" && parsed.port == "80") ||
                             (parsed.scheme == "https" && parsed.port == "443");
    return defaultPort ? parsed.host : parsed.host + ":" + parsed.port;
}

std::string urlEncode(const std::string& value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (isUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace chatpool::util
