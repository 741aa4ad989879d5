#pragma once

#include <string>
#include <string_view>

namespace chatpool::util {

std::string base64Encode(std::string_view input);

// Raw 20-byte digest.
std::string hmacSha1(std::string_view key, std::string_view message);

// Lowercase hex digest, used for the signin password hash.
std::string sha256Hex(std::string_view input);

std::string makeUuid();

} // namespace chatpool::util
