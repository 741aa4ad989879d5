#include "chatpool/util/Crypto.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <array>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace chatpool::util {

std::string base64Encode(std::string_view input) {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::uint32_t value = 0;
    int bitCount = -6;
    for (unsigned char c : input) {
        value = (value << 8) | c;
        bitCount += 8;
        while (bitCount >= 0) {
            output.push_back(alphabet[(value >> bitCount) & 0x3F]);
            bitCount -= 6;
        }
    }

    if (bitCount > -6) {
        output.push_back(alphabet[((value << 8) >> (bitCount + 8)) & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

std::string hmacSha1(std::string_view key, std::string_view message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    auto* result = HMAC(EVP_sha1(),
                        key.data(), static_cast<int>(key.size()),
                        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                        digest, &length);
    if (!result) {
        throw std::runtime_error("HMAC-SHA1 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), length);
}

std::string sha256Hex(std::string_view input) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);

    static constexpr char hex[] = "0123456789abcdef";
    std::string output;
    output.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char byte : digest) {
        output.push_back(hex[byte >> 4]);
        output.push_back(hex[byte & 0x0F]);
    }
    return output;
}

// Random (version 4) UUID in the canonical 8-4-4-4-12 form.
std::string makeUuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> dist(0, std::numeric_limits<unsigned long long>::max());

    std::array<unsigned char, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        auto value = dist(rng);
        for (std::size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<unsigned char>(value >> (8 * j));
        }
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // namespace chatpool::util
