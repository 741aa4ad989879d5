#include "chatpool/stream/TokenEstimator.hpp"

namespace chatpool::stream {
namespace {

bool isAsciiLetter(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // namespace

std::uint64_t estimateTokens(std::string_view utf8) {
    std::uint64_t ideographs = 0;
    std::uint64_t words = 0;
    bool inWord = false;

    std::size_t i = 0;
    while (i < utf8.size()) {
        const auto lead = static_cast<unsigned char>(utf8[i]);
        if (lead < 0x80) {
            const bool letter = isAsciiLetter(lead);
            if (letter && !inWord) {
                ++words;
            }
            inWord = letter;
            ++i;
            continue;
        }
        inWord = false;

        std::size_t length = 1;
        char32_t codepoint = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            codepoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            codepoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            codepoint = lead & 0x07;
        } else {
            ++i;
            continue;
        }

        if (i + length > utf8.size()) {
            break;
        }
        bool valid = true;
        for (std::size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(utf8[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            codepoint = (codepoint << 6) | (next & 0x3F);
        }
        if (!valid) {
            ++i;
            continue;
        }
        if (codepoint >= 0x4E00 && codepoint <= 0x9FFF) {
            ++ideographs;
        }
        i += length;
    }

    return ideographs + (words * 3) / 4;
}

} // namespace chatpool::stream
