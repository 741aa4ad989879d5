#pragma once

#include <cstdint>
#include <string_view>

namespace chatpool::stream {

// CJK ideographs (U+4E00..U+9FFF) plus 0.75 per run of ASCII letters, rounded down.
// Only feeds throughput statistics.
std::uint64_t estimateTokens(std::string_view utf8);

} // namespace chatpool::stream
