#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatpool::stream {

// Splits an event-stream body into lines. Accepts LF and CRLF and keeps a partial
// trailing line until the next chunk completes it.
class SseLineDecoder {
public:
    std::vector<std::string> feed(std::string_view chunk);

    // Remaining unterminated line, if any.
    std::optional<std::string> finish();

private:
    std::string pending_;
};

} // namespace chatpool::stream
