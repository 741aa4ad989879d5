#include "chatpool/stream/SseLineDecoder.hpp"

namespace chatpool::stream {

std::vector<std::string> SseLineDecoder::feed(std::string_view chunk) {
    std::vector<std::string> lines;
    pending_.append(chunk.data(), chunk.size());

    std::size_t start = 0;
    while (true) {
        const auto newline = pending_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        auto end = newline;
        if (end > start && pending_[end - 1] == '\r') {
            --end;
        }
        lines.emplace_back(pending_, start, end - start);
        start = newline + 1;
    }
    pending_.erase(0, start);
    return lines;
}

std::optional<std::string> SseLineDecoder::finish() {
    if (pending_.empty()) {
        return std::nullopt;
    }
    std::string tail = std::move(pending_);
    pending_.clear();
    if (!tail.empty() && tail.back() == '\r') {
        tail.pop_back();
    }
    return tail;
}

} // namespace chatpool::stream
