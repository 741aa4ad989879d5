#pragma once

#include "chatpool/stream/SseLineDecoder.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace chatpool::stream {

struct CompletionEvent {
    enum class Kind {
        ignore,
        delta,
        done,
        error
    };

    Kind kind{Kind::ignore};
    std::string text;
};

// Interprets one event-stream line. Lines that are not "data:" records, undecodable
// JSON and non-answer phases all come back as ignore.
CompletionEvent parseCompletionLine(std::string_view line);

enum class StreamState {
    connecting,
    first_byte_received,
    emitting_deltas,
    done,
    error
};

const char* toString(StreamState state);

struct StreamMetrics {
    double firstPacketDelay{};
    double generationTime{};
    std::uint64_t generatedTokens{};
    std::size_t deltaCount{};
};

// Drives one streamed completion: bytes in, answer deltas out, timings recorded.
class CompletionStream {
public:
    using Clock = std::chrono::steady_clock;
    using DeltaHandler = std::function<void(const std::string&)>;

    explicit CompletionStream(DeltaHandler onDelta, Clock::time_point startedAt = Clock::now());

    // Throws ChatError(remote_api_error) when the server reports an error in-band.
    void consume(std::string_view bytes);

    // Transport finished without error. Flushes an unterminated last line.
    void finish();

    // Moves to the error state; metrics stay as measured.
    void abort();

    StreamState state() const noexcept { return state_; }
    bool receivedContent() const noexcept { return metrics_.deltaCount > 0; }
    const StreamMetrics& metrics() const noexcept { return metrics_; }

private:
    void handleLine(std::string_view line);
    void complete();

    DeltaHandler onDelta_;
    SseLineDecoder decoder_;
    StreamState state_{StreamState::connecting};
    Clock::time_point startedAt_;
    Clock::time_point firstDeltaAt_{};
    StreamMetrics metrics_;
};

} // namespace chatpool::stream
