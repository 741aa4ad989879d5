#include "chatpool/stream/CompletionStream.hpp"
#include "chatpool/api/ChatError.hpp"
#include "chatpool/stream/TokenEstimator.hpp"
#include "chatpool/util/JsonUtil.hpp"
#include "chatpool/util/Logging.hpp"

#include <boost/json.hpp>

namespace chatpool::stream {
namespace {

constexpr std::string_view kDataPrefix = "data:";
constexpr std::string_view kDoneSentinel = "[DONE]";

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string describeError(const boost::json::value& error) {
    if (error.is_string()) {
        return std::string(error.as_string().c_str());
    }
    if (error.is_object()) {
        auto message = util::readString(error.as_object(), "message");
        if (!message.empty()) {
            return message;
        }
    }
    return util::stringifyJson(error);
}

} // namespace

CompletionEvent parseCompletionLine(std::string_view line) {
    line = trim(line);
    if (line.substr(0, kDataPrefix.size()) != kDataPrefix) {
        return {};
    }
    auto data = trim(line.substr(kDataPrefix.size()));
    if (data == kDoneSentinel) {
        return {CompletionEvent::Kind::done, {}};
    }
    if (data.empty()) {
        return {};
    }

    boost::json::value document;
    try {
        document = util::parseJson(std::string(data));
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug, std::string{"Skipping undecodable stream line: "} + ex.what());
        return {};
    }
    if (!document.is_object()) {
        return {};
    }
    const auto& root = document.as_object();

    const auto* choices = root.if_contains("choices");
    if (choices && choices->is_array() && !choices->as_array().empty()) {
        const auto& first = choices->as_array().front();
        if (!first.is_object()) {
            return {};
        }
        const auto* delta = first.as_object().if_contains("delta");
        if (!delta || !delta->is_object()) {
            return {};
        }
        const auto& fields = delta->as_object();
        if (util::readString(fields, "phase") != "answer") {
            return {};
        }
        auto content = util::readString(fields, "content");
        if (content.empty()) {
            return {};
        }
        return {CompletionEvent::Kind::delta, std::move(content)};
    }

    if (const auto* error = root.if_contains("error"); error && !error->is_null()) {
        return {CompletionEvent::Kind::error, describeError(*error)};
    }
    return {};
}

const char* toString(StreamState state) {
    switch (state) {
    case StreamState::connecting:
        return "connecting";
    case StreamState::first_byte_received:
        return "first_byte_received";
    case StreamState::emitting_deltas:
        return "emitting_deltas";
    case StreamState::done:
        return "done";
    case StreamState::error:
        return "error";
    }
    return "unknown";
}

CompletionStream::CompletionStream(DeltaHandler onDelta, Clock::time_point startedAt)
    : onDelta_(std::move(onDelta))
    , startedAt_(startedAt) {}

void CompletionStream::consume(std::string_view bytes) {
    if (state_ == StreamState::done || state_ == StreamState::error) {
        return;
    }
    if (state_ == StreamState::connecting) {
        state_ = StreamState::first_byte_received;
    }
    for (const auto& line : decoder_.feed(bytes)) {
        handleLine(line);
        if (state_ == StreamState::done) {
            return;
        }
    }
}

void CompletionStream::finish() {
    if (state_ == StreamState::done || state_ == StreamState::error) {
        return;
    }
    if (auto tail = decoder_.finish()) {
        handleLine(*tail);
    }
    complete();
}

void CompletionStream::abort() {
    state_ = StreamState::error;
}

void CompletionStream::handleLine(std::string_view line) {
    auto event = parseCompletionLine(line);
    switch (event.kind) {
    case CompletionEvent::Kind::ignore:
        return;
    case CompletionEvent::Kind::done:
        complete();
        return;
    case CompletionEvent::Kind::error:
        state_ = StreamState::error;
        throw api::ChatError(api::ChatError::Kind::remote_api_error, "Server reported an error: " + event.text);
    case CompletionEvent::Kind::delta:
        break;
    }

    if (state_ != StreamState::emitting_deltas) {
        state_ = StreamState::emitting_deltas;
        firstDeltaAt_ = Clock::now();
        metrics_.firstPacketDelay = std::chrono::duration<double>(firstDeltaAt_ - startedAt_).count();
    }
    ++metrics_.deltaCount;
    metrics_.generatedTokens += estimateTokens(event.text);
    onDelta_(event.text);
}

void CompletionStream::complete() {
    if (metrics_.deltaCount > 0) {
        metrics_.generationTime = std::chrono::duration<double>(Clock::now() - firstDeltaAt_).count();
    }
    state_ = StreamState::done;
}

} // namespace chatpool::stream
