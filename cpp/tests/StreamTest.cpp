#include "chatpool/api/ChatError.hpp"
#include "chatpool/stream/CompletionStream.hpp"
#include "chatpool/stream/SseLineDecoder.hpp"
#include "chatpool/stream/TokenEstimator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using namespace chatpool::stream;
using chatpool::api::ChatError;

std::string answerLine(const std::string& content) {
    return "data: {\"choices\":[{\"delta\":{\"phase\":\"answer\",\"content\":\"" + content + "\"}}]}\n";
}

TEST(TokenEstimatorTest, CountsIdeographsAndLatinWords) {
    EXPECT_EQ(estimateTokens(""), 0u);
    EXPECT_EQ(estimateTokens("Hello world"), 1u);
    EXPECT_EQ(estimateTokens("\xE4\xBD\xA0\xE5\xA5\xBD\xE4\xB8\x96\xE7\x95\x8C"), 4u);
    EXPECT_EQ(estimateTokens("\xE4\xBD\xA0\xE5\xA5\xBD hello world foo"), 4u);
    EXPECT_EQ(estimateTokens("abc123def"), 1u);
    EXPECT_EQ(estimateTokens("one two three four"), 3u);
}

TEST(TokenEstimatorTest, IgnoresNonIdeographicMultibyteText) {
    // U+00E9 and U+3042 (hiragana) are outside the ideograph block.
    EXPECT_EQ(estimateTokens("\xC3\xA9\xE3\x81\x82"), 0u);
    // A truncated sequence does not crash or count.
    EXPECT_EQ(estimateTokens("\xE4\xBD"), 0u);
}

TEST(SseLineDecoderTest, SplitsLfAndCrlfAndKeepsPartialLines) {
    SseLineDecoder decoder;
    auto lines = decoder.feed("data: a\r\ndata: b\ndata: par");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "data: a");
    EXPECT_EQ(lines[1], "data: b");

    lines = decoder.feed("tial\n\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "data: partial");
    EXPECT_EQ(lines[1], "");

    decoder.feed("tail");
    auto tail = decoder.finish();
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, "tail");
    EXPECT_FALSE(decoder.finish().has_value());
}

TEST(CompletionLineTest, RecognisesEventKinds) {
    auto delta = parseCompletionLine(answerLine("Hi"));
    EXPECT_EQ(delta.kind, CompletionEvent::Kind::delta);
    EXPECT_EQ(delta.text, "Hi");

    EXPECT_EQ(parseCompletionLine("data: [DONE]").kind, CompletionEvent::Kind::done);
    EXPECT_EQ(parseCompletionLine("data:[DONE]").kind, CompletionEvent::Kind::done);

    auto error = parseCompletionLine(R"(data: {"error":{"message":"quota exceeded"}})");
    EXPECT_EQ(error.kind, CompletionEvent::Kind::error);
    EXPECT_EQ(error.text, "quota exceeded");
}

TEST(CompletionLineTest, IgnoresNoise) {
    EXPECT_EQ(parseCompletionLine("").kind, CompletionEvent::Kind::ignore);
    EXPECT_EQ(parseCompletionLine(": keep-alive").kind, CompletionEvent::Kind::ignore);
    EXPECT_EQ(parseCompletionLine("event: message").kind, CompletionEvent::Kind::ignore);
    EXPECT_EQ(parseCompletionLine("data: {not json").kind, CompletionEvent::Kind::ignore);
    EXPECT_EQ(parseCompletionLine(R"(data: {"choices":[{"delta":{"phase":"think","content":"x"}}]})").kind,
              CompletionEvent::Kind::ignore);
    EXPECT_EQ(parseCompletionLine(R"(data: {"choices":[{"delta":{"phase":"answer","content":""}}]})").kind,
              CompletionEvent::Kind::ignore);
}

TEST(CompletionStreamTest, SingleDeltaThenDone) {
    std::vector<std::string> chunks;
    CompletionStream stream([&chunks](const std::string& chunk) { chunks.push_back(chunk); });
    EXPECT_EQ(stream.state(), StreamState::connecting);

    stream.consume(answerLine("Hi") + "data: [DONE]\n");
    stream.finish();

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], "Hi");
    EXPECT_EQ(stream.state(), StreamState::done);
    EXPECT_TRUE(stream.receivedContent());
    EXPECT_EQ(stream.metrics().deltaCount, 1u);
    EXPECT_GE(stream.metrics().firstPacketDelay, 0.0);
}

TEST(CompletionStreamTest, TracksStatesAcrossSplitChunks) {
    std::string received;
    CompletionStream stream([&received](const std::string& chunk) { received += chunk; });

    const auto body = answerLine("Hello") + "data: {broken\n" + answerLine(" world") + "data: [DONE]\n";
    stream.consume(body.substr(0, 10));
    EXPECT_EQ(stream.state(), StreamState::first_byte_received);
    stream.consume(body.substr(10, 80));
    EXPECT_EQ(stream.state(), StreamState::emitting_deltas);
    stream.consume(body.substr(90));
    stream.finish();

    EXPECT_EQ(received, "Hello world");
    EXPECT_EQ(stream.state(), StreamState::done);
    EXPECT_EQ(stream.metrics().generatedTokens, 0u);
}

TEST(CompletionStreamTest, IgnoresBytesAfterDone) {
    int deltas = 0;
    CompletionStream stream([&deltas](const std::string&) { ++deltas; });
    stream.consume("data: [DONE]\n" + answerLine("late"));
    stream.consume(answerLine("later"));
    stream.finish();
    EXPECT_EQ(deltas, 0);
    EXPECT_FALSE(stream.receivedContent());
    EXPECT_EQ(stream.state(), StreamState::done);
}

TEST(CompletionStreamTest, FlushesUnterminatedLastLine) {
    std::string received;
    CompletionStream stream([&received](const std::string& chunk) { received += chunk; });
    auto line = answerLine("tail");
    line.pop_back();
    stream.consume(line);
    EXPECT_TRUE(received.empty());
    stream.finish();
    EXPECT_EQ(received, "tail");
}

TEST(CompletionStreamTest, InBandErrorAbortsWithRemoteApiError) {
    CompletionStream stream([](const std::string&) {});
    try {
        stream.consume("data: {\"error\":\"rate limited\"}\n");
        FAIL() << "expected ChatError";
    } catch (const ChatError& ex) {
        EXPECT_EQ(ex.kind(), ChatError::Kind::remote_api_error);
        EXPECT_NE(std::string(ex.what()).find("rate limited"), std::string::npos);
    }
    EXPECT_EQ(stream.state(), StreamState::error);
}

} // namespace
