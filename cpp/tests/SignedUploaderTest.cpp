#include "chatpool/upload/SignedUploader.hpp"
#include "chatpool/util/Crypto.hpp"
#include "support/FakeChatBackend.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>

namespace {

using namespace chatpool;
using upload::SignedUploader;
namespace fs = std::filesystem;

std::string headerValue(const api::ObjectPut& put, const std::string& name) {
    for (const auto& [key, value] : put.headers) {
        if (key == name) {
            return value;
        }
    }
    return {};
}

SignedUploader::Settings noDelays() {
    SignedUploader::Settings settings;
    settings.baseDelay = std::chrono::milliseconds{0};
    settings.maxDelay = std::chrono::milliseconds{0};
    return settings;
}

class SignedUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("chatpool-upload-" + util::makeUuid());
        fs::create_directories(dir_);
        file_ = dir_ / "photo.png";
        std::ofstream out(file_, std::ios::binary);
        out << "not really a png";

        credential_.accessKeyId = "key-id";
        credential_.accessKeySecret = "secret";
        credential_.securityToken = "sts-token";
        credential_.fileUrl = "https://bucket.oss.example.com/user/abc/photo.png";
        credential_.filePath = "user/abc/photo.png";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    fs::path file_;
    api::UploadCredential credential_;
    test::FakeChatBackend backend_;
};

TEST(SignedUploaderSigningTest, CanonicalStringLowercasesAndSortsHeaders) {
    const std::map<std::string, std::string> headers{
        {"X-OSS-Security-Token", "sts-token"},
        {"X-Oss-Meta-A", "1"},
    };
    EXPECT_EQ(SignedUploader::canonicalString("PUT", "image/png", "Sun, 18 Oct 2026 09:30:00 GMT", headers,
                                              "/bucket/user/abc/photo.png"),
              "PUT\n\nimage/png\nSun, 18 Oct 2026 09:30:00 GMT\n"
              "x-oss-meta-a:1\nx-oss-security-token:sts-token\n/bucket/user/abc/photo.png");
}

TEST(SignedUploaderSigningTest, AuthorizationMatchesKnownSignature) {
    const auto canonical = SignedUploader::canonicalString(
        "PUT", "image/png", "Sun, 18 Oct 2026 09:30:00 GMT", {{"x-oss-security-token", "sts-token"}},
        "/bucket/user/abc/photo.png");
    EXPECT_EQ(SignedUploader::authorization("key-id", "secret", canonical), "OSS key-id:arroEjmq84qMQ6TzM0K0IP8U0Z4=");
}

TEST(SignedUploaderSigningTest, BackoffIsExponentialAndCapped) {
    test::FakeChatBackend backend;
    SignedUploader uploader(backend, SignedUploader::Settings{});
    EXPECT_EQ(uploader.backoffFor(0).count(), 0);
    EXPECT_EQ(uploader.backoffFor(1).count(), 1000);
    EXPECT_EQ(uploader.backoffFor(2).count(), 2000);
    EXPECT_EQ(uploader.backoffFor(3).count(), 3000);
    EXPECT_EQ(uploader.backoffFor(30).count(), 3000);
}

TEST_F(SignedUploaderTest, SignedPutCarriesRequiredHeaders) {
    SignedUploader uploader(backend_, noDelays());
    EXPECT_EQ(uploader.upload(file_, credential_), credential_.fileUrl);
    ASSERT_EQ(backend_.putCalls.load(), 1);

    const auto put = backend_.puts().front();
    EXPECT_EQ(put.url, "https://bucket.oss.example.com/user/abc/photo.png");
    EXPECT_EQ(put.body, "not really a png");
    EXPECT_EQ(headerValue(put, "Host"), "bucket.oss.example.com");
    EXPECT_EQ(headerValue(put, "Content-Type"), "image/png");
    EXPECT_EQ(headerValue(put, "Content-Length"), "16");
    EXPECT_EQ(headerValue(put, "x-oss-security-token"), "sts-token");

    const auto date = headerValue(put, "Date");
    ASSERT_FALSE(date.empty());
    const auto canonical = SignedUploader::canonicalString(
        "PUT", "image/png", date, {{"x-oss-security-token", "sts-token"}}, "/bucket/user/abc/photo.png");
    EXPECT_EQ(headerValue(put, "Authorization"), SignedUploader::authorization("key-id", "secret", canonical));
}

TEST_F(SignedUploaderTest, RetriesUntilStorageAccepts) {
    std::atomic<int> calls{0};
    backend_.putHook = [&calls](const api::ObjectPut&) { return ++calls < 3 ? 503 : 200; };
    SignedUploader uploader(backend_, noDelays());
    EXPECT_EQ(uploader.upload(file_, credential_), credential_.fileUrl);
    EXPECT_EQ(backend_.putCalls.load(), 3);
}

TEST_F(SignedUploaderTest, ReturnsIssuedUrlAfterExhaustingRetries) {
    backend_.putHook = [](const api::ObjectPut&) -> int { throw std::runtime_error("connection reset"); };
    SignedUploader uploader(backend_, noDelays());
    EXPECT_EQ(uploader.upload(file_, credential_), credential_.fileUrl);
    EXPECT_EQ(backend_.putCalls.load(), 4);
}

TEST_F(SignedUploaderTest, MissingFileFallsBackWithoutPut) {
    SignedUploader uploader(backend_, noDelays());
    EXPECT_EQ(uploader.upload(dir_ / "gone.png", credential_), credential_.fileUrl);
    EXPECT_EQ(backend_.putCalls.load(), 0);
}

} // namespace
