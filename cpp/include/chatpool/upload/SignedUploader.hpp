#pragma once

#include "chatpool/api/ApiModels.hpp"
#include "chatpool/api/ChatBackend.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace chatpool::upload {

class SignedUploader {
public:
    struct Settings {
        int maxRetries{3};
        std::chrono::milliseconds baseDelay{1000};
        std::chrono::milliseconds maxDelay{3000};
        std::chrono::seconds timeout{60};
    };

    SignedUploader(api::ChatBackend& backend, Settings settings);

    // PUTs the file to the credential's object URL. Failures are retried with capped
    // exponential backoff; once retries run out the pre-issued fileUrl is returned unverified.
    std::string upload(const std::filesystem::path& file, const api::UploadCredential& credential);

    // METHOD\n\nContent-Type\nDate\n<lowercased, sorted name:value\n ...>resource
    static std::string canonicalString(const std::string& method,
                                       const std::string& contentType,
                                       const std::string& date,
                                       const std::map<std::string, std::string>& signedHeaders,
                                       const std::string& resource);

    // "OSS <accessKeyId>:<base64(HMAC-SHA1(secret, canonical))>"
    static std::string authorization(const std::string& accessKeyId,
                                     const std::string& accessKeySecret,
                                     const std::string& canonical);

    std::chrono::milliseconds backoffFor(int retry) const;

private:
    void putOnce(const std::filesystem::path& file, const api::UploadCredential& credential);

    api::ChatBackend& backend_;
    Settings settings_;
};

} // namespace chatpool::upload
