#include "chatpool/upload/SignedUploader.hpp"

#include "chatpool/api/ChatError.hpp"
#include "chatpool/upload/FileUtils.hpp"
#include "chatpool/util/Crypto.hpp"
#include "chatpool/util/Logging.hpp"
#include "chatpool/util/TimeUtil.hpp"
#include "chatpool/util/Url.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <thread>

namespace chatpool::upload {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string readFile(const std::filesystem::path& file) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs.is_open()) {
        throw api::ChatError(api::ChatError::Kind::upload_failure, "cannot open " + file.string());
    }
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

} // namespace

SignedUploader::SignedUploader(api::ChatBackend& backend, Settings settings)
    : backend_(backend)
    , settings_(settings) {}

std::string SignedUploader::canonicalString(const std::string& method,
                                            const std::string& contentType,
                                            const std::string& date,
                                            const std::map<std::string, std::string>& signedHeaders,
                                            const std::string& resource) {
    std::map<std::string, std::string> lowered;
    for (const auto& [name, value] : signedHeaders) {
        lowered[toLower(name)] = value;
    }

    std::string canonical = method + "\n\n" + contentType + "\n" + date + "\n";
    for (const auto& [name, value] : lowered) {
        canonical += name + ":" + value + "\n";
    }
    canonical += resource;
    return canonical;
}

std::string SignedUploader::authorization(const std::string& accessKeyId,
                                          const std::string& accessKeySecret,
                                          const std::string& canonical) {
    return "OSS " + accessKeyId + ":" + util::base64Encode(util::hmacSha1(accessKeySecret, canonical));
}

std::chrono::milliseconds SignedUploader::backoffFor(int retry) const {
    if (retry <= 0) {
        return std::chrono::milliseconds::zero();
    }
    std::chrono::milliseconds delay =
        settings_.baseDelay * static_cast<std::chrono::milliseconds::rep>(1LL << std::min(retry - 1, 20));
    return std::min(delay, settings_.maxDelay);
}

void SignedUploader::putOnce(const std::filesystem::path& file, const api::UploadCredential& credential) {
    const auto content = readFile(file);
    const auto contentType = mimeTypeFor(file.filename().string());

    const auto bucketHost = util::parseUrl(credential.fileUrl).host;
    const auto bucket = bucketHost.substr(0, bucketHost.find('.'));
    const auto& objectKey = credential.filePath;
    const auto resource = "/" + bucket + "/" + objectKey;
    const auto date = util::httpDate(std::chrono::system_clock::now());

    const std::map<std::string, std::string> signedHeaders{
        {"x-oss-security-token", credential.securityToken},
    };
    const auto canonical = canonicalString("PUT", contentType, date, signedHeaders, resource);

    api::ObjectPut put;
    put.url = "https://" + bucketHost + "/" + objectKey;
    put.headers = {
        {"Host", bucketHost},
        {"Date", date},
        {"Content-Type", contentType},
        {"Content-Length", std::to_string(content.size())},
        {"Authorization", authorization(credential.accessKeyId, credential.accessKeySecret, canonical)},
        {"x-oss-security-token", credential.securityToken},
    };
    put.body = content;

    const int status = backend_.putObject(put, settings_.timeout);
    if (status != 200 && status != 201) {
        throw api::ChatError(api::ChatError::Kind::upload_failure,
                             "object storage rejected upload with status " + std::to_string(status),
                             status);
    }
}

std::string SignedUploader::upload(const std::filesystem::path& file, const api::UploadCredential& credential) {
    for (int attempt = 0; attempt <= settings_.maxRetries; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(backoffFor(attempt));
        }
        try {
            putOnce(file, credential);
            util::log(util::LogLevel::debug, "Uploaded " + file.filename().string() + " to " + credential.filePath);
            return credential.fileUrl;
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn,
                      "Upload attempt " + std::to_string(attempt + 1) + " for " + file.filename().string() +
                          " failed: " + ex.what());
        }
    }
    util::log(util::LogLevel::warn,
              "Upload of " + file.filename().string() + " exhausted retries; using unverified URL");
    return credential.fileUrl;
}

} // namespace chatpool::upload
