#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatpool::api {

struct SigninRequest {
    std::string email;
    std::string passwordHash;
};

struct SigninResponse {
    std::string token;
    std::int64_t expiresAt{};
    std::string userId;
};

struct NewChatRequest {
    std::string title{"New chat"};
    std::vector<std::string> models;
    std::string chatMode{"normal"};
    std::string chatType{"t2t"};
    std::int64_t timestamp{};
};

struct NewChatResponse {
    bool success{};
    std::string chatId;
};

struct UploadCredentialRequest {
    std::string filename;
    std::uint64_t filesize{};
    std::string filetype;
};

// Issued per file and used once.
struct UploadCredential {
    std::string accessKeyId;
    std::string accessKeySecret;
    std::string securityToken;
    std::string fileUrl;
    std::string filePath;
    std::string fileId;
    std::string expiration;

    std::vector<std::string> missingFields() const;
};

struct RemoteFileHead {
    int status{};
    std::string contentType;
    std::optional<std::uint64_t> contentLength;
};

struct FileInfo {
    std::string fileId;
    std::string fileUrl;
    std::string filename;
    std::uint64_t size{};
    std::string contentType;
    std::string userId;
    std::string fileType;
    std::string fileClass;
};

struct ObjectPut {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct CompletionRequest {
    std::string chatId;
    std::string model;
    std::string message;
    std::vector<FileInfo> files;
};

boost::json::object toJson(const SigninRequest& request);
boost::json::object toJson(const NewChatRequest& request);
boost::json::object toJson(const UploadCredentialRequest& request);

SigninResponse parseSigninResponse(const boost::json::value& value);
NewChatResponse parseNewChatResponse(const boost::json::value& value);

// Accepts both the enveloped {"data": {...}} form and the bare credential object.
// Throws std::invalid_argument when neither shape matches.
UploadCredential parseUploadCredential(const boost::json::value& value);

} // namespace chatpool::api
