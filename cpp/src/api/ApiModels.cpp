#include "chatpool/api/ApiModels.hpp"
#include "chatpool/util/JsonUtil.hpp"

#include <stdexcept>

namespace chatpool::api {

std::vector<std::string> UploadCredential::missingFields() const {
    std::vector<std::string> missing;
    if (accessKeyId.empty()) missing.emplace_back("access_key_id");
    if (accessKeySecret.empty()) missing.emplace_back("access_key_secret");
    if (securityToken.empty()) missing.emplace_back("security_token");
    if (fileUrl.empty()) missing.emplace_back("file_url");
    if (filePath.empty()) missing.emplace_back("file_path");
    return missing;
}

boost::json::object toJson(const SigninRequest& request) {
    boost::json::object obj;
    obj["email"] = request.email;
    obj["password"] = request.passwordHash;
    return obj;
}

boost::json::object toJson(const NewChatRequest& request) {
    boost::json::array models;
    for (const auto& model : request.models) {
        models.emplace_back(model);
    }
    boost::json::object obj;
    obj["title"] = request.title;
    obj["models"] = std::move(models);
    obj["chat_mode"] = request.chatMode;
    obj["chat_type"] = request.chatType;
    obj["timestamp"] = request.timestamp;
    return obj;
}

boost::json::object toJson(const UploadCredentialRequest& request) {
    boost::json::object obj;
    obj["filename"] = request.filename;
    obj["filesize"] = request.filesize;
    obj["filetype"] = request.filetype;
    return obj;
}

SigninResponse parseSigninResponse(const boost::json::value& value) {
    if (!value.is_object()) {
        throw std::invalid_argument("signin response is not an object");
    }
    const auto& obj = value.as_object();
    SigninResponse response;
    response.token = util::readString(obj, "token");
    response.expiresAt = util::readInt(obj, "expires_at");
    response.userId = util::readString(obj, "id");
    return response;
}

NewChatResponse parseNewChatResponse(const boost::json::value& value) {
    if (!value.is_object()) {
        throw std::invalid_argument("new chat response is not an object");
    }
    const auto& obj = value.as_object();
    NewChatResponse response;
    response.success = util::readBool(obj, "success");
    if (auto data = obj.if_contains("data"); data && data->is_object()) {
        response.chatId = util::readString(data->as_object(), "id");
    }
    return response;
}

UploadCredential parseUploadCredential(const boost::json::value& value) {
    if (!value.is_object()) {
        throw std::invalid_argument("upload credential response is not an object");
    }
    const boost::json::object* source = &value.as_object();
    if (auto data = source->if_contains("data"); data && data->is_object()) {
        source = &data->as_object();
    } else if (!source->contains("access_key_id") ||
               !source->contains("access_key_secret") ||
               !source->contains("security_token")) {
        throw std::invalid_argument("upload credential response has unexpected shape: " +
                                    util::stringifyJson(value));
    }

    UploadCredential credential;
    credential.accessKeyId = util::readString(*source, "access_key_id");
    credential.accessKeySecret = util::readString(*source, "access_key_secret");
    credential.securityToken = util::readString(*source, "security_token");
    credential.fileUrl = util::readString(*source, "file_url");
    credential.filePath = util::readString(*source, "file_path");
    credential.fileId = util::readString(*source, "file_id");
    credential.expiration = util::readString(*source, "expiration");
    return credential;
}

} // namespace chatpool::api
