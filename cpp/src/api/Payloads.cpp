#include "chatpool/api/Payloads.hpp"
#include "chatpool/util/Crypto.hpp"

#include <string>

namespace chatpool::api {
namespace {

constexpr std::int64_t kMaxTokens = 1048576;

bool startsWith(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string showTypeFor(const FileInfo& file) {
    if (file.fileClass == "vision" && startsWith(file.contentType, "image/")) {
        return "image";
    }
    if (file.fileClass == "vision" && startsWith(file.contentType, "video/")) {
        return "video";
    }
    if (file.fileClass == "audio") {
        return "audio";
    }
    return "file";
}

} // namespace

boost::json::object buildFileObject(const FileInfo& file, std::int64_t nowMillis) {
    boost::json::object meta;
    meta["name"] = file.filename;
    meta["size"] = file.size;
    meta["content_type"] = file.contentType;

    boost::json::object inner;
    inner["created_at"] = nowMillis;
    inner["data"] = boost::json::object{};
    inner["filename"] = file.filename;
    inner["hash"] = nullptr;
    inner["id"] = file.fileId;
    inner["user_id"] = file.userId;
    inner["meta"] = std::move(meta);
    inner["update_at"] = nowMillis;

    boost::json::object obj;
    obj["type"] = file.fileType;
    obj["file"] = std::move(inner);
    obj["id"] = file.fileId;
    obj["url"] = file.fileUrl;
    obj["name"] = file.filename;
    obj["collection_name"] = "";
    obj["progress"] = 0;
    obj["status"] = "uploaded";
    obj["greenNet"] = "success";
    obj["size"] = file.size;
    obj["error"] = "";
    obj["itemId"] = util::makeUuid();
    obj["file_type"] = file.contentType;
    obj["showType"] = showTypeFor(file);
    obj["file_class"] = file.fileClass;
    obj["uploadTaskId"] = util::makeUuid();
    return obj;
}

boost::json::object buildCompletionPayload(const CompletionRequest& request, std::int64_t nowMillis) {
    boost::json::array files;
    for (const auto& file : request.files) {
        files.emplace_back(buildFileObject(file, nowMillis));
    }

    boost::json::object featureConfig;
    featureConfig["thinking_enabled"] = false;
    featureConfig["output_schema"] = "phase";
    featureConfig["thinking_budget"] = 1024;
    featureConfig["mcp"] = boost::json::object{};

    boost::json::object generateCfg;
    generateCfg["max_input_tokens"] = kMaxTokens;
    generateCfg["max_tokens"] = kMaxTokens;
    generateCfg["max_new_tokens"] = kMaxTokens - static_cast<std::int64_t>(request.message.size());
    generateCfg["seed"] = -1;
    generateCfg["function_choice"] = "none";
    generateCfg["incremental_output"] = true;
    generateCfg["skip_stopword_postproc"] = false;

    boost::json::array childrenIds;
    childrenIds.emplace_back(util::makeUuid());
    boost::json::array models;
    models.emplace_back(request.model);
    boost::json::object extraMeta;
    extraMeta["subChatType"] = "t2t";
    boost::json::object extra;
    extra["meta"] = std::move(extraMeta);

    boost::json::object message;
    message["fid"] = util::makeUuid();
    message["parentId"] = nullptr;
    message["childrenIds"] = std::move(childrenIds);
    message["role"] = "user";
    message["content"] = request.message;
    message["user_action"] = "chat";
    message["files"] = std::move(files);
    message["timestamp"] = nowMillis;
    message["models"] = std::move(models);
    message["chat_type"] = "t2t";
    message["feature_config"] = std::move(featureConfig);
    message["generate_cfg"] = std::move(generateCfg);
    message["extra"] = std::move(extra);
    message["sub_chat_type"] = "t2t";
    message["parent_id"] = nullptr;

    boost::json::object payload;
    payload["stream"] = true;
    payload["incremental_output"] = true;
    payload["chat_id"] = request.chatId;
    payload["chat_mode"] = "normal";
    payload["model"] = request.model;
    payload["parent_id"] = nullptr;
    boost::json::array messages;
    messages.emplace_back(std::move(message));
    payload["messages"] = std::move(messages);
    payload["timestamp"] = nowMillis;
    return payload;
}

} // namespace chatpool::api
