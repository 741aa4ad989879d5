#include "chatpool/upload/FileUtils.hpp"

#include "chatpool/api/ChatError.hpp"
#include "chatpool/util/Crypto.hpp"
#include "chatpool/util/Logging.hpp"
#include "chatpool/util/Url.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string_view>
#include <system_error>
#include <unordered_map>

namespace chatpool::upload {
namespace {

const std::unordered_map<std::string, std::string>& extensionTable() {
    static const std::unordered_map<std::string, std::string> table{
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"}, {".gif", "image/gif"},
        {".webp", "image/webp"}, {".bmp", "image/bmp"}, {".svg", "image/svg+xml"}, {".tiff", "image/tiff"},
        {".tif", "image/tiff"}, {".ico", "image/ico"},
        {".mp4", "video/mp4"}, {".avi", "video/avi"}, {".mov", "video/quicktime"}, {".wmv", "video/wmv"},
        {".flv", "video/flv"}, {".webm", "video/webm"}, {".mkv", "video/mkv"}, {".3gp", "video/3gp"},
        {".m4v", "video/m4v"},
        {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".flac", "audio/flac"}, {".aac", "audio/aac"},
        {".ogg", "audio/ogg"}, {".wma", "audio/wma"}, {".m4a", "audio/m4a"}, {".opus", "audio/opus"},
        {".pdf", "application/pdf"}, {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".txt", "text/plain"}, {".csv", "text/csv"}, {".rtf", "application/rtf"}, {".zip", "application/zip"},
        {".rar", "application/x-rar-compressed"}, {".7z", "application/x-7z-compressed"},
        {".json", "application/json"}, {".xml", "application/xml"}, {".html", "text/html"},
        {".htm", "text/html"}, {".css", "text/css"}, {".js", "application/javascript"},
        {".py", "text/x-python"}, {".java", "text/x-java"}, {".c", "text/x-c"}, {".cpp", "text/x-c++"},
        {".cxx", "text/x-c++"}, {".cc", "text/x-c++"}, {".cs", "text/x-csharp"}, {".php", "text/x-php"},
        {".rb", "text/x-ruby"}, {".go", "text/x-go"}, {".rs", "text/x-rust"}, {".swift", "text/x-swift"},
        {".kt", "text/x-kotlin"}, {".scala", "text/x-scala"}, {".sql", "text/x-sql"},
        {".sh", "text/x-shell"}, {".bash", "text/x-shell"}, {".zsh", "text/x-shell"},
    };
    return table;
}

// Only media types get a dedicated upload type; everything else is a generic file.
const std::unordered_map<std::string, std::string>& mediaTypeTable() {
    static const std::unordered_map<std::string, std::string> table{
        {"image/jpeg", "image"}, {"image/jpg", "image"}, {"image/png", "image"}, {"image/gif", "image"},
        {"image/webp", "image"}, {"image/bmp", "image"}, {"image/svg+xml", "image"}, {"image/tiff", "image"},
        {"image/ico", "image"},
        {"video/mp4", "video"}, {"video/avi", "video"}, {"video/mov", "video"}, {"video/wmv", "video"},
        {"video/flv", "video"}, {"video/webm", "video"}, {"video/mkv", "video"}, {"video/3gp", "video"},
        {"video/m4v", "video"}, {"video/quicktime", "video"},
        {"audio/mp3", "audio"}, {"audio/wav", "audio"}, {"audio/flac", "audio"}, {"audio/aac", "audio"},
        {"audio/ogg", "audio"}, {"audio/wma", "audio"}, {"audio/m4a", "audio"}, {"audio/opus", "audio"},
        {"audio/mpeg", "audio"}, {"audio/x-wav", "audio"},
    };
    return table;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string_view view) {
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.front()))) {
        view.remove_prefix(1);
    }
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.back()))) {
        view.remove_suffix(1);
    }
    return std::string(view);
}

std::string fallbackUrlFilename() {
    const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    return "url_file_" + std::to_string(epoch) + ".jpg";
}

std::string basenameFromUrl(const std::string& url) {
    std::string path;
    try {
        path = util::parseUrl(url).target;
    } catch (const std::invalid_argument&) {
        return {};
    }
    path = path.substr(0, path.find_first_of("?#"));
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.find('.') == std::string::npos) {
        return {};
    }
    return name;
}

} // namespace

std::string mimeTypeFor(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    auto slash = filename.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "application/octet-stream";
    }
    const auto& table = extensionTable();
    auto it = table.find(toLower(filename.substr(dot)));
    return it == table.end() ? std::string{"application/octet-stream"} : it->second;
}

FileCategory categorize(const std::string& contentType) {
    FileCategory category;
    const auto& table = mediaTypeTable();
    auto it = table.find(contentType);
    category.fileType = it == table.end() ? "file" : it->second;

    if (contentType.rfind("image/", 0) == 0 || contentType.rfind("video/", 0) == 0) {
        category.fileClass = "vision";
    } else if (contentType.rfind("audio/", 0) == 0) {
        category.fileClass = "audio";
    } else {
        category.fileClass = "document";
    }
    return category;
}

bool isUrl(const std::string& path) {
    return path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0;
}

std::string filenameFromUrl(const std::string& url) {
    auto name = basenameFromUrl(url);
    return name.empty() ? fallbackUrlFilename() : name;
}

api::FileInfo inspectRemoteFile(api::ChatBackend& backend,
                              const std::string& url,
                              const std::string& userId,
                              std::chrono::seconds timeout) {
    api::FileInfo info;
    info.fileId = util::makeUuid();
    info.fileUrl = url;
    info.userId = userId;

    const auto derivedName = basenameFromUrl(url);
    info.filename = derivedName.empty() ? fallbackUrlFilename() : derivedName;

    try {
        auto head = backend.headRemote(url, timeout);
        std::string contentType = head.contentType.empty() ? std::string{"image/jpeg"} : head.contentType;
        contentType = trim(std::string_view(contentType).substr(0, contentType.find(';')));
        info.size = head.contentLength.value_or(0);

        if (!derivedName.empty()) {
            auto inferred = mimeTypeFor(derivedName);
            if (inferred != "application/octet-stream") {
                contentType = inferred;
            }
        }
        info.contentType = contentType;
        auto category = categorize(contentType);
        info.fileType = category.fileType;
        info.fileClass = category.fileClass;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Remote attachment inspection failed for " + url + ": " + ex.what());
        info.size = 0;
        info.contentType = "image/jpeg";
        info.fileType = "image";
        info.fileClass = "vision";
    }
    return info;
}

std::uint64_t validateLocalFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw api::ChatError(api::ChatError::Kind::attachment_error, "file does not exist: " + path.string());
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw api::ChatError(api::ChatError::Kind::attachment_error,
                             "cannot read size of " + path.string() + ": " + ec.message());
    }
    if (size == 0) {
        throw api::ChatError(api::ChatError::Kind::attachment_error, "file is empty: " + path.string());
    }
    if (size > kMaxUploadBytes) {
        throw api::ChatError(api::ChatError::Kind::attachment_error,
                             "file too large: " + path.string() + " (" + std::to_string(size) +
                                 " bytes, limit 100MB)");
    }
    return static_cast<std::uint64_t>(size);
}

} // namespace chatpool::upload
