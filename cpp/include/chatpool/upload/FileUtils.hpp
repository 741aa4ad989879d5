#pragma once

#include "chatpool/api/ApiModels.hpp"
#include "chatpool/api/ChatBackend.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chatpool::upload {

constexpr std::uint64_t kMaxUploadBytes = 100ull * 1024 * 1024;

struct FileCategory {
    std::string fileType;   // image, video, audio or file
    std::string fileClass;  // vision, audio or document
};

// Extension lookup; unknown extensions map to application/octet-stream.
std::string mimeTypeFor(const std::string& filename);

FileCategory categorize(const std::string& contentType);

bool isUrl(const std::string& path);

// Basename of the URL path when it has an extension, otherwise url_file_<epoch>.jpg.
std::string filenameFromUrl(const std::string& url);

// HEAD request describing a remote attachment. Never throws: an unreachable URL is described as a JPEG image.
api::FileInfo inspectRemoteFile(api::ChatBackend& backend,
                              const std::string& url,
                              const std::string& userId,
                              std::chrono::seconds timeout);

// Checks that a local attachment exists and is within the size limits.
// Throws ChatError(attachment_error) otherwise and returns the size.
std::uint64_t validateLocalFile(const std::filesystem::path& path);

} // namespace chatpool::upload
