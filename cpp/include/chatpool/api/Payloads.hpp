#pragma once

#include "chatpool/api/ApiModels.hpp"

#include <boost/json.hpp>

#include <cstdint>

namespace chatpool::api {

// Attachment descriptor embedded in a completion message.
boost::json::object buildFileObject(const FileInfo& file, std::int64_t nowMillis);

// Body of POST /chat/completions: a single streamed user message with its attachments.
boost::json::object buildCompletionPayload(const CompletionRequest& request, std::int64_t nowMillis);

} // namespace chatpool::api
