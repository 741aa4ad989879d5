#include "chatpool/api/ChatError.hpp"

namespace chatpool::api {

const char* toString(ChatError::Kind kind) {
    switch (kind) {
    case ChatError::Kind::authentication_failure: return "authentication_failure";
    case ChatError::Kind::no_account_available:   return "no_account_available";
    case ChatError::Kind::pool_empty:             return "pool_empty";
    case ChatError::Kind::upload_failure:         return "upload_failure";
    case ChatError::Kind::attachment_error:       return "attachment_error";
    case ChatError::Kind::session_create_failure: return "session_create_failure";
    case ChatError::Kind::transport_failure:      return "transport_failure";
    case ChatError::Kind::stream_decode_failure:  return "stream_decode_failure";
    case ChatError::Kind::remote_api_error:       return "remote_api_error";
    case ChatError::Kind::shutting_down:          return "shutting_down";
    }
    return "unknown";
}

} // namespace chatpool::api
