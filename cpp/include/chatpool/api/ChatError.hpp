#pragma once

#include <stdexcept>
#include <string>

namespace chatpool::api {

class ChatError : public std::runtime_error {
public:
    enum class Kind {
        authentication_failure,
        no_account_available,
        pool_empty,
        upload_failure,
        attachment_error,
        session_create_failure,
        transport_failure,
        stream_decode_failure,
        remote_api_error,
        shutting_down,
    };

    ChatError(Kind kind, const std::string& message, int status = 0)
        : std::runtime_error(message)
        , kind_(kind)
        , status_(status) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    // HTTP status when the failure came from a response, otherwise 0.
    [[nodiscard]] int status() const noexcept { return status_; }

    // Failures that a different account cannot fix.
    [[nodiscard]] bool retryable() const noexcept {
        return kind_ != Kind::pool_empty && kind_ != Kind::attachment_error && kind_ != Kind::shutting_down;
    }

private:
    Kind kind_;
    int status_;
};

const char* toString(ChatError::Kind kind);

} // namespace chatpool::api
