#include "transferd/base/error_code.h"

namespace transferd {

namespace {

class TransferdCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "transferd";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const TransferdCategory& get_category() {
    static TransferdCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidRequest: return "Invalid request";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::TransientNetworkError: return "Transient network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::ConnectionLost: return "Connection lost";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::PermanentTransferError: return "Permanent transfer error";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::AuthenticationFailed: return "Authentication failed";
        case ErrorCode::NotAuthenticated: return "Not authenticated";
        default: return "Unknown error";
    }
}

std::string kind_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::TransientNetworkError: return "TransientNetworkError";
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ErrorCode::SendFailed: return "SendFailed";
        case ErrorCode::ReceiveFailed: return "ReceiveFailed";
        case ErrorCode::ConnectionLost: return "ConnectionLost";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::PermanentTransferError: return "PermanentTransferError";
        case ErrorCode::StorageError: return "StorageError";
        case ErrorCode::AuthenticationFailed: return "AuthenticationFailed";
        case ErrorCode::NotAuthenticated: return "NotAuthenticated";
        default: return "Unknown";
    }
}

TransferdError::TransferdError(ErrorCode code, const std::string& message)
    : code_(code), detail_(message), message_(to_string(code) + ": " + message) {}

const char* TransferdError::what() const noexcept {
    return message_.c_str();
}

} // namespace transferd
