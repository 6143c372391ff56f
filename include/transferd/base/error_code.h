#ifndef TRANSFERD_BASE_ERROR_CODE_H
#define TRANSFERD_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace transferd {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // Command errors (1000-1999)
    InvalidRequest = 1001,
    InvalidState = 1002,
    NotFound = 1003,
    Timeout = 1004,
    Cancelled = 1005,
    InternalError = 1006,

    // Network errors (2000-2999)
    TransientNetworkError = 2001,
    ConnectionFailed = 2002,
    ConnectionClosed = 2003,
    SendFailed = 2004,
    ReceiveFailed = 2005,
    ConnectionLost = 2006,
    ProtocolError = 2007,

    // Transfer errors (3000-3999)
    PermanentTransferError = 3001,

    // Storage errors (4000-4999)
    StorageError = 4001,

    // Channel errors (5000-5999)
    AuthenticationFailed = 5001,
    NotAuthenticated = 5002
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

// Short machine-readable name, e.g. "InvalidState"
std::string kind_name(ErrorCode code);

class TransferdError : public std::exception {
public:
    TransferdError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const std::string& detail() const { return detail_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string detail_;
    std::string message_;
};

} // namespace transferd

namespace std {
template <>
struct is_error_code_enum<transferd::ErrorCode> : true_type {};
} // namespace std

#endif // TRANSFERD_BASE_ERROR_CODE_H
