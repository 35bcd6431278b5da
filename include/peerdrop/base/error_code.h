#ifndef PEERDROP_BASE_ERROR_CODE_H
#define PEERDROP_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace peerdrop {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    AlreadyExists = 1003,
    Timeout = 1004,
    Cancelled = 1005,
    InternalError = 1006,

    // Network errors (2000-2999)
    NetworkError = 2001,
    ConnectionFailed = 2002,
    ConnectionLost = 2003,
    SendFailed = 2004,
    ReceiveFailed = 2005,

    // Protocol errors (3000-3999)
    ProtocolError = 3001,
    MalformedMessage = 3002,
    UnexpectedMessage = 3003,

    // Transfer errors (4000-4999)
    TransferFailed = 4001,
    PeerRejected = 4002,
    IncompleteAssembly = 4003,
    MaxRetriesExceeded = 4004,
    HandshakeTimeout = 4005,
    ChecksumMismatch = 4006,
    ReadError = 4007,

    // Storage errors (5000-5999)
    StorageError = 5001,
    CheckpointError = 5002
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

// Wire form of a session failure reason, e.g. "connection-lost"
std::string to_reason(ErrorCode code);
ErrorCode error_code_from_reason(const std::string& reason);

// Failures that leave a session eligible for resume
bool is_resumable(ErrorCode code);

class PeerDropError : public std::exception {
public:
    PeerDropError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace peerdrop

namespace std {
template <>
struct is_error_code_enum<peerdrop::ErrorCode> : true_type {};
} // namespace std

#endif // PEERDROP_BASE_ERROR_CODE_H
