#include "peerdrop/base/error_code.h"

namespace peerdrop {

namespace {

class PeerDropCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "PeerDrop";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const PeerDropCategory& get_category() {
    static PeerDropCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionLost: return "Connection lost";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::MalformedMessage: return "Malformed message";
        case ErrorCode::UnexpectedMessage: return "Unexpected message";
        case ErrorCode::TransferFailed: return "Transfer failed";
        case ErrorCode::PeerRejected: return "Rejected by peer";
        case ErrorCode::IncompleteAssembly: return "Incomplete assembly";
        case ErrorCode::MaxRetriesExceeded: return "Maximum retries exceeded";
        case ErrorCode::HandshakeTimeout: return "Handshake timed out";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::ReadError: return "File read error";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::CheckpointError: return "Checkpoint error";
        default: return "Unknown error";
    }
}

std::string to_reason(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::ConnectionLost:
        case ErrorCode::ConnectionFailed: return "connection-lost";
        case ErrorCode::ProtocolError:
        case ErrorCode::MalformedMessage:
        case ErrorCode::UnexpectedMessage: return "protocol-error";
        case ErrorCode::PeerRejected: return "rejected";
        case ErrorCode::IncompleteAssembly: return "incomplete-assembly";
        case ErrorCode::MaxRetriesExceeded: return "max-retries-exceeded";
        case ErrorCode::HandshakeTimeout: return "handshake-timeout";
        case ErrorCode::ChecksumMismatch: return "checksum-mismatch";
        case ErrorCode::ReadError: return "read-error";
        default: return "transfer-failed";
    }
}

ErrorCode error_code_from_reason(const std::string& reason) {
    if (reason.empty()) return ErrorCode::Success;
    if (reason == "cancelled") return ErrorCode::Cancelled;
    if (reason == "not-found") return ErrorCode::NotFound;
    if (reason == "timeout") return ErrorCode::Timeout;
    if (reason == "connection-lost") return ErrorCode::ConnectionLost;
    if (reason == "protocol-error") return ErrorCode::ProtocolError;
    if (reason == "rejected") return ErrorCode::PeerRejected;
    if (reason == "incomplete-assembly") return ErrorCode::IncompleteAssembly;
    if (reason == "max-retries-exceeded") return ErrorCode::MaxRetriesExceeded;
    if (reason == "handshake-timeout") return ErrorCode::HandshakeTimeout;
    if (reason == "checksum-mismatch") return ErrorCode::ChecksumMismatch;
    if (reason == "read-error") return ErrorCode::ReadError;
    return ErrorCode::TransferFailed;
}

bool is_resumable(ErrorCode code) {
    return code == ErrorCode::ConnectionLost || code == ErrorCode::ConnectionFailed;
}

PeerDropError::PeerDropError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* PeerDropError::what() const noexcept {
    return message_.c_str();
}

} // namespace peerdrop
