#include "peerdrop/transfer/transfer_session.h"

namespace peerdrop {

std::string to_string(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Queued: return "queued";
        case SessionState::Handshaking: return "handshaking";
        case SessionState::Transferring: return "transferring";
        case SessionState::Paused: return "paused";
        case SessionState::Completed: return "completed";
        case SessionState::Failed: return "failed";
        case SessionState::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(SessionState state) {
    return state == SessionState::Completed || state == SessionState::Failed ||
           state == SessionState::Cancelled;
}

uint32_t estimate_total_chunks(uint64_t file_size, uint32_t chunk_size) {
    if (chunk_size == 0) return 0;
    if (file_size == 0) return 1;
    return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

} // namespace peerdrop
