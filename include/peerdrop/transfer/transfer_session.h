#ifndef PEERDROP_TRANSFER_TRANSFER_SESSION_H
#define PEERDROP_TRANSFER_TRANSFER_SESSION_H

#include "peerdrop/base/error_code.h"
#include <cstdint>
#include <string>
#include <vector>

namespace peerdrop {

enum class TransferDirection {
    Upload,
    Download
};

// Session lifecycle as seen by the coordinator
enum class SessionState {
    Idle = 0,
    Queued = 1,
    Handshaking = 2,
    Transferring = 3,
    Paused = 4,
    Completed = 5,
    Failed = 6,
    Cancelled = 7
};

std::string to_string(TransferDirection direction);
std::string to_string(SessionState state);
bool is_terminal(SessionState state);

struct TransferSession {
    std::string id;
    TransferDirection direction = TransferDirection::Download;
    std::string peer_id;
    std::string file_id;
    std::string file_name;
    uint64_t file_size = 0;
    std::string mime_type;
    SessionState state = SessionState::Idle;
    uint32_t chunk_size = 0;        // current chunk size
    uint32_t total_chunks = 0;
    uint64_t bytes_transferred = 0; // never decreases within one pass
    uint32_t chunk_index = 0;       // next chunk to send/expect
    uint64_t started_at = 0;        // ms since epoch
    uint64_t finished_at = 0;
    uint64_t resume_offset = 0;
    uint32_t retry_count = 0;
    ErrorCode last_error = ErrorCode::Success;
    std::string error_detail;
    std::vector<uint32_t> missing_chunks;
    bool pushed = false;

    double progress() const {
        return file_size == 0 ? (state == SessionState::Completed ? 1.0 : 0.0)
                              : static_cast<double>(bytes_transferred) / static_cast<double>(file_size);
    }
};

// ceil(size / chunk_size); an empty file still travels as one empty chunk
uint32_t estimate_total_chunks(uint64_t file_size, uint32_t chunk_size);

// Where an interrupted transfer continues
struct ResumePoint {
    uint64_t offset = 0;
    uint32_t chunk_index = 0;
};

} // namespace peerdrop

#endif // PEERDROP_TRANSFER_TRANSFER_SESSION_H
