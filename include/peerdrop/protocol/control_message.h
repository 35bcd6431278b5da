#ifndef PEERDROP_PROTOCOL_CONTROL_MESSAGE_H
#define PEERDROP_PROTOCOL_CONTROL_MESSAGE_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace peerdrop {

constexpr uint32_t PROTOCOL_VERSION = 1;

// Catalog entry advertised by the owning peer
struct FileManifestEntry {
    std::string id;
    std::string name;
    uint64_t byte_size = 0;
    std::string mime_type = "application/octet-stream";
    uint64_t advertised_at = 0;   // ms since epoch
    std::string owner_peer_id;
    std::string checksum;         // hex SHA-256, empty when not computed
};

enum class PressureLevel {
    Normal,
    High,
    Critical
};

struct HelloMessage {
    std::string peer_id;
    uint32_t version = PROTOCOL_VERSION;
};

struct FileMetadataMessage {
    FileManifestEntry file;
};

struct FilesListRequest {};

struct FilesListResponse {
    std::vector<FileManifestEntry> files;
};

struct DownloadRequest {
    std::string request_id;
    std::string file_id;
    std::string file_name;
    uint64_t file_size = 0;
    // Present when the requester already holds a prefix of the file
    std::optional<uint64_t> resume_offset;
    std::optional<uint32_t> resume_chunk;
};

struct DownloadStart {
    std::string request_id;
    std::string file_id;
    std::string file_name;
    uint64_t file_size = 0;
    std::string mime_type;
    uint32_t total_chunks = 0;
    uint32_t chunk_size = 0;
    bool pushed = false;
};

struct DownloadResume {
    std::string request_id;
    std::string file_id;
    uint64_t resume_offset = 0;
    uint32_t resume_chunk = 0;
    uint64_t file_size = 0;
    uint32_t total_chunks = 0;
    uint32_t chunk_size = 0;
};

struct DownloadCancel {
    std::string request_id;
};

// Precedes exactly one binary frame of chunk_size bytes
struct FileChunkHeader {
    std::string transfer_id;
    uint32_t chunk_index = 0;
    uint32_t chunk_size = 0;
    uint64_t offset = 0;
    bool is_last = false;
    uint64_t timestamp = 0;       // sender clock, ms
};

struct FinalStats {
    uint64_t total_bytes = 0;
    uint64_t total_time_ms = 0;
    double avg_speed = 0.0;       // bytes/s
    uint32_t avg_chunk_size = 0;
    uint32_t total_chunks = 0;
    std::string checksum;
};

struct DownloadComplete {
    std::string request_id;
    FinalStats final_stats;
};

struct DownloadError {
    std::string request_id;
    std::string error;            // failure reason, e.g. "not-found"
    std::vector<uint32_t> missing_chunks;
};

struct ThroughputReport {
    std::string transfer_id;
    double throughput = 0.0;      // bytes/s observed by the receiver
    double buffer_level = 0.0;    // chunks queued ahead of the receiver
    double rtt_ms = 0.0;
};

struct BufferPressure {
    std::string transfer_id;
    PressureLevel level = PressureLevel::Normal;
    double pressure = 0.0;        // [0, 1]
};

struct RateLimitRequest {
    std::string transfer_id;
    double max_rate = 0.0;        // bytes/s
};

struct ChunkAck {
    std::string transfer_id;
    uint32_t chunk_index = 0;
};

struct Ping {
    uint64_t timestamp = 0;
};

struct Pong {
    uint64_t timestamp = 0;       // echoed from the ping
};

struct Keepalive {
    uint64_t timestamp = 0;
};

struct KeepaliveAck {
    uint64_t timestamp = 0;
};

using ControlMessage = std::variant<
    HelloMessage,
    FileMetadataMessage,
    FilesListRequest,
    FilesListResponse,
    DownloadRequest,
    DownloadStart,
    DownloadResume,
    DownloadCancel,
    FileChunkHeader,
    DownloadComplete,
    DownloadError,
    ThroughputReport,
    BufferPressure,
    RateLimitRequest,
    ChunkAck,
    Ping,
    Pong,
    Keepalive,
    KeepaliveAck>;

// Wire tag ("download-request", ...) of a message
std::string message_type(const ControlMessage& message);

std::string to_string(PressureLevel level);
std::optional<PressureLevel> parse_pressure_level(const std::string& level);

// Helper for exhaustive std::visit dispatch
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace peerdrop

#endif // PEERDROP_PROTOCOL_CONTROL_MESSAGE_H
