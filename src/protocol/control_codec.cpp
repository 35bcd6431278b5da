#include "peerdrop/protocol/control_codec.h"

namespace peerdrop {

std::string message_type(const ControlMessage& message) {
    return std::visit(overloaded{
        [](const HelloMessage&) { return std::string("hello"); },
        [](const FileMetadataMessage&) { return std::string("file-metadata"); },
        [](const FilesListRequest&) { return std::string("files-list-request"); },
        [](const FilesListResponse&) { return std::string("files-list-response"); },
        [](const DownloadRequest&) { return std::string("download-request"); },
        [](const DownloadStart&) { return std::string("download-start"); },
        [](const DownloadResume&) { return std::string("download-resume"); },
        [](const DownloadCancel&) { return std::string("download-cancel"); },
        [](const FileChunkHeader&) { return std::string("file-chunk-header"); },
        [](const DownloadComplete&) { return std::string("download-complete"); },
        [](const DownloadError&) { return std::string("download-error"); },
        [](const ThroughputReport&) { return std::string("throughput-report"); },
        [](const BufferPressure&) { return std::string("buffer-pressure"); },
        [](const RateLimitRequest&) { return std::string("rate-limit-request"); },
        [](const ChunkAck&) { return std::string("chunk-ack"); },
        [](const Ping&) { return std::string("ping"); },
        [](const Pong&) { return std::string("pong"); },
        [](const Keepalive&) { return std::string("keepalive"); },
        [](const KeepaliveAck&) { return std::string("keepalive-ack"); },
    }, message);
}

std::string to_string(PressureLevel level) {
    switch (level) {
        case PressureLevel::Normal: return "normal";
        case PressureLevel::High: return "high";
        case PressureLevel::Critical: return "critical";
    }
    return "normal";
}

std::optional<PressureLevel> parse_pressure_level(const std::string& level) {
    if (level == "normal") return PressureLevel::Normal;
    if (level == "high") return PressureLevel::High;
    if (level == "critical") return PressureLevel::Critical;
    return std::nullopt;
}

json manifest_to_json(const FileManifestEntry& entry) {
    json j = {
        {"fileId", entry.id},
        {"name", entry.name},
        {"size", entry.byte_size},
        {"mimeType", entry.mime_type},
        {"timestamp", entry.advertised_at},
        {"ownerPeerId", entry.owner_peer_id}
    };
    if (!entry.checksum.empty()) {
        j["checksum"] = entry.checksum;
    }
    return j;
}

FileManifestEntry manifest_from_json(const json& j) {
    FileManifestEntry entry;
    entry.id = j.at("fileId").get<std::string>();
    entry.name = j.at("name").get<std::string>();
    entry.byte_size = j.at("size").get<uint64_t>();
    entry.mime_type = j.value("mimeType", std::string("application/octet-stream"));
    entry.advertised_at = j.value("timestamp", uint64_t{0});
    entry.owner_peer_id = j.value("ownerPeerId", std::string());
    entry.checksum = j.value("checksum", std::string());
    return entry;
}

json ControlCodec::to_json(const ControlMessage& message) {
    json body = std::visit(overloaded{
        [](const HelloMessage& m) -> json {
            return {{"peerId", m.peer_id}, {"version", m.version}};
        },
        [](const FileMetadataMessage& m) -> json {
            return manifest_to_json(m.file);
        },
        [](const FilesListRequest&) -> json {
            return json::object();
        },
        [](const FilesListResponse& m) -> json {
            json files = json::array();
            for (const auto& entry : m.files) {
                files.push_back(manifest_to_json(entry));
            }
            return {{"files", files}};
        },
        [](const DownloadRequest& m) -> json {
            json j = {{"requestId", m.request_id}, {"fileId", m.file_id},
                      {"fileName", m.file_name}, {"fileSize", m.file_size}};
            if (m.resume_offset) j["resumeOffset"] = *m.resume_offset;
            if (m.resume_chunk) j["resumeChunk"] = *m.resume_chunk;
            return j;
        },
        [](const DownloadStart& m) -> json {
            return {{"requestId", m.request_id}, {"fileId", m.file_id},
                    {"fileName", m.file_name}, {"fileSize", m.file_size},
                    {"mimeType", m.mime_type}, {"totalChunks", m.total_chunks},
                    {"chunkSize", m.chunk_size}, {"pushed", m.pushed}};
        },
        [](const DownloadResume& m) -> json {
            return {{"requestId", m.request_id}, {"fileId", m.file_id},
                    {"resumeOffset", m.resume_offset}, {"resumeChunk", m.resume_chunk},
                    {"fileSize", m.file_size}, {"totalChunks", m.total_chunks},
                    {"chunkSize", m.chunk_size}};
        },
        [](const DownloadCancel& m) -> json {
            return {{"requestId", m.request_id}};
        },
        [](const FileChunkHeader& m) -> json {
            return {{"transferId", m.transfer_id}, {"chunkIndex", m.chunk_index},
                    {"chunkSize", m.chunk_size}, {"offset", m.offset},
                    {"isLast", m.is_last}, {"timestamp", m.timestamp}};
        },
        [](const DownloadComplete& m) -> json {
            json stats = {{"totalBytes", m.final_stats.total_bytes},
                          {"totalTime", m.final_stats.total_time_ms},
                          {"avgSpeed", m.final_stats.avg_speed},
                          {"avgChunkSize", m.final_stats.avg_chunk_size},
                          {"totalChunks", m.final_stats.total_chunks}};
            if (!m.final_stats.checksum.empty()) {
                stats["checksum"] = m.final_stats.checksum;
            }
            return {{"requestId", m.request_id}, {"finalStats", stats}};
        },
        [](const DownloadError& m) -> json {
            json j = {{"requestId", m.request_id}, {"error", m.error}};
            if (!m.missing_chunks.empty()) j["missingChunks"] = m.missing_chunks;
            return j;
        },
        [](const ThroughputReport& m) -> json {
            return {{"transferId", m.transfer_id}, {"throughput", m.throughput},
                    {"bufferLevel", m.buffer_level}, {"rtt", m.rtt_ms}};
        },
        [](const BufferPressure& m) -> json {
            return {{"transferId", m.transfer_id}, {"level", to_string(m.level)},
                    {"pressure", m.pressure}};
        },
        [](const RateLimitRequest& m) -> json {
            return {{"transferId", m.transfer_id}, {"maxRate", m.max_rate}};
        },
        [](const ChunkAck& m) -> json {
            return {{"transferId", m.transfer_id}, {"chunkIndex", m.chunk_index}};
        },
        [](const Ping& m) -> json { return {{"timestamp", m.timestamp}}; },
        [](const Pong& m) -> json { return {{"timestamp", m.timestamp}}; },
        [](const Keepalive& m) -> json { return {{"timestamp", m.timestamp}}; },
        [](const KeepaliveAck& m) -> json { return {{"timestamp", m.timestamp}}; },
    }, message);

    body["type"] = message_type(message);
    return body;
}

std::string ControlCodec::encode(const ControlMessage& message) {
    return to_json(message).dump();
}

std::optional<ControlMessage> ControlCodec::decode(const std::string& text, std::string* error) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        if (error) *error = "invalid JSON";
        return std::nullopt;
    }
    return from_json(j, error);
}

std::optional<ControlMessage> ControlCodec::from_json(const json& j, std::string* error) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        if (error) *error = "missing type tag";
        return std::nullopt;
    }

    const std::string type = j["type"].get<std::string>();
    try {
        if (type == "hello") {
            HelloMessage m;
            m.peer_id = j.at("peerId").get<std::string>();
            m.version = j.value("version", PROTOCOL_VERSION);
            return m;
        }
        if (type == "file-metadata") {
            return FileMetadataMessage{manifest_from_json(j)};
        }
        if (type == "files-list-request") {
            return FilesListRequest{};
        }
        if (type == "files-list-response") {
            FilesListResponse m;
            for (const auto& item : j.at("files")) {
                m.files.push_back(manifest_from_json(item));
            }
            return m;
        }
        if (type == "download-request") {
            DownloadRequest m;
            m.request_id = j.at("requestId").get<std::string>();
            m.file_id = j.at("fileId").get<std::string>();
            m.file_name = j.value("fileName", std::string());
            m.file_size = j.value("fileSize", uint64_t{0});
            if (j.contains("resumeOffset")) m.resume_offset = j["resumeOffset"].get<uint64_t>();
            if (j.contains("resumeChunk")) m.resume_chunk = j["resumeChunk"].get<uint32_t>();
            return m;
        }
        if (type == "download-start") {
            DownloadStart m;
            m.request_id = j.at("requestId").get<std::string>();
            m.file_id = j.value("fileId", std::string());
            m.file_name = j.at("fileName").get<std::string>();
            m.file_size = j.at("fileSize").get<uint64_t>();
            m.mime_type = j.value("mimeType", std::string("application/octet-stream"));
            m.total_chunks = j.at("totalChunks").get<uint32_t>();
            m.chunk_size = j.at("chunkSize").get<uint32_t>();
            m.pushed = j.value("pushed", false);
            return m;
        }
        if (type == "download-resume") {
            DownloadResume m;
            m.request_id = j.at("requestId").get<std::string>();
            m.file_id = j.value("fileId", std::string());
            m.resume_offset = j.at("resumeOffset").get<uint64_t>();
            m.resume_chunk = j.at("resumeChunk").get<uint32_t>();
            m.file_size = j.value("fileSize", uint64_t{0});
            m.total_chunks = j.value("totalChunks", uint32_t{0});
            m.chunk_size = j.value("chunkSize", uint32_t{0});
            return m;
        }
        if (type == "download-cancel") {
            return DownloadCancel{j.at("requestId").get<std::string>()};
        }
        if (type == "file-chunk-header") {
            FileChunkHeader m;
            m.transfer_id = j.at("transferId").get<std::string>();
            m.chunk_index = j.at("chunkIndex").get<uint32_t>();
            m.chunk_size = j.at("chunkSize").get<uint32_t>();
            m.offset = j.at("offset").get<uint64_t>();
            m.is_last = j.value("isLast", false);
            m.timestamp = j.value("timestamp", uint64_t{0});
            return m;
        }
        if (type == "download-complete") {
            DownloadComplete m;
            m.request_id = j.at("requestId").get<std::string>();
            const auto& stats = j.at("finalStats");
            m.final_stats.total_bytes = stats.at("totalBytes").get<uint64_t>();
            m.final_stats.total_time_ms = stats.value("totalTime", uint64_t{0});
            m.final_stats.avg_speed = stats.value("avgSpeed", 0.0);
            m.final_stats.avg_chunk_size = stats.value("avgChunkSize", uint32_t{0});
            m.final_stats.total_chunks = stats.value("totalChunks", uint32_t{0});
            m.final_stats.checksum = stats.value("checksum", std::string());
            return m;
        }
        if (type == "download-error") {
            DownloadError m;
            m.request_id = j.at("requestId").get<std::string>();
            m.error = j.at("error").get<std::string>();
            if (j.contains("missingChunks")) {
                m.missing_chunks = j["missingChunks"].get<std::vector<uint32_t>>();
            }
            return m;
        }
        if (type == "throughput-report") {
            ThroughputReport m;
            m.transfer_id = j.at("transferId").get<std::string>();
            m.throughput = j.value("throughput", 0.0);
            m.buffer_level = j.value("bufferLevel", 0.0);
            m.rtt_ms = j.value("rtt", 0.0);
            return m;
        }
        if (type == "buffer-pressure") {
            BufferPressure m;
            m.transfer_id = j.at("transferId").get<std::string>();
            auto level = parse_pressure_level(j.at("level").get<std::string>());
            if (!level) {
                if (error) *error = "unknown pressure level";
                return std::nullopt;
            }
            m.level = *level;
            m.pressure = j.value("pressure", 0.0);
            return m;
        }
        if (type == "rate-limit-request") {
            RateLimitRequest m;
            m.transfer_id = j.at("transferId").get<std::string>();
            m.max_rate = j.at("maxRate").get<double>();
            return m;
        }
        if (type == "chunk-ack") {
            ChunkAck m;
            m.transfer_id = j.at("transferId").get<std::string>();
            m.chunk_index = j.at("chunkIndex").get<uint32_t>();
            return m;
        }
        if (type == "ping") return Ping{j.value("timestamp", uint64_t{0})};
        if (type == "pong") return Pong{j.value("timestamp", uint64_t{0})};
        if (type == "keepalive") return Keepalive{j.value("timestamp", uint64_t{0})};
        if (type == "keepalive-ack") return KeepaliveAck{j.value("timestamp", uint64_t{0})};
    } catch (const json::exception& e) {
        if (error) *error = "bad " + type + " message: " + e.what();
        return std::nullopt;
    }

    if (error) *error = "unknown message type: " + type;
    return std::nullopt;
}

} // namespace peerdrop
