#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <string>
#include "peerdrop/protocol/control_codec.h"

using namespace peerdrop;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Message type tags", "[protocol][type]") {
    REQUIRE(message_type(HelloMessage{"a"}) == "hello");
    REQUIRE(message_type(DownloadRequest{}) == "download-request");
    REQUIRE(message_type(FileChunkHeader{}) == "file-chunk-header");
    REQUIRE(message_type(BufferPressure{}) == "buffer-pressure");
    REQUIRE(message_type(KeepaliveAck{}) == "keepalive-ack");
}

TEST_CASE("Encoded messages use camelCase keys", "[protocol][encode]") {
    FileChunkHeader header;
    header.transfer_id = "download_1_abc";
    header.chunk_index = 7;
    header.chunk_size = 65536;
    header.offset = 7 * 65536;
    header.is_last = true;
    header.timestamp = 1700000000000ULL;

    auto j = ControlCodec::to_json(header);
    REQUIRE(j["type"] == "file-chunk-header");
    REQUIRE(j["transferId"] == "download_1_abc");
    REQUIRE(j["chunkIndex"] == 7);
    REQUIRE(j["chunkSize"] == 65536);
    REQUIRE(j["offset"] == 7 * 65536);
    REQUIRE(j["isLast"] == true);

    DownloadRequest request;
    request.request_id = "r1";
    request.file_id = "f1";
    auto plain = ControlCodec::to_json(request);
    REQUIRE_FALSE(plain.contains("resumeOffset"));
    request.resume_offset = 131072;
    request.resume_chunk = 2;
    auto resumed = ControlCodec::to_json(request);
    REQUIRE(resumed["resumeOffset"] == 131072);
    REQUIRE(resumed["resumeChunk"] == 2);
}

TEST_CASE("Decode download lifecycle messages", "[protocol][decode]") {
    SECTION("download-start") {
        auto message = ControlCodec::decode(
            R"({"type":"download-start","requestId":"r1","fileId":"f1","fileName":"a.bin",)"
            R"("fileSize":1000,"totalChunks":1,"chunkSize":32768})");
        REQUIRE(message);
        auto* start = std::get_if<DownloadStart>(&*message);
        REQUIRE(start);
        REQUIRE(start->request_id == "r1");
        REQUIRE(start->file_size == 1000);
        REQUIRE(start->mime_type == "application/octet-stream");
        REQUIRE_FALSE(start->pushed);
    }

    SECTION("download-complete with final stats") {
        DownloadComplete complete;
        complete.request_id = "r2";
        complete.final_stats.total_bytes = 10485760;
        complete.final_stats.total_chunks = 160;
        complete.final_stats.avg_chunk_size = 65536;
        complete.final_stats.checksum = "abc123";

        auto message = ControlCodec::decode(ControlCodec::encode(complete));
        REQUIRE(message);
        auto* decoded = std::get_if<DownloadComplete>(&*message);
        REQUIRE(decoded);
        REQUIRE(decoded->final_stats.total_bytes == 10485760);
        REQUIRE(decoded->final_stats.total_chunks == 160);
        REQUIRE(decoded->final_stats.checksum == "abc123");
    }

    SECTION("download-error carries missing chunks") {
        auto message = ControlCodec::decode(
            R"({"type":"download-error","requestId":"r3","error":"incomplete-assembly","missingChunks":[5,9]})");
        REQUIRE(message);
        auto* error = std::get_if<DownloadError>(&*message);
        REQUIRE(error);
        REQUIRE(error->error == "incomplete-assembly");
        REQUIRE(error->missing_chunks == std::vector<uint32_t>{5, 9});
    }

    SECTION("files-list-response") {
        FilesListResponse response;
        FileManifestEntry entry;
        entry.id = "file_1";
        entry.name = "notes.txt";
        entry.byte_size = 42;
        entry.mime_type = "text/plain";
        entry.owner_peer_id = "alice";
        response.files.push_back(entry);

        auto j = ControlCodec::to_json(response);
        REQUIRE(j["files"][0]["fileId"] == "file_1");
        REQUIRE(j["files"][0]["ownerPeerId"] == "alice");
        REQUIRE_FALSE(j["files"][0].contains("checksum"));

        auto message = ControlCodec::from_json(j);
        REQUIRE(message);
        auto* decoded = std::get_if<FilesListResponse>(&*message);
        REQUIRE(decoded);
        REQUIRE(decoded->files.size() == 1);
        REQUIRE(decoded->files[0].name == "notes.txt");
        REQUIRE(decoded->files[0].mime_type == "text/plain");
    }
}

TEST_CASE("Feedback messages", "[protocol][feedback]") {
    auto message = ControlCodec::decode(
        R"({"type":"buffer-pressure","transferId":"t","level":"critical","pressure":0.9})");
    REQUIRE(message);
    auto* pressure = std::get_if<BufferPressure>(&*message);
    REQUIRE(pressure);
    REQUIRE(pressure->level == PressureLevel::Critical);
    REQUIRE(pressure->pressure == 0.9);

    auto report = ControlCodec::decode(R"({"type":"throughput-report","transferId":"t","throughput":1000.5})");
    REQUIRE(report);
    REQUIRE(std::get<ThroughputReport>(*report).throughput == 1000.5);
    REQUIRE(std::get<ThroughputReport>(*report).buffer_level == 0.0);

    REQUIRE(parse_pressure_level("high") == PressureLevel::High);
    REQUIRE_FALSE(parse_pressure_level("severe"));
}

TEST_CASE("Malformed control messages are rejected", "[protocol][errors]") {
    std::string error;

    REQUIRE_FALSE(ControlCodec::decode("{not json", &error));
    REQUIRE(error == "invalid JSON");

    REQUIRE_FALSE(ControlCodec::decode(R"({"requestId":"r1"})", &error));
    REQUIRE(error == "missing type tag");

    REQUIRE_FALSE(ControlCodec::decode(R"([1,2,3])", &error));
    REQUIRE(error == "missing type tag");

    REQUIRE_FALSE(ControlCodec::decode(R"({"type":"teleport"})", &error));
    REQUIRE(error == "unknown message type: teleport");

    REQUIRE_FALSE(ControlCodec::decode(R"({"type":"download-request","fileId":"f1"})", &error));
    REQUIRE_THAT(error, ContainsSubstring("bad download-request message"));

    REQUIRE_FALSE(ControlCodec::decode(R"({"type":"chunk-ack","transferId":"t","chunkIndex":"three"})", &error));
    REQUIRE_THAT(error, ContainsSubstring("chunk-ack"));

    REQUIRE_FALSE(ControlCodec::decode(
        R"({"type":"buffer-pressure","transferId":"t","level":"severe"})", &error));
    REQUIRE(error == "unknown pressure level");
}
