#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <memory>
#include <optional>
#include <vector>
#include "peerdrop/net/loopback_channel.h"
#include "peerdrop/storage/resume_store.h"
#include "peerdrop/transfer/chunked_receiver.h"
#include "peerdrop/transfer/file_source.h"

using namespace peerdrop;

namespace {

constexpr uint32_t CHUNK = 1000;
constexpr uint32_t CHUNKS = 10;

std::vector<uint8_t> make_file(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i % 251);
    }
    return data;
}

// Receiver wired to the far end of an unstarted loopback pair; outgoing
// control frames just queue up on that side.
struct ReceiverFixture {
    std::shared_ptr<LoopbackChannel> owner_side;
    std::shared_ptr<LoopbackChannel> receiver_side;
    std::shared_ptr<PeerLink> link;
    std::shared_ptr<MemoryResumeStore> store = std::make_shared<MemoryResumeStore>();
    std::unique_ptr<ChunkedReceiver> receiver;
    std::vector<uint8_t> file = make_file(CHUNK * CHUNKS);

    int finished_calls = 0;
    std::optional<TransferSession> finished_session;
    std::optional<std::vector<uint8_t>> received;

    explicit ReceiverFixture(TransferConfig config = default_config()) {
        auto channels = LoopbackChannel::create_pair();
        owner_side = channels.first;
        receiver_side = channels.second;
        link = std::make_shared<PeerLink>("owner", receiver_side);

        TransferSession session;
        session.id = "download_test_1";
        session.peer_id = "owner";
        session.file_id = "f1";
        receiver = std::make_unique<ChunkedReceiver>(link, session, config, store);
        receiver->set_finished_callback([this](const TransferSession& s, const ReceivedFile* f) {
            finished_calls++;
            finished_session = s;
            if (f) received = f->data;
        });
    }

    static TransferConfig default_config() {
        TransferConfig config;
        config.checkpoint_interval_chunks = 4;
        config.feedback_interval_ms = 60000;
        return config;
    }

    void start() {
        DownloadStart start;
        start.request_id = "download_test_1";
        start.file_id = "f1";
        start.file_name = "data.bin";
        start.file_size = file.size();
        start.total_chunks = CHUNKS;
        start.chunk_size = CHUNK;
        REQUIRE(receiver->on_start(start));
    }

    FileChunkHeader header(uint32_t index) const {
        FileChunkHeader h;
        h.transfer_id = "download_test_1";
        h.chunk_index = index;
        h.chunk_size = CHUNK;
        h.offset = static_cast<uint64_t>(index) * CHUNK;
        h.is_last = index == CHUNKS - 1;
        return h;
    }

    bool deliver(uint32_t index) {
        auto h = header(index);
        if (!receiver->on_header(h)) return false;
        auto begin = file.begin() + static_cast<std::ptrdiff_t>(h.offset);
        return receiver->on_payload(h, std::vector<uint8_t>(begin, begin + CHUNK));
    }

    void complete(const std::string& checksum = "") {
        DownloadComplete done;
        done.request_id = "download_test_1";
        done.final_stats.total_bytes = file.size();
        done.final_stats.total_chunks = CHUNKS;
        done.final_stats.checksum = checksum;
        receiver->on_complete(done);
    }

    DownloadResume resume_message(uint32_t chunk, uint64_t offset) const {
        DownloadResume resume;
        resume.request_id = "download_test_1";
        resume.file_id = "f1";
        resume.resume_chunk = chunk;
        resume.resume_offset = offset;
        resume.file_size = file.size();
        resume.total_chunks = CHUNKS;
        resume.chunk_size = CHUNK;
        return resume;
    }
};

} // anonymous namespace

TEST_CASE("Receiver assembles chunks in order", "[receiver][assembly]") {
    ReceiverFixture f;
    f.start();
    REQUIRE(f.receiver->state() == ReceiverState::HeaderExpected);

    for (uint32_t i = 0; i < CHUNKS; ++i) {
        REQUIRE(f.deliver(i));
        if (i == 3) {
            auto cp = f.store->get("download_test_1");
            REQUIRE(cp);
            REQUIRE(cp->chunk_index == 4);
            REQUIRE(cp->byte_offset == 4 * CHUNK);
        }
    }
    REQUIRE(f.receiver->snapshot().bytes_transferred == f.file.size());

    f.complete(compute_checksum(f.file));

    REQUIRE(f.receiver->state() == ReceiverState::Completed);
    REQUIRE(f.finished_calls == 1);
    REQUIRE(f.finished_session->state == SessionState::Completed);
    REQUIRE(f.finished_session->chunk_index == CHUNKS);
    REQUIRE(f.received);
    REQUIRE(*f.received == f.file);
    REQUIRE_FALSE(f.store->get("download_test_1"));
}

TEST_CASE("Receiver reports missing chunks instead of assembling", "[receiver][assembly]") {
    ReceiverFixture f;
    f.start();
    for (uint32_t i = 0; i < CHUNKS; ++i) {
        if (i == 5) continue;
        REQUIRE(f.deliver(i));
    }
    f.complete();

    REQUIRE(f.receiver->state() == ReceiverState::Failed);
    REQUIRE(f.finished_calls == 1);
    REQUIRE_FALSE(f.received);
    REQUIRE(f.finished_session->state == SessionState::Failed);
    REQUIRE(f.finished_session->last_error == ErrorCode::IncompleteAssembly);
    REQUIRE(f.finished_session->missing_chunks == std::vector<uint32_t>{5});
    REQUIRE(f.receiver->missing_chunks() == std::vector<uint32_t>{5});
    REQUIRE_FALSE(f.store->get("download_test_1"));
}

TEST_CASE("Receiver rejects a checksum mismatch", "[receiver][assembly]") {
    ReceiverFixture f;
    f.start();
    for (uint32_t i = 0; i < CHUNKS; ++i) {
        REQUIRE(f.deliver(i));
    }
    f.complete(std::string(64, '0'));

    REQUIRE(f.receiver->state() == ReceiverState::Failed);
    REQUIRE(f.finished_session->last_error == ErrorCode::ChecksumMismatch);
    REQUIRE_FALSE(f.received);
}

TEST_CASE("Receiver ignores frames that do not fit the protocol", "[receiver][protocol]") {
    ReceiverFixture f;
    f.start();

    SECTION("payload without a header") {
        auto h = f.header(0);
        REQUIRE_FALSE(f.receiver->on_payload(h, std::vector<uint8_t>(CHUNK, 1)));
        REQUIRE(f.receiver->received_chunks() == 0);
        REQUIRE(f.receiver->state() == ReceiverState::HeaderExpected);
    }

    SECTION("header for another transfer") {
        auto h = f.header(0);
        h.transfer_id = "download_other";
        REQUIRE_FALSE(f.receiver->on_header(h));
        REQUIRE(f.receiver->state() == ReceiverState::HeaderExpected);
    }

    SECTION("payload size disagrees with its header") {
        auto h = f.header(0);
        REQUIRE(f.receiver->on_header(h));
        REQUIRE_FALSE(f.receiver->on_payload(h, std::vector<uint8_t>(CHUNK - 1, 1)));
        REQUIRE(f.receiver->received_chunks() == 0);
        REQUIRE(f.deliver(0));
        REQUIRE(f.receiver->received_chunks() == 1);
    }

    SECTION("chunk index no file of this size can reach") {
        auto h = f.header(0);
        h.chunk_index = std::numeric_limits<uint32_t>::max();
        REQUIRE_FALSE(f.receiver->on_header(h));
        h.chunk_index = 4000000000u;
        REQUIRE_FALSE(f.receiver->on_header(h));
        REQUIRE(f.receiver->state() == ReceiverState::HeaderExpected);
        REQUIRE_FALSE(f.receiver->on_payload(h, std::vector<uint8_t>(CHUNK, 1)));
        REQUIRE(f.receiver->received_chunks() == 0);
        REQUIRE(f.deliver(0));
        REQUIRE(f.receiver->received_chunks() == 1);
    }

    SECTION("chunk reaching past the end of the file") {
        auto h = f.header(CHUNKS - 1);
        h.offset = f.file.size() - CHUNK + 1;
        REQUIRE_FALSE(f.receiver->on_header(h));
        h = f.header(0);
        h.offset = std::numeric_limits<uint64_t>::max();
        REQUIRE_FALSE(f.receiver->on_header(h));
        REQUIRE(f.receiver->state() == ReceiverState::HeaderExpected);
        REQUIRE(f.receiver->snapshot().chunk_index == 0);
    }

    SECTION("second download-start") {
        DownloadStart again;
        again.request_id = "download_test_1";
        again.file_name = "data.bin";
        REQUIRE_FALSE(f.receiver->on_start(again));
    }

    REQUIRE(f.finished_calls == 0);
}

TEST_CASE("Receiver ignores chunk counts the file size cannot produce", "[receiver][protocol]") {
    ReceiverFixture f;

    DownloadStart start;
    start.request_id = "download_test_1";
    start.file_id = "f1";
    start.file_name = "data.bin";
    start.file_size = f.file.size();
    start.total_chunks = 4000000000u;
    start.chunk_size = CHUNK;
    REQUIRE_FALSE(f.receiver->on_start(start));
    REQUIRE(f.receiver->state() == ReceiverState::Idle);

    f.start();
    for (uint32_t i = 0; i < CHUNKS; ++i) {
        REQUIRE(f.deliver(i));
    }

    DownloadComplete bogus;
    bogus.request_id = "download_test_1";
    bogus.final_stats.total_bytes = f.file.size();
    bogus.final_stats.total_chunks = std::numeric_limits<uint32_t>::max();
    f.receiver->on_complete(bogus);
    REQUIRE(f.receiver->state() == ReceiverState::HeaderExpected);
    REQUIRE(f.finished_calls == 0);

    f.complete(compute_checksum(f.file));
    REQUIRE(f.receiver->state() == ReceiverState::Completed);
    REQUIRE(*f.received == f.file);
}

TEST_CASE("Receiver sends acks and throughput reports", "[receiver][feedback]") {
    ReceiverFixture f;
    f.start();
    auto before = f.receiver_side->frames_sent(FrameKind::Control);

    for (uint32_t i = 0; i < CHUNKS; ++i) {
        REQUIRE(f.deliver(i));
    }

    // One chunk-ack and one throughput-report after ten chunks
    REQUIRE(f.receiver_side->frames_sent(FrameKind::Control) - before == 2);
}

TEST_CASE("Losing the link after the last chunk still completes", "[receiver][connection]") {
    ReceiverFixture f;
    f.start();
    for (uint32_t i = 0; i < CHUNKS; ++i) {
        REQUIRE(f.deliver(i));
    }
    f.receiver->on_connection_lost();

    REQUIRE(f.receiver->state() == ReceiverState::Completed);
    REQUIRE(f.received);
    REQUIRE(*f.received == f.file);
}

TEST_CASE("Receiver resumes after a lost connection", "[receiver][resume]") {
    ReceiverFixture f;
    f.start();
    for (uint32_t i = 0; i < 6; ++i) {
        REQUIRE(f.deliver(i));
    }
    f.receiver->on_connection_lost();

    REQUIRE(f.receiver->state() == ReceiverState::Failed);
    REQUIRE(f.finished_calls == 1);
    REQUIRE_FALSE(f.received);
    REQUIRE(f.finished_session->last_error == ErrorCode::ConnectionLost);
    REQUIRE(is_resumable(f.finished_session->last_error));

    auto cp = f.store->get("download_test_1");
    REQUIRE(cp);
    REQUIRE(cp->chunk_index == 6);
    REQUIRE(cp->byte_offset == 6 * CHUNK);

    auto channels = LoopbackChannel::create_pair();
    auto new_link = std::make_shared<PeerLink>("owner", channels.second);
    auto point = f.receiver->prepare_resume(new_link);
    REQUIRE(point);
    REQUIRE(point->chunk_index == 6);
    REQUIRE(point->offset == 6 * CHUNK);
    REQUIRE(f.receiver->snapshot().state == SessionState::Handshaking);

    SECTION("continues from the resume point") {
        REQUIRE(f.receiver->on_resume(f.resume_message(6, 6 * CHUNK)));
        REQUIRE(f.receiver->state() == ReceiverState::HeaderExpected);
        for (uint32_t i = 6; i < CHUNKS; ++i) {
            REQUIRE(f.deliver(i));
        }
        f.complete(compute_checksum(f.file));

        REQUIRE(f.receiver->state() == ReceiverState::Completed);
        REQUIRE(f.finished_calls == 2);
        REQUIRE(f.received);
        REQUIRE(*f.received == f.file);
        REQUIRE(f.receiver->peer_id() == "owner");
    }

    SECTION("owner may restart from an earlier chunk") {
        REQUIRE(f.receiver->on_resume(f.resume_message(2, 2 * CHUNK)));
        REQUIRE(f.receiver->received_chunks() == 2);
        for (uint32_t i = 2; i < CHUNKS; ++i) {
            REQUIRE(f.deliver(i));
        }
        f.complete();
        REQUIRE(f.received);
        REQUIRE(*f.received == f.file);
    }

    SECTION("a resume point that disagrees with held data fails") {
        REQUIRE_FALSE(f.receiver->on_resume(f.resume_message(6, 5 * CHUNK)));
        REQUIRE(f.receiver->state() == ReceiverState::Failed);
        REQUIRE(f.finished_session->last_error == ErrorCode::ProtocolError);
        REQUIRE(f.receiver->received_chunks() == 0);
        REQUIRE_FALSE(f.store->get("download_test_1"));
        REQUIRE(channels.second->frames_sent(FrameKind::Control) == 1);
    }
}

TEST_CASE("Resume drops chunks past the first gap", "[receiver][resume]") {
    ReceiverFixture f;
    f.start();
    for (uint32_t i : {0u, 1u, 2u, 3u, 5u}) {
        REQUIRE(f.deliver(i));
    }
    f.receiver->on_connection_lost();

    auto point = f.receiver->resume_point();
    REQUIRE(point.chunk_index == 4);
    REQUIRE(point.offset == 4 * CHUNK);

    auto channels = LoopbackChannel::create_pair();
    REQUIRE(f.receiver->prepare_resume(std::make_shared<PeerLink>("owner", channels.second)));
    REQUIRE(f.receiver->on_resume(f.resume_message(4, 4 * CHUNK)));
    REQUIRE(f.receiver->received_chunks() == 4);
    REQUIRE(f.receiver->snapshot().bytes_transferred == 4 * CHUNK);
}

TEST_CASE("Completed or non-resumable receivers cannot be re-armed", "[receiver][resume]") {
    ReceiverFixture f;
    f.start();
    f.receiver->cancel();

    auto channels = LoopbackChannel::create_pair();
    REQUIRE_FALSE(f.receiver->prepare_resume(std::make_shared<PeerLink>("owner", channels.second)));
}

TEST_CASE("Cancelling a download", "[receiver][cancel]") {
    ReceiverFixture f;
    f.start();
    REQUIRE(f.deliver(0));
    auto before = f.receiver_side->frames_sent(FrameKind::Control);

    f.receiver->cancel();

    REQUIRE(f.receiver->state() == ReceiverState::Failed);
    REQUIRE(f.finished_session->state == SessionState::Cancelled);
    REQUIRE(f.finished_session->last_error == ErrorCode::Cancelled);
    REQUIRE(f.receiver_side->frames_sent(FrameKind::Control) == before + 1);

    // Further events are ignored
    f.receiver->on_connection_lost();
    f.receiver->cancel();
    REQUIRE(f.finished_calls == 1);
}

TEST_CASE("Remote failure ends the download", "[receiver][error]") {
    ReceiverFixture f;
    f.start();
    REQUIRE(f.deliver(0));
    f.receiver->on_remote_failure(ErrorCode::ReadError);

    REQUIRE(f.finished_session->state == SessionState::Failed);
    REQUIRE(f.finished_session->last_error == ErrorCode::ReadError);
    REQUIRE(f.receiver->received_chunks() == 0);
}
