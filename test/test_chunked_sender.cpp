#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <atomic>
#include <chrono>
#include <limits>
#include <memory>
#include <optional>
#include <vector>
#include <elio/elio.hpp>
#include "peerdrop/net/loopback_channel.h"
#include "peerdrop/storage/resume_store.h"
#include "peerdrop/transfer/chunked_receiver.h"
#include "peerdrop/transfer/chunked_sender.h"

using namespace peerdrop;

namespace {

constexpr uint32_t PINNED_CHUNK = 64 * 1024;
constexpr uint64_t TEN_MIB = 10ULL * 1024 * 1024;

std::shared_ptr<const std::vector<uint8_t>> make_file(size_t size) {
    auto data = std::make_shared<std::vector<uint8_t>>(size);
    for (size_t i = 0; i < size; ++i) {
        (*data)[i] = static_cast<uint8_t>((i * 7 + i / 4096) % 256);
    }
    return data;
}

TransferConfig pinned_config() {
    TransferConfig config;
    config.rate.min_chunk_size = PINNED_CHUNK;
    config.rate.max_chunk_size = PINNED_CHUNK;
    config.rate.initial_chunk_size = PINNED_CHUNK;
    config.rate.initial_delay_ms = 0;
    config.rate.min_delay_ms = 0;
    config.rate.max_delay_ms = 0;
    config.max_retries = 2;
    config.retry_base_delay_ms = 1;
    return config;
}

class FailingSource : public FileSource {
public:
    explicit FailingSource(uint64_t size) : size_(size) {}
    uint64_t size() const override { return size_; }
    std::optional<std::vector<uint8_t>> read(uint64_t, uint32_t) override { return std::nullopt; }

private:
    uint64_t size_;
};

// Owner and receiver on the two ends of a loopback pair, wired by hand
struct SenderFixture {
    TransferConfig config;
    std::shared_ptr<const std::vector<uint8_t>> file;
    std::shared_ptr<LoopbackChannel> owner_channel;
    std::shared_ptr<LoopbackChannel> receiver_channel;
    std::shared_ptr<PeerLink> owner_link;
    std::shared_ptr<PeerLink> receiver_link;
    std::shared_ptr<MemoryResumeStore> owner_store = std::make_shared<MemoryResumeStore>();
    std::shared_ptr<ChunkedSender> sender;
    std::shared_ptr<ChunkedReceiver> receiver;

    std::atomic<bool> sender_done{false};
    std::atomic<bool> receiver_done{false};
    std::optional<TransferSession> sender_result;
    std::optional<std::vector<uint8_t>> received;

    SenderFixture(uint64_t size,
                  const LoopbackChannel::Options& owner_options = {},
                  const LoopbackChannel::Options& receiver_options = {},
                  std::shared_ptr<FileSource> source = nullptr)
        : config(pinned_config()), file(make_file(size)) {
        auto channels = LoopbackChannel::create_pair(owner_options, receiver_options);
        owner_channel = channels.first;
        receiver_channel = channels.second;
        owner_link = std::make_shared<PeerLink>("receiver", owner_channel);
        receiver_link = std::make_shared<PeerLink>("owner", receiver_channel);

        TransferSession session;
        session.id = "upload_test_1";
        session.peer_id = "receiver";
        session.file_id = "f1";
        session.file_name = "ten.bin";

        if (!source) {
            source = std::make_shared<MemoryFileSource>(file);
        }
        auto rate = std::make_shared<RateController>(config.rate);
        sender = std::make_shared<ChunkedSender>(owner_link, source, rate, session, config, owner_store);
        sender->set_checksum(compute_checksum(*file));
        sender->set_finished_callback([this](const TransferSession& s) {
            sender_result = s;
            sender_done = true;
        });

        TransferSession download = session;
        download.peer_id = "owner";
        receiver = std::make_shared<ChunkedReceiver>(receiver_link, download, config);
        receiver->set_finished_callback([this](const TransferSession&, const ReceivedFile* f) {
            if (f) received = f->data;
            receiver_done = true;
        });

        std::weak_ptr<ChunkedSender> weak_sender = sender;
        owner_link->set_message_handler([weak_sender](const ControlMessage& message) {
            auto s = weak_sender.lock();
            if (!s) return;
            if (auto* ack = std::get_if<ChunkAck>(&message)) {
                s->on_chunk_ack(ack->chunk_index);
            } else if (std::holds_alternative<DownloadCancel>(message)) {
                s->cancel(false);
            }
        });

        std::weak_ptr<ChunkedReceiver> weak_receiver = receiver;
        receiver_link->set_message_handler([weak_receiver](const ControlMessage& message) {
            auto r = weak_receiver.lock();
            if (!r) return;
            std::visit(overloaded{
                [&](const DownloadStart& m) { r->on_start(m); },
                [&](const FileChunkHeader& m) { r->on_header(m); },
                [&](const DownloadComplete& m) { r->on_complete(m); },
                [&](const DownloadCancel&) { r->on_remote_failure(ErrorCode::Cancelled); },
                [&](const DownloadError& m) { r->on_remote_failure(error_code_from_reason(m.error)); },
                [](const auto&) {},
            }, message);
        });
        receiver_link->set_payload_handler([weak_receiver](const FileChunkHeader& header, std::vector<uint8_t> data) {
            if (auto r = weak_receiver.lock()) {
                r->on_payload(header, std::move(data));
            }
        });
        receiver_link->set_closed_handler([weak_receiver]() {
            if (auto r = weak_receiver.lock()) {
                r->on_connection_lost();
            }
        });
    }

    elio::coro::task<void> wait_until_done(std::chrono::milliseconds limit) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (!(sender_done && receiver_done) && std::chrono::steady_clock::now() < deadline) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(5));
        }
    }

    elio::coro::task<void> shutdown() {
        owner_channel->close();
        co_await elio::time::sleep_for(std::chrono::milliseconds(50));
    }
};

} // anonymous namespace

TEST_CASE("Sender streams a file at a pinned chunk size", "[sender][stream]") {
    SenderFixture f(TEN_MIB);

    elio::run([&]() -> elio::coro::task<void> {
        f.owner_link->attach();
        f.receiver_link->attach();
        if (f.sender->start_upload()) {
            co_await f.sender->run();
        }
        co_await f.wait_until_done(std::chrono::seconds(30));
        co_await f.shutdown();
        co_return;
    }());

    REQUIRE(f.sender_done);
    REQUIRE(f.receiver_done);
    REQUIRE(f.sender->state() == SenderState::Completed);
    REQUIRE(f.owner_channel->frames_sent(FrameKind::Binary) == 160);

    auto snapshot = f.sender->snapshot();
    REQUIRE(snapshot.state == SessionState::Completed);
    REQUIRE(snapshot.bytes_transferred == TEN_MIB);
    REQUIRE(snapshot.chunk_index == 160);
    REQUIRE(snapshot.total_chunks == 160);
    REQUIRE(snapshot.chunk_size == PINNED_CHUNK);

    REQUIRE(f.receiver->state() == ReceiverState::Completed);
    REQUIRE(f.received);
    REQUIRE(f.received->size() == TEN_MIB);
    REQUIRE(*f.received == *f.file);
    auto stats = f.receiver->final_stats();
    REQUIRE(stats);
    REQUIRE(stats->total_bytes == TEN_MIB);
    REQUIRE(stats->total_chunks == 160);
    REQUIRE(stats->avg_chunk_size == PINNED_CHUNK);

    // Completed uploads leave no checkpoint behind
    REQUIRE(f.owner_store->list().empty());
}

TEST_CASE("Sender handles a final partial chunk and an empty file", "[sender][stream]") {
    auto size = GENERATE(as<uint64_t>{}, 0, 1, 65536, 65537, 200000);
    SenderFixture f(size);

    elio::run([&]() -> elio::coro::task<void> {
        f.owner_link->attach();
        f.receiver_link->attach();
        if (f.sender->start_upload()) {
            co_await f.sender->run();
        }
        co_await f.wait_until_done(std::chrono::seconds(10));
        co_await f.shutdown();
        co_return;
    }());

    uint64_t expected_chunks = size == 0 ? 1 : (size + PINNED_CHUNK - 1) / PINNED_CHUNK;
    REQUIRE(f.owner_channel->frames_sent(FrameKind::Binary) == expected_chunks);
    REQUIRE(f.received);
    REQUIRE(*f.received == *f.file);
}

TEST_CASE("Paused uploads send nothing until resumed", "[sender][pause]") {
    SenderFixture f(20 * PINNED_CHUNK);
    uint64_t frames_while_paused = 0;
    SessionState state_while_paused = SessionState::Idle;

    elio::run([&]() -> elio::coro::task<void> {
        f.owner_link->attach();
        f.receiver_link->attach();
        if (!f.sender->start_upload()) co_return;
        f.sender->pause();
        (void)f.sender->run().spawn();

        co_await elio::time::sleep_for(std::chrono::milliseconds(100));
        frames_while_paused = f.owner_channel->frames_sent(FrameKind::Binary);
        state_while_paused = f.sender->snapshot().state;

        f.sender->resume();
        co_await f.wait_until_done(std::chrono::seconds(10));
        co_await f.shutdown();
        co_return;
    }());

    REQUIRE(frames_while_paused == 0);
    REQUIRE(state_while_paused == SessionState::Paused);
    REQUIRE(f.sender->state() == SenderState::Completed);
    REQUIRE(f.received);
    REQUIRE(*f.received == *f.file);
}

TEST_CASE("Cancelling before streaming notifies the receiver", "[sender][cancel]") {
    SenderFixture f(4 * PINNED_CHUNK);

    REQUIRE(f.sender->start_upload());
    f.sender->cancel();

    REQUIRE(f.sender->state() == SenderState::Failed);
    REQUIRE(f.sender_done);
    REQUIRE(f.sender_result->state == SessionState::Cancelled);
    REQUIRE(f.sender_result->last_error == ErrorCode::Cancelled);
    // download-start and download-cancel
    REQUIRE(f.owner_channel->frames_sent(FrameKind::Control) == 2);
    REQUIRE(f.owner_channel->frames_sent(FrameKind::Binary) == 0);
    REQUIRE_FALSE(f.sender->start_upload());
}

TEST_CASE("Cancelling mid-stream stops at a chunk boundary", "[sender][cancel]") {
    LoopbackChannel::Options slow;
    slow.bytes_per_tick = PINNED_CHUNK;
    slow.tick_ms = 5;
    SenderFixture f(TEN_MIB, {}, slow);

    elio::run([&]() -> elio::coro::task<void> {
        f.owner_link->attach();
        f.receiver_link->attach();
        if (!f.sender->start_upload()) co_return;
        (void)f.sender->run().spawn();

        co_await elio::time::sleep_for(std::chrono::milliseconds(100));
        f.sender->cancel();
        co_await f.wait_until_done(std::chrono::seconds(10));
        co_await f.shutdown();
        co_return;
    }());

    REQUIRE(f.sender_done);
    REQUIRE(f.sender_result->state == SessionState::Cancelled);
    REQUIRE(f.owner_channel->frames_sent(FrameKind::Binary) < 160);
    REQUIRE(f.receiver->state() == ReceiverState::Failed);
    REQUIRE(f.receiver->snapshot().last_error == ErrorCode::Cancelled);
    REQUIRE_FALSE(f.received);
}

TEST_CASE("Dropped connection leaves a sender checkpoint", "[sender][resume]") {
    LoopbackChannel::Options faulty;
    faulty.fail_after_bytes = 4 * 1024 * 1024;
    SenderFixture f(TEN_MIB, faulty);

    elio::run([&]() -> elio::coro::task<void> {
        f.owner_link->attach();
        f.receiver_link->attach();
        if (f.sender->start_upload()) {
            co_await f.sender->run();
        }
        co_await f.wait_until_done(std::chrono::seconds(10));
        co_await f.shutdown();
        co_return;
    }());

    REQUIRE(f.sender->state() == SenderState::Failed);
    REQUIRE(f.sender_result->last_error == ErrorCode::ConnectionLost);

    auto cp = f.owner_store->get("upload_test_1");
    REQUIRE(cp);
    REQUIRE(cp->chunk_index > 0);
    REQUIRE(cp->chunk_index < 64);
    REQUIRE(cp->byte_offset == static_cast<uint64_t>(cp->chunk_index) * PINNED_CHUNK);

    REQUIRE(f.receiver->state() == ReceiverState::Failed);
    REQUIRE(f.receiver->snapshot().last_error == ErrorCode::ConnectionLost);
    REQUIRE(f.receiver->resume_point().chunk_index <= cp->chunk_index);
}

TEST_CASE("Read failures are retried then reported", "[sender][retry]") {
    SenderFixture f(4 * PINNED_CHUNK, {}, {}, std::make_shared<FailingSource>(4 * PINNED_CHUNK));

    elio::run([&]() -> elio::coro::task<void> {
        f.owner_link->attach();
        f.receiver_link->attach();
        if (f.sender->start_upload()) {
            co_await f.sender->run();
        }
        co_await f.wait_until_done(std::chrono::seconds(5));
        co_await f.shutdown();
        co_return;
    }());

    REQUIRE(f.sender->state() == SenderState::Failed);
    REQUIRE(f.sender_result->last_error == ErrorCode::MaxRetriesExceeded);
    REQUIRE(f.sender_result->retry_count == 3);
    REQUIRE(f.receiver->snapshot().last_error == ErrorCode::MaxRetriesExceeded);
}

TEST_CASE("Rejected sends on a live link are retried then reported", "[sender][retry]") {
    // The queue never has room for a whole chunk, but the link stays up
    LoopbackChannel::Options cramped;
    cramped.max_queued_bytes = 32 * 1024;
    SenderFixture f(4 * PINNED_CHUNK, cramped);

    bool still_connected = false;
    elio::run([&]() -> elio::coro::task<void> {
        f.owner_link->attach();
        f.receiver_link->attach();
        if (f.sender->start_upload()) {
            co_await f.sender->run();
        }
        co_await f.wait_until_done(std::chrono::seconds(5));
        still_connected = f.owner_link->is_connected();
        co_await f.shutdown();
        co_return;
    }());

    REQUIRE(still_connected);
    REQUIRE(f.owner_channel->frames_sent(FrameKind::Binary) == 0);
    REQUIRE(f.sender->state() == SenderState::Failed);
    REQUIRE(f.sender_result->last_error == ErrorCode::MaxRetriesExceeded);
    REQUIRE(f.sender_result->retry_count == 3);
    REQUIRE(f.receiver->snapshot().last_error == ErrorCode::MaxRetriesExceeded);
}

TEST_CASE("Retry backoff doubles up to its cap", "[sender][retry]") {
    TransferConfig config;
    config.retry_base_delay_ms = 100;
    config.retry_max_delay_ms = 5000;

    REQUIRE(retry_backoff_ms(config, 1) == 100);
    REQUIRE(retry_backoff_ms(config, 2) == 200);
    REQUIRE(retry_backoff_ms(config, 6) == 3200);
    REQUIRE(retry_backoff_ms(config, 7) == 5000);
    REQUIRE(retry_backoff_ms(config, 33) == 5000);
    REQUIRE(retry_backoff_ms(config, std::numeric_limits<uint32_t>::max()) == 5000);

    config.retry_base_delay_ms = 0;
    REQUIRE(retry_backoff_ms(config, std::numeric_limits<uint32_t>::max()) == 0);
}

TEST_CASE("Resuming at the end of the file only sends the summary", "[sender][resume]") {
    SenderFixture f(4 * PINNED_CHUNK);

    bool done = false;
    elio::run([&]() -> elio::coro::task<void> {
        f.owner_link->attach();
        f.receiver_link->attach();
        if (f.sender->start_upload(ResumePoint{4 * PINNED_CHUNK, 4})) {
            co_await f.sender->run();
        }
        for (int i = 0; i < 200 && !f.sender_done; ++i) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(5));
        }
        done = f.sender_done;
        co_await f.shutdown();
        co_return;
    }());

    REQUIRE(done);
    REQUIRE(f.owner_channel->frames_sent(FrameKind::Binary) == 0);
    REQUIRE(f.sender->state() == SenderState::Completed);
    REQUIRE(f.sender_result->chunk_index == 4);
    REQUIRE(f.sender_result->total_chunks == 4);
    REQUIRE(f.sender_result->bytes_transferred == 4 * PINNED_CHUNK);
}
