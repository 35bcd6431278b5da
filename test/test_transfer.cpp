#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <elio/elio.hpp>
#include "peerdrop/net/loopback_channel.h"
#include "peerdrop/storage/resume_store.h"
#include "peerdrop/transfer/transfer_coordinator.h"

using namespace peerdrop;

namespace {

constexpr uint32_t PINNED_CHUNK = 64 * 1024;

TransferConfig test_config() {
    TransferConfig config;
    config.rate.min_chunk_size = PINNED_CHUNK;
    config.rate.max_chunk_size = PINNED_CHUNK;
    config.rate.initial_chunk_size = PINNED_CHUNK;
    config.rate.initial_delay_ms = 0;
    config.rate.min_delay_ms = 0;
    config.rate.max_delay_ms = 0;
    return config;
}

std::vector<uint8_t> make_file(size_t size, uint8_t seed) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed + i / 65536) % 256);
    }
    return data;
}

// One coordinator with its own checkpoint store and a record of what it received
struct Node {
    std::string id;
    std::shared_ptr<MemoryResumeStore> store = std::make_shared<MemoryResumeStore>();
    std::unique_ptr<TransferCoordinator> coordinator;

    std::mutex mutex;
    std::map<std::string, std::vector<uint8_t>> files;   // by file id
    std::vector<TransferSession> finished;

    Node(std::string node_id, const TransferConfig& config = test_config())
        : id(std::move(node_id)),
          coordinator(std::make_unique<TransferCoordinator>(id, config, store)) {
        coordinator->set_on_file_received([this](const TransferSession&, const ReceivedFile& file) {
            std::lock_guard<std::mutex> lock(mutex);
            files[file.file_id] = file.data;
        });
        coordinator->set_on_session_finished([this](const TransferSession& session) {
            std::lock_guard<std::mutex> lock(mutex);
            finished.push_back(session);
        });
    }

    TransferCoordinator* operator->() { return coordinator.get(); }

    std::optional<std::vector<uint8_t>> file(const std::string& file_id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = files.find(file_id);
        if (it == files.end()) return std::nullopt;
        return it->second;
    }

    size_t file_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return files.size();
    }

    std::optional<TransferSession> finished_session(const std::string& transfer_id) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& session : finished) {
            if (session.id == transfer_id) return session;
        }
        return std::nullopt;
    }
};

// Joins two nodes over a fresh loopback pair; returns a's and b's channel
std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>
connect(Node& a, Node& b,
        const LoopbackChannel::Options& a_options = {},
        const LoopbackChannel::Options& b_options = {}) {
    auto channels = LoopbackChannel::create_pair(a_options, b_options);
    a->add_peer(b.id, channels.first);
    b->add_peer(a.id, channels.second);
    return channels;
}

elio::coro::task<bool> wait_until(std::function<bool()> predicate,
                                  std::chrono::milliseconds limit = std::chrono::seconds(20)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            co_return false;
        }
        co_await elio::time::sleep_for(std::chrono::milliseconds(5));
    }
    co_return true;
}

elio::coro::task<void> shutdown(std::vector<Node*> nodes) {
    for (auto* node : nodes) {
        node->coordinator->stop();
    }
    // Let the maintenance loops and channel pumps observe the stop
    co_await elio::time::sleep_for(std::chrono::milliseconds(200));
}

} // anonymous namespace

TEST_CASE("Coordinator rejects an invalid rate policy", "[transfer][config]") {
    auto config = test_config();
    config.rate.min_chunk_size = 0;
    REQUIRE_THROWS_AS(TransferCoordinator("node", config), PeerDropError);
}

TEST_CASE("Shared file is discovered and downloaded", "[transfer][e2e]") {
    Node alice("alice");
    Node bob("bob");
    auto content = make_file(1024 * 1024 + 123, 1);
    auto entry = alice->share_bytes("hello.bin", content);

    std::vector<std::string> catalog_updates;
    std::vector<std::string> disconnected;
    bob->set_on_catalog_updated([&](const std::string& peer_id) { catalog_updates.push_back(peer_id); });
    bob->set_on_peer_disconnected([&](const std::string& peer_id) { disconnected.push_back(peer_id); });

    bool discovered = false;
    bool received = false;
    bool catalog_cleared = false;
    std::optional<std::string> transfer_id;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        connect(alice, bob);

        discovered = co_await wait_until([&] { return bob->catalog().find_remote(entry.id).has_value(); });
        if (discovered) {
            transfer_id = bob->request_download(entry.id);
            received = co_await wait_until([&] { return bob.file(entry.id).has_value(); });
        }

        bob->remove_peer("alice");
        catalog_cleared = co_await wait_until([&] { return !bob->catalog().find_remote(entry.id); });
        co_await shutdown({&alice, &bob});
        co_return;
    }());

    REQUIRE(discovered);
    REQUIRE(transfer_id);
    REQUIRE(transfer_id->rfind("download_", 0) == 0);
    REQUIRE(received);
    REQUIRE(*bob.file(entry.id) == content);
    REQUIRE_FALSE(catalog_updates.empty());
    REQUIRE(catalog_updates.front() == "alice");

    auto session = bob->get_session(*transfer_id);
    REQUIRE(session);
    REQUIRE(session->state == SessionState::Completed);
    REQUIRE(session->direction == TransferDirection::Download);
    REQUIRE(session->file_name == "hello.bin");
    REQUIRE(session->bytes_transferred == content.size());
    REQUIRE(session->total_chunks == 17);

    REQUIRE(bob->stats().downloads_completed == 1);
    REQUIRE(bob->stats().bytes_downloaded == content.size());
    REQUIRE(alice->stats().uploads_completed == 1);
    REQUIRE(alice->stats().bytes_uploaded == content.size());

    REQUIRE(catalog_cleared);
    REQUIRE(disconnected == std::vector<std::string>{"alice"});
    REQUIRE_FALSE(bob->request_download(entry.id));
}

TEST_CASE("Interrupted download resumes without resending received chunks", "[transfer][resume]") {
    Node alice("alice");
    Node bob("bob");
    auto content = make_file(10 * 1024 * 1024, 2);
    auto entry = alice->share_bytes("big.bin", content);

    LoopbackChannel::Options faulty;
    faulty.fail_after_bytes = 4 * 1024 * 1024;

    std::optional<std::string> transfer_id;
    bool interrupted = false;
    bool resumed = false;
    bool received = false;
    uint32_t resume_chunk = 0;
    uint64_t second_pass_frames = 0;
    std::vector<std::string> resumable;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        connect(alice, bob, faulty);

        if (!co_await wait_until([&] { return bob->catalog().find_remote(entry.id).has_value(); })) {
            co_return;
        }
        transfer_id = bob->request_download(entry.id);

        interrupted = co_await wait_until([&] {
            return alice->stats().uploads_failed == 1 && !bob->resumable_downloads().empty();
        });
        resumable = bob->resumable_downloads();
        if (auto cp = bob.store->get(*transfer_id)) {
            resume_chunk = cp->chunk_index;
        }

        auto second = connect(alice, bob);
        resumed = bob->resume_download(*transfer_id);
        received = co_await wait_until([&] { return bob.file(entry.id).has_value(); });
        second_pass_frames = second.first->frames_sent(FrameKind::Binary);

        co_await shutdown({&alice, &bob});
        co_return;
    }());

    REQUIRE(transfer_id);
    REQUIRE(interrupted);
    REQUIRE(resumable == std::vector<std::string>{*transfer_id});
    REQUIRE(resume_chunk > 0);
    REQUIRE(resume_chunk < 160);
    REQUIRE(resumed);
    REQUIRE(received);
    REQUIRE(second_pass_frames == 160 - resume_chunk);
    REQUIRE(*bob.file(entry.id) == content);

    auto session = bob->get_session(*transfer_id);
    REQUIRE(session);
    REQUIRE(session->state == SessionState::Completed);
    REQUIRE(session->resume_offset == static_cast<uint64_t>(resume_chunk) * PINNED_CHUNK);
    REQUIRE(bob->resumable_downloads().empty());
    REQUIRE_FALSE(bob.store->get(*transfer_id));
    REQUIRE_FALSE(alice.store->get(*transfer_id));
}

TEST_CASE("One faulty peer does not disturb the others", "[transfer][fanout]") {
    Node alice("alice");
    Node bob("bob");
    Node carol("carol");
    auto content = make_file(2 * 1024 * 1024, 3);
    auto entry = alice->share_bytes("shared.bin", content);

    LoopbackChannel::Options faulty;
    faulty.fail_after_bytes = 512 * 1024;

    std::vector<std::string> uploads;
    bool carol_done = false;
    bool bob_failed = false;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        carol->start();
        connect(alice, bob, faulty);
        connect(alice, carol);

        uploads = alice->broadcast_file(entry.id);
        carol_done = co_await wait_until([&] { return carol.file(entry.id).has_value(); });
        bob_failed = co_await wait_until([&] {
            return alice->stats().uploads_failed == 1 && bob->stats().downloads_failed == 1;
        });
        co_await shutdown({&alice, &bob, &carol});
        co_return;
    }());

    REQUIRE(uploads.size() == 2);
    for (const auto& id : uploads) {
        REQUIRE(id.rfind("upload_", 0) == 0);
    }
    REQUIRE(carol_done);
    REQUIRE(*carol.file(entry.id) == content);
    REQUIRE(bob_failed);
    REQUIRE(bob.file_count() == 0);
    REQUIRE(alice->stats().uploads_completed == 1);

    // bob's partial push is kept for resume
    auto bob_resumable = bob->resumable_downloads();
    REQUIRE(bob_resumable.size() == 1);
    auto session = bob->get_session(bob_resumable.front());
    REQUIRE(session);
    REQUIRE(session->pushed);
    REQUIRE(session->last_error == ErrorCode::ConnectionLost);
}

TEST_CASE("Queued downloads start in request order", "[transfer][queue]") {
    auto config = test_config();
    config.max_concurrent_downloads = 1;
    Node alice("alice");
    Node bob("bob", config);

    std::vector<FileManifestEntry> entries;
    for (int i = 0; i < 3; ++i) {
        entries.push_back(alice->share_bytes("file" + std::to_string(i) + ".bin",
                                             make_file(256 * 1024, static_cast<uint8_t>(10 + i))));
    }

    std::mutex started_mutex;
    std::vector<std::string> started;
    size_t max_active = 0;
    bob->set_on_session_started([&](const TransferSession& session) {
        auto active = bob->stats().active_downloads;
        std::lock_guard<std::mutex> lock(started_mutex);
        started.push_back(session.id);
        max_active = std::max(max_active, active);
    });

    std::vector<std::string> ids;
    std::vector<std::string> queued_after_request;
    std::vector<std::string> extra;
    bool all_received = false;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        connect(alice, bob);

        if (!co_await wait_until([&] { return bob->catalog().remote_count() == 3; })) {
            co_return;
        }
        for (const auto& entry : entries) {
            if (auto id = bob->request_download(entry.id)) {
                ids.push_back(*id);
            }
        }
        queued_after_request = bob->queued_downloads();
        extra = bob->request_all_downloads();

        all_received = co_await wait_until([&] { return bob.file_count() == 3; });
        co_await shutdown({&alice, &bob});
        co_return;
    }());

    REQUIRE(ids.size() == 3);
    REQUIRE(queued_after_request == std::vector<std::string>{ids[1], ids[2]});
    REQUIRE(extra.empty());
    REQUIRE(all_received);
    REQUIRE(started == ids);
    REQUIRE(max_active == 1);
    for (size_t i = 0; i < entries.size(); ++i) {
        REQUIRE(*bob.file(entries[i].id) == make_file(256 * 1024, static_cast<uint8_t>(10 + i)));
    }
}

TEST_CASE("Cancelling a queued download", "[transfer][queue][cancel]") {
    auto config = test_config();
    config.max_concurrent_downloads = 1;
    Node alice("alice");
    Node bob("bob", config);
    auto first = alice->share_bytes("first.bin", make_file(512 * 1024, 4));
    auto second = alice->share_bytes("second.bin", make_file(1024, 5));

    std::optional<std::string> first_id;
    std::optional<std::string> second_id;
    bool cancelled = false;
    bool first_done = false;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        connect(alice, bob);
        if (!co_await wait_until([&] { return bob->catalog().remote_count() == 2; })) {
            co_return;
        }
        first_id = bob->request_download(first.id);
        second_id = bob->request_download(second.id);
        cancelled = bob->cancel_transfer(*second_id);
        first_done = co_await wait_until([&] { return bob.file(first.id).has_value(); });
        co_await elio::time::sleep_for(std::chrono::milliseconds(100));
        co_await shutdown({&alice, &bob});
        co_return;
    }());

    REQUIRE(cancelled);
    REQUIRE(first_done);
    REQUIRE_FALSE(bob.file(second.id));
    auto session = bob->get_session(*second_id);
    REQUIRE(session);
    REQUIRE(session->state == SessionState::Cancelled);
    REQUIRE_FALSE(bob->cancel_transfer("download_unknown"));
}

TEST_CASE("Requesting a file the owner does not have", "[transfer][error]") {
    Node alice("alice");
    Node bob("bob");

    std::optional<std::string> transfer_id;
    bool finished = false;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        connect(alice, bob);
        transfer_id = bob->request_download("alice", "file_does_not_exist");
        if (transfer_id) {
            finished = co_await wait_until([&] { return bob.finished_session(*transfer_id).has_value(); });
        }
        co_await shutdown({&alice, &bob});
        co_return;
    }());

    REQUIRE(transfer_id);
    REQUIRE(finished);
    auto session = bob.finished_session(*transfer_id);
    REQUIRE(session->state == SessionState::Failed);
    REQUIRE(session->last_error == ErrorCode::NotFound);
    REQUIRE(bob->resumable_downloads().empty());
    REQUIRE(bob->stats().downloads_failed == 1);
}

TEST_CASE("Pushes are refused when the receiver does not accept them", "[transfer][push]") {
    auto config = test_config();
    config.accept_pushes = false;
    Node alice("alice");
    Node bob("bob", config);
    auto entry = alice->share_bytes("unwanted.bin", make_file(10 * 1024 * 1024, 6));

    // Slow delivery towards bob so the refusal arrives mid-stream
    LoopbackChannel::Options slow;
    slow.bytes_per_tick = PINNED_CHUNK;
    slow.tick_ms = 5;

    std::vector<std::string> uploads;
    bool upload_finished = false;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        connect(alice, bob, {}, slow);
        uploads = alice->broadcast_file(entry.id);
        if (uploads.size() == 1) {
            upload_finished = co_await wait_until([&] { return alice.finished_session(uploads[0]).has_value(); });
        }
        co_await shutdown({&alice, &bob});
        co_return;
    }());

    REQUIRE(uploads.size() == 1);
    REQUIRE(upload_finished);
    REQUIRE(alice.finished_session(uploads[0])->state == SessionState::Cancelled);
    REQUIRE(bob.file_count() == 0);
    REQUIRE(bob->history().empty());
}

TEST_CASE("Upload pause and resume through the coordinator", "[transfer][pause]") {
    Node alice("alice");
    Node bob("bob");
    auto content = make_file(10 * 1024 * 1024, 7);
    auto entry = alice->share_bytes("paused.bin", content);

    LoopbackChannel::Options slow;
    slow.bytes_per_tick = PINNED_CHUNK;
    slow.tick_ms = 5;

    std::vector<std::string> uploads;
    SessionState paused_state = SessionState::Idle;
    bool received = false;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        connect(alice, bob, {}, slow);
        uploads = alice->broadcast_file(entry.id);
        if (uploads.size() != 1) co_return;

        alice->pause_upload(uploads[0]);
        co_await elio::time::sleep_for(std::chrono::milliseconds(50));
        if (auto session = alice->get_session(uploads[0])) {
            paused_state = session->state;
        }
        alice->resume_upload(uploads[0]);
        received = co_await wait_until([&] { return bob.file(entry.id).has_value(); });
        co_await shutdown({&alice, &bob});
        co_return;
    }());

    REQUIRE(paused_state == SessionState::Paused);
    REQUIRE(received);
    REQUIRE(*bob.file(entry.id) == content);
    REQUIRE_FALSE(alice->pause_upload("upload_unknown"));
}

TEST_CASE("Reconnecting right after a drop hands the upload to the new link", "[transfer][resume]") {
    auto slow_config = test_config();
    slow_config.rate.initial_delay_ms = 50;
    slow_config.rate.min_delay_ms = 50;
    slow_config.rate.max_delay_ms = 50;
    Node alice("alice", slow_config);
    Node bob("bob");
    auto content = make_file(2 * 1024 * 1024, 8);
    auto entry = alice->share_bytes("relinked.bin", content);

    std::optional<std::string> transfer_id;
    bool halfway = false;
    bool resumed = false;
    bool paused = false;
    SessionState paused_state = SessionState::Idle;
    bool received = false;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        auto first = connect(alice, bob);

        if (!co_await wait_until([&] { return bob->catalog().find_remote(entry.id).has_value(); })) {
            co_return;
        }
        transfer_id = bob->request_download(entry.id);
        if (!transfer_id) co_return;

        const std::string id = *transfer_id;
        halfway = co_await wait_until([&] {
            auto session = bob->get_session(id);
            return session && session->bytes_transferred >= 1024 * 1024;
        });

        first.second->close();
        if (!co_await wait_until([&] { return !bob->resumable_downloads().empty(); })) {
            co_return;
        }
        connect(alice, bob);
        resumed = bob->resume_download(id);

        // The upload now being served must be the one the new link started
        co_await elio::time::sleep_for(std::chrono::milliseconds(150));
        paused = alice->pause_upload(id);
        if (auto session = alice->get_session(id)) {
            paused_state = session->state;
        }
        alice->resume_upload(id);

        received = co_await wait_until([&] { return bob.file(entry.id).has_value(); });
        co_await shutdown({&alice, &bob});
        co_return;
    }());

    REQUIRE(transfer_id);
    REQUIRE(halfway);
    REQUIRE(resumed);
    REQUIRE(paused);
    REQUIRE(paused_state == SessionState::Paused);
    REQUIRE(received);
    REQUIRE(*bob.file(entry.id) == content);
    REQUIRE(alice->stats().uploads_completed == 1);
    REQUIRE(alice->stats().uploads_failed == 1);
    REQUIRE_FALSE(alice.store->get(*transfer_id));
}

TEST_CASE("An owner that never answers times out the handshake", "[transfer][queue][timeout]") {
    auto config = test_config();
    config.handshake_timeout_ms = 200;
    config.max_concurrent_downloads = 1;
    Node alice("alice");
    Node bob("bob", config);
    auto content = make_file(256 * 1024, 9);
    auto entry = alice->share_bytes("after.bin", content);

    std::optional<std::string> silent_id;
    std::optional<std::string> queued_id;
    std::vector<std::string> queued_after_request;
    bool timed_out = false;
    bool received = false;

    elio::run([&]() -> elio::coro::task<void> {
        alice->start();
        bob->start();
        // Nobody ever reads the far end of this pair
        auto silent = LoopbackChannel::create_pair();
        bob->add_peer("silent", silent.second);
        connect(alice, bob);

        if (!co_await wait_until([&] { return bob->catalog().find_remote(entry.id).has_value(); })) {
            co_return;
        }
        silent_id = bob->request_download("silent", "file_x");
        queued_id = bob->request_download(entry.id);
        queued_after_request = bob->queued_downloads();
        if (!silent_id) co_return;

        const std::string id = *silent_id;
        timed_out = co_await wait_until([&] { return bob.finished_session(id).has_value(); },
                                        std::chrono::seconds(5));
        received = co_await wait_until([&] { return bob.file(entry.id).has_value(); });
        co_await shutdown({&alice, &bob});
        co_return;
    }());

    REQUIRE(silent_id);
    REQUIRE(queued_id);
    REQUIRE(queued_after_request == std::vector<std::string>{*queued_id});
    REQUIRE(timed_out);
    auto session = bob.finished_session(*silent_id);
    REQUIRE(session->state == SessionState::Failed);
    REQUIRE(session->last_error == ErrorCode::HandshakeTimeout);
    REQUIRE(received);
    REQUIRE(*bob.file(entry.id) == content);
    REQUIRE(bob->stats().downloads_failed == 1);
}
