#include "peerdrop/transfer/transfer_coordinator.h"
#include "peerdrop/base/logger.h"
#include "peerdrop/base/utils.h"
#include "peerdrop/net/peer_link.h"
#include "peerdrop/transfer/chunked_sender.h"
#include <elio/elio.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace peerdrop {

namespace {

constexpr auto MAINTENANCE_INTERVAL = std::chrono::milliseconds(100);
constexpr size_t MAX_HISTORY = 1024;

elio::coro::task<void> drive_upload(std::shared_ptr<ChunkedSender> sender) {
    co_await sender->run();
    co_return;
}

} // anonymous namespace

struct TransferCoordinator::Impl : std::enable_shared_from_this<TransferCoordinator::Impl> {
    struct PeerState {
        std::shared_ptr<PeerLink> link;
        std::shared_ptr<RateController> rate;
        std::unordered_map<std::string, std::shared_ptr<ChunkedSender>> uploads;
        std::unordered_map<std::string, std::shared_ptr<ChunkedReceiver>> downloads;
        std::chrono::steady_clock::time_point last_ping;
        std::chrono::steady_clock::time_point last_keepalive;
    };

    // A requested download waiting for a free slot
    struct DownloadQueueEntry {
        TransferSession session;
    };

    struct Handshake {
        std::string peer_id;
        std::chrono::steady_clock::time_point deadline;
    };

    std::string local_peer_id;
    TransferConfig config;
    ResumeConfig resume_config;
    std::shared_ptr<ResumeStore> resume_store;
    TransferCatalog catalog;

    std::atomic<bool> running{false};
    std::chrono::steady_clock::time_point last_gc;

    mutable std::mutex mutex;
    std::unordered_map<std::string, PeerState> peers;
    std::deque<DownloadQueueEntry> queue;
    std::unordered_set<std::string> active_downloads;   // counted against max_concurrent_downloads
    std::unordered_map<std::string, Handshake> handshakes;
    std::unordered_map<std::string, std::shared_ptr<ChunkedReceiver>> resumable;
    std::deque<TransferSession> history;
    CoordinatorStats stats;

    FileReceivedCallback on_file_received;
    SessionCallback on_session_started;
    SessionCallback on_session_finished;
    PeerCallback on_catalog_updated;
    PeerCallback on_peer_disconnected;

    Impl(std::string peer_id, const TransferConfig& cfg,
         std::shared_ptr<ResumeStore> store, const ResumeConfig& resume_cfg)
        : local_peer_id(peer_id),
          config(cfg),
          resume_config(resume_cfg),
          resume_store(std::move(store)),
          catalog(std::move(peer_id)) {}

    // Peer links

    void attach_link(const std::string& peer_id, const std::shared_ptr<PeerLink>& link) {
        std::weak_ptr<Impl> weak = shared_from_this();
        std::weak_ptr<PeerLink> weak_link = link;
        link->set_message_handler([weak, peer_id](const ControlMessage& message) {
            if (auto self = weak.lock()) {
                self->handle_message(peer_id, message);
            }
        });
        link->set_payload_handler([weak, peer_id](const FileChunkHeader& header, std::vector<uint8_t> data) {
            if (auto self = weak.lock()) {
                self->handle_payload(peer_id, header, std::move(data));
            }
        });
        link->set_closed_handler([weak, peer_id, weak_link]() {
            if (auto self = weak.lock()) {
                self->handle_link_closed(peer_id, weak_link.lock());
            }
        });
    }

    void handle_link_closed(const std::string& peer_id, const std::shared_ptr<PeerLink>& link) {
        std::vector<std::shared_ptr<ChunkedReceiver>> receivers;
        std::vector<std::shared_ptr<ChunkedSender>> senders;
        PeerCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = peers.find(peer_id);
            if (it == peers.end() || it->second.link != link) {
                return;
            }
            for (auto& [id, receiver] : it->second.downloads) {
                receivers.push_back(receiver);
            }
            for (auto& [id, sender] : it->second.uploads) {
                senders.push_back(sender);
            }
            peers.erase(it);
            stats.connected_peers = peers.size();
            callback = on_peer_disconnected;
        }

        Logger::instance().info("Peer {} disconnected", peer_id);
        catalog.remove_peer(peer_id);
        for (auto& sender : senders) {
            sender->on_connection_lost();
        }
        for (auto& receiver : receivers) {
            receiver->on_connection_lost();
        }
        if (callback) {
            callback(peer_id);
        }
        pump_queue();
    }

    std::shared_ptr<PeerLink> link_for(const std::string& peer_id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = peers.find(peer_id);
        return it == peers.end() ? nullptr : it->second.link;
    }

    std::shared_ptr<RateController> rate_for(const std::string& peer_id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = peers.find(peer_id);
        return it == peers.end() ? nullptr : it->second.rate;
    }

    std::shared_ptr<ChunkedReceiver> download_for(const std::string& peer_id, const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = peers.find(peer_id);
        if (it == peers.end()) return nullptr;
        auto dit = it->second.downloads.find(id);
        return dit == it->second.downloads.end() ? nullptr : dit->second;
    }

    std::shared_ptr<ChunkedSender> upload_for(const std::string& peer_id, const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = peers.find(peer_id);
        if (it == peers.end()) return nullptr;
        auto uit = it->second.uploads.find(id);
        return uit == it->second.uploads.end() ? nullptr : uit->second;
    }

    void announce(const FileManifestEntry& entry) {
        std::vector<std::shared_ptr<PeerLink>> links;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto& [id, peer] : peers) {
                links.push_back(peer.link);
            }
        }
        for (auto& link : links) {
            link->send_message(FileMetadataMessage{entry});
        }
    }

    // Message dispatch

    void handle_message(const std::string& peer_id, const ControlMessage& message) {
        std::visit(overloaded{
            [&](const HelloMessage& m) {
                Logger::instance().debug("Hello from {} (protocol {}) on link {}", m.peer_id, m.version, peer_id);
            },
            [&](const FileMetadataMessage& m) {
                if (catalog.merge_remote(m.file, peer_id)) {
                    Logger::instance().debug("Peer {} announced {} ({})", peer_id, m.file.name, m.file.id);
                    notify_catalog_updated(peer_id);
                }
            },
            [&](const FilesListRequest&) {
                if (auto link = link_for(peer_id)) {
                    link->send_message(FilesListResponse{catalog.local_files()});
                }
            },
            [&](const FilesListResponse& m) {
                size_t merged = catalog.merge_remote(m.files, peer_id);
                Logger::instance().info("Catalog of {}: {} files", peer_id, merged);
                notify_catalog_updated(peer_id);
            },
            [&](const DownloadRequest& m) { handle_download_request(peer_id, m); },
            [&](const DownloadStart& m) { handle_download_start(peer_id, m); },
            [&](const DownloadResume& m) {
                auto receiver = download_for(peer_id, m.request_id);
                if (!receiver) {
                    Logger::instance().warning("download-resume for unknown transfer {} from {}", m.request_id, peer_id);
                    return;
                }
                clear_handshake(m.request_id);
                receiver->on_resume(m);
            },
            [&](const DownloadCancel& m) {
                if (auto sender = upload_for(peer_id, m.request_id)) {
                    sender->cancel(false);
                } else if (auto receiver = download_for(peer_id, m.request_id)) {
                    clear_handshake(m.request_id);
                    receiver->on_remote_failure(ErrorCode::Cancelled, "cancelled by " + peer_id);
                }
            },
            [&](const FileChunkHeader& m) {
                auto receiver = download_for(peer_id, m.transfer_id);
                if (!receiver) {
                    Logger::instance().warning("Chunk header for unknown transfer {} from {}", m.transfer_id, peer_id);
                    return;
                }
                receiver->on_header(m);
            },
            [&](const DownloadComplete& m) {
                if (auto receiver = download_for(peer_id, m.request_id)) {
                    receiver->on_complete(m);
                }
            },
            [&](const DownloadError& m) { handle_download_error(peer_id, m); },
            [&](const ThroughputReport& m) {
                if (auto rate = rate_for(peer_id)) {
                    rate->on_feedback(RateFeedback{m.buffer_level, m.throughput, m.rtt_ms});
                }
            },
            [&](const BufferPressure& m) {
                if (auto rate = rate_for(peer_id)) {
                    rate->on_buffer_pressure(m.level, m.pressure);
                }
            },
            [&](const RateLimitRequest& m) {
                if (auto rate = rate_for(peer_id)) {
                    rate->on_rate_limit(m.max_rate);
                }
            },
            [&](const ChunkAck& m) {
                if (auto sender = upload_for(peer_id, m.transfer_id)) {
                    sender->on_chunk_ack(m.chunk_index);
                }
            },
            [&](const Ping& m) {
                if (auto link = link_for(peer_id)) {
                    link->send_message(Pong{m.timestamp});
                }
            },
            [&](const Pong& m) { handle_pong(peer_id, m); },
            [&](const Keepalive& m) {
                if (auto link = link_for(peer_id)) {
                    link->send_message(KeepaliveAck{m.timestamp});
                }
            },
            [&](const KeepaliveAck&) {},
        }, message);
    }

    void handle_payload(const std::string& peer_id, const FileChunkHeader& header, std::vector<uint8_t> data) {
        auto receiver = download_for(peer_id, header.transfer_id);
        if (!receiver) {
            Logger::instance().warning("Payload for unknown transfer {} from {}", header.transfer_id, peer_id);
            return;
        }
        receiver->on_payload(header, std::move(data));
    }

    void handle_pong(const std::string& peer_id, const Pong& pong) {
        uint64_t now = current_time_ms();
        if (pong.timestamp == 0 || pong.timestamp > now) {
            return;
        }
        double rtt = static_cast<double>(now - pong.timestamp);
        std::shared_ptr<RateController> rate;
        std::vector<std::shared_ptr<ChunkedReceiver>> receivers;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = peers.find(peer_id);
            if (it == peers.end()) return;
            rate = it->second.rate;
            for (auto& [id, receiver] : it->second.downloads) {
                receivers.push_back(receiver);
            }
        }
        rate->on_rtt(rtt);
        for (auto& receiver : receivers) {
            receiver->set_rtt(rtt);
        }
        Logger::instance().debug("RTT to {}: {:.0f} ms", peer_id, rtt);
    }

    void notify_catalog_updated(const std::string& peer_id) {
        PeerCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            callback = on_catalog_updated;
        }
        if (callback) {
            callback(peer_id);
        }
    }

    // Uploads

    void handle_download_request(const std::string& peer_id, const DownloadRequest& request) {
        auto link = link_for(peer_id);
        if (!link) {
            return;
        }

        auto entry = catalog.find_local(request.file_id);
        auto source = entry ? catalog.open_local(request.file_id) : nullptr;
        if (!entry || !source) {
            Logger::instance().warning("Peer {} requested unknown file {}", peer_id, request.file_id);
            DownloadError error;
            error.request_id = request.request_id;
            error.error = to_reason(ErrorCode::NotFound);
            link->send_message(error);
            return;
        }

        std::optional<ResumePoint> resume_from;
        if (request.resume_offset && request.resume_chunk) {
            ResumePoint requested{*request.resume_offset, *request.resume_chunk};
            if (resume_store) {
                auto checkpoint = resume_store->get(request.request_id);
                if (checkpoint && checkpoint->chunk_index < requested.chunk_index) {
                    Logger::instance().info("Upload {}: resume clamped from chunk {} to checkpoint {}",
                                            request.request_id, requested.chunk_index, checkpoint->chunk_index);
                    requested = ResumePoint{checkpoint->byte_offset, checkpoint->chunk_index};
                }
            }
            if (requested.offset > source->size()) {
                requested = ResumePoint{};
            }
            resume_from = requested;
        }

        if (auto previous = upload_for(peer_id, request.request_id)) {
            previous->cancel(false);
        }

        TransferSession session;
        session.id = request.request_id;
        session.direction = TransferDirection::Upload;
        session.peer_id = peer_id;
        session.file_id = entry->id;
        session.file_name = entry->name;
        session.file_size = entry->byte_size;
        session.mime_type = entry->mime_type;
        start_upload(peer_id, link, std::move(source), std::move(session), entry->checksum, resume_from);
    }

    bool start_upload(const std::string& peer_id,
                      const std::shared_ptr<PeerLink>& link,
                      std::shared_ptr<FileSource> source,
                      TransferSession session,
                      const std::string& checksum,
                      std::optional<ResumePoint> resume_from) {
        auto rate = rate_for(peer_id);
        if (!rate) {
            return false;
        }

        auto sender = std::make_shared<ChunkedSender>(link, std::move(source), rate, session, config, resume_store);
        sender->set_checksum(checksum);
        std::weak_ptr<Impl> weak = shared_from_this();
        std::weak_ptr<ChunkedSender> weak_sender = sender;
        sender->set_finished_callback([weak, weak_sender, peer_id](const TransferSession& result) {
            if (auto self = weak.lock()) {
                self->handle_upload_finished(peer_id, weak_sender.lock(), result);
            }
        });

        SessionCallback started;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = peers.find(peer_id);
            if (it == peers.end() || it->second.link != link) {
                return false;
            }
            it->second.uploads[session.id] = sender;
            stats.active_uploads++;
            started = on_session_started;
        }

        if (!sender->start_upload(resume_from)) {
            return false;
        }
        if (started) {
            started(sender->snapshot());
        }
        (void)drive_upload(sender).spawn();
        return true;
    }

    void handle_upload_finished(const std::string& peer_id,
                                const std::shared_ptr<ChunkedSender>& sender,
                                const TransferSession& session) {
        SessionCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = peers.find(peer_id);
            if (it != peers.end()) {
                auto uit = it->second.uploads.find(session.id);
                if (uit != it->second.uploads.end() && uit->second == sender) {
                    it->second.uploads.erase(uit);
                }
            }
            if (stats.active_uploads > 0) stats.active_uploads--;
            if (session.state == SessionState::Completed) {
                stats.uploads_completed++;
            } else {
                stats.uploads_failed++;
            }
            stats.bytes_uploaded += session.bytes_transferred - session.resume_offset;
            record_history_locked(session);
            callback = on_session_finished;
        }
        if (callback) {
            callback(session);
        }
    }

    // Downloads

    void handle_download_start(const std::string& peer_id, const DownloadStart& start) {
        if (auto receiver = download_for(peer_id, start.request_id)) {
            clear_handshake(start.request_id);
            receiver->on_start(start);
            return;
        }

        if (!start.pushed) {
            Logger::instance().warning("download-start for unknown transfer {} from {}", start.request_id, peer_id);
            return;
        }

        auto link = link_for(peer_id);
        if (!link) {
            return;
        }
        if (!config.accept_pushes) {
            Logger::instance().info("Rejecting pushed file {} from {}", start.file_name, peer_id);
            DownloadError error;
            error.request_id = start.request_id;
            error.error = to_reason(ErrorCode::PeerRejected);
            link->send_message(error);
            return;
        }

        TransferSession session;
        session.id = start.request_id;
        session.direction = TransferDirection::Download;
        session.peer_id = peer_id;
        session.file_id = start.file_id;
        session.file_name = start.file_name;
        session.file_size = start.file_size;
        session.pushed = true;
        session.state = SessionState::Handshaking;

        auto receiver = make_receiver(peer_id, link, session);
        SessionCallback started;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = peers.find(peer_id);
            if (it == peers.end()) return;
            it->second.downloads[session.id] = receiver;
            started = on_session_started;
        }
        Logger::instance().info("Accepting pushed file {} from {}", start.file_name, peer_id);
        receiver->on_start(start);
        if (started) {
            started(receiver->snapshot());
        }
    }

    std::shared_ptr<ChunkedReceiver> make_receiver(const std::string& peer_id,
                                                   const std::shared_ptr<PeerLink>& link,
                                                   const TransferSession& session) {
        auto receiver = std::make_shared<ChunkedReceiver>(link, session, config, resume_store);
        std::weak_ptr<Impl> weak = shared_from_this();
        std::weak_ptr<ChunkedReceiver> weak_receiver = receiver;
        receiver->set_finished_callback([weak, weak_receiver, peer_id](const TransferSession& result,
                                                                       const ReceivedFile* file) {
            if (auto self = weak.lock()) {
                self->handle_download_finished(peer_id, weak_receiver.lock(), result, file);
            }
        });
        return receiver;
    }

    void handle_download_finished(const std::string& peer_id,
                                  const std::shared_ptr<ChunkedReceiver>& receiver,
                                  const TransferSession& session,
                                  const ReceivedFile* file) {
        FileReceivedCallback received;
        SessionCallback finished;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = peers.find(peer_id);
            if (it != peers.end()) {
                auto dit = it->second.downloads.find(session.id);
                if (dit != it->second.downloads.end() && dit->second == receiver) {
                    it->second.downloads.erase(dit);
                }
            }
            active_downloads.erase(session.id);
            handshakes.erase(session.id);

            if (session.state == SessionState::Completed) {
                stats.downloads_completed++;
                stats.bytes_downloaded += session.bytes_transferred;
                resumable.erase(session.id);
            } else {
                stats.downloads_failed++;
                if (receiver && session.state == SessionState::Failed && is_resumable(session.last_error)) {
                    resumable[session.id] = receiver;
                }
            }
            record_history_locked(session);
            received = on_file_received;
            finished = on_session_finished;
        }

        if (file && received) {
            received(session, *file);
        }
        if (finished) {
            finished(session);
        }
        pump_queue();
    }

    void handle_download_error(const std::string& peer_id, const DownloadError& error) {
        ErrorCode code = error_code_from_reason(error.error);
        if (auto receiver = download_for(peer_id, error.request_id)) {
            clear_handshake(error.request_id);
            receiver->on_remote_failure(code, "reported by " + peer_id + ": " + error.error);
            return;
        }
        if (auto sender = upload_for(peer_id, error.request_id)) {
            Logger::instance().warning("Peer {} aborted upload {}: {}", peer_id, error.request_id, error.error);
            sender->cancel(false);
            return;
        }
        if (!error.missing_chunks.empty()) {
            Logger::instance().warning("Peer {} could not assemble {}: {} chunks missing",
                                       peer_id, error.request_id, error.missing_chunks.size());
        } else {
            Logger::instance().debug("download-error {} for finished transfer {} from {}",
                                     error.error, error.request_id, peer_id);
        }
    }

    void clear_handshake(const std::string& transfer_id) {
        std::lock_guard<std::mutex> lock(mutex);
        handshakes.erase(transfer_id);
    }

    std::optional<std::string> enqueue_download(const std::string& peer_id, const std::string& file_id) {
        TransferSession session;
        session.id = generate_id("download");
        session.direction = TransferDirection::Download;
        session.peer_id = peer_id;
        session.file_id = file_id;
        session.state = SessionState::Queued;
        if (auto entry = catalog.find_remote(file_id)) {
            session.file_name = entry->name;
            session.file_size = entry->byte_size;
            session.mime_type = entry->mime_type;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            queue.push_back(DownloadQueueEntry{session});
            stats.queued_downloads = queue.size();
        }
        Logger::instance().info("Download {} of {} from {} queued", session.id,
                                session.file_name.empty() ? file_id : session.file_name, peer_id);
        pump_queue();
        return session.id;
    }

    // Starts queued downloads while slots are free
    void pump_queue() {
        struct Launch {
            std::shared_ptr<PeerLink> link;
            std::shared_ptr<ChunkedReceiver> receiver;
            DownloadRequest request;
        };
        std::vector<Launch> launches;
        std::vector<TransferSession> dropped;
        SessionCallback started;
        SessionCallback finished;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!running && !queue.empty()) {
                return;
            }
            while (!queue.empty() && active_downloads.size() < std::max<uint32_t>(1, config.max_concurrent_downloads)) {
                TransferSession session = std::move(queue.front().session);
                queue.pop_front();

                auto it = peers.find(session.peer_id);
                if (it == peers.end()) {
                    session.state = SessionState::Failed;
                    session.last_error = ErrorCode::ConnectionFailed;
                    session.error_detail = "peer " + session.peer_id + " not connected";
                    session.finished_at = current_time_ms();
                    stats.downloads_failed++;
                    record_history_locked(session);
                    dropped.push_back(session);
                    continue;
                }

                session.state = SessionState::Handshaking;
                session.started_at = current_time_ms();
                auto receiver = make_receiver(session.peer_id, it->second.link, session);
                it->second.downloads[session.id] = receiver;
                active_downloads.insert(session.id);
                handshakes[session.id] = Handshake{
                    session.peer_id,
                    std::chrono::steady_clock::now() + std::chrono::milliseconds(config.handshake_timeout_ms)};

                DownloadRequest request;
                request.request_id = session.id;
                request.file_id = session.file_id;
                request.file_name = session.file_name;
                request.file_size = session.file_size;
                launches.push_back(Launch{it->second.link, receiver, std::move(request)});
            }
            stats.queued_downloads = queue.size();
            started = on_session_started;
            finished = on_session_finished;
        }

        for (auto& session : dropped) {
            Logger::instance().warning("Download {} dropped: {}", session.id, session.error_detail);
            if (finished) finished(session);
        }

        for (auto& launch : launches) {
            Logger::instance().info("Download {}: requesting {} from {}", launch.request.request_id,
                                    launch.request.file_id, launch.link->peer_id());
            if (started) {
                started(launch.receiver->snapshot());
            }
            if (!launch.link->send_message(launch.request)) {
                clear_handshake(launch.request.request_id);
                launch.receiver->on_connection_lost();
            }
        }
    }

    bool resume(const std::string& transfer_id) {
        std::shared_ptr<ChunkedReceiver> receiver;
        std::shared_ptr<PeerLink> link;
        std::string peer_id;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto rit = resumable.find(transfer_id);
            if (rit == resumable.end()) {
                return false;
            }
            receiver = rit->second;
            peer_id = receiver->peer_id();
            auto pit = peers.find(peer_id);
            if (pit == peers.end()) {
                Logger::instance().warning("Cannot resume {}: peer {} not connected", transfer_id, peer_id);
                return false;
            }
            link = pit->second.link;
        }

        auto point = receiver->prepare_resume(link);
        if (!point) {
            return false;
        }
        auto session = receiver->snapshot();

        SessionCallback started;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto pit = peers.find(peer_id);
            if (pit == peers.end() || pit->second.link != link) {
                return false;
            }
            resumable.erase(transfer_id);
            pit->second.downloads[transfer_id] = receiver;
            active_downloads.insert(transfer_id);
            handshakes[transfer_id] = Handshake{
                peer_id, std::chrono::steady_clock::now() + std::chrono::milliseconds(config.handshake_timeout_ms)};
            started = on_session_started;
        }

        DownloadRequest request;
        request.request_id = transfer_id;
        request.file_id = session.file_id;
        request.file_name = session.file_name;
        request.file_size = session.file_size;
        request.resume_offset = point->offset;
        request.resume_chunk = point->chunk_index;

        Logger::instance().info("Download {}: resuming from chunk {} (offset {}) with {}",
                                transfer_id, point->chunk_index, point->offset, peer_id);
        if (started) {
            started(session);
        }
        if (!link->send_message(request)) {
            clear_handshake(transfer_id);
            receiver->on_connection_lost();
            return false;
        }
        return true;
    }

    void record_history_locked(const TransferSession& session) {
        history.push_back(session);
        while (history.size() > MAX_HISTORY) {
            history.pop_front();
        }
    }

    // Maintenance

    static elio::coro::task<void> maintenance_loop(std::shared_ptr<Impl> self) {
        while (self->running) {
            co_await elio::time::sleep_for(MAINTENANCE_INTERVAL);
            if (!self->running) {
                break;
            }
            self->tick();
        }
        co_return;
    }

    void tick() {
        auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<std::shared_ptr<PeerLink>, ControlMessage>> outgoing;
        std::vector<std::shared_ptr<PeerLink>> stale;
        std::vector<std::shared_ptr<ChunkedReceiver>> timed_out;
        bool gc_due = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            const uint64_t wall = current_time_ms();
            for (auto& [peer_id, peer] : peers) {
                if (config.heartbeat_timeout_sec > 0 &&
                    now - peer.link->last_activity() > std::chrono::seconds(config.heartbeat_timeout_sec)) {
                    Logger::instance().warning("Peer {} silent for {} s, closing", peer_id, config.heartbeat_timeout_sec);
                    stale.push_back(peer.link);
                    continue;
                }
                if (config.ping_interval_sec > 0 &&
                    now - peer.last_ping >= std::chrono::seconds(config.ping_interval_sec)) {
                    peer.last_ping = now;
                    outgoing.emplace_back(peer.link, Ping{wall});
                }
                bool busy = !peer.uploads.empty() || !peer.downloads.empty();
                if (busy && config.keepalive_interval_sec > 0 &&
                    now - peer.last_keepalive >= std::chrono::seconds(config.keepalive_interval_sec)) {
                    peer.last_keepalive = now;
                    outgoing.emplace_back(peer.link, Keepalive{wall});
                }
            }

            for (auto it = handshakes.begin(); it != handshakes.end();) {
                if (now >= it->second.deadline) {
                    auto pit = peers.find(it->second.peer_id);
                    if (pit != peers.end()) {
                        auto dit = pit->second.downloads.find(it->first);
                        if (dit != pit->second.downloads.end()) {
                            timed_out.push_back(dit->second);
                        }
                    }
                    it = handshakes.erase(it);
                } else {
                    ++it;
                }
            }

            if (resume_store && resume_config.gc_interval_sec > 0 &&
                now - last_gc >= std::chrono::seconds(resume_config.gc_interval_sec)) {
                last_gc = now;
                gc_due = true;
            }
        }

        for (auto& [link, message] : outgoing) {
            link->send_message(message);
        }
        for (auto& link : stale) {
            link->close();
        }
        for (auto& receiver : timed_out) {
            Logger::instance().warning("Download {}: no answer from {} within {} ms",
                                       receiver->transfer_id(), receiver->peer_id(), config.handshake_timeout_ms);
            receiver->on_remote_failure(ErrorCode::HandshakeTimeout, "no download-start within " +
                                        std::to_string(config.handshake_timeout_ms) + " ms");
        }
        if (gc_due) {
            collect_garbage();
        }
    }

    void collect_garbage() {
        auto removed = resume_store->collect_garbage(std::chrono::hours(resume_config.max_age_hours));
        if (removed > 0) {
            Logger::instance().info("Removed {} expired resume checkpoints", removed);
        }
    }
};

TransferCoordinator::TransferCoordinator(std::string local_peer_id,
                                         const TransferConfig& config,
                                         std::shared_ptr<ResumeStore> resume_store,
                                         const ResumeConfig& resume_config)
    : impl_(std::make_shared<Impl>(std::move(local_peer_id), config, std::move(resume_store), resume_config)) {
    std::string error;
    if (!validate_policy(config.rate, &error)) {
        throw PeerDropError(ErrorCode::InvalidArgument, "invalid rate control policy: " + error);
    }
}

TransferCoordinator::~TransferCoordinator() {
    stop();
}

const std::string& TransferCoordinator::local_peer_id() const {
    return impl_->local_peer_id;
}

TransferCatalog& TransferCoordinator::catalog() {
    return impl_->catalog;
}

const TransferConfig& TransferCoordinator::config() const {
    return impl_->config;
}

void TransferCoordinator::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    impl_->last_gc = std::chrono::steady_clock::now();
    if (impl_->resume_store) {
        impl_->collect_garbage();
    }
    (void)Impl::maintenance_loop(impl_).spawn();
    Logger::instance().info("Transfer coordinator {} started", impl_->local_peer_id);
    impl_->pump_queue();
}

void TransferCoordinator::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }

    std::vector<std::shared_ptr<ChunkedSender>> senders;
    std::vector<std::shared_ptr<ChunkedReceiver>> receivers;
    std::vector<std::shared_ptr<PeerLink>> links;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& [peer_id, peer] : impl_->peers) {
            for (auto& [id, sender] : peer.uploads) senders.push_back(sender);
            for (auto& [id, receiver] : peer.downloads) receivers.push_back(receiver);
            links.push_back(peer.link);
        }
        impl_->queue.clear();
        impl_->handshakes.clear();
        impl_->stats.queued_downloads = 0;
    }

    for (auto& sender : senders) {
        sender->cancel();
    }
    for (auto& receiver : receivers) {
        receiver->cancel();
    }
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->peers.clear();
        impl_->stats.connected_peers = 0;
    }
    for (auto& link : links) {
        link->set_closed_handler(nullptr);
        link->close();
    }
    Logger::instance().info("Transfer coordinator {} stopped", impl_->local_peer_id);
}

bool TransferCoordinator::is_running() const {
    return impl_->running;
}

bool TransferCoordinator::add_peer(const std::string& peer_id, std::shared_ptr<Channel> channel) {
    if (peer_id.empty() || !channel) {
        return false;
    }

    auto link = std::make_shared<PeerLink>(peer_id, channel);
    impl_->attach_link(peer_id, link);

    std::shared_ptr<PeerLink> replaced;
    std::vector<std::shared_ptr<ChunkedReceiver>> orphaned;
    std::vector<std::shared_ptr<ChunkedSender>> orphaned_uploads;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->peers.find(peer_id);
        if (it != impl_->peers.end()) {
            replaced = it->second.link;
            for (auto& [id, receiver] : it->second.downloads) {
                orphaned.push_back(receiver);
            }
            for (auto& [id, sender] : it->second.uploads) {
                orphaned_uploads.push_back(sender);
            }
            impl_->peers.erase(it);
        }
        Impl::PeerState state;
        state.link = link;
        state.rate = std::make_shared<RateController>(impl_->config.rate);
        state.last_ping = std::chrono::steady_clock::now();
        state.last_keepalive = state.last_ping;
        impl_->peers.emplace(peer_id, std::move(state));
        impl_->stats.connected_peers = impl_->peers.size();
    }

    if (replaced) {
        Logger::instance().info("Peer {} reconnected, replacing previous link", peer_id);
        replaced->set_closed_handler(nullptr);
        replaced->close();
        for (auto& sender : orphaned_uploads) {
            sender->on_connection_lost();
        }
        for (auto& receiver : orphaned) {
            receiver->on_connection_lost();
        }
    } else {
        Logger::instance().info("Peer {} connected", peer_id);
    }

    link->attach();
    link->send_message(FilesListRequest{});
    link->send_message(Ping{current_time_ms()});
    impl_->pump_queue();
    return true;
}

void TransferCoordinator::remove_peer(const std::string& peer_id) {
    if (auto link = impl_->link_for(peer_id)) {
        link->close();
        // Closing normally reports back through the closed handler; make sure
        // the peer is gone even when the channel was already closed.
        impl_->handle_link_closed(peer_id, link);
    }
}

std::vector<std::string> TransferCoordinator::connected_peers() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<std::string> result;
    for (const auto& [peer_id, peer] : impl_->peers) {
        result.push_back(peer_id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool TransferCoordinator::is_connected(const std::string& peer_id) const {
    auto link = impl_->link_for(peer_id);
    return link && link->is_connected();
}

std::optional<FileManifestEntry> TransferCoordinator::share_file(const std::filesystem::path& path) {
    auto entry = impl_->catalog.share_file(path, impl_->config.checksum_max_bytes);
    if (entry) {
        impl_->announce(*entry);
    }
    return entry;
}

FileManifestEntry TransferCoordinator::share_bytes(const std::string& name,
                                                   std::vector<uint8_t> data,
                                                   const std::string& mime_type) {
    bool with_checksum = data.size() <= impl_->config.checksum_max_bytes;
    auto entry = impl_->catalog.share_bytes(name, std::move(data), mime_type, with_checksum);
    impl_->announce(entry);
    return entry;
}

bool TransferCoordinator::request_catalog(const std::string& peer_id) {
    auto link = impl_->link_for(peer_id);
    return link && link->send_message(FilesListRequest{});
}

std::optional<std::string> TransferCoordinator::request_download(const std::string& file_id) {
    auto entry = impl_->catalog.find_remote(file_id);
    if (!entry) {
        Logger::instance().warning("No peer advertises file {}", file_id);
        return std::nullopt;
    }
    return request_download(entry->owner_peer_id, file_id);
}

std::optional<std::string> TransferCoordinator::request_download(const std::string& peer_id,
                                                                 const std::string& file_id) {
    if (!impl_->link_for(peer_id)) {
        Logger::instance().warning("Cannot download {}: peer {} not connected", file_id, peer_id);
        return std::nullopt;
    }
    return impl_->enqueue_download(peer_id, file_id);
}

std::vector<std::string> TransferCoordinator::request_all_downloads() {
    std::unordered_set<std::string> wanted;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& entry : impl_->queue) {
            wanted.insert(entry.session.file_id);
        }
        for (const auto& [peer_id, peer] : impl_->peers) {
            for (const auto& [id, receiver] : peer.downloads) {
                wanted.insert(receiver->snapshot().file_id);
            }
        }
        for (const auto& session : impl_->history) {
            if (session.direction == TransferDirection::Download && session.state == SessionState::Completed) {
                wanted.insert(session.file_id);
            }
        }
    }

    std::vector<std::string> ids;
    for (const auto& entry : impl_->catalog.available_downloads()) {
        if (wanted.count(entry.id)) {
            continue;
        }
        if (auto id = request_download(entry.owner_peer_id, entry.id)) {
            ids.push_back(*id);
        }
    }
    return ids;
}

bool TransferCoordinator::resume_download(const std::string& transfer_id) {
    return impl_->resume(transfer_id);
}

std::vector<std::string> TransferCoordinator::resumable_downloads() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<std::string> ids;
    for (const auto& [id, receiver] : impl_->resumable) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool TransferCoordinator::cancel_transfer(const std::string& transfer_id) {
    std::shared_ptr<ChunkedSender> sender;
    std::shared_ptr<ChunkedReceiver> receiver;
    std::optional<TransferSession> dequeued;
    TransferCoordinator::SessionCallback finished;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& [peer_id, peer] : impl_->peers) {
            if (auto it = peer.uploads.find(transfer_id); it != peer.uploads.end()) {
                sender = it->second;
            }
            if (auto it = peer.downloads.find(transfer_id); it != peer.downloads.end()) {
                receiver = it->second;
            }
        }
        if (!sender && !receiver) {
            auto it = std::find_if(impl_->queue.begin(), impl_->queue.end(),
                                   [&](const auto& entry) { return entry.session.id == transfer_id; });
            if (it != impl_->queue.end()) {
                dequeued = std::move(it->session);
                impl_->queue.erase(it);
                impl_->stats.queued_downloads = impl_->queue.size();
                dequeued->state = SessionState::Cancelled;
                dequeued->last_error = ErrorCode::Cancelled;
                dequeued->finished_at = current_time_ms();
                impl_->record_history_locked(*dequeued);
                finished = impl_->on_session_finished;
            } else if (impl_->resumable.erase(transfer_id) > 0) {
                if (impl_->resume_store) {
                    impl_->resume_store->remove(transfer_id);
                }
                return true;
            }
        }
    }

    if (sender) {
        sender->cancel();
        return true;
    }
    if (receiver) {
        impl_->clear_handshake(transfer_id);
        receiver->cancel();
        return true;
    }
    if (dequeued) {
        Logger::instance().info("Download {} removed from queue", transfer_id);
        if (finished) finished(*dequeued);
        return true;
    }
    return false;
}

bool TransferCoordinator::pause_upload(const std::string& transfer_id) {
    std::shared_ptr<ChunkedSender> sender;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& [peer_id, peer] : impl_->peers) {
            if (auto it = peer.uploads.find(transfer_id); it != peer.uploads.end()) {
                sender = it->second;
            }
        }
    }
    if (!sender) {
        return false;
    }
    sender->pause();
    return true;
}

bool TransferCoordinator::resume_upload(const std::string& transfer_id) {
    std::shared_ptr<ChunkedSender> sender;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& [peer_id, peer] : impl_->peers) {
            if (auto it = peer.uploads.find(transfer_id); it != peer.uploads.end()) {
                sender = it->second;
            }
        }
    }
    if (!sender) {
        return false;
    }
    sender->resume();
    return true;
}

std::vector<std::string> TransferCoordinator::broadcast_file(const std::string& file_id) {
    std::vector<std::string> ids;
    auto entry = impl_->catalog.find_local(file_id);
    if (!entry) {
        Logger::instance().warning("Cannot broadcast {}: not shared locally", file_id);
        return ids;
    }

    std::vector<std::pair<std::string, std::shared_ptr<PeerLink>>> targets;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto& [peer_id, peer] : impl_->peers) {
            targets.emplace_back(peer_id, peer.link);
        }
    }
    std::sort(targets.begin(), targets.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    Logger::instance().info("Broadcasting {} to {} peers", entry->name, targets.size());
    for (auto& [peer_id, link] : targets) {
        auto source = impl_->catalog.open_local(file_id);
        if (!source) {
            break;
        }
        TransferSession session;
        session.id = generate_id("upload");
        session.direction = TransferDirection::Upload;
        session.peer_id = peer_id;
        session.file_id = entry->id;
        session.file_name = entry->name;
        session.file_size = entry->byte_size;
        session.mime_type = entry->mime_type;
        session.pushed = true;
        std::string id = session.id;
        if (impl_->start_upload(peer_id, link, std::move(source), std::move(session), entry->checksum, std::nullopt)) {
            ids.push_back(id);
        } else {
            Logger::instance().warning("Broadcast of {} to {} could not start", entry->name, peer_id);
        }
    }
    return ids;
}

std::optional<TransferSession> TransferCoordinator::get_session(const std::string& transfer_id) const {
    std::shared_ptr<ChunkedSender> sender;
    std::shared_ptr<ChunkedReceiver> receiver;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& [peer_id, peer] : impl_->peers) {
            if (auto it = peer.uploads.find(transfer_id); it != peer.uploads.end()) {
                sender = it->second;
            }
            if (auto it = peer.downloads.find(transfer_id); it != peer.downloads.end()) {
                receiver = it->second;
            }
        }
        if (!sender && !receiver) {
            for (const auto& entry : impl_->queue) {
                if (entry.session.id == transfer_id) {
                    return entry.session;
                }
            }
            if (auto it = impl_->resumable.find(transfer_id); it != impl_->resumable.end()) {
                receiver = it->second;
            } else {
                for (auto it = impl_->history.rbegin(); it != impl_->history.rend(); ++it) {
                    if (it->id == transfer_id) {
                        return *it;
                    }
                }
                return std::nullopt;
            }
        }
    }
    return sender ? sender->snapshot() : receiver->snapshot();
}

std::vector<TransferSession> TransferCoordinator::active_sessions() const {
    std::vector<std::shared_ptr<ChunkedSender>> senders;
    std::vector<std::shared_ptr<ChunkedReceiver>> receivers;
    std::vector<TransferSession> result;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& [peer_id, peer] : impl_->peers) {
            for (const auto& [id, sender] : peer.uploads) senders.push_back(sender);
            for (const auto& [id, receiver] : peer.downloads) receivers.push_back(receiver);
        }
        for (const auto& entry : impl_->queue) {
            result.push_back(entry.session);
        }
    }
    for (auto& sender : senders) {
        result.push_back(sender->snapshot());
    }
    for (auto& receiver : receivers) {
        result.push_back(receiver->snapshot());
    }
    return result;
}

std::vector<TransferSession> TransferCoordinator::history() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return std::vector<TransferSession>(impl_->history.begin(), impl_->history.end());
}

std::vector<std::string> TransferCoordinator::queued_downloads() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<std::string> ids;
    for (const auto& entry : impl_->queue) {
        ids.push_back(entry.session.id);
    }
    return ids;
}

std::shared_ptr<RateController> TransferCoordinator::rate_controller(const std::string& peer_id) const {
    return impl_->rate_for(peer_id);
}

CoordinatorStats TransferCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    CoordinatorStats result = impl_->stats;
    result.active_downloads = 0;
    for (const auto& [peer_id, peer] : impl_->peers) {
        result.active_downloads += peer.downloads.size();
    }
    return result;
}

void TransferCoordinator::set_on_file_received(FileReceivedCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_file_received = std::move(callback);
}

void TransferCoordinator::set_on_session_started(SessionCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_session_started = std::move(callback);
}

void TransferCoordinator::set_on_session_finished(SessionCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_session_finished = std::move(callback);
}

void TransferCoordinator::set_on_catalog_updated(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_catalog_updated = std::move(callback);
}

void TransferCoordinator::set_on_peer_disconnected(PeerCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_peer_disconnected = std::move(callback);
}

} // namespace peerdrop
