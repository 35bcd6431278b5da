#ifndef PEERDROP_TRANSFER_TRANSFER_COORDINATOR_H
#define PEERDROP_TRANSFER_TRANSFER_COORDINATOR_H

#include "peerdrop/base/config.h"
#include "peerdrop/catalog/transfer_catalog.h"
#include "peerdrop/net/channel.h"
#include "peerdrop/storage/resume_store.h"
#include "peerdrop/transfer/chunked_receiver.h"
#include "peerdrop/transfer/rate_controller.h"
#include "peerdrop/transfer/transfer_session.h"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop {

struct CoordinatorStats {
    uint64_t uploads_completed = 0;
    uint64_t uploads_failed = 0;
    uint64_t downloads_completed = 0;
    uint64_t downloads_failed = 0;
    uint64_t bytes_uploaded = 0;
    uint64_t bytes_downloaded = 0;
    size_t connected_peers = 0;
    size_t active_uploads = 0;
    size_t active_downloads = 0;
    size_t queued_downloads = 0;
};

// Owns every peer link and every session of the local node. Sessions run as
// independent tasks; the coordinator turns their outcomes into queue,
// catalog and history effects.
class TransferCoordinator {
public:
    using FileReceivedCallback = std::function<void(const TransferSession&, const ReceivedFile&)>;
    using SessionCallback = std::function<void(const TransferSession&)>;
    using PeerCallback = std::function<void(const std::string& peer_id)>;

    TransferCoordinator(std::string local_peer_id,
                        const TransferConfig& config,
                        std::shared_ptr<ResumeStore> resume_store = nullptr,
                        const ResumeConfig& resume_config = ResumeConfig{});
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    const std::string& local_peer_id() const;
    TransferCatalog& catalog();
    const TransferConfig& config() const;

    // Starts the maintenance task (liveness, handshake timeouts, checkpoint GC).
    // Must be called from inside the runtime.
    void start();
    // Cancels every session and closes every link
    void stop();
    bool is_running() const;

    // Takes ownership of a connected channel. A second channel for the same
    // peer replaces the first, whose sessions fail with connection-lost.
    bool add_peer(const std::string& peer_id, std::shared_ptr<Channel> channel);
    void remove_peer(const std::string& peer_id);
    std::vector<std::string> connected_peers() const;
    bool is_connected(const std::string& peer_id) const;

    // Share and announce to every connected peer
    std::optional<FileManifestEntry> share_file(const std::filesystem::path& path);
    FileManifestEntry share_bytes(const std::string& name,
                                  std::vector<uint8_t> data,
                                  const std::string& mime_type = "");

    bool request_catalog(const std::string& peer_id);

    // Queue a download; returns the transfer id, or nullopt when the owner is unknown
    std::optional<std::string> request_download(const std::string& file_id);
    std::optional<std::string> request_download(const std::string& peer_id, const std::string& file_id);
    // Queue every advertised file not yet downloaded or queued
    std::vector<std::string> request_all_downloads();

    // Continue a download that failed with connection-lost
    bool resume_download(const std::string& transfer_id);
    std::vector<std::string> resumable_downloads() const;

    bool cancel_transfer(const std::string& transfer_id);
    bool pause_upload(const std::string& transfer_id);
    bool resume_upload(const std::string& transfer_id);

    // Push a local file to every connected peer; returns one upload id per peer
    std::vector<std::string> broadcast_file(const std::string& file_id);

    std::optional<TransferSession> get_session(const std::string& transfer_id) const;
    std::vector<TransferSession> active_sessions() const;
    std::vector<TransferSession> history() const;
    std::vector<std::string> queued_downloads() const;
    std::shared_ptr<RateController> rate_controller(const std::string& peer_id) const;
    CoordinatorStats stats() const;

    void set_on_file_received(FileReceivedCallback callback);
    void set_on_session_started(SessionCallback callback);
    void set_on_session_finished(SessionCallback callback);
    void set_on_catalog_updated(PeerCallback callback);
    void set_on_peer_disconnected(PeerCallback callback);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace peerdrop

#endif // PEERDROP_TRANSFER_TRANSFER_COORDINATOR_H
