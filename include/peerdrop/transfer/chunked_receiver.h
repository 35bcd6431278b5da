#ifndef PEERDROP_TRANSFER_CHUNKED_RECEIVER_H
#define PEERDROP_TRANSFER_CHUNKED_RECEIVER_H

#include "peerdrop/base/config.h"
#include "peerdrop/net/peer_link.h"
#include "peerdrop/storage/resume_store.h"
#include "peerdrop/transfer/transfer_session.h"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace peerdrop {

enum class ReceiverState {
    Idle,
    HeaderExpected,
    PayloadExpected,
    Assembling,
    Completed,
    Failed
};

std::string to_string(ReceiverState state);

struct ReceivedFile {
    std::string transfer_id;
    std::string file_id;
    std::string name;
    std::string mime_type;
    std::vector<uint8_t> data;
};

// Accumulates one incoming transfer. All on_* calls for one receiver come
// from the link's delivery task in channel order.
class ChunkedReceiver {
public:
    // file is null unless the session completed
    using FinishedCallback = std::function<void(const TransferSession&, const ReceivedFile*)>;

    ChunkedReceiver(std::shared_ptr<PeerLink> link,
                    TransferSession session,
                    const TransferConfig& config,
                    std::shared_ptr<ResumeStore> resume_store = nullptr);

    void set_finished_callback(FinishedCallback callback);

    bool on_start(const DownloadStart& start);
    bool on_resume(const DownloadResume& resume);
    bool on_header(const FileChunkHeader& header);
    bool on_payload(const FileChunkHeader& header, std::vector<uint8_t> data);
    void on_complete(const DownloadComplete& complete);

    void on_connection_lost();
    void on_remote_failure(ErrorCode error, const std::string& detail = "");
    void cancel(bool notify_peer = true);

    // Re-arm a connection-lost receiver on a new link; returns where to continue
    std::optional<ResumePoint> prepare_resume(std::shared_ptr<PeerLink> link);

    void set_rtt(double rtt_ms);

    std::vector<uint32_t> missing_chunks() const;
    ResumePoint resume_point() const;
    uint32_t received_chunks() const;
    std::optional<FinalStats> final_stats() const;
    double buffer_level_chunks() const;

    ReceiverState state() const;
    TransferSession snapshot() const;
    const std::string& transfer_id() const { return transfer_id_; }
    std::string peer_id() const;

private:
    struct Outcome {
        std::vector<ControlMessage> outbox;
        bool finished = false;
        TransferSession session;
        std::optional<ReceivedFile> file;
    };

    void deliver(std::shared_ptr<PeerLink> link, Outcome outcome);
    void fail_locked(Outcome& out, ErrorCode error, const std::string& detail, bool keep_chunks);
    void assemble_locked(Outcome& out, uint32_t total);
    void feedback_locked(Outcome& out, std::chrono::steady_clock::time_point now);
    void checkpoint_locked();
    std::vector<uint32_t> missing_locked(uint32_t total, size_t limit) const;
    uint64_t missing_count_locked(uint32_t total) const;
    ResumePoint resume_point_locked() const;
    uint32_t final_total_locked() const;

    std::shared_ptr<PeerLink> link_;
    TransferConfig config_;
    std::shared_ptr<ResumeStore> resume_store_;
    const std::string transfer_id_;

    mutable std::mutex mutex_;
    TransferSession session_;
    ReceiverState state_ = ReceiverState::Idle;
    FinishedCallback finished_callback_;

    // Keyed by chunk index; only chunks actually received take memory
    std::map<uint32_t, std::vector<uint8_t>> chunks_;
    uint32_t received_chunks_ = 0;
    uint64_t bytes_received_ = 0;
    std::optional<FileChunkHeader> expected_;
    std::optional<uint32_t> last_index_;
    std::optional<FinalStats> final_stats_;

    // Feedback state
    std::chrono::steady_clock::time_point last_feedback_;
    uint32_t chunks_since_feedback_ = 0;
    uint64_t bytes_since_feedback_ = 0;
    double download_rate_ = 0.0;
    double rtt_ms_ = 0.0;
    double buffer_level_chunks_ = 0.0;
    std::optional<int64_t> min_one_way_ms_;
};

} // namespace peerdrop

#endif // PEERDROP_TRANSFER_CHUNKED_RECEIVER_H
