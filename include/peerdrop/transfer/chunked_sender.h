#ifndef PEERDROP_TRANSFER_CHUNKED_SENDER_H
#define PEERDROP_TRANSFER_CHUNKED_SENDER_H

#include "peerdrop/base/config.h"
#include "peerdrop/net/peer_link.h"
#include "peerdrop/storage/resume_store.h"
#include "peerdrop/transfer/file_source.h"
#include "peerdrop/transfer/rate_controller.h"
#include "peerdrop/transfer/transfer_session.h"
#include <elio/elio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace peerdrop {

enum class SenderState {
    Idle,
    MetadataSent,
    Streaming,
    Paused,
    Completed,
    Failed
};

std::string to_string(SenderState state);

// Outcome of one send_next_chunk() call
enum class SendStep {
    Sent,
    Retrying,
    Paused,
    Completed,
    Failed
};

// Delay before retry number `failures`: base doubled per failure, capped at retry_max_delay_ms
uint64_t retry_backoff_ms(const TransferConfig& config, uint32_t failures);

// Streams one file to one peer. The owning coordinator drives run() as an
// independent task; pause/resume/cancel may be called from anywhere.
class ChunkedSender : public std::enable_shared_from_this<ChunkedSender> {
public:
    using FinishedCallback = std::function<void(const TransferSession&)>;

    ChunkedSender(std::shared_ptr<PeerLink> link,
                  std::shared_ptr<FileSource> source,
                  std::shared_ptr<RateController> rate,
                  TransferSession session,
                  const TransferConfig& config,
                  std::shared_ptr<ResumeStore> resume_store = nullptr);
    ~ChunkedSender();

    void set_finished_callback(FinishedCallback callback);
    void set_checksum(std::string checksum);

    // Announces the file (download-start, or download-resume when resuming)
    bool start_upload(std::optional<ResumePoint> resume_from = std::nullopt);

    elio::coro::task<SendStep> send_next_chunk();

    // Loops send_next_chunk() until the session ends
    elio::coro::task<void> run();

    void pause();
    void resume();
    // notify_peer=false when the cancel came from the peer itself
    void cancel(bool notify_peer = true);
    // Checkpoints and fails with connection-lost without waiting for the next chunk boundary
    void on_connection_lost();
    void on_chunk_ack(uint32_t chunk_index);

    SenderState state() const;
    TransferSession snapshot() const;
    const std::string& transfer_id() const { return transfer_id_; }
    const std::string& peer_id() const { return link_->peer_id(); }

private:
    elio::coro::task<bool> wait_for_buffer();
    elio::coro::task<void> wait_for_ack(uint32_t chunk_index);
    elio::coro::task<SendStep> retry_after_failure(ErrorCode exhausted_error, const std::string& what);
    void checkpoint();
    void send_completion();
    void finish(SenderState state, ErrorCode error, const std::string& detail = "");
    bool interrupted() const;

    std::shared_ptr<PeerLink> link_;
    std::shared_ptr<FileSource> source_;
    std::shared_ptr<RateController> rate_;
    TransferConfig config_;
    std::shared_ptr<ResumeStore> resume_store_;
    const std::string transfer_id_;

    mutable std::mutex mutex_;
    TransferSession session_;
    SenderState state_ = SenderState::Idle;
    uint64_t offset_ = 0;
    std::string checksum_;
    FinishedCallback finished_callback_;

    std::atomic<bool> paused_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> running_{false};
    std::atomic<int64_t> last_acked_{-1};

    uint32_t consecutive_failures_ = 0;
    uint64_t pass_bytes_ = 0;
    uint32_t pass_chunks_ = 0;
    std::chrono::steady_clock::time_point pass_started_;
    std::chrono::steady_clock::time_point sample_started_;
    uint64_t sample_bytes_ = 0;
};

} // namespace peerdrop

#endif // PEERDROP_TRANSFER_CHUNKED_SENDER_H
