#include "peerdrop/transfer/chunked_sender.h"
#include "peerdrop/base/logger.h"
#include "peerdrop/base/utils.h"
#include <algorithm>

namespace peerdrop {

namespace {

constexpr auto PAUSE_POLL_INTERVAL = std::chrono::milliseconds(20);
constexpr auto ACK_POLL_INTERVAL = std::chrono::milliseconds(5);
constexpr auto SAMPLE_INTERVAL = std::chrono::milliseconds(1000);

} // anonymous namespace

std::string to_string(SenderState state) {
    switch (state) {
        case SenderState::Idle: return "idle";
        case SenderState::MetadataSent: return "metadata-sent";
        case SenderState::Streaming: return "streaming";
        case SenderState::Paused: return "paused";
        case SenderState::Completed: return "completed";
        case SenderState::Failed: return "failed";
    }
    return "unknown";
}

ChunkedSender::ChunkedSender(std::shared_ptr<PeerLink> link,
                             std::shared_ptr<FileSource> source,
                             std::shared_ptr<RateController> rate,
                             TransferSession session,
                             const TransferConfig& config,
                             std::shared_ptr<ResumeStore> resume_store)
    : link_(std::move(link)),
      source_(std::move(source)),
      rate_(std::move(rate)),
      config_(config),
      resume_store_(std::move(resume_store)),
      transfer_id_(session.id),
      session_(std::move(session)) {
    session_.direction = TransferDirection::Upload;
    session_.file_size = source_->size();
}

ChunkedSender::~ChunkedSender() {
    source_->release();
}

void ChunkedSender::set_finished_callback(FinishedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_callback_ = std::move(callback);
}

void ChunkedSender::set_checksum(std::string checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    checksum_ = std::move(checksum);
}

bool ChunkedSender::start_upload(std::optional<ResumePoint> resume_from) {
    ControlMessage announce;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SenderState::Idle) {
            Logger::instance().warning("Upload " + transfer_id_ + " already started");
            return false;
        }

        uint64_t size = source_->size();
        uint32_t chunk_size = rate_->chunk_size();

        if (resume_from && resume_from->offset <= size) {
            offset_ = resume_from->offset;
            session_.chunk_index = resume_from->chunk_index;
            session_.resume_offset = resume_from->offset;
        } else {
            offset_ = 0;
            session_.chunk_index = 0;
            session_.resume_offset = 0;
        }

        session_.bytes_transferred = offset_;
        session_.chunk_size = chunk_size;
        session_.total_chunks = session_.chunk_index +
            (offset_ < size ? estimate_total_chunks(size - offset_, chunk_size)
                            : (size == 0 && session_.chunk_index == 0 ? 1 : 0));
        session_.started_at = current_time_ms();
        session_.state = SessionState::Handshaking;
        last_acked_ = static_cast<int64_t>(session_.chunk_index) - 1;

        if (resume_from) {
            DownloadResume msg;
            msg.request_id = transfer_id_;
            msg.file_id = session_.file_id;
            msg.resume_offset = offset_;
            msg.resume_chunk = session_.chunk_index;
            msg.file_size = size;
            msg.total_chunks = session_.total_chunks;
            msg.chunk_size = chunk_size;
            announce = msg;
        } else {
            DownloadStart msg;
            msg.request_id = transfer_id_;
            msg.file_id = session_.file_id;
            msg.file_name = session_.file_name;
            msg.file_size = size;
            msg.mime_type = session_.mime_type;
            msg.total_chunks = session_.total_chunks;
            msg.chunk_size = chunk_size;
            msg.pushed = session_.pushed;
            announce = msg;
        }
        state_ = SenderState::MetadataSent;
    }

    if (!link_->send_message(announce)) {
        finish(SenderState::Failed, ErrorCode::ConnectionLost, "announcement could not be sent");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SenderState::MetadataSent) {
            return false;
        }
        state_ = paused_ ? SenderState::Paused : SenderState::Streaming;
        session_.state = paused_ ? SessionState::Paused : SessionState::Transferring;
        pass_started_ = std::chrono::steady_clock::now();
        sample_started_ = pass_started_;
        Logger::instance().info("Upload {} of {} to {} started at chunk {} (offset {})",
                                transfer_id_, session_.file_name, link_->peer_id(),
                                session_.chunk_index, offset_);
    }
    return true;
}

bool ChunkedSender::interrupted() const {
    return cancelled_ || !link_->is_connected();
}

elio::coro::task<bool> ChunkedSender::wait_for_buffer() {
    if (link_->buffered_amount() < config_.buffer_high_water) {
        co_return true;
    }

    uint32_t interval = std::max<uint32_t>(1, config_.buffer_poll_interval_ms);
    uint32_t waited = 0;
    while (link_->buffered_amount() >= config_.buffer_high_water) {
        if (interrupted()) {
            co_return false;
        }
        if (waited >= config_.buffer_wait_timeout_ms) {
            Logger::instance().warning("Upload {}: send buffer still at {} bytes after {} ms, continuing",
                                       transfer_id_, link_->buffered_amount(), waited);
            rate_->on_local_backpressure();
            co_return false;
        }
        co_await elio::time::sleep_for(std::chrono::milliseconds(interval));
        waited += interval;
        interval = std::min(interval * 2, std::max<uint32_t>(1, config_.buffer_poll_max_interval_ms));
    }
    co_return true;
}

elio::coro::task<void> ChunkedSender::wait_for_ack(uint32_t chunk_index) {
    uint32_t waited = 0;
    const auto step = static_cast<uint32_t>(ACK_POLL_INTERVAL.count());
    while (last_acked_.load() < static_cast<int64_t>(chunk_index)) {
        if (interrupted()) {
            co_return;
        }
        if (waited >= config_.ack_timeout_ms) {
            Logger::instance().warning("Upload {}: no ack for chunk {} after {} ms, continuing",
                                       transfer_id_, chunk_index, waited);
            co_return;
        }
        co_await elio::time::sleep_for(ACK_POLL_INTERVAL);
        waited += step;
    }
}

uint64_t retry_backoff_ms(const TransferConfig& config, uint32_t failures) {
    uint64_t backoff = config.retry_base_delay_ms;
    if (backoff == 0) {
        return 0;
    }
    for (uint32_t i = 1; i < failures && backoff < config.retry_max_delay_ms; ++i) {
        backoff *= 2;
    }
    return std::min<uint64_t>(backoff, config.retry_max_delay_ms);
}

elio::coro::task<SendStep> ChunkedSender::retry_after_failure(ErrorCode exhausted_error, const std::string& what) {
    consecutive_failures_++;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.retry_count++;
    }

    if (consecutive_failures_ > config_.max_retries) {
        Logger::instance().error("Upload {}: {} failed {} times, giving up",
                                 transfer_id_, what, consecutive_failures_);
        DownloadError error;
        error.request_id = transfer_id_;
        error.error = to_reason(ErrorCode::MaxRetriesExceeded);
        link_->send_message(error);
        finish(SenderState::Failed, ErrorCode::MaxRetriesExceeded, what + ": " + to_string(exhausted_error));
        co_return SendStep::Failed;
    }

    const uint64_t backoff = retry_backoff_ms(config_, consecutive_failures_);
    Logger::instance().warning("Upload {}: {} failed, retry {}/{} in {} ms",
                               transfer_id_, what, consecutive_failures_, config_.max_retries, backoff);
    co_await elio::time::sleep_for(std::chrono::milliseconds(backoff));
    co_return SendStep::Retrying;
}

elio::coro::task<SendStep> ChunkedSender::send_next_chunk() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SenderState::Completed) co_return SendStep::Completed;
        if (state_ == SenderState::Failed) co_return SendStep::Failed;
    }

    if (cancelled_) {
        finish(SenderState::Failed, ErrorCode::Cancelled);
        co_return SendStep::Failed;
    }
    if (!link_->is_connected()) {
        checkpoint();
        finish(SenderState::Failed, ErrorCode::ConnectionLost, "channel closed mid-stream");
        co_return SendStep::Failed;
    }
    if (paused_) {
        co_return SendStep::Paused;
    }

    // Resumed at the end of the file; only the summary is left to send
    bool nothing_left;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        nothing_left = offset_ >= source_->size() && session_.chunk_index > 0;
    }
    if (nothing_left) {
        send_completion();
        co_return SendStep::Completed;
    }

    // (a) current chunk size
    const uint32_t chunk_size = rate_->chunk_size();

    // (b) backpressure; a timeout is only a warning
    co_await wait_for_buffer();
    if (cancelled_ || !link_->is_connected()) {
        co_return co_await send_next_chunk();
    }

    // (c) next slice
    uint64_t offset;
    uint32_t chunk_index;
    const uint64_t size = source_->size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        offset = offset_;
        chunk_index = session_.chunk_index;
    }
    const uint32_t length = static_cast<uint32_t>(std::min<uint64_t>(chunk_size, size - offset));

    auto data = source_->read(offset, length);
    if (!data || data->size() != length) {
        co_return co_await retry_after_failure(ErrorCode::ReadError, "read at offset " + std::to_string(offset));
    }

    // (d) header then payload
    FileChunkHeader header;
    header.transfer_id = transfer_id_;
    header.chunk_index = chunk_index;
    header.chunk_size = length;
    header.offset = offset;
    header.is_last = offset + length >= size;
    header.timestamp = current_time_ms();

    if (!link_->send_chunk(header, std::move(*data))) {
        if (!link_->is_connected()) {
            co_return co_await send_next_chunk();
        }
        co_return co_await retry_after_failure(ErrorCode::SendFailed, "send of chunk " + std::to_string(chunk_index));
    }
    consecutive_failures_ = 0;

    // (f) advance
    bool due_checkpoint = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        offset_ += length;
        session_.chunk_index = chunk_index + 1;
        session_.bytes_transferred = offset_;
        session_.chunk_size = chunk_size;
        uint64_t remaining = size - offset_;
        session_.total_chunks = session_.chunk_index +
            (remaining > 0 ? estimate_total_chunks(remaining, chunk_size) : 0);
        pass_bytes_ += length;
        pass_chunks_++;
        sample_bytes_ += length;
        due_checkpoint = config_.checkpoint_interval_chunks > 0 &&
                         session_.chunk_index % config_.checkpoint_interval_chunks == 0;
    }

    auto now = std::chrono::steady_clock::now();
    auto sample_elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - sample_started_);
    if (sample_elapsed >= SAMPLE_INTERVAL) {
        rate_->on_upload_sample(sample_bytes_, sample_elapsed);
        sample_bytes_ = 0;
        sample_started_ = now;
    }

    Logger::instance().debug("Upload {}: chunk {} ({} bytes at {}) sent", transfer_id_, chunk_index, length, offset);

    if (header.is_last) {
        send_completion();
        co_return SendStep::Completed;
    }

    if (due_checkpoint) {
        checkpoint();
    }

    if (config_.ack_interval_chunks > 0 && (chunk_index + 1) % config_.ack_interval_chunks == 0) {
        co_await wait_for_ack(chunk_index);
    }

    // (e) pacing
    uint32_t delay = rate_->delay_ms();
    if (delay > 0) {
        co_await elio::time::sleep_for(std::chrono::milliseconds(delay));
    }
    co_return SendStep::Sent;
}

elio::coro::task<void> ChunkedSender::run() {
    auto self = shared_from_this();
    running_ = true;

    while (true) {
        SendStep step = co_await send_next_chunk();
        if (step == SendStep::Completed || step == SendStep::Failed) {
            break;
        }
        if (step == SendStep::Paused) {
            co_await elio::time::sleep_for(PAUSE_POLL_INTERVAL);
        }
    }

    running_ = false;
    co_return;
}

void ChunkedSender::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SenderState::Streaming && state_ != SenderState::MetadataSent) {
        return;
    }
    paused_ = true;
    if (state_ == SenderState::Streaming) {
        state_ = SenderState::Paused;
        session_.state = SessionState::Paused;
    }
    Logger::instance().info("Upload {} paused at chunk {}", transfer_id_, session_.chunk_index);
}

void ChunkedSender::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = false;
    if (state_ == SenderState::Paused) {
        state_ = SenderState::Streaming;
        session_.state = SessionState::Transferring;
        Logger::instance().info("Upload {} resumed at chunk {}", transfer_id_, session_.chunk_index);
    }
}

void ChunkedSender::cancel(bool notify_peer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SenderState::Completed || state_ == SenderState::Failed) {
            return;
        }
    }
    if (cancelled_.exchange(true)) {
        return;
    }

    if (notify_peer && link_->is_connected()) {
        link_->send_message(DownloadCancel{transfer_id_});
    }
    Logger::instance().info("Upload {} cancelled", transfer_id_);

    // Without a running loop nobody else reaches the next chunk boundary
    if (!running_) {
        finish(SenderState::Failed, ErrorCode::Cancelled);
    }
}

void ChunkedSender::on_connection_lost() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SenderState::Completed || state_ == SenderState::Failed) {
            return;
        }
    }
    checkpoint();
    finish(SenderState::Failed, ErrorCode::ConnectionLost, "link closed");
}

void ChunkedSender::on_chunk_ack(uint32_t chunk_index) {
    int64_t current = last_acked_.load();
    while (static_cast<int64_t>(chunk_index) > current &&
           !last_acked_.compare_exchange_weak(current, static_cast<int64_t>(chunk_index))) {
    }
}

void ChunkedSender::checkpoint() {
    if (!resume_store_) {
        return;
    }
    ResumeCheckpoint cp;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A finished sender may share its id with a newer session
        if (state_ == SenderState::Completed || state_ == SenderState::Failed) {
            return;
        }
        cp.transfer_id = transfer_id_;
        cp.file_id = session_.file_id;
        cp.file_name = session_.file_name;
        cp.file_size = session_.file_size;
        cp.byte_offset = offset_;
        cp.chunk_index = session_.chunk_index;
    }
    cp.saved_at = current_time_ms();
    if (!resume_store_->put(cp)) {
        Logger::instance().warning("Upload {}: checkpoint at chunk {} not saved", transfer_id_, cp.chunk_index);
        return;
    }
    Logger::instance().debug("Upload {}: checkpoint at chunk {} (offset {})", transfer_id_, cp.chunk_index, cp.byte_offset);
}

void ChunkedSender::send_completion() {
    DownloadComplete msg;
    msg.request_id = transfer_id_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - pass_started_).count();
        msg.final_stats.total_bytes = session_.bytes_transferred;
        msg.final_stats.total_time_ms = static_cast<uint64_t>(elapsed);
        msg.final_stats.avg_speed = elapsed > 0 ? static_cast<double>(pass_bytes_) * 1000.0 / static_cast<double>(elapsed)
                                                : static_cast<double>(pass_bytes_);
        msg.final_stats.avg_chunk_size = pass_chunks_ > 0 ? static_cast<uint32_t>(pass_bytes_ / pass_chunks_) : 0;
        msg.final_stats.total_chunks = session_.chunk_index;
        msg.final_stats.checksum = checksum_;
        session_.total_chunks = session_.chunk_index;
    }

    if (!link_->send_message(msg)) {
        // All data went out; only the summary is missing
        Logger::instance().warning("Upload {}: completion message not delivered", transfer_id_);
    }
    if (resume_store_) {
        resume_store_->remove(transfer_id_);
    }
    Logger::instance().info("Upload {} completed: {} bytes in {} ms ({:.0f} B/s, avg chunk {} bytes)",
                            transfer_id_, msg.final_stats.total_bytes, msg.final_stats.total_time_ms,
                            msg.final_stats.avg_speed, msg.final_stats.avg_chunk_size);
    finish(SenderState::Completed, ErrorCode::Success);
}

void ChunkedSender::finish(SenderState state, ErrorCode error, const std::string& detail) {
    TransferSession result;
    FinishedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SenderState::Completed || state_ == SenderState::Failed) {
            return;
        }
        state_ = state;
        session_.last_error = error;
        session_.error_detail = detail;
        session_.finished_at = current_time_ms();
        if (state == SenderState::Completed) {
            session_.state = SessionState::Completed;
        } else if (error == ErrorCode::Cancelled) {
            session_.state = SessionState::Cancelled;
        } else {
            session_.state = SessionState::Failed;
        }
        result = session_;
        callback = finished_callback_;
    }

    source_->release();

    if (state == SenderState::Failed) {
        Logger::instance().warning("Upload {} to {} failed: {}{}", transfer_id_, link_->peer_id(),
                                   to_reason(error), detail.empty() ? "" : " (" + detail + ")");
    }
    if (callback) {
        callback(result);
    }
}

SenderState ChunkedSender::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TransferSession ChunkedSender::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

} // namespace peerdrop
