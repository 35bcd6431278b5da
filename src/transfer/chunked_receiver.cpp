#include "peerdrop/transfer/chunked_receiver.h"
#include "peerdrop/base/logger.h"
#include "peerdrop/base/utils.h"
#include "peerdrop/transfer/file_source.h"
#include <algorithm>
#include <iterator>
#include <limits>

namespace peerdrop {

namespace {

// Missing indices listed in a failure report; the count is always exact
constexpr size_t MAX_REPORTED_MISSING = 1024;

// Every chunk but the one of an empty file carries at least one byte
bool plausible_total(uint64_t total_chunks, uint64_t file_size) {
    return total_chunks <= std::max<uint64_t>(file_size, 1);
}

bool plausible_header(const FileChunkHeader& header, uint64_t file_size, std::string* why) {
    if (header.chunk_size > file_size || header.offset > file_size - header.chunk_size) {
        *why = "bytes [" + std::to_string(header.offset) + ", +" + std::to_string(header.chunk_size) +
               ") outside a " + std::to_string(file_size) + "-byte file";
        return false;
    }
    if (header.chunk_size == 0 && file_size > 0) {
        *why = "empty chunk";
        return false;
    }
    if (header.chunk_index == std::numeric_limits<uint32_t>::max() || header.chunk_index > header.offset) {
        *why = "index " + std::to_string(header.chunk_index) + " cannot start at offset " +
               std::to_string(header.offset);
        return false;
    }
    return true;
}

} // anonymous namespace

std::string to_string(ReceiverState state) {
    switch (state) {
        case ReceiverState::Idle: return "idle";
        case ReceiverState::HeaderExpected: return "header-expected";
        case ReceiverState::PayloadExpected: return "payload-expected";
        case ReceiverState::Assembling: return "assembling";
        case ReceiverState::Completed: return "completed";
        case ReceiverState::Failed: return "failed";
    }
    return "unknown";
}

ChunkedReceiver::ChunkedReceiver(std::shared_ptr<PeerLink> link,
                                 TransferSession session,
                                 const TransferConfig& config,
                                 std::shared_ptr<ResumeStore> resume_store)
    : link_(std::move(link)),
      config_(config),
      resume_store_(std::move(resume_store)),
      transfer_id_(session.id),
      session_(std::move(session)) {
    session_.direction = TransferDirection::Download;
}

void ChunkedReceiver::set_finished_callback(FinishedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_callback_ = std::move(callback);
}

void ChunkedReceiver::deliver(std::shared_ptr<PeerLink> link, Outcome outcome) {
    for (const auto& message : outcome.outbox) {
        if (link && !link->send_message(message)) {
            Logger::instance().debug("Download {}: {} not sent, link down", transfer_id_, message_type(message));
        }
    }
    if (!outcome.finished) {
        return;
    }
    FinishedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = finished_callback_;
    }
    if (callback) {
        callback(outcome.session, outcome.file ? &*outcome.file : nullptr);
    }
}

bool ChunkedReceiver::on_start(const DownloadStart& start) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ReceiverState::Idle) {
        Logger::instance().warning("Download {}: unexpected download-start in state {}", transfer_id_, to_string(state_));
        return false;
    }
    if (!plausible_total(start.total_chunks, start.file_size)) {
        Logger::instance().warning("Download {}: download-start announces {} chunks for {} bytes, ignored",
                                   transfer_id_, start.total_chunks, start.file_size);
        return false;
    }

    session_.file_id = start.file_id.empty() ? session_.file_id : start.file_id;
    session_.file_name = start.file_name;
    session_.file_size = start.file_size;
    session_.mime_type = start.mime_type;
    session_.total_chunks = start.total_chunks;
    session_.chunk_size = start.chunk_size;
    session_.chunk_index = 0;
    session_.bytes_transferred = 0;
    session_.resume_offset = 0;
    session_.pushed = start.pushed;
    session_.started_at = current_time_ms();
    session_.state = SessionState::Transferring;

    chunks_.clear();
    received_chunks_ = 0;
    bytes_received_ = 0;
    expected_.reset();
    last_index_.reset();
    final_stats_.reset();
    last_feedback_ = std::chrono::steady_clock::now();
    state_ = ReceiverState::HeaderExpected;

    Logger::instance().info("Download {}: receiving {} ({} bytes, ~{} chunks) from {}",
                            transfer_id_, start.file_name, start.file_size, start.total_chunks, link_->peer_id());
    return true;
}

std::optional<ResumePoint> ChunkedReceiver::prepare_resume(std::shared_ptr<PeerLink> link) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool resumable = state_ == ReceiverState::Failed && is_resumable(session_.last_error);
    if (!resumable && state_ != ReceiverState::Idle) {
        return std::nullopt;
    }
    link_ = std::move(link);
    state_ = ReceiverState::Idle;
    expected_.reset();
    session_.state = SessionState::Handshaking;
    session_.last_error = ErrorCode::Success;
    session_.error_detail.clear();
    session_.finished_at = 0;
    return resume_point_locked();
}

bool ChunkedReceiver::on_resume(const DownloadResume& resume) {
    Outcome out;
    std::shared_ptr<PeerLink> link;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        link = link_;
        if (state_ != ReceiverState::Idle && state_ != ReceiverState::HeaderExpected) {
            Logger::instance().warning("Download {}: unexpected download-resume in state {}", transfer_id_, to_string(state_));
            return false;
        }

        const uint64_t file_size = resume.file_size > 0 ? resume.file_size : session_.file_size;
        if (!plausible_total(resume.total_chunks, file_size)) {
            Logger::instance().warning("Download {}: download-resume announces {} chunks for {} bytes, ignored",
                                       transfer_id_, resume.total_chunks, file_size);
            return false;
        }

        uint64_t prefix = 0;
        bool consistent = true;
        for (uint32_t i = 0; consistent && i < resume.resume_chunk; ++i) {
            auto it = chunks_.find(i);
            if (it == chunks_.end()) {
                consistent = false;
            } else {
                prefix += it->second.size();
            }
        }

        if (!consistent || prefix != resume.resume_offset) {
            fail_locked(out, ErrorCode::ProtocolError,
                        "resume point chunk " + std::to_string(resume.resume_chunk) +
                        " offset " + std::to_string(resume.resume_offset) + " does not match received data",
                        false);
            DownloadError error;
            error.request_id = transfer_id_;
            error.error = to_reason(ErrorCode::ProtocolError);
            out.outbox.push_back(error);
        } else {
            // Anything past the resume point is sent again
            for (auto it = chunks_.lower_bound(resume.resume_chunk); it != chunks_.end();) {
                received_chunks_--;
                bytes_received_ -= it->second.size();
                it = chunks_.erase(it);
            }
            session_.file_size = file_size;
            session_.total_chunks = std::max(resume.total_chunks, resume.resume_chunk);
            session_.chunk_size = resume.chunk_size;
            session_.chunk_index = resume.resume_chunk;
            session_.bytes_transferred = bytes_received_;
            session_.resume_offset = resume.resume_offset;
            session_.state = SessionState::Transferring;
            last_index_.reset();
            final_stats_.reset();
            min_one_way_ms_.reset();
            last_feedback_ = std::chrono::steady_clock::now();
            chunks_since_feedback_ = 0;
            bytes_since_feedback_ = 0;
            state_ = ReceiverState::HeaderExpected;
            ok = true;
            Logger::instance().info("Download {}: resuming at chunk {} (offset {})",
                                    transfer_id_, resume.resume_chunk, resume.resume_offset);
        }
    }
    deliver(link, std::move(out));
    return ok;
}

bool ChunkedReceiver::on_header(const FileChunkHeader& header) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (header.transfer_id != transfer_id_) {
        return false;
    }
    if (state_ == ReceiverState::PayloadExpected) {
        Logger::instance().warning("Download {}: header for chunk {} while chunk {} payload pending",
                                   transfer_id_, header.chunk_index, expected_ ? expected_->chunk_index : 0);
    } else if (state_ != ReceiverState::HeaderExpected) {
        Logger::instance().warning("Download {}: unexpected chunk header in state {}", transfer_id_, to_string(state_));
        return false;
    }
    std::string why;
    if (!plausible_header(header, session_.file_size, &why)) {
        Logger::instance().warning("Download {}: malformed header for chunk {} ({}), ignored",
                                   transfer_id_, header.chunk_index, why);
        return false;
    }
    if (header.chunk_index < session_.chunk_index) {
        Logger::instance().debug("Download {}: chunk {} retransmitted", transfer_id_, header.chunk_index);
    }

    expected_ = header;
    state_ = ReceiverState::PayloadExpected;
    return true;
}

bool ChunkedReceiver::on_payload(const FileChunkHeader& header, std::vector<uint8_t> data) {
    Outcome out;
    std::shared_ptr<PeerLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        link = link_;
        if (state_ != ReceiverState::PayloadExpected || !expected_ ||
            expected_->chunk_index != header.chunk_index) {
            Logger::instance().warning("Download {}: payload for chunk {} without matching header, ignored",
                                       transfer_id_, header.chunk_index);
            return false;
        }
        const FileChunkHeader accepted = *expected_;
        expected_.reset();
        state_ = ReceiverState::HeaderExpected;

        if (data.size() != accepted.chunk_size) {
            Logger::instance().warning("Download {}: chunk {} carries {} bytes, header said {}; dropped",
                                       transfer_id_, accepted.chunk_index, data.size(), accepted.chunk_size);
            return false;
        }

        const uint32_t index = accepted.chunk_index;
        auto [slot, inserted] = chunks_.try_emplace(index);
        if (inserted) {
            received_chunks_++;
        } else {
            bytes_received_ -= slot->second.size();
        }
        bytes_received_ += data.size();
        bytes_since_feedback_ += data.size();
        chunks_since_feedback_++;
        slot->second = std::move(data);

        session_.chunk_index = std::max(session_.chunk_index, index + 1);
        session_.total_chunks = std::max<uint32_t>(session_.total_chunks, session_.chunk_index);
        session_.bytes_transferred = std::max(session_.bytes_transferred, bytes_received_);
        session_.chunk_size = accepted.chunk_size;

        // Queueing delay relative to the fastest delivery seen so far
        if (accepted.timestamp > 0) {
            int64_t one_way = static_cast<int64_t>(current_time_ms()) - static_cast<int64_t>(accepted.timestamp);
            if (!min_one_way_ms_ || one_way < *min_one_way_ms_) {
                min_one_way_ms_ = one_way;
            }
            double queue_ms = static_cast<double>(one_way - *min_one_way_ms_);
            double avg_chunk = received_chunks_ > 0 ? static_cast<double>(bytes_received_) / received_chunks_ : 0.0;
            buffer_level_chunks_ = (avg_chunk > 0.0 && download_rate_ > 0.0)
                ? queue_ms / 1000.0 * download_rate_ / avg_chunk
                : 0.0;
        }

        if (config_.ack_interval_chunks > 0 && (index + 1) % config_.ack_interval_chunks == 0) {
            out.outbox.push_back(ChunkAck{transfer_id_, index});
        }

        auto now = std::chrono::steady_clock::now();
        auto since = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_feedback_).count();
        if ((config_.feedback_interval_chunks > 0 && chunks_since_feedback_ >= config_.feedback_interval_chunks) ||
            since >= static_cast<int64_t>(config_.feedback_interval_ms)) {
            feedback_locked(out, now);
        }

        if (config_.checkpoint_interval_chunks > 0 && session_.chunk_index % config_.checkpoint_interval_chunks == 0) {
            checkpoint_locked();
        }

        if (accepted.is_last) {
            last_index_ = index;
        }
    }
    deliver(link, std::move(out));
    return true;
}

void ChunkedReceiver::feedback_locked(Outcome& out, std::chrono::steady_clock::time_point now) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_feedback_).count();
    download_rate_ = static_cast<double>(bytes_since_feedback_) * 1000.0 / static_cast<double>(std::max<int64_t>(elapsed, 1));

    ThroughputReport report;
    report.transfer_id = transfer_id_;
    report.throughput = download_rate_;
    report.buffer_level = buffer_level_chunks_;
    report.rtt_ms = rtt_ms_;
    out.outbox.push_back(report);

    double pressure = std::clamp(buffer_level_chunks_ / config_.rate.buffer_capacity_chunks, 0.0, 1.0);
    if (pressure > config_.critical_pressure_threshold) {
        out.outbox.push_back(BufferPressure{transfer_id_, PressureLevel::Critical, pressure});
        out.outbox.push_back(RateLimitRequest{transfer_id_, download_rate_ * config_.rate_limit_fraction});
        Logger::instance().debug("Download {}: critical buffer pressure {:.2f}", transfer_id_, pressure);
    } else if (pressure > config_.high_pressure_threshold) {
        out.outbox.push_back(BufferPressure{transfer_id_, PressureLevel::High, pressure});
    }

    last_feedback_ = now;
    chunks_since_feedback_ = 0;
    bytes_since_feedback_ = 0;
}

void ChunkedReceiver::on_complete(const DownloadComplete& complete) {
    Outcome out;
    std::shared_ptr<PeerLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        link = link_;
        if (state_ != ReceiverState::HeaderExpected && state_ != ReceiverState::PayloadExpected) {
            Logger::instance().warning("Download {}: unexpected download-complete in state {}", transfer_id_, to_string(state_));
            return;
        }
        if (!plausible_total(complete.final_stats.total_chunks, session_.file_size)) {
            Logger::instance().warning("Download {}: download-complete reports {} chunks for {} bytes, ignored",
                                       transfer_id_, complete.final_stats.total_chunks, session_.file_size);
            return;
        }
        final_stats_ = complete.final_stats;
        assemble_locked(out, final_total_locked());
    }
    deliver(link, std::move(out));
}

uint32_t ChunkedReceiver::final_total_locked() const {
    if (final_stats_ && final_stats_->total_chunks > 0) {
        return final_stats_->total_chunks;
    }
    if (last_index_) {
        return *last_index_ + 1;
    }
    uint32_t highest = chunks_.empty() ? 0 : chunks_.rbegin()->first + 1;
    return std::max(session_.total_chunks, highest);
}

// First `limit` absent indices below total, walking the gaps between stored chunks
std::vector<uint32_t> ChunkedReceiver::missing_locked(uint32_t total, size_t limit) const {
    std::vector<uint32_t> missing;
    uint32_t next = 0;
    for (auto it = chunks_.begin(); it != chunks_.end() && it->first < total && missing.size() < limit; ++it) {
        for (; next < it->first && missing.size() < limit; ++next) {
            missing.push_back(next);
        }
        next = it->first + 1;
    }
    for (; next < total && missing.size() < limit; ++next) {
        missing.push_back(next);
    }
    return missing;
}

uint64_t ChunkedReceiver::missing_count_locked(uint32_t total) const {
    auto present = static_cast<uint64_t>(std::distance(chunks_.begin(), chunks_.lower_bound(total)));
    return total - present;
}

void ChunkedReceiver::assemble_locked(Outcome& out, uint32_t total) {
    state_ = ReceiverState::Assembling;

    const uint64_t missing_count = missing_count_locked(total);
    if (missing_count > 0) {
        auto missing = missing_locked(total, MAX_REPORTED_MISSING);
        std::string list;
        for (size_t i = 0; i < missing.size() && i < 16; ++i) {
            list += (i ? "," : "") + std::to_string(missing[i]);
        }
        if (missing_count > 16) list += ",...";
        session_.missing_chunks = missing;
        fail_locked(out, ErrorCode::IncompleteAssembly,
                    std::to_string(missing_count) + " of " + std::to_string(total) + " chunks missing [" + list + "]",
                    false);
        DownloadError error;
        error.request_id = transfer_id_;
        error.error = to_reason(ErrorCode::IncompleteAssembly);
        error.missing_chunks = std::move(missing);
        out.outbox.push_back(std::move(error));
        return;
    }

    ReceivedFile file;
    file.transfer_id = transfer_id_;
    file.file_id = session_.file_id;
    file.name = session_.file_name;
    file.mime_type = session_.mime_type;
    file.data.reserve(bytes_received_);
    for (auto it = chunks_.begin(); it != chunks_.end() && it->first < total; ++it) {
        file.data.insert(file.data.end(), it->second.begin(), it->second.end());
    }

    if (file.data.size() != session_.file_size) {
        fail_locked(out, ErrorCode::IncompleteAssembly,
                    "assembled " + std::to_string(file.data.size()) + " bytes, expected " +
                    std::to_string(session_.file_size),
                    false);
        DownloadError error;
        error.request_id = transfer_id_;
        error.error = to_reason(ErrorCode::IncompleteAssembly);
        out.outbox.push_back(std::move(error));
        return;
    }

    if (final_stats_ && !final_stats_->checksum.empty()) {
        auto actual = compute_checksum(file.data);
        if (actual != final_stats_->checksum) {
            fail_locked(out, ErrorCode::ChecksumMismatch, "expected " + final_stats_->checksum + ", got " + actual, false);
            DownloadError error;
            error.request_id = transfer_id_;
            error.error = to_reason(ErrorCode::ChecksumMismatch);
            out.outbox.push_back(std::move(error));
            return;
        }
    }

    state_ = ReceiverState::Completed;
    session_.state = SessionState::Completed;
    session_.chunk_index = total;
    session_.total_chunks = total;
    session_.bytes_transferred = file.data.size();
    session_.finished_at = current_time_ms();
    session_.missing_chunks.clear();
    chunks_.clear();
    if (resume_store_) {
        resume_store_->remove(transfer_id_);
    }

    Logger::instance().info("Download {}: {} assembled ({} bytes, {} chunks)",
                            transfer_id_, file.name, file.data.size(), total);

    out.finished = true;
    out.session = session_;
    out.file = std::move(file);
}

void ChunkedReceiver::fail_locked(Outcome& out, ErrorCode error, const std::string& detail, bool keep_chunks) {
    state_ = ReceiverState::Failed;
    expected_.reset();
    session_.state = error == ErrorCode::Cancelled ? SessionState::Cancelled : SessionState::Failed;
    session_.last_error = error;
    session_.error_detail = detail;
    session_.finished_at = current_time_ms();
    if (!keep_chunks) {
        chunks_.clear();
        received_chunks_ = 0;
        bytes_received_ = 0;
        if (resume_store_) {
            resume_store_->remove(transfer_id_);
        }
    }

    Logger::instance().warning("Download {} failed: {}{}", transfer_id_, to_reason(error),
                               detail.empty() ? "" : " (" + detail + ")");

    out.finished = true;
    out.session = session_;
}

void ChunkedReceiver::checkpoint_locked() {
    if (!resume_store_) {
        return;
    }
    auto point = resume_point_locked();
    ResumeCheckpoint cp;
    cp.transfer_id = transfer_id_;
    cp.file_id = session_.file_id;
    cp.file_name = session_.file_name;
    cp.file_size = session_.file_size;
    cp.byte_offset = point.offset;
    cp.chunk_index = point.chunk_index;
    cp.saved_at = current_time_ms();
    if (!resume_store_->put(cp)) {
        Logger::instance().warning("Download {}: checkpoint not saved", transfer_id_);
    }
}

void ChunkedReceiver::on_connection_lost() {
    Outcome out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ReceiverState::Completed || state_ == ReceiverState::Failed) {
            return;
        }
        if (state_ == ReceiverState::Idle) {
            fail_locked(out, ErrorCode::ConnectionLost, "connection closed before the transfer started", true);
        } else if (last_index_ && missing_count_locked(*last_index_ + 1) == 0) {
            // Only the completion summary was lost
            assemble_locked(out, *last_index_ + 1);
        } else {
            checkpoint_locked();
            fail_locked(out, ErrorCode::ConnectionLost, "connection closed mid-transfer", true);
        }
    }
    deliver(nullptr, std::move(out));
}

void ChunkedReceiver::on_remote_failure(ErrorCode error, const std::string& detail) {
    Outcome out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ReceiverState::Completed || state_ == ReceiverState::Failed) {
            return;
        }
        fail_locked(out, error, detail.empty() ? "reported by " + link_->peer_id() : detail, false);
    }
    deliver(nullptr, std::move(out));
}

void ChunkedReceiver::cancel(bool notify_peer) {
    Outcome out;
    std::shared_ptr<PeerLink> link;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        link = link_;
        if (state_ == ReceiverState::Completed || state_ == ReceiverState::Failed) {
            return;
        }
        if (notify_peer) {
            out.outbox.push_back(DownloadCancel{transfer_id_});
        }
        fail_locked(out, ErrorCode::Cancelled, "", false);
    }
    deliver(link, std::move(out));
}

void ChunkedReceiver::set_rtt(double rtt_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    rtt_ms_ = rtt_ms;
}

ResumePoint ChunkedReceiver::resume_point_locked() const {
    ResumePoint point;
    for (const auto& [index, chunk] : chunks_) {
        if (index != point.chunk_index) break;
        point.offset += chunk.size();
        point.chunk_index++;
    }
    return point;
}

std::vector<uint32_t> ChunkedReceiver::missing_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.missing_chunks.empty() ? missing_locked(final_total_locked(), MAX_REPORTED_MISSING)
                                           : session_.missing_chunks;
}

ResumePoint ChunkedReceiver::resume_point() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resume_point_locked();
}

uint32_t ChunkedReceiver::received_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_chunks_;
}

std::optional<FinalStats> ChunkedReceiver::final_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return final_stats_;
}

double ChunkedReceiver::buffer_level_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_level_chunks_;
}

ReceiverState ChunkedReceiver::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TransferSession ChunkedReceiver::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

std::string ChunkedReceiver::peer_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return link_ ? link_->peer_id() : session_.peer_id;
}

} // namespace peerdrop
