#include "peerdrop/net/loopback_channel.h"
#include "peerdrop/base/logger.h"

namespace peerdrop {

std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>
LoopbackChannel::create_pair(const Options& first, const Options& second) {
    auto shared = std::make_shared<Shared>();
    std::shared_ptr<LoopbackChannel> a(new LoopbackChannel(shared, 0, first));
    std::shared_ptr<LoopbackChannel> b(new LoopbackChannel(shared, 1, second));
    return {a, b};
}

LoopbackChannel::LoopbackChannel(std::shared_ptr<Shared> shared, int side, const Options& options)
    : shared_(std::move(shared)), side_(side), options_(options) {}

void LoopbackChannel::start() {
    if (started_) return;
    started_ = true;
    (void)pump(shared_from_this()).spawn();
}

bool LoopbackChannel::send(Frame frame) {
    bool drop = false;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!shared_->connected) return false;

        uint64_t size = frame.size();
        if (options_.fail_after_bytes > 0 &&
            shared_->bytes_sent[side_] + size > options_.fail_after_bytes) {
            drop = true;
        } else {
            if (shared_->queued_bytes[side_] + size > options_.max_queued_bytes) {
                return false;
            }
            shared_->queued_bytes[side_] += size;
            shared_->bytes_sent[side_] += size;
            if (frame.kind == FrameKind::Binary) {
                shared_->binary_frames[side_]++;
            } else {
                shared_->control_frames[side_]++;
            }
            shared_->queue[side_].push_back(std::move(frame));
        }
    }

    if (drop) {
        Logger::instance().debug("Loopback channel dropping connection after injected fault");
        close();
        return false;
    }
    return true;
}

uint64_t LoopbackChannel::buffered_amount() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->queued_bytes[side_];
}

bool LoopbackChannel::has_room_for(uint64_t bytes, size_t) const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->connected && shared_->queued_bytes[side_] + bytes <= options_.max_queued_bytes;
}

bool LoopbackChannel::is_connected() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->connected;
}

void LoopbackChannel::close() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (!shared_->connected) return;
    shared_->connected = false;
    for (int i = 0; i < 2; ++i) {
        shared_->queue[i].clear();
        shared_->queued_bytes[i] = 0;
    }
}

uint64_t LoopbackChannel::frames_sent(FrameKind kind) const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return kind == FrameKind::Binary ? shared_->binary_frames[side_] : shared_->control_frames[side_];
}

uint64_t LoopbackChannel::bytes_sent() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->bytes_sent[side_];
}

elio::coro::task<void> LoopbackChannel::pump(std::shared_ptr<LoopbackChannel> self) {
    const int peer = 1 - self->side_;
    self->emit_connect();

    while (true) {
        std::deque<Frame> batch;
        bool connected = false;
        {
            std::lock_guard<std::mutex> lock(self->shared_->mutex);
            connected = self->shared_->connected;
            if (connected) {
                auto& queue = self->shared_->queue[peer];
                uint64_t budget = self->options_.bytes_per_tick;
                uint64_t taken = 0;
                while (!queue.empty()) {
                    uint64_t size = queue.front().size();
                    if (budget > 0 && taken > 0 && taken + size > budget) break;
                    taken += size;
                    batch.push_back(std::move(queue.front()));
                    queue.pop_front();
                }
                self->shared_->queued_bytes[peer] -= taken;
            }
        }

        if (!connected) {
            self->emit_close();
            co_return;
        }

        for (auto& frame : batch) {
            if (!self->is_connected()) break;
            self->emit_data(std::move(frame));
        }

        if (batch.empty() || self->options_.bytes_per_tick > 0) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(self->options_.tick_ms));
        }
    }
}

} // namespace peerdrop
