#ifndef PEERDROP_NET_LOOPBACK_CHANNEL_H
#define PEERDROP_NET_LOOPBACK_CHANNEL_H

#include "peerdrop/net/channel.h"
#include <elio/elio.hpp>
#include <deque>
#include <memory>
#include <utility>

namespace peerdrop {

// In-process channel pair. Frames queue until the receiving side's pump
// delivers them, so buffered_amount() behaves like a real send buffer.
class LoopbackChannel : public Channel, public std::enable_shared_from_this<LoopbackChannel> {
public:
    struct Options {
        uint64_t max_queued_bytes = 64ULL * 1024 * 1024;
        uint64_t bytes_per_tick = 0;    // delivery budget per tick, 0 = unlimited
        uint32_t tick_ms = 1;
        uint64_t fail_after_bytes = 0;  // simulate a drop once this many bytes were sent, 0 = never
    };

    static std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>
    create_pair(const Options& first = Options{}, const Options& second = Options{});

    void start() override;
    bool send(Frame frame) override;
    uint64_t buffered_amount() const override;
    bool has_room_for(uint64_t bytes, size_t frames) const override;
    bool is_connected() const override;
    void close() override;

    // Frames of the given kind this side has handed to send()
    uint64_t frames_sent(FrameKind kind) const;
    uint64_t bytes_sent() const;

private:
    struct Shared {
        mutable std::mutex mutex;
        bool connected = true;
        std::deque<Frame> queue[2];       // queue[i]: frames sent by side i
        uint64_t queued_bytes[2] = {0, 0};
        uint64_t bytes_sent[2] = {0, 0};
        uint64_t control_frames[2] = {0, 0};
        uint64_t binary_frames[2] = {0, 0};
    };

    LoopbackChannel(std::shared_ptr<Shared> shared, int side, const Options& options);

    static elio::coro::task<void> pump(std::shared_ptr<LoopbackChannel> self);

    std::shared_ptr<Shared> shared_;
    int side_;
    Options options_;
    bool started_ = false;
};

} // namespace peerdrop

#endif // PEERDROP_NET_LOOPBACK_CHANNEL_H
