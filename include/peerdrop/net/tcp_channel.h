#ifndef PEERDROP_NET_TCP_CHANNEL_H
#define PEERDROP_NET_TCP_CHANNEL_H

#include "peerdrop/net/channel.h"
#include <elio/elio.hpp>
#include <elio/net/tcp.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <optional>

namespace peerdrop {

// Frame wire format
constexpr uint32_t FRAME_MAGIC = 0x50445250;  // "PDRP"
constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

struct FrameWireHeader {
    uint32_t magic;
    uint8_t kind;
    uint8_t reserved[3];
    uint32_t length;    // network byte order
} __attribute__((packed));

static_assert(sizeof(FrameWireHeader) == 12, "FrameWireHeader must be 12 bytes");

FrameWireHeader make_wire_header(const Frame& frame);

// Validates magic, kind and size; returns the payload length
std::optional<uint32_t> parse_wire_header(const FrameWireHeader& header, FrameKind* kind);

class TcpChannel : public Channel, public std::enable_shared_from_this<TcpChannel> {
public:
    explicit TcpChannel(elio::net::tcp_stream stream, uint64_t max_queued_bytes = 64ULL * 1024 * 1024);
    ~TcpChannel() override;

    static elio::coro::task<std::shared_ptr<TcpChannel>> connect(const std::string& host, uint16_t port);

    void start() override;
    bool send(Frame frame) override;
    uint64_t buffered_amount() const override;
    bool has_room_for(uint64_t bytes, size_t frames) const override;
    bool is_connected() const override;
    void close() override;

private:
    static elio::coro::task<void> reader_loop(std::shared_ptr<TcpChannel> self);
    static elio::coro::task<void> writer_loop(std::shared_ptr<TcpChannel> self);

    elio::coro::task<bool> read_exact(void* buffer, size_t length);
    elio::coro::task<bool> write_all(const void* buffer, size_t length);
    void mark_closed(const std::string& reason);

    elio::net::tcp_stream stream_;
    uint64_t max_queued_bytes_;

    mutable std::mutex queue_mutex_;
    std::deque<Frame> send_queue_;
    uint64_t queued_bytes_ = 0;

    std::atomic<bool> connected_{true};
    std::atomic<bool> started_{false};
};

} // namespace peerdrop

#endif // PEERDROP_NET_TCP_CHANNEL_H
