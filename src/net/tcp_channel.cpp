#include "peerdrop/net/tcp_channel.h"
#include "peerdrop/base/logger.h"
#include <arpa/inet.h>
#include <cstring>

namespace peerdrop {

FrameWireHeader make_wire_header(const Frame& frame) {
    FrameWireHeader header{};
    header.magic = htonl(FRAME_MAGIC);
    header.kind = static_cast<uint8_t>(frame.kind);
    header.length = htonl(static_cast<uint32_t>(frame.data.size()));
    return header;
}

std::optional<uint32_t> parse_wire_header(const FrameWireHeader& header, FrameKind* kind) {
    if (ntohl(header.magic) != FRAME_MAGIC) {
        return std::nullopt;
    }
    if (header.kind != static_cast<uint8_t>(FrameKind::Control) &&
        header.kind != static_cast<uint8_t>(FrameKind::Binary)) {
        return std::nullopt;
    }
    uint32_t length = ntohl(header.length);
    if (length > MAX_FRAME_SIZE) {
        return std::nullopt;
    }
    if (kind) *kind = static_cast<FrameKind>(header.kind);
    return length;
}

TcpChannel::TcpChannel(elio::net::tcp_stream stream, uint64_t max_queued_bytes)
    : stream_(std::move(stream)), max_queued_bytes_(max_queued_bytes) {}

TcpChannel::~TcpChannel() = default;

elio::coro::task<std::shared_ptr<TcpChannel>> TcpChannel::connect(const std::string& host, uint16_t port) {
    elio::net::tcp_options opts;
    opts.no_delay = true;

    auto connect_result = co_await elio::net::tcp_connect(host, port, opts);
    if (!connect_result) {
        Logger::instance().error("Failed to connect to " + host + ":" + std::to_string(port));
        co_return nullptr;
    }

    Logger::instance().info("Connected to " + host + ":" + std::to_string(port));
    co_return std::make_shared<TcpChannel>(std::move(*connect_result));
}

void TcpChannel::start() {
    if (started_.exchange(true)) return;
    auto self = shared_from_this();
    (void)reader_loop(self).spawn();
    (void)writer_loop(self).spawn();
    emit_connect();
}

bool TcpChannel::send(Frame frame) {
    if (!connected_) return false;
    if (frame.data.size() > MAX_FRAME_SIZE) {
        Logger::instance().error("Frame of " + std::to_string(frame.data.size()) + " bytes exceeds limit");
        return false;
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    uint64_t size = frame.data.size() + sizeof(FrameWireHeader);
    if (queued_bytes_ + size > max_queued_bytes_) {
        return false;
    }
    queued_bytes_ += size;
    send_queue_.push_back(std::move(frame));
    return true;
}

uint64_t TcpChannel::buffered_amount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queued_bytes_;
}

bool TcpChannel::has_room_for(uint64_t bytes, size_t frames) const {
    if (!connected_) return false;
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queued_bytes_ + bytes + frames * sizeof(FrameWireHeader) <= max_queued_bytes_;
}

bool TcpChannel::is_connected() const {
    return connected_;
}

void TcpChannel::close() {
    mark_closed("closed locally");
}

void TcpChannel::mark_closed(const std::string& reason) {
    if (!connected_.exchange(false)) return;
    Logger::instance().debug("TCP channel closing: " + reason);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        send_queue_.clear();
        queued_bytes_ = 0;
    }
    emit_close();
}

elio::coro::task<bool> TcpChannel::read_exact(void* buffer, size_t length) {
    auto* out = static_cast<uint8_t*>(buffer);
    size_t done = 0;
    while (done < length) {
        auto result = co_await stream_.read(out + done, length - done);
        if (result.result <= 0) {
            co_return false;
        }
        done += static_cast<size_t>(result.result);
    }
    co_return true;
}

elio::coro::task<bool> TcpChannel::write_all(const void* buffer, size_t length) {
    const auto* in = static_cast<const uint8_t*>(buffer);
    size_t done = 0;
    while (done < length) {
        auto result = co_await stream_.write(in + done, length - done);
        if (result.result <= 0) {
            co_return false;
        }
        done += static_cast<size_t>(result.result);
    }
    co_return true;
}

elio::coro::task<void> TcpChannel::reader_loop(std::shared_ptr<TcpChannel> self) {
    while (self->connected_) {
        FrameWireHeader header{};
        if (!co_await self->read_exact(&header, sizeof(header))) {
            self->mark_closed("peer closed connection");
            break;
        }

        FrameKind kind = FrameKind::Control;
        auto length = parse_wire_header(header, &kind);
        if (!length) {
            self->emit_error("invalid frame header");
            self->mark_closed("invalid frame header");
            break;
        }

        Frame frame;
        frame.kind = kind;
        frame.data.resize(*length);
        if (*length > 0 && !co_await self->read_exact(frame.data.data(), *length)) {
            self->mark_closed("connection lost mid-frame");
            break;
        }

        self->emit_data(std::move(frame));
    }

    co_return;
}

elio::coro::task<void> TcpChannel::writer_loop(std::shared_ptr<TcpChannel> self) {
    while (self->connected_) {
        std::optional<Frame> next;
        {
            std::lock_guard<std::mutex> lock(self->queue_mutex_);
            if (!self->send_queue_.empty()) {
                next = std::move(self->send_queue_.front());
                self->send_queue_.pop_front();
            }
        }

        if (!next) {
            co_await elio::time::sleep_for(std::chrono::milliseconds(1));
            continue;
        }

        FrameWireHeader header = make_wire_header(*next);
        bool ok = co_await self->write_all(&header, sizeof(header));
        if (ok && !next->data.empty()) {
            ok = co_await self->write_all(next->data.data(), next->data.size());
        }

        {
            std::lock_guard<std::mutex> lock(self->queue_mutex_);
            uint64_t size = next->data.size() + sizeof(FrameWireHeader);
            self->queued_bytes_ = self->queued_bytes_ >= size ? self->queued_bytes_ - size : 0;
        }

        if (!ok) {
            self->emit_error("write failed");
            self->mark_closed("write failed");
            break;
        }
    }

    // Closing the stream also wakes a reader blocked on the socket
    co_await self->stream_.close();
    co_return;
}

} // namespace peerdrop
