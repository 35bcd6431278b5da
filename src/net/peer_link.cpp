#include "peerdrop/net/peer_link.h"
#include "peerdrop/base/logger.h"
#include "peerdrop/protocol/control_codec.h"

namespace peerdrop {

namespace {

int64_t steady_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

PeerLink::PeerLink(std::string peer_id, std::shared_ptr<Channel> channel)
    : peer_id_(std::move(peer_id)), channel_(std::move(channel)) {
    last_activity_ns_ = steady_now_ns();
}

PeerLink::~PeerLink() {
    channel_->on_data(nullptr);
    channel_->on_close(nullptr);
    channel_->on_error(nullptr);
}

void PeerLink::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    message_handler_ = std::move(handler);
}

void PeerLink::set_payload_handler(PayloadHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    payload_handler_ = std::move(handler);
}

void PeerLink::set_closed_handler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    closed_handler_ = std::move(handler);
}

void PeerLink::attach() {
    std::weak_ptr<PeerLink> weak = shared_from_this();
    channel_->on_data([weak](Frame frame) {
        if (auto self = weak.lock()) {
            self->handle_frame(std::move(frame));
        }
    });
    channel_->on_close([weak]() {
        if (auto self = weak.lock()) {
            self->handle_closed();
        }
    });
    channel_->on_error([weak](const std::string& message) {
        if (auto self = weak.lock()) {
            Logger::instance().warning("Channel error from peer " + self->peer_id_ + ": " + message);
        }
    });
    channel_->start();
}

bool PeerLink::send_message(const ControlMessage& message) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return channel_->send(Frame::control(ControlCodec::encode(message)));
}

bool PeerLink::send_chunk(const FileChunkHeader& header, std::vector<uint8_t> payload) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    Frame header_frame = Frame::control(ControlCodec::encode(header));
    // Only this lock's holder adds to the queue, so room checked here stays available
    if (!channel_->has_room_for(header_frame.size() + payload.size(), 2)) {
        return false;
    }
    if (!channel_->send(std::move(header_frame))) {
        return false;
    }
    if (!channel_->send(Frame::binary(std::move(payload)))) {
        // The receiver now holds a header without payload; the connection
        // is unusable for chunk pairing until it is re-established.
        Logger::instance().warning("Payload send failed after header for chunk " +
                                   std::to_string(header.chunk_index) + ", closing link to " + peer_id_);
        channel_->close();
        return false;
    }
    return true;
}

uint64_t PeerLink::buffered_amount() const {
    return channel_->buffered_amount();
}

bool PeerLink::is_connected() const {
    return channel_->is_connected();
}

void PeerLink::close() {
    channel_->close();
}

std::chrono::steady_clock::time_point PeerLink::last_activity() const {
    return std::chrono::steady_clock::time_point(std::chrono::nanoseconds(last_activity_ns_.load()));
}

void PeerLink::handle_frame(Frame frame) {
    last_activity_ns_ = steady_now_ns();

    if (frame.kind == FrameKind::Binary) {
        if (!pending_header_) {
            protocol_errors_++;
            Logger::instance().warning("Unexpected binary frame from " + peer_id_ +
                                       " (" + std::to_string(frame.size()) + " bytes), ignoring");
            return;
        }
        FileChunkHeader header = std::move(*pending_header_);
        pending_header_.reset();

        PayloadHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = payload_handler_;
        }
        if (handler) handler(header, std::move(frame.data));
        return;
    }

    std::string error;
    auto message = ControlCodec::decode(frame.text(), &error);
    if (!message) {
        protocol_errors_++;
        Logger::instance().warning("Dropping malformed message from " + peer_id_ + ": " + error);
        return;
    }

    if (auto* header = std::get_if<FileChunkHeader>(&*message)) {
        if (pending_header_) {
            protocol_errors_++;
            Logger::instance().warning("Chunk header " + std::to_string(header->chunk_index) +
                                       " from " + peer_id_ + " replaces a header without payload");
        }
        pending_header_ = *header;
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = message_handler_;
    }
    if (handler) handler(*message);
}

void PeerLink::handle_closed() {
    pending_header_.reset();
    ClosedHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = closed_handler_;
    }
    if (handler) handler();
}

} // namespace peerdrop
