#ifndef PEERDROP_NET_PEER_LINK_H
#define PEERDROP_NET_PEER_LINK_H

#include "peerdrop/net/channel.h"
#include "peerdrop/protocol/control_message.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace peerdrop {

// Typed view of one peer's channel. Control frames are decoded once here;
// each binary frame is paired with the file-chunk-header sent just before it.
class PeerLink : public std::enable_shared_from_this<PeerLink> {
public:
    using MessageHandler = std::function<void(const ControlMessage&)>;
    using PayloadHandler = std::function<void(const FileChunkHeader&, std::vector<uint8_t>)>;
    using ClosedHandler = std::function<void()>;

    PeerLink(std::string peer_id, std::shared_ptr<Channel> channel);
    ~PeerLink();

    const std::string& peer_id() const { return peer_id_; }
    std::shared_ptr<Channel> channel() const { return channel_; }

    void set_message_handler(MessageHandler handler);
    void set_payload_handler(PayloadHandler handler);
    void set_closed_handler(ClosedHandler handler);

    // Install channel callbacks and start delivery
    void attach();

    bool send_message(const ControlMessage& message);

    // Header and payload go out back-to-back; no other chunk can interleave
    bool send_chunk(const FileChunkHeader& header, std::vector<uint8_t> payload);

    uint64_t buffered_amount() const;
    bool is_connected() const;
    void close();

    std::chrono::steady_clock::time_point last_activity() const;

    uint64_t protocol_errors() const { return protocol_errors_.load(); }

    // Entry point for frames arriving from the channel
    void handle_frame(Frame frame);

private:
    void handle_closed();

    std::string peer_id_;
    std::shared_ptr<Channel> channel_;

    std::mutex send_mutex_;
    mutable std::mutex handler_mutex_;
    MessageHandler message_handler_;
    PayloadHandler payload_handler_;
    ClosedHandler closed_handler_;

    // Expected-next-frame marker
    std::optional<FileChunkHeader> pending_header_;

    std::atomic<int64_t> last_activity_ns_{0};
    std::atomic<uint64_t> protocol_errors_{0};
};

} // namespace peerdrop

#endif // PEERDROP_NET_PEER_LINK_H
