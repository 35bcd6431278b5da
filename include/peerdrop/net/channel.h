#ifndef PEERDROP_NET_CHANNEL_H
#define PEERDROP_NET_CHANNEL_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace peerdrop {

enum class FrameKind : uint8_t {
    Control = 1,  // UTF-8 JSON control message
    Binary = 2    // raw chunk payload
};

struct Frame {
    FrameKind kind = FrameKind::Control;
    std::vector<uint8_t> data;

    static Frame control(const std::string& text);
    static Frame binary(std::vector<uint8_t> payload);

    std::string text() const { return std::string(data.begin(), data.end()); }
    size_t size() const { return data.size(); }
};

// Reliable, ordered, message-oriented channel to one remote peer.
// Handlers may be invoked from any worker thread but never concurrently
// for the same channel.
class Channel {
public:
    using DataHandler = std::function<void(Frame)>;
    using ConnectHandler = std::function<void()>;
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    virtual ~Channel() = default;

    // Begin delivering frames; must be called from inside the runtime
    virtual void start() = 0;

    // Queue a frame; false when closed or the send queue is full
    virtual bool send(Frame frame) = 0;

    // Bytes queued locally and not yet handed to the peer
    virtual uint64_t buffered_amount() const = 0;

    // Whether send() would currently accept `frames` frames totalling `bytes`
    virtual bool has_room_for(uint64_t bytes, size_t frames) const = 0;

    virtual bool is_connected() const = 0;
    virtual void close() = 0;

    void on_data(DataHandler handler);
    void on_connect(ConnectHandler handler);
    void on_close(CloseHandler handler);
    void on_error(ErrorHandler handler);

protected:
    void emit_data(Frame frame);
    void emit_connect();
    void emit_close();
    void emit_error(const std::string& message);

private:
    mutable std::mutex handlers_mutex_;
    DataHandler data_handler_;
    ConnectHandler connect_handler_;
    CloseHandler close_handler_;
    ErrorHandler error_handler_;
    bool close_emitted_ = false;
};

} // namespace peerdrop

#endif // PEERDROP_NET_CHANNEL_H
