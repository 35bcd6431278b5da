#include "peerdrop/net/channel.h"

namespace peerdrop {

Frame Frame::control(const std::string& text) {
    Frame frame;
    frame.kind = FrameKind::Control;
    frame.data.assign(text.begin(), text.end());
    return frame;
}

Frame Frame::binary(std::vector<uint8_t> payload) {
    Frame frame;
    frame.kind = FrameKind::Binary;
    frame.data = std::move(payload);
    return frame;
}

void Channel::on_data(DataHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    data_handler_ = std::move(handler);
}

void Channel::on_connect(ConnectHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    connect_handler_ = std::move(handler);
}

void Channel::on_close(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    close_handler_ = std::move(handler);
}

void Channel::on_error(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    error_handler_ = std::move(handler);
}

void Channel::emit_data(Frame frame) {
    DataHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = data_handler_;
    }
    if (handler) handler(std::move(frame));
}

void Channel::emit_connect() {
    ConnectHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = connect_handler_;
    }
    if (handler) handler();
}

void Channel::emit_close() {
    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        if (close_emitted_) return;
        close_emitted_ = true;
        handler = close_handler_;
    }
    if (handler) handler();
}

void Channel::emit_error(const std::string& message) {
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = error_handler_;
    }
    if (handler) handler(message);
}

} // namespace peerdrop
