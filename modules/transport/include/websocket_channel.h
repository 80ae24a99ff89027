#ifndef TVLINK_WEBSOCKET_CHANNEL_H
#define TVLINK_WEBSOCKET_CHANNEL_H

#include <memory>

#include "frame_channel.h"

namespace tvlink {

// Boost.Beast WebSocket client (ws and wss). Each channel runs its own
// io_context thread; all stream operations are serialized on a strand.
class WebSocketChannel : public FrameChannel {
public:
    WebSocketChannel();
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    void open(const Endpoint& endpoint,
              std::chrono::milliseconds timeout,
              FrameHandler on_frame,
              CloseHandler on_close) override;
    void send_text(const std::string& text) override;
    bool ping(std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_open() const override;

    static FrameChannelFactory factory();

private:
    class Impl;
    std::shared_ptr<Impl> m_impl;
};

} // namespace tvlink

#endif // TVLINK_WEBSOCKET_CHANNEL_H
