#ifndef TVLINK_FRAME_CHANNEL_H
#define TVLINK_FRAME_CHANNEL_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tvlink {

struct Endpoint {
    std::string host;
    int port = 3000;
    bool secure = false;
    std::string path = "/";

    std::string url() const;
};

// Parses ws://host[:port][/path] and wss://...; default ports 3000 (ws) and 3001 (wss).
std::optional<Endpoint> parse_socket_url(const std::string& url);

// A message-framed text stream (a WebSocket in production). Implementations
// deliver frames and remote closure on their own thread; after close() returns
// no handler is invoked again.
class FrameChannel {
public:
    using FrameHandler = std::function<void(const std::string& text)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~FrameChannel() = default;

    // Blocks until the handshake completes. Throws TvLinkError
    // (InvalidAddress, NetworkFailure) on failure.
    virtual void open(const Endpoint& endpoint,
                      std::chrono::milliseconds timeout,
                      FrameHandler on_frame,
                      CloseHandler on_close) = 0;

    // Throws TvLinkError(NotConnected) when closed, NetworkFailure on write error.
    virtual void send_text(const std::string& text) = 0;

    // Native ping; true once the pong arrives within the timeout.
    virtual bool ping(std::chrono::milliseconds timeout) = 0;

    // Local close. The close handler is not invoked.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

using FrameChannelFactory = std::function<std::unique_ptr<FrameChannel>()>;

} // namespace tvlink

#endif // TVLINK_FRAME_CHANNEL_H
