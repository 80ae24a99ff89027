#ifndef TVLINK_PROTOCOL_TRANSPORT_H
#define TVLINK_PROTOCOL_TRANSPORT_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "frame_channel.h"
#include "response_decoder.h"

namespace tvlink {

using json = nlohmann::json;

// One control connection to a TV: connect, register, multiplexed requests
// matched by id, heartbeat, and the lazily opened pointer (button) socket.
//
// Thread model: public calls may come from any thread. Frames and remote
// closure arrive on the channel's thread. Every PendingRequest is completed
// exactly once, by whichever path removes it from the pending table first.
class ProtocolTransport {
public:
    using PairingPromptHandler = std::function<void()>;
    using DisconnectHandler = std::function<void(const std::optional<std::string>& reason)>;

    explicit ProtocolTransport(FrameChannelFactory factory,
                               ResponseDecoder decoder = ResponseDecoder());
    ~ProtocolTransport();

    ProtocolTransport(const ProtocolTransport&) = delete;
    ProtocolTransport& operator=(const ProtocolTransport&) = delete;

    // Raised at most once per connection, when the TV shows the pairing prompt.
    void set_pairing_prompt_handler(PairingPromptHandler handler);
    // Raised for remote closure and receive errors; never for disconnect(false).
    void set_disconnect_handler(DisconnectHandler handler);

    // Throws InvalidAddress or NetworkFailure. An existing connection is closed silently first.
    void connect(const std::string& host, int port, bool secure);

    // Returns the client key issued by the TV (may be empty).
    std::string register_client(const std::optional<std::string>& client_key,
                                std::chrono::milliseconds timeout);

    // Returns the full response envelope. Throws NotConnected, RequestTimedOut,
    // RequestRejected or NetworkFailure.
    json request(const std::string& uri,
                 const std::optional<json>& payload,
                 std::chrono::milliseconds timeout);

    bool send_ping(std::chrono::milliseconds timeout);

    // Idempotent.
    void disconnect(bool notify, const std::optional<std::string>& reason = std::nullopt);

    void send_pointer_button(const std::string& name);
    void prewarm_pointer_socket();

    bool is_connected() const;
    std::optional<Endpoint> endpoint() const;
    size_t pending_count() const;

    static json registration_manifest();
    static std::chrono::milliseconds clamp_request_timeout(std::chrono::milliseconds timeout);
    static std::chrono::milliseconds clamp_register_timeout(std::chrono::milliseconds timeout);
    static std::chrono::milliseconds clamp_ping_timeout(std::chrono::milliseconds timeout);

private:
    struct PendingRequest {
        std::string id;
        std::chrono::steady_clock::time_point issued_at;
        std::chrono::steady_clock::time_point deadline;
        std::promise<json> completion;
    };
    using PendingPtr = std::shared_ptr<PendingRequest>;

    std::string next_id(const char* prefix);
    PendingPtr make_pending(const std::string& id, std::chrono::milliseconds timeout);

    void send_or_fail(const std::shared_ptr<FrameChannel>& channel, const PendingPtr& pending, const std::string& text);
    json await(const PendingPtr& pending, bool registration, std::chrono::milliseconds timeout);

    // Remove-then-complete; false when another path already completed it.
    bool take_pending(const std::string& id, PendingPtr& out);
    bool take_registration(const std::string& id, PendingPtr& out);

    void handle_frame(uint64_t generation, const std::string& text);
    void handle_close(uint64_t generation, const std::string& reason);

    std::shared_ptr<FrameChannel> ensure_pointer_socket();
    void reset_pointer_socket();

    FrameChannelFactory m_factory;
    ResponseDecoder m_decoder;

    mutable std::mutex m_mutex;
    std::shared_ptr<FrameChannel> m_channel;
    std::shared_ptr<FrameChannel> m_pointer;
    std::optional<Endpoint> m_endpoint;
    std::map<std::string, PendingPtr> m_pending;
    PendingPtr m_registration;
    bool m_prompt_announced = false;
    uint64_t m_generation = 0;
    uint64_t m_counter = 0;

    PairingPromptHandler m_prompt_handler;
    DisconnectHandler m_disconnect_handler;

    // Serializes pointer socket setup; never held together with m_mutex.
    std::mutex m_pointer_setup_mutex;
};

} // namespace tvlink

#endif // TVLINK_PROTOCOL_TRANSPORT_H
