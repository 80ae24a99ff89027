#ifndef TVLINK_SESSION_EVENTS_H
#define TVLINK_SESSION_EVENTS_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "device.h"
#include "tvlink_error.h"

namespace tvlink {

// --- Discovery published a new merged device list ---
struct DevicesDiscoveredEvent {
    std::vector<Device> devices;
};

// --- Discovery reported a non-fatal failure or the empty-results hint ---
struct DiscoveryFailedEvent {
    ErrorCode code = ErrorCode::NetworkFailure;
    std::string message;
};

// --- The control socket closed without a local disconnect ---
struct TransportDisconnectedEvent {
    uint64_t session_generation = 0;
    std::optional<std::string> reason;
};

// --- The TV is showing its pairing prompt ---
struct PairingPromptEvent {
    uint64_t session_generation = 0;
};

// --- Local network came up or went away ---
struct NetworkReachabilityChangedEvent {
    bool reachable = true;
};

// --- Consecutive keepalive failures hit the threshold ---
struct KeepaliveExhaustedEvent {
    uint64_t session_generation = 0;
};

using SessionEvent = std::variant<
    DevicesDiscoveredEvent,
    DiscoveryFailedEvent,
    TransportDisconnectedEvent,
    PairingPromptEvent,
    NetworkReachabilityChangedEvent,
    KeepaliveExhaustedEvent
>;

const char* session_event_name(const SessionEvent& event);

/**
 * @brief FIFO queue with one processing thread.
 *
 * Producers (transport, discovery, network monitor, keepalive) push from their
 * own threads; the handler runs on the processing thread only, one event at a
 * time. Handler exceptions are logged and do not stop the loop.
 */
class SessionEventQueue {
public:
    using Handler = std::function<void(const SessionEvent&)>;

    SessionEventQueue() = default;
    ~SessionEventQueue();

    SessionEventQueue(const SessionEventQueue&) = delete;
    SessionEventQueue& operator=(const SessionEventQueue&) = delete;

    void pushEvent(SessionEvent event);
    void startEventProcessing(Handler handler);
    void stopEventProcessing();

    // Blocks until the queue is empty and no handler is running.
    bool waitIdle(std::chrono::milliseconds timeout);

    bool isRunning() const { return m_running.load(); }

private:
    void processEventQueue(Handler handler);

    std::queue<SessionEvent> m_eventQueue;
    std::mutex m_eventMutex;
    std::condition_variable m_eventCv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    std::mutex m_lifecycleMutex;
    std::thread m_processingThread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};
};

} // namespace tvlink

#endif // TVLINK_SESSION_EVENTS_H
