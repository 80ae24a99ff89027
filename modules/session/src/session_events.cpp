#include "session_events.h"
#include "logger.h"

#include <type_traits>

namespace tvlink {

const char* session_event_name(const SessionEvent& event) {
    return std::visit([](auto&& arg) -> const char* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DevicesDiscoveredEvent>) return "DevicesDiscoveredEvent";
        else if constexpr (std::is_same_v<T, DiscoveryFailedEvent>) return "DiscoveryFailedEvent";
        else if constexpr (std::is_same_v<T, TransportDisconnectedEvent>) return "TransportDisconnectedEvent";
        else if constexpr (std::is_same_v<T, PairingPromptEvent>) return "PairingPromptEvent";
        else if constexpr (std::is_same_v<T, NetworkReachabilityChangedEvent>) return "NetworkReachabilityChangedEvent";
        else return "KeepaliveExhaustedEvent";
    }, event);
}

SessionEventQueue::~SessionEventQueue() {
    stopEventProcessing();
}

void SessionEventQueue::pushEvent(SessionEvent event) {
    if (m_stopping) {
        LOG_DEBUG("[Session] Ignoring " + std::string(session_event_name(event)) + " while stopping");
        return;
    }
    size_t queue_size = 0;
    const char* name = session_event_name(event);
    {
        std::lock_guard<std::mutex> lock(m_eventMutex);
        m_eventQueue.push(std::move(event));
        queue_size = m_eventQueue.size();
    }
    LOG_DEBUG("[Session] Event queued (" + std::string(name) + "), size=" + std::to_string(queue_size));
    m_eventCv.notify_all();
}

void SessionEventQueue::startEventProcessing(Handler handler) {
    std::lock_guard<std::mutex> lifecycle_lock(m_lifecycleMutex);
    if (m_running && !m_stopping) {
        LOG_WARN("[Session] Event processing already running");
        return;
    }
    if (m_processingThread.joinable()) {
        m_stopping = true;
        m_eventCv.notify_all();
        m_processingThread.join();
    }
    m_running = true;
    m_stopping = false;
    m_processingThread = std::thread([this, handler = std::move(handler)] { processEventQueue(handler); });
}

void SessionEventQueue::stopEventProcessing() {
    std::lock_guard<std::mutex> lifecycle_lock(m_lifecycleMutex);
    m_stopping = true;
    m_eventCv.notify_all();
    if (m_processingThread.joinable()) {
        if (m_processingThread.get_id() == std::this_thread::get_id()) {
            m_processingThread.detach();
        } else {
            m_processingThread.join();
        }
    }
    m_running = false;
    {
        std::lock_guard<std::mutex> lock(m_eventMutex);
        std::queue<SessionEvent>().swap(m_eventQueue);
        m_busy = false;
    }
    m_idleCv.notify_all();
}

bool SessionEventQueue::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_eventMutex);
    return m_idleCv.wait_for(lock, timeout, [this] { return m_eventQueue.empty() && !m_busy; });
}

void SessionEventQueue::processEventQueue(Handler handler) {
    uint64_t event_count = 0;
    while (true) {
        std::unique_lock<std::mutex> lock(m_eventMutex);
        m_eventCv.wait(lock, [this] { return !m_eventQueue.empty() || m_stopping; });
        if (m_stopping) {
            break;
        }

        SessionEvent event = std::move(m_eventQueue.front());
        m_eventQueue.pop();
        m_busy = true;
        ++event_count;
        lock.unlock();

        LOG_DEBUG("[Session] Processing event #" + std::to_string(event_count) + " (" + session_event_name(event) + ")");
        try {
            handler(event);
        } catch (const std::exception& e) {
            LOG_WARN("[Session] Error processing " + std::string(session_event_name(event)) + ": " + e.what());
        }

        lock.lock();
        m_busy = false;
        if (m_eventQueue.empty()) {
            m_idleCv.notify_all();
        }
    }
    LOG_DEBUG("[Session] Event processing stopped after " + std::to_string(event_count) + " events");
}

} // namespace tvlink
