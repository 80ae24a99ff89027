#include "connection_state_machine.h"
#include "logger.h"

namespace tvlink {

ConnectionEvent ConnectionEvent::begin_scan() {
    ConnectionEvent e;
    e.type = ConnectionEventType::BeginScan;
    return e;
}

ConnectionEvent ConnectionEvent::found_devices(int count) {
    ConnectionEvent e;
    e.type = ConnectionEventType::FoundDevices;
    e.device_count = count;
    return e;
}

ConnectionEvent ConnectionEvent::begin_pairing(const Device& device) {
    ConnectionEvent e;
    e.type = ConnectionEventType::BeginPairing;
    e.device_id = device.id;
    e.device_name = device.name;
    return e;
}

ConnectionEvent ConnectionEvent::did_connect(const Device& device) {
    ConnectionEvent e;
    e.type = ConnectionEventType::DidConnect;
    e.device_id = device.id;
    e.device_name = device.name;
    return e;
}

ConnectionEvent ConnectionEvent::begin_reconnect(const Device& device) {
    ConnectionEvent e;
    e.type = ConnectionEventType::BeginReconnect;
    e.device_id = device.id;
    e.device_name = device.name;
    return e;
}

ConnectionEvent ConnectionEvent::fail(const std::string& message) {
    ConnectionEvent e;
    e.type = ConnectionEventType::Fail;
    e.message = message;
    return e;
}

ConnectionEvent ConnectionEvent::disconnect() {
    ConnectionEvent e;
    e.type = ConnectionEventType::Disconnect;
    return e;
}

bool operator==(const ConnectionState& lhs, const ConnectionState& rhs) {
    return lhs.phase == rhs.phase && lhs.device_count == rhs.device_count &&
           lhs.device_id == rhs.device_id && lhs.device_name == rhs.device_name &&
           lhs.message == rhs.message;
}

bool operator!=(const ConnectionState& lhs, const ConnectionState& rhs) {
    return !(lhs == rhs);
}

const char* phase_name(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::Idle: return "Idle";
        case ConnectionPhase::Scanning: return "Scanning";
        case ConnectionPhase::Discovered: return "Discovered";
        case ConnectionPhase::Pairing: return "Pairing";
        case ConnectionPhase::Connected: return "Connected";
        case ConnectionPhase::Reconnecting: return "Reconnecting";
        case ConnectionPhase::Failed: return "Failed";
    }
    return "Unknown";
}

const char* event_name(ConnectionEventType type) {
    switch (type) {
        case ConnectionEventType::BeginScan: return "beginScan";
        case ConnectionEventType::FoundDevices: return "foundDevices";
        case ConnectionEventType::BeginPairing: return "beginPairing";
        case ConnectionEventType::DidConnect: return "didConnect";
        case ConnectionEventType::BeginReconnect: return "beginReconnect";
        case ConnectionEventType::Fail: return "fail";
        case ConnectionEventType::Disconnect: return "disconnect";
    }
    return "unknown";
}

std::string state_label(const ConnectionState& state) {
    if (state.phase == ConnectionPhase::Discovered) {
        return state.device_count == 1 ? "1 TV Found" : std::to_string(state.device_count) + " TVs Found";
    }
    return phase_name(state.phase);
}

// ==========================================================
// TRANSITION TABLE
// ==========================================================
ConnectionState ConnectionStateMachine::reduce(const ConnectionState& /*current*/, const ConnectionEvent& event) {
    ConnectionState next;
    switch (event.type) {
        case ConnectionEventType::BeginScan:
            next.phase = ConnectionPhase::Scanning;
            break;
        case ConnectionEventType::FoundDevices:
            next.phase = ConnectionPhase::Discovered;
            next.device_count = event.device_count;
            break;
        case ConnectionEventType::BeginPairing:
            next.phase = ConnectionPhase::Pairing;
            next.device_id = event.device_id;
            next.device_name = event.device_name;
            break;
        case ConnectionEventType::DidConnect:
            next.phase = ConnectionPhase::Connected;
            next.device_id = event.device_id;
            next.device_name = event.device_name;
            break;
        case ConnectionEventType::BeginReconnect:
            next.phase = ConnectionPhase::Reconnecting;
            next.device_id = event.device_id;
            next.device_name = event.device_name;
            break;
        case ConnectionEventType::Fail:
            next.phase = ConnectionPhase::Failed;
            next.message = event.message;
            break;
        case ConnectionEventType::Disconnect:
            next.phase = ConnectionPhase::Idle;
            break;
    }
    return next;
}

const ConnectionState& ConnectionStateMachine::apply(const ConnectionEvent& event) {
    const ConnectionState old_state = m_state;
    m_state = reduce(old_state, event);

    if (m_state != old_state) {
        std::string line = std::string("[SessionFSM] ") + state_label(old_state) +
                           " --(" + event_name(event.type) + ")--> " + state_label(m_state);
        if (!m_state.device_name.empty()) {
            line += " device=" + m_state.device_name;
        }
        if (!m_state.message.empty()) {
            line += " reason=" + m_state.message;
        }
        LOG_INFO(line);
    }
    return m_state;
}

} // namespace tvlink
