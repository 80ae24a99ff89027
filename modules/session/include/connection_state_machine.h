#ifndef TVLINK_CONNECTION_STATE_MACHINE_H
#define TVLINK_CONNECTION_STATE_MACHINE_H

#include <string>

#include "device.h"

namespace tvlink {

// =======================================================
// Connection phases (exactly one active)
// =======================================================
enum class ConnectionPhase {
    Idle,
    Scanning,
    Discovered,
    Pairing,
    Connected,
    Reconnecting,
    Failed
};

enum class ConnectionEventType {
    BeginScan,
    FoundDevices,
    BeginPairing,
    DidConnect,
    BeginReconnect,
    Fail,
    Disconnect
};

struct ConnectionEvent {
    ConnectionEventType type = ConnectionEventType::Disconnect;
    int device_count = 0;
    std::string device_id;
    std::string device_name;
    std::string message;

    static ConnectionEvent begin_scan();
    static ConnectionEvent found_devices(int count);
    static ConnectionEvent begin_pairing(const Device& device);
    static ConnectionEvent did_connect(const Device& device);
    static ConnectionEvent begin_reconnect(const Device& device);
    static ConnectionEvent fail(const std::string& message);
    static ConnectionEvent disconnect();
};

struct ConnectionState {
    ConnectionPhase phase = ConnectionPhase::Idle;
    int device_count = 0;       // Discovered
    std::string device_id;      // Pairing, Connected, Reconnecting
    std::string device_name;
    std::string message;        // Failed
};

bool operator==(const ConnectionState& lhs, const ConnectionState& rhs);
bool operator!=(const ConnectionState& lhs, const ConnectionState& rhs);

const char* phase_name(ConnectionPhase phase);
const char* event_name(ConnectionEventType type);

// Short UI label: "Idle", "1 TV Found", "3 TVs Found", "Connected", ...
std::string state_label(const ConnectionState& state);

// =======================================================
// The SessionController owns the only instance and is the only writer.
// =======================================================
class ConnectionStateMachine {
public:
    // Pure and total: the next state is a function of the event alone.
    static ConnectionState reduce(const ConnectionState& current, const ConnectionEvent& event);

    // Reduces, stores and logs the transition.
    const ConnectionState& apply(const ConnectionEvent& event);

    const ConnectionState& state() const { return m_state; }
    bool is_connected() const { return m_state.phase == ConnectionPhase::Connected; }

private:
    ConnectionState m_state;
};

} // namespace tvlink

#endif // TVLINK_CONNECTION_STATE_MACHINE_H
