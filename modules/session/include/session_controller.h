#ifndef TVLINK_SESSION_CONTROLLER_H
#define TVLINK_SESSION_CONTROLLER_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "command.h"
#include "connection_state_machine.h"
#include "execution_gate.h"
#include "latency_tracker.h"
#include "protocol_transport.h"
#include "rate_limiter.h"
#include "reconnect_supervisor.h"
#include "session_dependencies.h"
#include "session_events.h"

namespace tvlink {

enum class ButtonTransportMode {
    SsapSendButton,
    PointerSocket
};

const char* button_transport_label(ButtonTransportMode mode);

struct SessionDiagnostics {
    std::string state_label;
    std::string device_name = "No TV";
    std::string device_ip = "N/A";
    std::optional<int> device_port;
    std::string button_transport;
    int reconnect_attempts = 0;
    int command_retries = 0;
    int ping_failures = 0;
    std::optional<SystemTime> last_auto_recovery_at;
    std::optional<int> last_error_code;
    std::optional<std::string> last_error_message;
    std::optional<std::string> last_error_command;
    std::optional<SystemTime> last_error_at;
    std::vector<std::string> service_names;
    std::vector<std::string> capabilities;
    LatencyStats latency;
};

void to_json(nlohmann::json& j, const SessionDiagnostics& diagnostics);

/**
 * @brief Owns the TV session: discovery results, the current device, the
 * connection state machine and every outbound command.
 *
 * Commands are serialized through the execution gate and the rate limiter. A
 * transient failure of a retry-safe command forces one reconnect and one retry.
 * Transport, discovery, keepalive and network events arrive through the session
 * event queue and are applied on its processing thread.
 *
 * State and device handlers run with the session lock held and must not call
 * back into the controller.
 */
class SessionController {
public:
    using StateHandler = std::function<void(const ConnectionState& state)>;
    using DevicesHandler = std::function<void(const std::vector<Device>& devices)>;

    explicit SessionController(std::shared_ptr<ISessionDependenciesFactory> factory = nullptr);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Starts the event queue and the network monitor.
    void start();
    void shutdown();

    void set_state_handler(StateHandler handler);
    void set_discovered_devices_handler(DevicesHandler handler);
    void set_known_devices_handler(DevicesHandler handler);

    // ---- Discovery ----
    void begin_scan();
    void stop_scan();
    // Applies a discovery publication: persists every sighting, refreshes the
    // known list and reports the count unless connected.
    void update_discovered(const std::vector<Device>& devices);
    std::vector<Device> discovered_devices() const;
    std::vector<Device> known_devices() const;

    // ---- Connection ----
    // Tries the device's endpoints in order; throws the last failure.
    void connect(const Device& device, bool as_reconnection = false);
    // host, host:port, ws://host[:port] or wss://host[:port]. Throws InvalidAddress.
    Device connect_manual(const std::string& address);
    void disconnect();
    void reconnect_to_last_device_if_possible();

    // ---- Commands ----
    void send(const Command& command);
    std::vector<AppShortcut> fetch_launch_apps();
    std::vector<InputSource> fetch_input_sources();
    std::optional<VolumeState> fetch_volume_state();
    bool ping();

    // Empty clears the stored address. Throws InvalidWakeAddress or NoDeviceSelected.
    void update_wake_address(const std::optional<std::string>& mac,
                             const std::optional<std::string>& device_id = std::nullopt);

    // ---- Introspection ----
    ConnectionState state() const;
    std::optional<Device> current_device() const;
    ButtonTransportMode button_mode() const;
    std::set<std::string> service_names() const;
    SessionDiagnostics diagnostics() const;
    nlohmann::json diagnostics_json() const;
    ProtocolTransport& transport() { return *m_transport; }
    ReconnectSupervisor& supervisor() { return m_supervisor; }

    // ---- Events ----
    void post_event(SessionEvent event);
    bool wait_for_idle(std::chrono::milliseconds timeout);

    static std::optional<std::pair<std::string, int>> parse_manual_address(const std::string& address);
    static std::vector<Endpoint> candidate_endpoints(const Device& device);
    // Positive evidence only: a token present adds, a token absent removes.
    static std::set<Capability> infer_capabilities(const std::set<std::string>& service_names,
                                                   const std::set<Capability>& fallback);

private:
    struct SessionTicket {
        CancellationToken token;
        uint64_t generation = 0;
    };

    struct LastError {
        std::optional<int> code;
        std::string message;
        std::optional<std::string> command_key;
        SystemTime at;
    };

    SessionTicket begin_session();
    bool is_current_generation(uint64_t generation) const;

    void pair(std::chrono::milliseconds timeout);

    void send_command(const Command& command);
    void send_button(const std::string& name);
    bool current_mute_state();
    void power_on_via_wake();
    bool should_retry(const Command& command, const TvLinkError& error) const;
    void recover_connection_for_retry(const Device& device);
    // Records the failure, downgrades an assumed capability, and returns what to throw.
    TvLinkError command_failure(const Command& command, const Device& device, const TvLinkError& error);
    void mark_capability_unsupported(Capability capability, const std::string& device_id);

    void start_post_connect(const Device& device, uint64_t generation);
    void hydrate(const Device& device, uint64_t generation, CancellationToken token);
    void warm_up_pointer(const Device& device, uint64_t generation, CancellationToken token);
    void start_keepalive(uint64_t generation);
    KeepaliveOutcome keepalive_probe(uint64_t generation);

    void schedule_reconnect_with_backoff();
    void schedule_reconnect(std::chrono::milliseconds delay);
    std::optional<Device> reconnect_candidate();
    bool has_live_connection() const;

    void handle_event(const SessionEvent& event);
    void on_transport_disconnected(const TransportDisconnectedEvent& event);
    void on_pairing_prompt(const PairingPromptEvent& event);
    void on_reachability_changed(const NetworkReachabilityChangedEvent& event);
    void on_keepalive_exhausted(const KeepaliveExhaustedEvent& event);
    void on_discovery_failed(const DiscoveryFailedEvent& event);

    void apply_locked(const ConnectionEvent& event);
    void reload_known_devices();
    void record_command_error(const std::string& message, const std::optional<std::string>& command_key);

    std::shared_ptr<ISessionDependenciesFactory> m_factory;
    std::shared_ptr<AddressProbe> m_probe;
    std::shared_ptr<SecretStore> m_secrets;
    std::shared_ptr<KnownDevicesStore> m_known_store;
    std::shared_ptr<WakeOnLanSender> m_wake_sender;
    std::unique_ptr<ProtocolTransport> m_transport;
    std::unique_ptr<DiscoveryEngine> m_discovery;
    std::unique_ptr<NetworkMonitor> m_network_monitor;

    mutable std::mutex m_mutex;
    ConnectionStateMachine m_state_machine;
    std::optional<Device> m_current_device;
    std::optional<Device> m_pending_pair_device;
    std::vector<Device> m_discovered;
    std::vector<Device> m_known;
    std::set<std::string> m_service_names;
    ButtonTransportMode m_button_mode = ButtonTransportMode::SsapSendButton;
    bool m_suppress_next_disconnect_failure = false;
    std::optional<LastError> m_last_error;
    std::optional<SystemTime> m_last_auto_recovery_at;
    int m_reconnect_attempts_total = 0;
    int m_command_retry_count = 0;
    int m_ping_failure_count = 0;
    std::chrono::steady_clock::time_point m_last_command_dispatch{};
    CancellationSource m_connect_cancel;
    uint64_t m_generation = 0;

    StateHandler m_state_handler;
    DevicesHandler m_discovered_handler;
    DevicesHandler m_known_handler;

    std::mutex m_connect_mutex;
    std::atomic<int> m_connecting{0};

    ExecutionGate m_gate;
    RateLimiter m_limiter;
    LatencyTracker m_latency;
    ReconnectSupervisor m_supervisor;
    TaskSlot m_hydration;
    TaskSlot m_warmup;
    SessionEventQueue m_events;
    std::atomic<bool> m_started{false};
};

} // namespace tvlink

#endif // TVLINK_SESSION_CONTROLLER_H
