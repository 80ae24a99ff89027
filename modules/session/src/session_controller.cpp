#include "session_controller.h"
#include "config_manager.h"
#include "logger.h"
#include "string_utils.h"
#include "telemetry.h"

#include <algorithm>

namespace tvlink {

namespace {

namespace uri {
constexpr const char* kVolumeUp = "ssap://audio/volumeUp";
constexpr const char* kVolumeDown = "ssap://audio/volumeDown";
constexpr const char* kSetVolume = "ssap://audio/setVolume";
constexpr const char* kGetVolume = "ssap://audio/getVolume";
constexpr const char* kSetMute = "ssap://audio/setMute";
constexpr const char* kTurnOff = "ssap://system/turnOff";
constexpr const char* kLaunch = "ssap://system.launcher/launch";
constexpr const char* kListLaunchPoints = "ssap://com.webos.applicationManager/listLaunchPoints";
constexpr const char* kSwitchInput = "ssap://tv/switchInput";
constexpr const char* kExternalInputList = "ssap://tv/getExternalInputList";
constexpr const char* kInsertText = "ssap://com.webos.service.ime/insertText";
constexpr const char* kSendButton = "ssap://com.webos.service.networkinput/sendButton";
constexpr const char* kServiceList = "ssap://api/getServiceList";
} // namespace uri

constexpr const char* kConnectionLost = "Connection to the TV was lost.";
constexpr const char* kConnectionFailed = "TV connection failed.";

std::chrono::milliseconds ms(int value) {
    return std::chrono::milliseconds(value);
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

bool any_service_contains(const std::set<std::string>& names, std::initializer_list<const char*> tokens) {
    for (const auto& name : names) {
        if (contains_any(name, tokens)) {
            return true;
        }
    }
    return false;
}

void toggle_capability(std::set<Capability>& caps, bool present, std::initializer_list<Capability> which) {
    for (Capability c : which) {
        if (present) {
            caps.insert(c);
        } else {
            caps.erase(c);
        }
    }
}

nlohmann::json optional_time(const std::optional<SystemTime>& t) {
    return t ? nlohmann::json(to_epoch_ms(*t)) : nlohmann::json(nullptr);
}

} // namespace

const char* button_transport_label(ButtonTransportMode mode) {
    return mode == ButtonTransportMode::PointerSocket ? "Pointer socket" : "SSAP sendButton";
}

void to_json(nlohmann::json& j, const SessionDiagnostics& d) {
    j = nlohmann::json{
        {"state", d.state_label},
        {"deviceName", d.device_name},
        {"deviceIP", d.device_ip},
        {"devicePort", d.device_port ? nlohmann::json(*d.device_port) : nlohmann::json(nullptr)},
        {"buttonTransport", d.button_transport},
        {"reconnectAttempts", d.reconnect_attempts},
        {"commandRetries", d.command_retries},
        {"pingFailures", d.ping_failures},
        {"lastAutoRecoveryAt", optional_time(d.last_auto_recovery_at)},
        {"lastErrorCode", d.last_error_code ? nlohmann::json(*d.last_error_code) : nlohmann::json(nullptr)},
        {"lastErrorMessage", d.last_error_message ? nlohmann::json(*d.last_error_message) : nlohmann::json(nullptr)},
        {"lastErrorCommand", d.last_error_command ? nlohmann::json(*d.last_error_command) : nlohmann::json(nullptr)},
        {"lastErrorAt", optional_time(d.last_error_at)},
        {"serviceNames", d.service_names},
        {"capabilities", d.capabilities},
        {"latency", d.latency},
    };
}

// =======================================================
// Construction / lifecycle
// =======================================================

SessionController::SessionController(std::shared_ptr<ISessionDependenciesFactory> factory)
    : m_factory(factory ? factory : std::make_shared<DefaultSessionDependenciesFactory>()) {
    m_probe = m_factory->createAddressProbe();
    m_secrets = m_factory->createSecretStore();
    m_known_store = m_factory->createKnownDevicesStore();
    m_wake_sender = m_factory->createWakeOnLanSender();
    m_transport = std::make_unique<ProtocolTransport>(m_factory->createChannelFactory());
    m_discovery = m_factory->createDiscoveryEngine();
    m_network_monitor = m_factory->createNetworkMonitor();

    m_transport->set_pairing_prompt_handler([this] {
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            generation = m_generation;
        }
        post_event(PairingPromptEvent{generation});
    });
    m_transport->set_disconnect_handler([this](const std::optional<std::string>& reason) {
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            generation = m_generation;
        }
        post_event(TransportDisconnectedEvent{generation, reason});
    });

    if (m_discovery) {
        m_discovery->set_devices_handler([this](const std::vector<Device>& devices) {
            post_event(DevicesDiscoveredEvent{devices});
        });
        m_discovery->set_failure_handler([this](const TvLinkError& error) {
            post_event(DiscoveryFailedEvent{error.code(), error.what()});
        });
    }

    m_known = m_known_store->load();
}

SessionController::~SessionController() {
    shutdown();
}

void SessionController::start() {
    if (m_started.exchange(true)) {
        return;
    }
    m_events.startEventProcessing([this](const SessionEvent& event) { handle_event(event); });
    if (m_network_monitor) {
        m_network_monitor->start([this](bool reachable) {
            post_event(NetworkReachabilityChangedEvent{reachable});
        });
    }
    LOG_INFO("[Session] Started");
}

void SessionController::shutdown() {
    const bool was_started = m_started.exchange(false);
    if (m_network_monitor) {
        m_network_monitor->stop();
    }
    if (m_discovery) {
        m_discovery->stop();
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connect_cancel.cancel();
        ++m_generation;
    }
    m_supervisor.shutdown();
    m_hydration.shutdown();
    m_warmup.shutdown();
    m_events.stopEventProcessing();
    m_transport->disconnect(false);
    if (was_started) {
        LOG_INFO("[Session] Stopped");
    }
}

void SessionController::set_state_handler(StateHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state_handler = std::move(handler);
}

void SessionController::set_discovered_devices_handler(DevicesHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_discovered_handler = std::move(handler);
}

void SessionController::set_known_devices_handler(DevicesHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_known_handler = std::move(handler);
}

void SessionController::apply_locked(const ConnectionEvent& event) {
    const ConnectionState previous = m_state_machine.state();
    const ConnectionState& next = m_state_machine.apply(event);
    if (next != previous && m_state_handler) {
        m_state_handler(next);
    }
}

void SessionController::reload_known_devices() {
    auto devices = m_known_store->load();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_known = std::move(devices);
    if (m_known_handler) {
        m_known_handler(m_known);
    }
}

void SessionController::record_command_error(const std::string& message,
                                             const std::optional<std::string>& command_key) {
    LastError error;
    error.message = trim(message);
    error.code = extract_status_code(error.message);
    error.command_key = command_key;
    error.at = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_error = std::move(error);
}

// =======================================================
// Discovery
// =======================================================

void SessionController::begin_scan() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_state_machine.is_connected()) {
            apply_locked(ConnectionEvent::begin_scan());
        }
        m_discovered.clear();
    }
    if (m_discovery) {
        m_discovery->start();
    }
}

void SessionController::stop_scan() {
    if (m_discovery) {
        m_discovery->stop();
    }
}

void SessionController::update_discovered(const std::vector<Device>& devices) {
    for (const auto& device : devices) {
        m_known_store->upsert(device);
    }
    reload_known_devices();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_discovered = devices;
    if (m_discovered_handler) {
        m_discovered_handler(m_discovered);
    }
    if (m_state_machine.is_connected()) {
        return;
    }
    // The empty list published when a scan starts keeps the scanning state.
    if (devices.empty() && m_state_machine.state().phase == ConnectionPhase::Scanning) {
        return;
    }
    apply_locked(ConnectionEvent::found_devices(static_cast<int>(devices.size())));
}

std::vector<Device> SessionController::discovered_devices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_discovered;
}

std::vector<Device> SessionController::known_devices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_known;
}

// =======================================================
// Connection
// =======================================================

std::vector<Endpoint> SessionController::candidate_endpoints(const Device& device) {
    std::vector<Endpoint> out;
    auto add = [&](int port, bool secure) {
        for (const auto& existing : out) {
            if (existing.port == port && existing.secure == secure) {
                return;
            }
        }
        Endpoint endpoint;
        endpoint.host = device.host;
        endpoint.port = port;
        endpoint.secure = secure;
        out.push_back(endpoint);
    };
    add(device.port, device.port == 3001);
    add(3000, false);
    add(3001, true);
    return out;
}

std::optional<std::pair<std::string, int>> SessionController::parse_manual_address(const std::string& address) {
    const std::string trimmed = trim(address);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    const std::string with_scheme = trimmed.find("://") != std::string::npos ? trimmed : "ws://" + trimmed;
    const auto endpoint = parse_socket_url(with_scheme);
    if (!endpoint || endpoint->host.empty()) {
        return std::nullopt;
    }
    return std::make_pair(endpoint->host, endpoint->port);
}

SessionController::SessionTicket SessionController::begin_session() {
    m_supervisor.cancel_pending();
    m_supervisor.stop_keepalive();
    m_hydration.cancel();
    m_warmup.cancel();

    SessionTicket ticket;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connect_cancel.cancel();
        m_connect_cancel = CancellationSource();
        ++m_generation;
        m_button_mode = ButtonTransportMode::SsapSendButton;
        m_service_names.clear();
        ticket = SessionTicket{m_connect_cancel.token(), m_generation};
    }
    // Fails a registration still waiting on the superseded connect so it
    // releases the connect lock now instead of at its pairing timeout.
    m_transport->disconnect(false);
    return ticket;
}

bool SessionController::is_current_generation(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation == generation;
}

void SessionController::connect(const Device& device, bool as_reconnection) {
    const SessionTicket ticket = begin_session();
    std::lock_guard<std::mutex> connect_lock(m_connect_mutex);
    ticket.token.throw_if_cancelled();

    struct ConnectingScope {
        std::atomic<int>& counter;
        explicit ConnectingScope(std::atomic<int>& c) : counter(c) { ++counter; }
        ~ConnectingScope() { --counter; }
    } connecting(m_connecting);

    const auto& config = ConfigManager::getInstance();
    const auto started = std::chrono::steady_clock::now();
    auto& telemetry = Telemetry::getInstance();
    telemetry.inc_counter("session.connect_attempts");

    bool mark_auto_recovery = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (as_reconnection) {
            ++m_reconnect_attempts_total;
        }
    }
    if (as_reconnection) {
        telemetry.inc_counter("session.reconnect_attempts");
    }
    mark_auto_recovery = m_supervisor.take_auto_recovery_mark() && as_reconnection;

    LOG_INFO("[Session] Connecting to " + device.name + " (" + device.host + ":" + std::to_string(device.port) + ")" +
             (as_reconnection ? " as reconnection" : ""));

    TvLinkError last_error(ErrorCode::NetworkFailure, kConnectionFailed);
    for (const auto& endpoint : candidate_endpoints(device)) {
        ticket.token.throw_if_cancelled();

        if (as_reconnection && endpoint.port != device.port &&
            !m_probe->probe(device.host, endpoint.port, ms(config.getFallbackProbeTimeoutMs()))) {
            LOG_DEBUG("[Session] Skipping unreachable fallback port " + std::to_string(endpoint.port));
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_generation != ticket.generation) {
                throw TvLinkError(ErrorCode::Cancelled);
            }
            m_pending_pair_device = device;
            apply_locked(as_reconnection ? ConnectionEvent::begin_reconnect(device)
                                         : ConnectionEvent::begin_pairing(device));
        }

        try {
            m_transport->connect(device.host, endpoint.port, endpoint.secure);
            ticket.token.throw_if_cancelled();
            pair(ms(as_reconnection ? config.getReconnectRegistrationTimeoutMs()
                                    : config.getPairingRegistrationTimeoutMs()));
            ticket.token.throw_if_cancelled();

            Device connected = device;
            connected.port = endpoint.port;
            connected.last_connected_at = std::chrono::system_clock::now();
            connected = m_known_store->mark_connected(connected);
            reload_known_devices();

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_generation != ticket.generation) {
                    throw TvLinkError(ErrorCode::Cancelled);
                }
                m_current_device = connected;
                m_pending_pair_device.reset();
                if (mark_auto_recovery) {
                    m_last_auto_recovery_at = std::chrono::system_clock::now();
                }
                apply_locked(ConnectionEvent::did_connect(connected));
            }
            m_supervisor.reset_attempts();

            telemetry.inc_counter("session.connect_success");
            telemetry.observe_hist_ms("session.connect_ms", elapsed_ms(started));
            LOG_INFO("[Session] Connected to " + connected.name + " on port " + std::to_string(endpoint.port) +
                     (endpoint.secure ? " (wss)" : " (ws)"));

            start_post_connect(connected, ticket.generation);
            start_keepalive(ticket.generation);
            return;
        } catch (const TvLinkError& e) {
            if (e.code() == ErrorCode::Cancelled || ticket.token.is_cancelled()) {
                LOG_DEBUG("[Session] Connect to " + device.host + " cancelled");
                throw TvLinkError(ErrorCode::Cancelled);
            }
            last_error = e;
            record_command_error(e.what(), std::nullopt);
            m_transport->disconnect(false);
            LOG_WARN("[Session] Endpoint " + endpoint.url() + " failed: " + e.what());
            if (is_explicit_rejection(e.what())) {
                break;
            }
        }
    }

    bool had_device = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_generation != ticket.generation) {
            throw TvLinkError(ErrorCode::Cancelled);
        }
        m_pending_pair_device.reset();
        had_device = m_current_device.has_value();
        apply_locked(ConnectionEvent::fail(last_error.what()));
    }
    if (as_reconnection || had_device) {
        schedule_reconnect_with_backoff();
    }
    throw last_error;
}

void SessionController::pair(std::chrono::milliseconds timeout) {
    std::optional<Device> device;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        device = m_pending_pair_device ? m_pending_pair_device : m_current_device;
    }
    if (!device) {
        throw TvLinkError(ErrorCode::NoDeviceSelected);
    }

    const std::string slot = client_key_slot(device->id);
    const std::optional<std::string> existing_key = m_secrets->get(slot);

    auto store_key = [&](const std::string& key) {
        if (!key.empty() && !m_secrets->set(slot, key)) {
            LOG_WARN("[Session] Could not store the client key for " + device->id);
        }
    };

    try {
        store_key(m_transport->register_client(existing_key, timeout));
        return;
    } catch (const TvLinkError& e) {
        if (e.code() == ErrorCode::Cancelled) {
            throw;
        }
        if (!existing_key || !should_retry_pairing_without_credential(e.what())) {
            throw TvLinkError(ErrorCode::PairingFailed, e.what());
        }
        LOG_WARN("[Session] Stored client key rejected (" + std::string(e.what()) + "), pairing again");
    }

    m_secrets->remove(slot);
    try {
        store_key(m_transport->register_client(std::nullopt, timeout));
    } catch (const TvLinkError& e) {
        if (e.code() == ErrorCode::Cancelled) {
            throw;
        }
        throw TvLinkError(ErrorCode::PairingFailed, e.what());
    }
}

Device SessionController::connect_manual(const std::string& address) {
    const auto parsed = parse_manual_address(address);
    if (!parsed) {
        throw TvLinkError(ErrorCode::InvalidAddress, address);
    }
    connect(make_manual_device(parsed->first, parsed->second), false);
    auto device = current_device();
    if (!device) {
        throw TvLinkError(ErrorCode::NotConnected);
    }
    return *device;
}

void SessionController::disconnect() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connect_cancel.cancel();
        ++m_generation;
    }
    m_hydration.cancel();
    m_warmup.cancel();
    m_supervisor.stop_keepalive();
    m_supervisor.cancel_pending();
    m_supervisor.reset_attempts();
    m_supervisor.mark_next_as_auto_recovery(false);

    m_transport->disconnect(false);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_button_mode = ButtonTransportMode::SsapSendButton;
        m_service_names.clear();
        m_current_device.reset();
        m_pending_pair_device.reset();
        apply_locked(ConnectionEvent::disconnect());
    }
    m_limiter.reset();
    LOG_INFO("[Session] Disconnected");
}

std::optional<Device> SessionController::reconnect_candidate() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_current_device) {
            return m_current_device;
        }
    }
    return m_known_store->last_connected_device();
}

bool SessionController::has_live_connection() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state_machine.is_connected() && m_transport->is_connected();
}

void SessionController::reconnect_to_last_device_if_possible() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state_machine.is_connected() && m_transport->is_connected()) {
            return;
        }
    }
    const auto candidate = reconnect_candidate();
    if (!candidate) {
        LOG_DEBUG("[Reconnect] No previous TV to reconnect to");
        return;
    }
    m_supervisor.mark_next_as_auto_recovery(true);
    try {
        connect(*candidate, true);
    } catch (const TvLinkError& e) {
        if (e.code() == ErrorCode::Cancelled) {
            LOG_DEBUG("[Reconnect] Reconnect cancelled");
            return;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        apply_locked(ConnectionEvent::fail(e.what()));
    }
}

void SessionController::schedule_reconnect_with_backoff() {
    if (!m_supervisor.is_reachable()) {
        LOG_DEBUG("[Reconnect] Network unreachable, not scheduling");
        return;
    }
    if (!reconnect_candidate()) {
        return;
    }
    schedule_reconnect(m_supervisor.next_backoff_delay());
}

void SessionController::schedule_reconnect(std::chrono::milliseconds delay) {
    if (!m_supervisor.is_reachable() || has_live_connection() || !reconnect_candidate()) {
        return;
    }
    m_supervisor.schedule(delay, [this](CancellationToken token) {
        if (token.is_cancelled() || has_live_connection()) {
            return;
        }
        const auto candidate = reconnect_candidate();
        if (!candidate) {
            return;
        }
        m_supervisor.mark_next_as_auto_recovery(true);
        try {
            connect(*candidate, true);
        } catch (const TvLinkError& e) {
            if (e.code() == ErrorCode::Cancelled) {
                LOG_DEBUG("[Reconnect] Attempt cancelled");
                return;
            }
            LOG_WARN("[Reconnect] Attempt failed: " + std::string(e.what()));
            std::lock_guard<std::mutex> lock(m_mutex);
            apply_locked(ConnectionEvent::fail(e.what()));
        }
    });
}

// =======================================================
// Post-connect work
// =======================================================

std::set<Capability> SessionController::infer_capabilities(const std::set<std::string>& names,
                                                           const std::set<Capability>& fallback) {
    if (names.empty()) {
        return fallback;
    }
    std::set<Capability> caps = fallback;
    toggle_capability(caps, any_service_contains(names, {"audio"}), {Capability::Volume, Capability::Mute});
    toggle_capability(caps, any_service_contains(names, {"launcher", "applicationmanager"}), {Capability::LaunchApp});
    toggle_capability(caps, any_service_contains(names, {"tv", "broadcast"}), {Capability::InputSwitch});
    toggle_capability(caps, any_service_contains(names, {"ime"}), {Capability::Keyboard});
    toggle_capability(caps, any_service_contains(names, {"system"}), {Capability::Power});
    return caps;
}

void SessionController::start_post_connect(const Device& device, uint64_t generation) {
    m_hydration.start([this, device, generation](CancellationToken token) { hydrate(device, generation, token); });
    m_warmup.start([this, device, generation](CancellationToken token) { warm_up_pointer(device, generation, token); });
}

void SessionController::hydrate(const Device& device, uint64_t generation, CancellationToken token) {
    const auto& config = ConfigManager::getInstance();
    Device hydrated = device;

    std::optional<std::set<std::string>> names;
    try {
        names = ResponseDecoder::service_names(
            m_transport->request(uri::kServiceList, std::nullopt, ms(config.getStateQueryTimeoutMs())));
    } catch (const TvLinkError& e) {
        LOG_DEBUG("[Session] Service list unavailable: " + std::string(e.what()));
    }
    if (token.is_cancelled() || !is_current_generation(generation)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (names) {
            m_service_names = *names;
        } else {
            m_service_names.clear();
        }
    }
    if (names && !names->empty()) {
        hydrated.capabilities = infer_capabilities(*names, hydrated.capabilities);
    }

    try {
        const auto apps = ResponseDecoder::launch_apps(
            m_transport->request(uri::kListLaunchPoints, std::nullopt, ms(config.getLaunchDataTimeoutMs())));
        if (!apps.empty()) {
            hydrated.capabilities.insert(Capability::LaunchApp);
        }
    } catch (const TvLinkError& e) {
        LOG_DEBUG("[Session] Launch points unavailable: " + std::string(e.what()));
    }
    if (token.is_cancelled()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_generation != generation || !m_current_device || m_current_device->id != device.id) {
            return;
        }
        hydrated.port = m_current_device->port;
        hydrated.last_connected_at = m_current_device->last_connected_at;
        hydrated.wake_mac = m_current_device->wake_mac;
        m_current_device = hydrated;
    }
    hydrated = m_known_store->mark_connected(hydrated);
    reload_known_devices();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_generation != generation) {
        return;
    }
    m_current_device = hydrated;
    if (m_state_machine.is_connected()) {
        apply_locked(ConnectionEvent::did_connect(hydrated));
    }
    LOG_INFO("[Session] Capabilities for " + hydrated.name + ": " + describe_capabilities(hydrated.capabilities));
}

void SessionController::warm_up_pointer(const Device& device, uint64_t generation, CancellationToken token) {
    bool ready = false;
    try {
        m_transport->prewarm_pointer_socket();
        ready = true;
    } catch (const TvLinkError& e) {
        LOG_DEBUG("[Session] Pointer socket warmup failed: " + std::string(e.what()));
    }
    if (token.is_cancelled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_generation != generation || !m_current_device || m_current_device->id != device.id) {
        return;
    }
    m_button_mode = ready ? ButtonTransportMode::PointerSocket : ButtonTransportMode::SsapSendButton;
}

void SessionController::start_keepalive(uint64_t generation) {
    m_supervisor.start_keepalive(
        [this, generation](CancellationToken) { return keepalive_probe(generation); },
        [this, generation] { post_event(KeepaliveExhaustedEvent{generation}); });
}

KeepaliveOutcome SessionController::keepalive_probe(uint64_t generation) {
    const auto& config = ConfigManager::getInstance();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_generation != generation || !m_state_machine.is_connected() || !m_current_device) {
            return KeepaliveOutcome::Idle;
        }
        const auto since_command = std::chrono::steady_clock::now() - m_last_command_dispatch;
        if (since_command < ms(config.getKeepaliveGraceMs())) {
            return KeepaliveOutcome::Skipped;
        }
    }
    if (m_transport->send_ping(ms(config.getKeepaliveTimeoutMs()))) {
        return KeepaliveOutcome::Healthy;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_ping_failure_count;
    return KeepaliveOutcome::Failed;
}

// =======================================================
// Commands
// =======================================================

void SessionController::send(const Command& command) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last_command_dispatch = std::chrono::steady_clock::now();
    }
    const std::string key = rate_limit_key(command);

    m_gate.run([&] {
        const auto started = std::chrono::steady_clock::now();
        try {
            if (command.kind == CommandKind::PowerOn) {
                power_on_via_wake();
            } else {
                std::optional<Device> device = current_device();
                if (!device) {
                    throw TvLinkError(ErrorCode::NotConnected);
                }
                const auto capability = required_capability(command);
                if (capability && !device->has(*capability)) {
                    throw TvLinkError(ErrorCode::CommandUnsupported);
                }

                m_limiter.wait(command);
                uint64_t generation = 0;
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    generation = m_generation;
                }
                try {
                    send_command(command);
                } catch (const TvLinkError& first) {
                    if (!should_retry(command, first)) {
                        throw command_failure(command, *device, first);
                    }
                    if (!is_current_generation(generation) || !current_device()) {
                        LOG_DEBUG("[Session] " + key + " interrupted by a session change, not retrying");
                        throw TvLinkError(ErrorCode::Cancelled);
                    }
                    LOG_WARN("[Session] " + key + " failed (" + first.what() + "), reconnecting for one retry");
                    recover_connection_for_retry(*device);
                    try {
                        send_command(command);
                    } catch (const TvLinkError& second) {
                        throw command_failure(command, *device, second);
                    }
                }
            }
            const auto latency = std::chrono::milliseconds(elapsed_ms(started));
            m_latency.record(key, latency, true, false);
            Telemetry::getInstance().observe_hist_ms("session.command_latency_ms", latency.count());
        } catch (const TvLinkError& e) {
            const bool timed_out = e.code() == ErrorCode::RequestTimedOut || is_timeout_error(e.what());
            m_latency.record(key, std::chrono::milliseconds(elapsed_ms(started)), false, timed_out);
            throw;
        }
    });
}

bool SessionController::should_retry(const Command& command, const TvLinkError& error) const {
    if (!is_safe_for_retry(command) || is_unsupported_method_error(error.what())) {
        return false;
    }
    switch (error.code()) {
        case ErrorCode::NotConnected:
        case ErrorCode::RequestTimedOut:
            return true;
        default:
            return is_transient_error(error.what());
    }
}

void SessionController::recover_connection_for_retry(const Device& device) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_command_retry_count;
    }
    Telemetry::getInstance().inc_counter("session.command_retries");
    m_supervisor.mark_next_as_auto_recovery(true);
    m_transport->disconnect(false);
    connect(device, true);
}

TvLinkError SessionController::command_failure(const Command& command, const Device& device,
                                               const TvLinkError& error) {
    record_command_error(error.what(), rate_limit_key(command));
    const auto capability = required_capability(command);
    if (capability && device.has(*capability) && is_unsupported_method_error(error.what())) {
        LOG_WARN("[Session] " + std::string(capability_name(*capability)) + " unsupported on " + device.name +
                 ": " + error.what());
        mark_capability_unsupported(*capability, device.id);
        return TvLinkError(ErrorCode::CommandUnsupported);
    }
    return error;
}

void SessionController::mark_capability_unsupported(Capability capability, const std::string& device_id) {
    Device updated;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_current_device || m_current_device->id != device_id) {
            return;
        }
        if (m_current_device->capabilities.erase(capability) == 0) {
            return;
        }
        updated = *m_current_device;
    }
    m_known_store->upsert(updated);
    reload_known_devices();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state_machine.is_connected()) {
        apply_locked(ConnectionEvent::did_connect(updated));
    }
}

void SessionController::send_command(const Command& command) {
    const auto& config = ConfigManager::getInstance();
    const auto control = ms(config.getControlCommandTimeoutMs());
    const auto state_query = ms(config.getStateQueryTimeoutMs());

    if (auto button = button_name(command)) {
        send_button(*button);
        return;
    }

    switch (command.kind) {
        case CommandKind::VolumeUp:
            m_transport->request(uri::kVolumeUp, std::nullopt, control);
            break;
        case CommandKind::VolumeDown:
            m_transport->request(uri::kVolumeDown, std::nullopt, control);
            break;
        case CommandKind::SetVolume:
            m_transport->request(uri::kSetVolume, json{{"volume", std::min(100, std::max(0, command.level))}}, control);
            break;
        case CommandKind::Mute: {
            const bool muted = command.mute ? *command.mute : !current_mute_state();
            m_transport->request(uri::kSetMute, json{{"mute", muted}}, control);
            break;
        }
        case CommandKind::PowerOff: {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_suppress_next_disconnect_failure = true;
            }
            try {
                m_transport->request(uri::kTurnOff, std::nullopt, state_query);
            } catch (const TvLinkError&) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_suppress_next_disconnect_failure = false;
                throw;
            }
            break;
        }
        case CommandKind::LaunchApp:
            m_transport->request(uri::kLaunch, json{{"id", command.argument}}, ms(config.getLaunchDataTimeoutMs()));
            break;
        case CommandKind::InputSwitch:
            m_transport->request(uri::kSwitchInput, json{{"inputId", command.argument}}, state_query);
            break;
        case CommandKind::KeyboardText:
            m_transport->request(uri::kInsertText, json{{"text", command.argument}, {"replace", 0}}, control);
            break;
        case CommandKind::PowerOn:
            power_on_via_wake();
            break;
        default:
            throw TvLinkError(ErrorCode::CommandUnsupported);
    }
}

void SessionController::send_button(const std::string& name) {
    if (button_mode() == ButtonTransportMode::PointerSocket) {
        m_transport->send_pointer_button(name);
        return;
    }
    try {
        m_transport->request(uri::kSendButton, json{{"name", name}},
                             ms(ConfigManager::getInstance().getControlCommandTimeoutMs()));
    } catch (const TvLinkError& e) {
        if (!should_fallback_to_pointer(e.what())) {
            throw;
        }
        LOG_INFO("[Session] sendButton unavailable (" + std::string(e.what()) + "), switching to pointer socket");
        m_transport->send_pointer_button(name);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_button_mode = ButtonTransportMode::PointerSocket;
    }
}

bool SessionController::current_mute_state() {
    try {
        const auto state = ResponseDecoder::volume_state(m_transport->request(
            uri::kGetVolume, std::nullopt, ms(ConfigManager::getInstance().getStateQueryTimeoutMs())));
        if (state) {
            return state->muted;
        }
    } catch (const TvLinkError& e) {
        LOG_DEBUG("[Session] Volume state unavailable for mute toggle: " + std::string(e.what()));
    }
    // Unknown state: treat as unmuted so the toggle mutes.
    return false;
}

void SessionController::power_on_via_wake() {
    const auto last_known = m_known_store->last_connected_device();
    std::optional<Device> preferred = current_device();
    if (!preferred) {
        preferred = last_known;
    }
    if (!preferred) {
        throw TvLinkError(ErrorCode::NoDeviceSelected);
    }

    std::optional<std::string> mac = preferred->wake_mac;
    if (!mac) {
        if (auto stored = m_known_store->find(preferred->id)) {
            mac = stored->wake_mac;
        }
    }
    if (!mac && last_known) {
        mac = last_known->wake_mac;
    }
    const auto normalized = mac ? normalize_mac_address(*mac) : std::nullopt;
    if (!normalized) {
        throw TvLinkError(ErrorCode::InvalidWakeAddress);
    }
    m_wake_sender->send(*normalized, preferred->host);
}

void SessionController::update_wake_address(const std::optional<std::string>& mac,
                                            const std::optional<std::string>& device_id) {
    std::optional<std::string> target = device_id;
    if (!target) {
        if (auto current = current_device()) {
            target = current->id;
        } else if (auto last = m_known_store->last_connected_device()) {
            target = last->id;
        }
    }
    if (!target) {
        throw TvLinkError(ErrorCode::NoDeviceSelected);
    }

    const std::string trimmed = mac ? trim(*mac) : std::string();
    std::optional<std::string> normalized;
    if (!trimmed.empty()) {
        normalized = normalize_mac_address(trimmed);
        if (!normalized) {
            throw TvLinkError(ErrorCode::InvalidWakeAddress, trimmed);
        }
    }

    auto devices = m_known_store->load();
    auto it = std::find_if(devices.begin(), devices.end(), [&](const Device& d) { return d.id == *target; });
    if (it == devices.end()) {
        throw TvLinkError(ErrorCode::NoDeviceSelected);
    }
    it->wake_mac = normalized;
    if (!m_known_store->save(devices)) {
        LOG_WARN("[Session] Wake address for " + *target + " was not persisted");
    }
    reload_known_devices();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current_device && m_current_device->id == *target) {
        m_current_device->wake_mac = normalized;
    }
    LOG_INFO("[WoL] Wake address for " + *target + (normalized ? " set to " + *normalized : " cleared"));
}

std::vector<AppShortcut> SessionController::fetch_launch_apps() {
    if (!current_device()) {
        return {};
    }
    try {
        return ResponseDecoder::launch_apps(m_transport->request(
            uri::kListLaunchPoints, std::nullopt, ms(ConfigManager::getInstance().getLaunchDataTimeoutMs())));
    } catch (const TvLinkError& e) {
        LOG_DEBUG("[Session] Launch apps unavailable: " + std::string(e.what()));
        return {};
    }
}

std::vector<InputSource> SessionController::fetch_input_sources() {
    if (!current_device()) {
        return {};
    }
    try {
        return ResponseDecoder::input_sources(m_transport->request(
            uri::kExternalInputList, std::nullopt, ms(ConfigManager::getInstance().getStateQueryTimeoutMs())));
    } catch (const TvLinkError& e) {
        LOG_DEBUG("[Session] Input sources unavailable: " + std::string(e.what()));
        return {};
    }
}

std::optional<VolumeState> SessionController::fetch_volume_state() {
    if (!current_device()) {
        return std::nullopt;
    }
    try {
        return ResponseDecoder::volume_state(m_transport->request(
            uri::kGetVolume, std::nullopt, ms(ConfigManager::getInstance().getStateQueryTimeoutMs())));
    } catch (const TvLinkError& e) {
        LOG_DEBUG("[Session] Volume state unavailable: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool SessionController::ping() {
    try {
        m_transport->request(uri::kServiceList, std::nullopt, ms(ConfigManager::getInstance().getPingTimeoutMs()));
        return true;
    } catch (const TvLinkError& e) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_ping_failure_count;
        }
        record_command_error(e.what(), std::nullopt);
        if (e.code() == ErrorCode::RequestTimedOut || e.code() == ErrorCode::NotConnected ||
            is_transient_error(e.what())) {
            schedule_reconnect_with_backoff();
        }
        return false;
    }
}

// =======================================================
// Events
// =======================================================

void SessionController::post_event(SessionEvent event) {
    m_events.pushEvent(std::move(event));
}

bool SessionController::wait_for_idle(std::chrono::milliseconds timeout) {
    return m_events.waitIdle(timeout);
}

void SessionController::handle_event(const SessionEvent& event) {
    if (auto* e = std::get_if<DevicesDiscoveredEvent>(&event)) {
        update_discovered(e->devices);
    } else if (auto* e = std::get_if<DiscoveryFailedEvent>(&event)) {
        on_discovery_failed(*e);
    } else if (auto* e = std::get_if<TransportDisconnectedEvent>(&event)) {
        on_transport_disconnected(*e);
    } else if (auto* e = std::get_if<PairingPromptEvent>(&event)) {
        on_pairing_prompt(*e);
    } else if (auto* e = std::get_if<NetworkReachabilityChangedEvent>(&event)) {
        on_reachability_changed(*e);
    } else if (auto* e = std::get_if<KeepaliveExhaustedEvent>(&event)) {
        on_keepalive_exhausted(*e);
    }
}

void SessionController::on_discovery_failed(const DiscoveryFailedEvent& event) {
    LOG_WARN("[Discovery] " + event.message);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state_machine.is_connected()) {
        return;
    }
    apply_locked(ConnectionEvent::fail(event.message));
}

void SessionController::on_transport_disconnected(const TransportDisconnectedEvent& event) {
    bool suppressed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (event.session_generation != m_generation) {
            LOG_DEBUG("[Session] Ignoring closure of a previous session");
            return;
        }
        if (m_connecting.load() > 0) {
            LOG_DEBUG("[Session] Ignoring closure while a connect is in progress");
            return;
        }
        suppressed = m_suppress_next_disconnect_failure;
        m_suppress_next_disconnect_failure = false;
    }

    m_hydration.cancel();
    m_warmup.cancel();
    m_supervisor.reset_keepalive_streak();

    if (suppressed) {
        m_supervisor.reset_attempts();
        std::lock_guard<std::mutex> lock(m_mutex);
        apply_locked(ConnectionEvent::disconnect());
        LOG_INFO("[Session] TV closed the connection after power off");
        return;
    }

    const std::string message = event.reason ? *event.reason : kConnectionLost;
    record_command_error(message, std::nullopt);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        apply_locked(ConnectionEvent::fail(message));
    }
    schedule_reconnect_with_backoff();
}

void SessionController::on_pairing_prompt(const PairingPromptEvent& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (event.session_generation != m_generation || !m_pending_pair_device) {
        return;
    }
    LOG_INFO("[Session] Accept the pairing prompt on " + m_pending_pair_device->name);
    apply_locked(ConnectionEvent::begin_pairing(*m_pending_pair_device));
}

void SessionController::on_reachability_changed(const NetworkReachabilityChangedEvent& event) {
    const bool became_reachable = m_supervisor.update_reachability(event.reachable);
    if (!became_reachable) {
        return;
    }
    m_supervisor.reset_attempts();
    m_supervisor.schedule(std::chrono::milliseconds(0), [this](CancellationToken token) {
        if (!token.is_cancelled()) {
            reconnect_to_last_device_if_possible();
        }
    });
}

void SessionController::on_keepalive_exhausted(const KeepaliveExhaustedEvent& event) {
    if (!is_current_generation(event.session_generation)) {
        return;
    }
    LOG_WARN("[Keepalive] TV stopped answering, forcing a reconnect");
    m_supervisor.stop_keepalive();
    m_supervisor.mark_next_as_auto_recovery(true);
    m_supervisor.reset_attempts();
    m_transport->disconnect(false);
    schedule_reconnect_with_backoff();
}

// =======================================================
// Introspection
// =======================================================

ConnectionState SessionController::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state_machine.state();
}

std::optional<Device> SessionController::current_device() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_device;
}

ButtonTransportMode SessionController::button_mode() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_button_mode;
}

std::set<std::string> SessionController::service_names() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_service_names;
}

SessionDiagnostics SessionController::diagnostics() const {
    const auto last_connected = m_known_store->last_connected_device();
    SessionDiagnostics d;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::optional<Device> device = m_current_device ? m_current_device : last_connected;
        d.state_label = state_label(m_state_machine.state());
        if (device) {
            d.device_name = device->name;
            d.device_ip = device->host;
            d.device_port = device->port;
            for (Capability c : device->capabilities) {
                d.capabilities.push_back(capability_name(c));
            }
        }
        d.button_transport = button_transport_label(m_button_mode);
        d.reconnect_attempts = m_reconnect_attempts_total;
        d.command_retries = m_command_retry_count;
        d.ping_failures = m_ping_failure_count;
        d.last_auto_recovery_at = m_last_auto_recovery_at;
        if (m_last_error) {
            d.last_error_code = m_last_error->code;
            d.last_error_message = m_last_error->message;
            d.last_error_command = m_last_error->command_key;
            d.last_error_at = m_last_error->at;
        }
        d.service_names.assign(m_service_names.begin(), m_service_names.end());
    }
    d.latency = m_latency.stats();
    return d;
}

nlohmann::json SessionController::diagnostics_json() const {
    return diagnostics();
}

} // namespace tvlink
