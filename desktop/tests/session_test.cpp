#include "config_manager.h"
#include "fake_tv_channel.h"
#include "logger.h"
#include "session_controller.h"
#include "telemetry.h"
#include "tvlink_error.h"
#include "websocket_channel.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace tvlink;
using namespace std::chrono_literals;
using tvlink::testing::FakeTv;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

namespace {

constexpr const char* kServiceListUri = "ssap://api/getServiceList";
constexpr const char* kLaunchPointsUri = "ssap://com.webos.applicationManager/listLaunchPoints";
constexpr const char* kPointerSocketUri = "ssap://com.webos.service.networkinput/getPointerInputSocket";
constexpr const char* kSendButtonUri = "ssap://com.webos.service.networkinput/sendButton";
constexpr const char* kVolumeUpUri = "ssap://audio/volumeUp";
constexpr const char* kLaunchUri = "ssap://system.launcher/launch";
constexpr const char* kGetVolumeUri = "ssap://audio/getVolume";

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

std::optional<ErrorCode> code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const TvLinkError& e) {
        return e.code();
    }
    return std::nullopt;
}

class ScriptedProbe : public AddressProbe {
public:
    ProbeOutcome probe_outcome(const std::string&, int port, std::chrono::milliseconds) const override {
        std::lock_guard<std::mutex> lock(mu);
        return reachable_ports.count(port) != 0 ? ProbeOutcome::Reachable : ProbeOutcome::Unreachable;
    }

    mutable std::mutex mu;
    std::set<int> reachable_ports = {3000, 3001};
};

class RecordingWakeSender : public WakeOnLanSender {
public:
    void send(const std::string& mac, const std::optional<std::string>& host) override {
        std::lock_guard<std::mutex> lock(mu);
        sent.emplace_back(mac, host);
    }

    std::mutex mu;
    std::vector<std::pair<std::string, std::optional<std::string>>> sent;
};

// Fake TV channels, scripted probe and in-memory stores; no discovery or
// network monitor.
class TestDependencies : public ISessionDependenciesFactory {
public:
    FrameChannelFactory createChannelFactory() override { return tv.factory(); }
    std::shared_ptr<AddressProbe> createAddressProbe() override { return probe; }
    std::shared_ptr<SecretStore> createSecretStore() override { return secrets; }
    std::shared_ptr<KnownDevicesStore> createKnownDevicesStore() override { return known; }
    std::shared_ptr<WakeOnLanSender> createWakeOnLanSender() override { return wake; }
    std::unique_ptr<DiscoveryEngine> createDiscoveryEngine() override { return nullptr; }
    std::unique_ptr<NetworkMonitor> createNetworkMonitor() override { return nullptr; }

    FakeTv tv;
    std::shared_ptr<ScriptedProbe> probe = std::make_shared<ScriptedProbe>();
    std::shared_ptr<InMemorySecretStore> secrets = std::make_shared<InMemorySecretStore>();
    std::shared_ptr<InMemoryKnownDevicesStore> known = std::make_shared<InMemoryKnownDevicesStore>();
    std::shared_ptr<RecordingWakeSender> wake = std::make_shared<RecordingWakeSender>();
};

struct StateRecorder {
    std::mutex mu;
    std::vector<ConnectionState> states;

    void attach(SessionController& session) {
        session.set_state_handler([this](const ConnectionState& state) {
            std::lock_guard<std::mutex> lock(mu);
            states.push_back(state);
        });
    }

    bool saw(ConnectionPhase phase) {
        std::lock_guard<std::mutex> lock(mu);
        for (const auto& s : states) {
            if (s.phase == phase) return true;
        }
        return false;
    }
};

Device living_room(int port = 3000) {
    Device d = make_discovered_device("192.168.1.50", port);
    d.name = "Living Room";
    return d;
}

bool is_phase(SessionController& session, ConnectionPhase phase) {
    return session.state().phase == phase;
}

// Waits for the post-connect hydration and pointer warm-up to finish.
void settle(TestDependencies& deps, int generation_requests = 1) {
    wait_until([&] {
        return deps.tv.script->count_requests(kLaunchPointsUri) >= generation_requests &&
               deps.tv.script->count_requests(kPointerSocketUri) >= generation_requests;
    }, 2000ms);
    std::this_thread::sleep_for(100ms);
}

int registrations(TestDependencies& deps) {
    std::lock_guard<std::mutex> lock(deps.tv.script->mu);
    return deps.tv.script->registrations;
}

size_t opened_sockets(TestDependencies& deps) {
    std::lock_guard<std::mutex> lock(deps.tv.script->mu);
    return deps.tv.script->opened_ports.size();
}

void reset_environment() {
    ConfigManager::getInstance().reset();
    Telemetry::getInstance().clear();
}

} // namespace

bool test_connect_falls_back_to_plain_port() {
    std::cout << "Testing connect fallback to the plain port..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    deps->tv.script->failing_ports = {3001};
    SessionController session(deps);
    StateRecorder recorder;
    recorder.attach(session);
    session.start();

    session.connect(living_room(3001));
    TEST_ASSERT(is_phase(session, ConnectionPhase::Connected), "connected");
    TEST_ASSERT(session.current_device()->port == 3000, "connected on the plain port");
    TEST_ASSERT(recorder.saw(ConnectionPhase::Pairing), "pairing announced");
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        TEST_ASSERT(deps->tv.script->opened_ports.size() >= 2, "two control attempts");
        TEST_ASSERT(deps->tv.script->opened_ports[0] == 3001 && deps->tv.script->opened_ports[1] == 3000,
                    "secure port first, then plain");
    }

    TEST_ASSERT(deps->secrets->get(client_key_slot("lg-192.168.1.50")) == std::optional<std::string>("client-key-1"),
                "issued key stored");
    auto last = deps->known->last_connected_device();
    TEST_ASSERT(last && last->port == 3000 && last->last_connected_at, "connection remembered with the working port");
    TEST_ASSERT(Telemetry::getInstance().counter_value("session.connect_success") == 1, "success counted");

    settle(*deps);
    const nlohmann::json diag = session.diagnostics_json();
    TEST_ASSERT(diag.at("state") == "Connected", "diagnostics state");
    TEST_ASSERT(diag.at("deviceName") == "Living Room" && diag.at("deviceIP") == "192.168.1.50", "diagnostics device");
    TEST_ASSERT(diag.at("devicePort") == 3000, "diagnostics port");
    TEST_ASSERT(diag.at("buttonTransport") == "Pointer socket", "pointer warm-up succeeded");
    TEST_ASSERT(diag.at("reconnectAttempts") == 0 && diag.at("commandRetries") == 0, "no recovery needed");
    TEST_ASSERT(diag.contains("latency") && diag.at("latency").contains("p95Ms"), "latency block");

    session.disconnect();
    TEST_ASSERT(is_phase(session, ConnectionPhase::Idle), "disconnect returns to idle");
    TEST_ASSERT(!session.current_device(), "no current device");
    session.shutdown();

    std::cout << "Connect fallback Passed!" << std::endl;
    return true;
}

bool test_command_while_disconnected() {
    std::cout << "Testing commands while disconnected..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    SessionController session(deps);
    session.start();

    const auto started = std::chrono::steady_clock::now();
    TEST_ASSERT(code_of([&] { session.send(Command::simple(CommandKind::VolumeUp)); }) == ErrorCode::NotConnected,
                "NotConnected");
    TEST_ASSERT(std::chrono::steady_clock::now() - started < 100ms, "fails without waiting");
    TEST_ASSERT(deps->tv.script->count_requests(kVolumeUpUri) == 0, "nothing sent");

    // A second attempt is not delayed: the first never reached the limiter.
    const auto again = std::chrono::steady_clock::now();
    TEST_ASSERT(code_of([&] { session.send(Command::simple(CommandKind::VolumeUp)); }) == ErrorCode::NotConnected,
                "still NotConnected");
    TEST_ASSERT(std::chrono::steady_clock::now() - again < 100ms, "no rate-limit wait");

    const auto stats = session.diagnostics().latency;
    TEST_ASSERT(stats.samples == 2 && stats.successes == 0, "failures are sampled");
    TEST_ASSERT(session.fetch_launch_apps().empty() && !session.fetch_volume_state(), "queries need a device");
    session.shutdown();

    std::cout << "Commands while disconnected Passed!" << std::endl;
    return true;
}

bool test_keepalive_forces_single_reconnect() {
    std::cout << "Testing keepalive recovery..." << std::endl;
    reset_environment();
    auto& config = ConfigManager::getInstance();
    config.setValueAtPath({"keepalive", "interval_ms"}, 40);
    config.setValueAtPath({"keepalive", "command_grace_ms"}, 0);

    auto deps = std::make_shared<TestDependencies>();
    SessionController session(deps);
    session.start();
    session.connect(living_room());
    const size_t opens_before = opened_sockets(*deps);

    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->fail_pings_remaining = 2;
    }

    TEST_ASSERT(wait_until([&] {
        return Telemetry::getInstance().counter_value("session.reconnect_attempts") == 1 &&
               is_phase(session, ConnectionPhase::Connected);
    }, 3000ms), "one reconnect restores the session");

    // Let several healthy keepalive rounds pass.
    std::this_thread::sleep_for(300ms);
    TEST_ASSERT(Telemetry::getInstance().counter_value("session.reconnect_attempts") == 1, "exactly one reconnect");
    TEST_ASSERT(Telemetry::getInstance().counter_value("session.keepalive_failures") == 2, "two failed pings");
    TEST_ASSERT(opened_sockets(*deps) > opens_before, "a new socket was opened");
    TEST_ASSERT(is_phase(session, ConnectionPhase::Connected), "still connected");

    const auto diag = session.diagnostics();
    TEST_ASSERT(diag.reconnect_attempts == 1, "diagnostics count the reconnect");
    TEST_ASSERT(diag.ping_failures == 2, "diagnostics count ping failures");
    TEST_ASSERT(diag.last_auto_recovery_at.has_value(), "auto recovery stamped");
    session.shutdown();
    config.reset();

    std::cout << "Keepalive recovery Passed!" << std::endl;
    return true;
}

bool test_remote_close_reconnects() {
    std::cout << "Testing recovery after remote close..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    SessionController session(deps);
    StateRecorder recorder;
    recorder.attach(session);
    session.start();
    session.connect(living_room());
    settle(*deps);

    deps->tv.drop_control_connections("Connection reset by peer");
    TEST_ASSERT(wait_until([&] { return recorder.saw(ConnectionPhase::Failed); }, 2000ms), "failure surfaced");
    {
        std::lock_guard<std::mutex> lock(recorder.mu);
        bool found = false;
        for (const auto& s : recorder.states) {
            found = found || (s.phase == ConnectionPhase::Failed && s.message == "Connection reset by peer");
        }
        TEST_ASSERT(found, "failure carries the close reason");
    }
    TEST_ASSERT(wait_until([&] {
        return recorder.saw(ConnectionPhase::Reconnecting) && is_phase(session, ConnectionPhase::Connected);
    }, 3000ms), "reconnected automatically");
    TEST_ASSERT(session.diagnostics().last_error_message == std::optional<std::string>("Connection reset by peer"),
                "close reason recorded");
    session.shutdown();

    std::cout << "Recovery after remote close Passed!" << std::endl;
    return true;
}

bool test_transient_failure_retries_once() {
    std::cout << "Testing transient failure retry..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    SessionController session(deps);
    session.start();
    session.connect(living_room());
    settle(*deps);

    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->errors[kVolumeUpUri] = "write: Broken pipe";
        deps->tv.script->error_limits[kVolumeUpUri] = 1;
    }
    const int registrations_before = registrations(*deps);
    session.send(Command::simple(CommandKind::VolumeUp));
    TEST_ASSERT(deps->tv.script->count_requests(kVolumeUpUri) == 2, "sent twice");
    TEST_ASSERT(registrations(*deps) == registrations_before + 1, "reconnected between the attempts");

    const auto diag = session.diagnostics();
    TEST_ASSERT(diag.command_retries == 1, "one retry recorded");
    TEST_ASSERT(diag.reconnect_attempts == 1, "retry reconnect counted");
    TEST_ASSERT(Telemetry::getInstance().counter_value("session.command_retries") == 1, "retry telemetry");

    // Power off is never replayed.
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->errors["ssap://system/turnOff"] = "write: Broken pipe";
    }
    TEST_ASSERT(code_of([&] { session.send(Command::simple(CommandKind::PowerOff)); }) == ErrorCode::RequestRejected,
                "power off failure surfaces");
    TEST_ASSERT(deps->tv.script->count_requests("ssap://system/turnOff") == 1, "power off sent once");
    TEST_ASSERT(session.diagnostics().command_retries == 1, "no retry for power off");
    session.shutdown();

    std::cout << "Transient failure retry Passed!" << std::endl;
    return true;
}

bool test_unsupported_method_downgrades_capability() {
    std::cout << "Testing capability downgrade..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->errors[kLaunchUri] = "404 no such service or method";
    }
    SessionController session(deps);
    session.start();
    session.connect(living_room());
    settle(*deps);
    TEST_ASSERT(session.current_device()->has(Capability::LaunchApp), "launch assumed before the failure");

    TEST_ASSERT(code_of([&] { session.send(Command::launch_app("netflix")); }) == ErrorCode::CommandUnsupported,
                "unsupported method maps to CommandUnsupported");
    TEST_ASSERT(!session.current_device()->has(Capability::LaunchApp), "capability dropped");
    auto stored = deps->known->find("lg-192.168.1.50");
    TEST_ASSERT(stored && !stored->has(Capability::LaunchApp), "downgrade persisted");

    TEST_ASSERT(code_of([&] { session.send(Command::launch_app("netflix")); }) == ErrorCode::CommandUnsupported,
                "later launches are refused locally");
    TEST_ASSERT(deps->tv.script->count_requests(kLaunchUri) == 1, "no second request");

    const auto diag = session.diagnostics();
    TEST_ASSERT(diag.last_error_code == std::optional<int>(404), "status code extracted");
    TEST_ASSERT(diag.last_error_command == std::optional<std::string>("launch_app"), "failing command recorded");
    TEST_ASSERT(diag.command_retries == 0, "unsupported methods are not retried");
    session.shutdown();

    std::cout << "Capability downgrade Passed!" << std::endl;
    return true;
}

bool test_hydration_infers_capabilities() {
    std::cout << "Testing capability hydration..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->payloads[kServiceListUri] = {
            {"returnValue", true},
            {"services", {{{"name", "audio"}}, {{"name", "system"}}, {{"name", "tv"}}}},
        };
    }
    SessionController session(deps);
    session.start();
    session.connect(living_room());

    TEST_ASSERT(wait_until([&] {
        auto device = session.current_device();
        return device && !device->has(Capability::Keyboard);
    }, 2000ms), "hydration applied");
    const Device device = *session.current_device();
    TEST_ASSERT(device.has(Capability::Volume) && device.has(Capability::Power), "advertised services kept");
    TEST_ASSERT(device.has(Capability::InputSwitch), "tv service enables inputs");
    TEST_ASSERT(!device.has(Capability::LaunchApp), "no launcher service and no launch points");
    TEST_ASSERT(device.has(Capability::DirectionalPad), "untracked capabilities stay");
    TEST_ASSERT(session.service_names() == std::set<std::string>({"audio", "system", "tv"}), "service names kept");

    const std::set<Capability> all = all_capabilities();
    TEST_ASSERT(SessionController::infer_capabilities({}, all) == all, "no services keeps the fallback");
    session.shutdown();

    std::cout << "Capability hydration Passed!" << std::endl;
    return true;
}

bool test_pairing_with_stale_key() {
    std::cout << "Testing pairing with a stale client key..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    const std::string slot = client_key_slot("lg-192.168.1.50");
    deps->secrets->set(slot, "stale-key");
    deps->tv.script->rejected_keys = {"stale-key"};
    deps->tv.script->show_prompt = true;
    deps->tv.script->issued_key = "fresh-key";

    SessionController session(deps);
    StateRecorder recorder;
    recorder.attach(session);
    session.start();
    session.connect(living_room());

    TEST_ASSERT(is_phase(session, ConnectionPhase::Connected), "connected after re-pairing");
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        TEST_ASSERT(deps->tv.script->registration_keys.size() == 2, "registered twice");
        TEST_ASSERT(deps->tv.script->registration_keys[0] == std::optional<std::string>("stale-key"), "stale key first");
        TEST_ASSERT(!deps->tv.script->registration_keys[1], "then without a key");
    }
    TEST_ASSERT(deps->secrets->get(slot) == std::optional<std::string>("fresh-key"), "fresh key stored");
    session.shutdown();

    // An explicit refusal is final.
    reset_environment();
    auto refused = std::make_shared<TestDependencies>();
    refused->tv.script->registration_error = "403 User denied access";
    SessionController denied(refused);
    denied.start();
    TEST_ASSERT(code_of([&] { denied.connect(living_room()); }) == ErrorCode::PairingFailed, "PairingFailed");
    TEST_ASSERT(is_phase(denied, ConnectionPhase::Failed), "failed state");
    TEST_ASSERT(denied.state().message == "403 User denied access", "refusal is the message");
    TEST_ASSERT(opened_sockets(*refused) == 1, "no other endpoint tried after a refusal");
    std::this_thread::sleep_for(150ms);
    TEST_ASSERT(opened_sockets(*refused) == 1, "no reconnect after a refusal");
    denied.shutdown();

    std::cout << "Pairing with a stale client key Passed!" << std::endl;
    return true;
}

bool test_button_fallback_to_pointer() {
    std::cout << "Testing button fallback to the pointer socket..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->errors[kPointerSocketUri] = "500 pointer input unavailable";
    }
    SessionController session(deps);
    session.start();
    session.connect(living_room());
    settle(*deps);
    TEST_ASSERT(session.button_mode() == ButtonTransportMode::SsapSendButton, "warm-up failure keeps sendButton");

    session.send(Command::simple(CommandKind::Home));
    TEST_ASSERT(deps->tv.script->count_requests(kSendButtonUri) == 1, "home went through sendButton");

    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->errors.erase(kPointerSocketUri);
        deps->tv.script->errors[kSendButtonUri] = "com.webos.service.networkinput is busy";
    }
    session.send(Command::simple(CommandKind::Up));
    TEST_ASSERT(session.button_mode() == ButtonTransportMode::PointerSocket, "switched to the pointer socket");
    session.send(Command::simple(CommandKind::Down));
    TEST_ASSERT(deps->tv.script->count_requests(kSendButtonUri) == 2, "sendButton not tried again");
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        const auto& frames = deps->tv.script->pointer_frames;
        TEST_ASSERT(frames.size() == 2, "two pointer frames");
        TEST_ASSERT(frames[0] == "type:button\nname:UP\n\n" && frames[1] == "type:button\nname:DOWN\n\n",
                    "pointer frame format");
    }
    TEST_ASSERT(session.diagnostics_json().at("buttonTransport") == "Pointer socket", "diagnostics label");
    session.shutdown();

    std::cout << "Button fallback Passed!" << std::endl;
    return true;
}

bool test_mute_toggle_and_power_off() {
    std::cout << "Testing mute toggle and power off..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->payloads["ssap://audio/getVolume"] = {{"returnValue", true}, {"volume", 12}, {"muted", true}};
    }
    SessionController session(deps);
    session.start();
    session.connect(living_room());
    settle(*deps);

    auto volume = session.fetch_volume_state();
    TEST_ASSERT(volume && volume->level == 12 && volume->muted, "volume state");

    session.send(Command::set_mute(std::nullopt));
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        const json& last = deps->tv.script->requests.back();
        TEST_ASSERT(last.at("uri") == "ssap://audio/setMute", "setMute sent");
        TEST_ASSERT(last.at("payload").at("mute") == false, "toggle unmutes a muted TV");
    }
    session.send(Command::set_volume(30));
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        TEST_ASSERT(deps->tv.script->requests.back().at("payload").at("volume") == 30, "setVolume payload");
    }

    // The TV closing the socket after power off is expected.
    const size_t opens = opened_sockets(*deps);
    session.send(Command::simple(CommandKind::PowerOff));
    deps->tv.drop_control_connections("TV powered off");
    TEST_ASSERT(wait_until([&] { return is_phase(session, ConnectionPhase::Idle); }, 2000ms), "idle after power off");
    std::this_thread::sleep_for(200ms);
    TEST_ASSERT(is_phase(session, ConnectionPhase::Idle), "no failure after power off");
    TEST_ASSERT(opened_sockets(*deps) == opens, "no reconnect after power off");
    session.shutdown();

    std::cout << "Mute toggle and power off Passed!" << std::endl;
    return true;
}

bool test_power_on_and_wake_address() {
    std::cout << "Testing power on and wake address..." << std::endl;
    reset_environment();

    auto deps = std::make_shared<TestDependencies>();
    SessionController session(deps);
    session.start();

    TEST_ASSERT(code_of([&] { session.send(Command::simple(CommandKind::PowerOn)); }) == ErrorCode::NoDeviceSelected,
                "no device to wake");
    TEST_ASSERT(code_of([&] { session.update_wake_address(std::string("aa:bb:cc:dd:ee:ff")); }) ==
                    ErrorCode::NoDeviceSelected, "no device to update");

    deps->known->mark_connected(living_room());
    TEST_ASSERT(code_of([&] { session.send(Command::simple(CommandKind::PowerOn)); }) == ErrorCode::InvalidWakeAddress,
                "no stored wake address");
    TEST_ASSERT(code_of([&] { session.update_wake_address(std::string("not a mac")); }) ==
                    ErrorCode::InvalidWakeAddress, "malformed address rejected");

    session.update_wake_address(std::string(" aa-bb-cc-dd-ee-ff "));
    TEST_ASSERT(deps->known->find("lg-192.168.1.50")->wake_mac == std::optional<std::string>("AA:BB:CC:DD:EE:FF"),
                "normalized address stored");
    TEST_ASSERT(session.known_devices().front().wake_mac.has_value(), "known list refreshed");

    // Power on works while disconnected.
    session.send(Command::simple(CommandKind::PowerOn));
    {
        std::lock_guard<std::mutex> lock(deps->wake->mu);
        TEST_ASSERT(deps->wake->sent.size() == 1, "one wake request");
        TEST_ASSERT(deps->wake->sent[0].first == "AA:BB:CC:DD:EE:FF", "wake address");
        TEST_ASSERT(deps->wake->sent[0].second == std::optional<std::string>("192.168.1.50"), "wake host");
    }

    session.update_wake_address(std::nullopt);
    TEST_ASSERT(!deps->known->find("lg-192.168.1.50")->wake_mac, "address cleared");
    session.shutdown();

    std::cout << "Power on and wake address Passed!" << std::endl;
    return true;
}

bool test_manual_addresses_and_scan_state() {
    std::cout << "Testing manual addresses and scan state..." << std::endl;
    reset_environment();

    auto parsed = SessionController::parse_manual_address(" 192.168.1.50 ");
    TEST_ASSERT(parsed && parsed->first == "192.168.1.50" && parsed->second == 3000, "bare host");
    parsed = SessionController::parse_manual_address("wss://10.0.0.9");
    TEST_ASSERT(parsed && parsed->second == 3001, "wss defaults to 3001");
    parsed = SessionController::parse_manual_address("10.0.0.9:3001");
    TEST_ASSERT(parsed && parsed->second == 3001, "explicit port");
    TEST_ASSERT(!SessionController::parse_manual_address("   "), "blank address");

    const auto endpoints = SessionController::candidate_endpoints(living_room(3001));
    TEST_ASSERT(endpoints.size() == 2, "deduplicated endpoints");
    TEST_ASSERT(endpoints[0].port == 3001 && endpoints[0].secure, "device port first");
    TEST_ASSERT(endpoints[1].port == 3000 && !endpoints[1].secure, "plain fallback");

    auto deps = std::make_shared<TestDependencies>();
    SessionController session(deps);
    session.start();
    TEST_ASSERT(code_of([&] { session.connect_manual("ws://"); }) == ErrorCode::InvalidAddress, "invalid address");

    const Device manual = session.connect_manual("192.168.1.77");
    TEST_ASSERT(manual.id == "lg-192.168.1.77" && manual.name == "LG TV (192.168.1.77)", "manual device");
    session.disconnect();

    session.begin_scan();
    TEST_ASSERT(is_phase(session, ConnectionPhase::Scanning), "scanning");
    session.update_discovered({});
    TEST_ASSERT(is_phase(session, ConnectionPhase::Scanning), "the empty first publication keeps scanning");
    session.update_discovered({living_room()});
    TEST_ASSERT(state_label(session.state()) == "1 TV Found", "found label");
    TEST_ASSERT(session.discovered_devices().size() == 1, "discovered list");
    TEST_ASSERT(deps->known->find("lg-192.168.1.50").has_value(), "sightings are remembered");
    session.shutdown();

    std::cout << "Manual addresses and scan state Passed!" << std::endl;
    return true;
}

bool test_new_connect_supersedes_pending_pairing() {
    std::cout << "Testing a new connect superseding a pending pairing..." << std::endl;
    reset_environment();
    ConfigManager::getInstance().setValueAtPath({"session", "pairing_registration_timeout_ms"}, 8000);

    auto deps = std::make_shared<TestDependencies>();
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->unanswered_registrations = 1;
    }
    SessionController session(deps);
    session.start();

    Device first = make_discovered_device("10.0.0.1", 3000);
    Device second = make_discovered_device("10.0.0.2", 3000);

    std::optional<ErrorCode> first_result;
    std::thread first_connect([&] { first_result = code_of([&] { session.connect(first); }); });
    const bool first_waiting = wait_until([&] { return registrations(*deps) == 1; }, 2000ms);

    const auto started = std::chrono::steady_clock::now();
    const auto second_result = code_of([&] { session.connect(second); });
    const auto elapsed = std::chrono::steady_clock::now() - started;
    first_connect.join();

    TEST_ASSERT(first_waiting, "first registration left pending");
    TEST_ASSERT(!second_result, "second connect succeeded");
    TEST_ASSERT(elapsed < 1500ms, "second connect did not wait out the first registration");
    TEST_ASSERT(first_result == ErrorCode::Cancelled, "first connect cancelled");
    TEST_ASSERT(is_phase(session, ConnectionPhase::Connected), "connected");
    TEST_ASSERT(session.current_device() && session.current_device()->host == "10.0.0.2", "second device is current");
    TEST_ASSERT(registrations(*deps) == 2, "one registration each");
    session.shutdown();

    std::cout << "New connect superseding a pending pairing Passed!" << std::endl;
    return true;
}

bool test_disconnect_during_command_is_final() {
    std::cout << "Testing disconnect during an in-flight command..." << std::endl;
    reset_environment();
    ConfigManager::getInstance().setValueAtPath({"session", "control_command_timeout_ms"}, 5000);

    auto deps = std::make_shared<TestDependencies>();
    SessionController session(deps);
    session.start();
    session.connect(living_room());
    settle(*deps);
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->silent_uris.insert(kVolumeUpUri);
    }
    const int registrations_before = registrations(*deps);
    const size_t opens_before = opened_sockets(*deps);

    std::optional<ErrorCode> result;
    std::thread sender([&] { result = code_of([&] { session.send(Command::simple(CommandKind::VolumeUp)); }); });
    const bool in_flight = wait_until([&] { return deps->tv.script->count_requests(kVolumeUpUri) == 1; }, 2000ms);
    session.disconnect();
    sender.join();

    TEST_ASSERT(in_flight, "volume up reached the TV");
    TEST_ASSERT(result == ErrorCode::Cancelled, "interrupted command reports Cancelled");
    std::this_thread::sleep_for(300ms);
    TEST_ASSERT(is_phase(session, ConnectionPhase::Idle), "disconnect is not undone");
    TEST_ASSERT(!session.current_device(), "no current device");
    TEST_ASSERT(registrations(*deps) == registrations_before, "no re-registration");
    TEST_ASSERT(opened_sockets(*deps) == opens_before, "no new socket");
    TEST_ASSERT(session.diagnostics().command_retries == 0, "no retry recorded");
    TEST_ASSERT(deps->tv.script->count_requests(kVolumeUpUri) == 1, "command not replayed");
    session.shutdown();

    std::cout << "Disconnect during an in-flight command Passed!" << std::endl;
    return true;
}

bool test_disconnect_twice_is_idle() {
    std::cout << "Testing repeated disconnect..." << std::endl;
    reset_environment();
    ConfigManager::getInstance().setValueAtPath({"session", "state_query_timeout_ms"}, 5000);

    auto deps = std::make_shared<TestDependencies>();
    SessionController session(deps);
    session.start();
    session.connect(living_room());
    settle(*deps);
    {
        std::lock_guard<std::mutex> lock(deps->tv.script->mu);
        deps->tv.script->silent_uris.insert(kGetVolumeUri);
    }

    std::optional<VolumeState> volume;
    std::thread query([&] { volume = session.fetch_volume_state(); });
    const bool pending = wait_until([&] {
        return deps->tv.script->count_requests(kGetVolumeUri) == 1 && session.transport().pending_count() >= 1;
    }, 2000ms);

    session.disconnect();
    const bool idle_after_first = is_phase(session, ConnectionPhase::Idle);
    session.disconnect();
    const bool idle_after_second = is_phase(session, ConnectionPhase::Idle);
    const size_t left_pending = session.transport().pending_count();
    query.join();

    TEST_ASSERT(pending, "volume query in flight");
    TEST_ASSERT(idle_after_first, "idle after the first disconnect");
    TEST_ASSERT(idle_after_second, "idle after the second disconnect");
    TEST_ASSERT(left_pending == 0, "no request left pending");
    TEST_ASSERT(!volume, "the interrupted query yields nothing");
    TEST_ASSERT(!session.current_device(), "no current device");
    session.shutdown();

    std::cout << "Repeated disconnect Passed!" << std::endl;
    return true;
}

bool test_default_channel_factory() {
    std::cout << "Testing default channel factory..." << std::endl;

    DefaultSessionDependenciesFactory factory;
    const FrameChannelFactory make_channel = factory.createChannelFactory();
    TEST_ASSERT(static_cast<bool>(make_channel), "factory returned");
    std::unique_ptr<FrameChannel> channel = make_channel();
    TEST_ASSERT(channel != nullptr, "channel created");
    TEST_ASSERT(dynamic_cast<WebSocketChannel*>(channel.get()) != nullptr, "WebSocket channel");
    TEST_ASSERT(!channel->is_open(), "not opened until connect");
    TEST_ASSERT(make_channel().get() != channel.get(), "a fresh channel per call");

    std::cout << "Default channel factory Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running Session Tests..." << std::endl;

    test_connect_falls_back_to_plain_port();
    test_command_while_disconnected();
    test_keepalive_forces_single_reconnect();
    test_remote_close_reconnects();
    test_transient_failure_retries_once();
    test_unsupported_method_downgrades_capability();
    test_hydration_infers_capabilities();
    test_pairing_with_stale_key();
    test_button_fallback_to_pointer();
    test_mute_toggle_and_power_off();
    test_power_on_and_wake_address();
    test_manual_addresses_and_scan_state();
    test_new_connect_supersedes_pending_pairing();
    test_disconnect_during_command_is_final();
    test_disconnect_twice_is_idle();
    test_default_channel_factory();

    if (tests_failed == 0) {
        std::cout << "ALL SESSION TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
