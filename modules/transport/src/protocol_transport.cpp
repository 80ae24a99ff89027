#include "protocol_transport.h"
#include "config_manager.h"
#include "logger.h"
#include "telemetry.h"
#include "tvlink_error.h"

#include <algorithm>
#include <vector>

namespace tvlink {

namespace {

constexpr const char* kPointerSocketUri = "ssap://com.webos.service.networkinput/getPointerInputSocket";

std::chrono::milliseconds clamp_ms(std::chrono::milliseconds value, int64_t lo, int64_t hi) {
    return std::chrono::milliseconds(std::max<int64_t>(lo, std::min<int64_t>(hi, value.count())));
}

std::string frame_id(const json& message) {
    auto it = message.find("id");
    if (it == message.end()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number()) {
        return it->dump();
    }
    return {};
}

const std::vector<std::string>& manifest_permissions() {
    static const std::vector<std::string> permissions = {
        "LAUNCH",
        "LAUNCH_WEBAPP",
        "APP_TO_APP",
        "CONTROL_AUDIO",
        "CONTROL_POWER",
        "READ_RUNNING_APPS",
        "READ_INPUT_DEVICE_LIST",
        "READ_CURRENT_CHANNEL",
        "READ_INSTALLED_APPS",
        "CONTROL_INPUT_JOYSTICK",
        "CONTROL_INPUT_MEDIA_PLAYBACK",
        "CONTROL_INPUT_MEDIA_RECORDING",
        "CONTROL_INPUT_TEXT",
        "CONTROL_MOUSE_AND_KEYBOARD"
    };
    return permissions;
}

template <typename T>
void fail_with(std::promise<T>& promise, ErrorCode code, const std::string& detail) {
    promise.set_exception(std::make_exception_ptr(TvLinkError(code, detail)));
}

} // namespace

ProtocolTransport::ProtocolTransport(FrameChannelFactory factory, ResponseDecoder decoder)
    : m_factory(std::move(factory)), m_decoder(std::move(decoder)) {}

ProtocolTransport::~ProtocolTransport() {
    disconnect(false);
}

void ProtocolTransport::set_pairing_prompt_handler(PairingPromptHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_prompt_handler = std::move(handler);
}

void ProtocolTransport::set_disconnect_handler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_disconnect_handler = std::move(handler);
}

json ProtocolTransport::registration_manifest() {
    json permissions = manifest_permissions();
    return json{
        {"manifestVersion", 1},
        {"appVersion", "1.0"},
        {"permissions", permissions},
        {"signed", {
            {"appId", "com.tvlink.remote"},
            {"vendorId", "com.tvlink"},
            {"created", "2026-01-01"},
            {"localizedAppNames", {{"", "tvlink Remote"}}},
            {"localizedVendorNames", {{"", "tvlink"}}},
            {"permissions", permissions},
            {"serial", "7d1f0c4ab2e94f6d8e35a90b6c21f4e8"}
        }}
    };
}

std::chrono::milliseconds ProtocolTransport::clamp_request_timeout(std::chrono::milliseconds timeout) {
    return clamp_ms(timeout, 800, 20000);
}

std::chrono::milliseconds ProtocolTransport::clamp_register_timeout(std::chrono::milliseconds timeout) {
    return clamp_ms(timeout, 1200, 45000);
}

std::chrono::milliseconds ProtocolTransport::clamp_ping_timeout(std::chrono::milliseconds timeout) {
    return clamp_ms(timeout, 350, 4000);
}

std::string ProtocolTransport::next_id(const char* prefix) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::string(prefix) + std::to_string(++m_counter);
}

ProtocolTransport::PendingPtr ProtocolTransport::make_pending(const std::string& id,
                                                              std::chrono::milliseconds timeout) {
    auto pending = std::make_shared<PendingRequest>();
    pending->id = id;
    pending->issued_at = std::chrono::steady_clock::now();
    pending->deadline = pending->issued_at + timeout;
    return pending;
}

void ProtocolTransport::connect(const std::string& host, int port, bool secure) {
    if (host.empty()) {
        throw TvLinkError(ErrorCode::InvalidAddress);
    }
    disconnect(false);

    Endpoint endpoint;
    endpoint.host = host;
    endpoint.port = port;
    endpoint.secure = secure;

    std::shared_ptr<FrameChannel> channel(m_factory());
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        generation = ++m_generation;
    }

    const auto timeout = std::chrono::milliseconds(ConfigManager::getInstance().getConnectTimeoutMs());
    LOG_DEBUG("[Transport] Opening " + endpoint.url());
    channel->open(endpoint, timeout,
        [this, generation](const std::string& text) { handle_frame(generation, text); },
        [this, generation](const std::string& reason) { handle_close(generation, reason); });

    if (!channel->is_open()) {
        channel->close();
        throw TvLinkError(ErrorCode::NetworkFailure, "Connection closed during handshake.");
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation) {
            // A disconnect raced with the handshake.
            channel->close();
            throw TvLinkError(ErrorCode::Cancelled);
        }
        m_channel = channel;
        m_endpoint = endpoint;
        m_prompt_announced = false;
    }
    LOG_INFO("[Transport] Connected to " + endpoint.url());
}

std::string ProtocolTransport::register_client(const std::optional<std::string>& client_key,
                                               std::chrono::milliseconds timeout) {
    const auto bounded = clamp_register_timeout(timeout);
    const std::string id = next_id("register_");

    json payload = {
        {"forcePairing", false},
        {"pairingType", "PROMPT"},
        {"manifest", registration_manifest()}
    };
    if (client_key && !client_key->empty()) {
        payload["client-key"] = *client_key;
    }
    const json envelope = {{"id", id}, {"type", "register"}, {"payload", payload}};

    auto pending = make_pending(id, bounded);
    std::shared_ptr<FrameChannel> channel;
    PendingPtr previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_channel) {
            throw TvLinkError(ErrorCode::NotConnected);
        }
        channel = m_channel;
        previous = std::move(m_registration);
        m_registration = pending;
    }
    if (previous) {
        fail_with(previous->completion, ErrorCode::RegistrationFailed, "Registration superseded.");
    }

    LOG_INFO(std::string("[Transport] Registering ") + (client_key && !client_key->empty() ? "with stored key" : "without key"));
    try {
        channel->send_text(envelope.dump());
    } catch (const TvLinkError& e) {
        PendingPtr owned;
        if (take_registration(id, owned)) {
            fail_with(owned->completion, e.code(), e.detail());
        }
    }

    json result = await(pending, true, bounded);
    return result.is_string() ? result.get<std::string>() : std::string();
}

json ProtocolTransport::request(const std::string& uri,
                                const std::optional<json>& payload,
                                std::chrono::milliseconds timeout) {
    const auto bounded = clamp_request_timeout(timeout);
    const std::string id = next_id("req_");

    json envelope = {{"id", id}, {"type", "request"}, {"uri", uri}};
    if (payload) {
        envelope["payload"] = *payload;
    }

    auto pending = make_pending(id, bounded);
    std::shared_ptr<FrameChannel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_channel) {
            throw TvLinkError(ErrorCode::NotConnected);
        }
        channel = m_channel;
        m_pending[id] = pending;
    }
    Telemetry::getInstance().inc_counter("transport.requests");

    send_or_fail(channel, pending, envelope.dump());
    return await(pending, false, bounded);
}

void ProtocolTransport::send_or_fail(const std::shared_ptr<FrameChannel>& channel,
                                     const PendingPtr& pending,
                                     const std::string& text) {
    try {
        channel->send_text(text);
    } catch (const TvLinkError& e) {
        PendingPtr owned;
        if (take_pending(pending->id, owned)) {
            fail_with(owned->completion, e.code(), e.detail());
        }
    }
}

json ProtocolTransport::await(const PendingPtr& pending, bool registration, std::chrono::milliseconds timeout) {
    std::future<json> future = pending->completion.get_future();
    if (future.wait_for(timeout) != std::future_status::ready) {
        PendingPtr owned;
        const bool claimed = registration ? take_registration(pending->id, owned)
                                          : take_pending(pending->id, owned);
        if (claimed) {
            Telemetry::getInstance().inc_counter("transport.timeouts");
            LOG_WARN("[Transport] " + pending->id + " timed out after " + std::to_string(timeout.count()) + "ms");
            throw TvLinkError(ErrorCode::RequestTimedOut);
        }
        // Another path owns completion and is about to deliver it.
    }
    return future.get();
}

bool ProtocolTransport::take_pending(const std::string& id, PendingPtr& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(id);
    if (it == m_pending.end()) {
        return false;
    }
    out = std::move(it->second);
    m_pending.erase(it);
    return true;
}

bool ProtocolTransport::take_registration(const std::string& id, PendingPtr& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_registration || (!id.empty() && m_registration->id != id)) {
        return false;
    }
    out = std::move(m_registration);
    m_registration.reset();
    return true;
}

void ProtocolTransport::handle_frame(uint64_t generation, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation) {
            return;
        }
    }

    json message = json::parse(text, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        LOG_WARN("[Transport] Undecodable frame, closing connection");
        disconnect(true, std::string("TV sent an unreadable message."));
        return;
    }

    const std::string id = frame_id(message);
    const std::string type = message.value("type", std::string());

    std::string registration_id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_registration) {
            registration_id = m_registration->id;
        }
    }

    if (!registration_id.empty() && id == registration_id && type == "response") {
        if (ResponseDecoder::is_pairing_prompt(message)) {
            PairingPromptHandler handler;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_prompt_announced) {
                    return;
                }
                m_prompt_announced = true;
                handler = m_prompt_handler;
            }
            LOG_INFO("[Transport] Pairing prompt shown on TV");
            if (handler) {
                handler();
            }
        }
        return;
    }

    if (type == "registered") {
        PendingPtr owned;
        if (take_registration(std::string(), owned)) {
            owned->completion.set_value(json(ResponseDecoder::client_key(message).value_or("")));
        }
        return;
    }

    if (type == "error" && !registration_id.empty() && id == registration_id) {
        PendingPtr owned;
        if (take_registration(id, owned)) {
            const std::string reason = m_decoder.error_message(message);
            LOG_WARN("[Transport] Registration error: " + reason);
            fail_with(owned->completion, ErrorCode::RegistrationFailed, reason);
        }
        return;
    }

    if (id.empty()) {
        LOG_DEBUG("[Transport] Ignoring unsolicited " + type + " frame");
        return;
    }

    PendingPtr owned;
    if (!take_pending(id, owned)) {
        LOG_DEBUG("[Transport] No pending request for " + id);
        return;
    }

    if (type == "error" || (type == "response" && m_decoder.is_failure(message))) {
        const std::string reason = m_decoder.error_message(message);
        LOG_DEBUG("[Transport] " + id + " rejected: " + reason);
        fail_with(owned->completion, ErrorCode::RequestRejected, reason);
        return;
    }
    owned->completion.set_value(std::move(message));
}

void ProtocolTransport::handle_close(uint64_t generation, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation || !m_channel) {
            return;
        }
    }
    LOG_INFO("[Transport] Connection closed by peer: " + reason);
    disconnect(true, reason.empty() ? std::optional<std::string>() : std::optional<std::string>(reason));
}

bool ProtocolTransport::send_ping(std::chrono::milliseconds timeout) {
    std::shared_ptr<FrameChannel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel = m_channel;
    }
    if (!channel) {
        return false;
    }
    try {
        return channel->ping(clamp_ping_timeout(timeout));
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("[Transport] Ping failed: ") + e.what());
        return false;
    }
}

void ProtocolTransport::disconnect(bool notify, const std::optional<std::string>& reason) {
    std::shared_ptr<FrameChannel> channel;
    std::shared_ptr<FrameChannel> pointer;
    std::map<std::string, PendingPtr> pending;
    PendingPtr registration;
    DisconnectHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_generation;
        channel = std::move(m_channel);
        pointer = std::move(m_pointer);
        m_channel.reset();
        m_pointer.reset();
        pending.swap(m_pending);
        registration = std::move(m_registration);
        m_registration.reset();
        m_endpoint.reset();
        m_prompt_announced = false;
        handler = m_disconnect_handler;
    }

    if (pointer) {
        pointer->close();
    }
    if (channel) {
        channel->close();
    }

    if (registration) {
        fail_with(registration->completion, ErrorCode::RegistrationFailed,
                  reason.value_or("Pairing ended before completion."));
    }
    for (auto& entry : pending) {
        fail_with(entry.second->completion, ErrorCode::NotConnected, "");
    }

    if (channel) {
        LOG_INFO("[Transport] Disconnected" + (reason ? ": " + *reason : std::string()) +
                 (pending.empty() ? std::string() : " (" + std::to_string(pending.size()) + " pending failed)"));
        if (notify && handler) {
            handler(reason);
        }
    }
}

std::shared_ptr<FrameChannel> ProtocolTransport::ensure_pointer_socket() {
    std::lock_guard<std::mutex> setup(m_pointer_setup_mutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_pointer && m_pointer->is_open()) {
            return m_pointer;
        }
    }

    const auto timeout = std::chrono::milliseconds(ConfigManager::getInstance().getStateQueryTimeoutMs());
    const json response = request(kPointerSocketUri, std::nullopt, timeout);
    const auto path = ResponseDecoder::pointer_socket_path(response);
    if (!path) {
        throw TvLinkError(ErrorCode::InvalidResponse);
    }
    const auto endpoint = parse_socket_url(*path);
    if (!endpoint) {
        throw TvLinkError(ErrorCode::InvalidResponse);
    }

    std::shared_ptr<FrameChannel> pointer(m_factory());
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        generation = m_generation;
    }
    pointer->open(*endpoint,
                  std::chrono::milliseconds(ConfigManager::getInstance().getConnectTimeoutMs()),
                  [](const std::string&) {},
                  [](const std::string& reason) { LOG_DEBUG("[Transport] Pointer socket closed: " + reason); });

    std::lock_guard<std::mutex> lock(m_mutex);
    if (generation != m_generation || !m_channel) {
        pointer->close();
        throw TvLinkError(ErrorCode::NotConnected);
    }
    m_pointer = pointer;
    LOG_DEBUG("[Transport] Pointer socket ready at " + endpoint->url());
    return pointer;
}

void ProtocolTransport::reset_pointer_socket() {
    std::shared_ptr<FrameChannel> pointer;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pointer = std::move(m_pointer);
        m_pointer.reset();
    }
    if (pointer) {
        pointer->close();
    }
}

void ProtocolTransport::prewarm_pointer_socket() {
    ensure_pointer_socket();
}

void ProtocolTransport::send_pointer_button(const std::string& name) {
    const std::string frame = "type:button\nname:" + name + "\n\n";
    try {
        ensure_pointer_socket()->send_text(frame);
        return;
    } catch (const TvLinkError& e) {
        if (e.code() == ErrorCode::Cancelled) {
            throw;
        }
        LOG_DEBUG(std::string("[Transport] Pointer send failed, reopening: ") + e.what());
    }
    reset_pointer_socket();
    ensure_pointer_socket()->send_text(frame);
}

bool ProtocolTransport::is_connected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channel != nullptr && m_channel->is_open();
}

std::optional<Endpoint> ProtocolTransport::endpoint() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endpoint;
}

size_t ProtocolTransport::pending_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size() + (m_registration ? 1 : 0);
}

} // namespace tvlink
