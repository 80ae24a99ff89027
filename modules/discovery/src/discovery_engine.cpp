#include "discovery_engine.h"
#include "config_manager.h"
#include "logger.h"
#include "ssdp_codec.h"
#include "string_utils.h"
#include "telemetry.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace tvlink {

namespace {

constexpr const char* kEmptyResultsHint =
    "No LG TVs were discovered. Check Wi-Fi subnet, router multicast/client isolation, "
    "and LG Connect Apps on the TV.";

std::string first_txt(const std::map<std::string, std::string>& txt, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = txt.find(key);
        if (it != txt.end() && !trim(it->second).empty()) {
            return trim(it->second);
        }
    }
    return {};
}

} // namespace

DiscoveryEngine::DiscoveryEngine(std::shared_ptr<AddressProbe> probe,
                                 std::shared_ptr<DescriptionFetcher> fetcher)
    : m_probe(std::move(probe)), m_fetcher(std::move(fetcher)) {}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

void DiscoveryEngine::set_devices_handler(DevicesHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_devices_handler = std::move(handler);
}

void DiscoveryEngine::set_failure_handler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failure_handler = std::move(handler);
}

void DiscoveryEngine::start() {
    stop();

    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel = CancellationSource();
        token = m_cancel.token();
        m_devices.clear();
        m_fetching.clear();
        m_permission_reported = false;
    }
    m_running = true;
    publish();

    auto& config = ConfigManager::getInstance();
    LOG_INFO("[Discovery] Scan started (ssdp=" + std::string(config.isSsdpEnabled() ? "on" : "off") +
             " mdns=" + (config.isMdnsEnabled() ? "on" : "off") +
             " subnet=" + (config.isSubnetScanEnabled() ? "on" : "off") + ")");

    if (config.isMdnsEnabled()) {
        m_mdns.start(
            [this](const MdnsService& service) { ingest_mdns_service(service); },
            [this](int err, const std::string& message) { report_socket_error(err, message); },
            token);
    }
    if (config.isSsdpEnabled()) {
        spawn([this, token] { ssdp_loop(token); });
    }
    if (config.isSubnetScanEnabled()) {
        spawn([this, token] { subnet_fallback_loop(token); });
    }
    spawn([this, token] { empty_hint_loop(token); });
}

void DiscoveryEngine::stop() {
    const bool was_running = m_running.exchange(false);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel.cancel();
    }
    m_mdns.stop();

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(m_threads_mutex);
        threads.swap(m_threads);
    }
    for (auto& thread : threads) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else if (thread.joinable()) {
            thread.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_devices.clear();
        m_fetching.clear();
    }
    if (was_running) {
        LOG_INFO("[Discovery] Scan stopped");
    }
}

void DiscoveryEngine::spawn(std::function<void()> work) {
    std::lock_guard<std::mutex> lock(m_threads_mutex);
    m_threads.emplace_back(std::move(work));
}

std::vector<Device> DiscoveryEngine::devices() const {
    std::vector<Device> out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        out.reserve(m_devices.size());
        for (const auto& entry : m_devices) {
            out.push_back(entry.second);
        }
    }
    std::sort(out.begin(), out.end(), device_name_less);
    return out;
}

bool DiscoveryEngine::upsert_locked(const Device& incoming) {
    auto it = m_devices.find(incoming.id);
    if (it == m_devices.end()) {
        m_devices.emplace(incoming.id, incoming);
        return true;
    }
    Device merged = merge_sighting(it->second, incoming);
    if (merged.manufacturer == "LG" && !it->second.manufacturer.empty()) {
        merged.manufacturer = it->second.manufacturer;
    }
    if (nlohmann::json(merged) == nlohmann::json(it->second)) {
        return false;
    }
    it->second = merged;
    return true;
}

void DiscoveryEngine::publish() {
    std::lock_guard<std::mutex> publish_lock(m_publish_mutex);
    if (!m_running) {
        return;
    }
    DevicesHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = m_devices_handler;
    }
    const auto list = devices();
    LOG_DEBUG("[Discovery] Publishing " + std::to_string(list.size()) + " device(s)");
    if (handler) {
        handler(list);
    }
}

void DiscoveryEngine::report_failure(const TvLinkError& error) {
    FailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (error.code() == ErrorCode::LocalNetworkPermissionDenied) {
            if (m_permission_reported) {
                return;
            }
            m_permission_reported = true;
        }
        handler = m_failure_handler;
    }
    LOG_WARN(std::string("[Discovery] ") + error.what());
    if (handler) {
        handler(error);
    }
}

void DiscoveryEngine::report_socket_error(int err, const std::string& message) {
    if (err == EPERM || err == EACCES || is_permission_denied_error(message)) {
        report_failure(TvLinkError(ErrorCode::LocalNetworkPermissionDenied, message));
    } else {
        report_failure(TvLinkError(ErrorCode::NetworkFailure, message));
    }
}

void DiscoveryEngine::ingest_ssdp_response(const std::string& response, const std::string& sender_ip) {
    if (!m_running) {
        return;
    }
    auto sighting = device_from_ssdp_response(response, sender_ip);
    if (!sighting) {
        return;
    }
    Telemetry::getInstance().inc_counter("discovery.ssdp_responses");

    const std::string id = sighting->device.id;
    bool changed = false;
    bool fetch = false;
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        changed = upsert_locked(sighting->device);
        if (sighting->location && m_fetching.insert(id).second) {
            fetch = true;
            token = m_cancel.token();
        }
    }
    if (changed) {
        LOG_DEBUG("[SSDP] Sighting " + sighting->device.host + ":" + std::to_string(sighting->device.port));
        publish();
    }
    if (fetch) {
        const std::string location = *sighting->location;
        spawn([this, id, location, token] { fetch_description(id, location, token); });
    }
}

void DiscoveryEngine::ingest_mdns_service(const MdnsService& service) {
    if (!m_running) {
        return;
    }
    Device device = make_discovered_device(service.host, service.port);
    if (!trim(service.display_name).empty()) {
        device.name = trim(service.display_name);
    }
    const std::string model = first_txt(service.txt, {"model", "modelname", "md"});
    const std::string manufacturer = first_txt(service.txt, {"manufacturer", "mf"});
    if (!model.empty()) {
        device.model = model;
    }
    if (!manufacturer.empty()) {
        device.manufacturer = manufacturer;
    }
    if (!looks_like_webos_device(device.name, model, device.manufacturer)) {
        LOG_DEBUG("[mDNS] Ignoring non-LG service " + service.instance);
        return;
    }
    device.service_name = service.instance;

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        changed = upsert_locked(device);
    }
    if (changed) {
        publish();
    }
}

void DiscoveryEngine::ingest_subnet_hit(const std::string& host, int port) {
    if (!m_running) {
        return;
    }
    Telemetry::getInstance().inc_counter("discovery.subnet_hits");
    const Device device = make_manual_device(host, port);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_devices.count(device.id) != 0) {
            return;
        }
        m_devices.emplace(device.id, device);
    }
    LOG_INFO("[SubnetScan] Found candidate " + host + ":" + std::to_string(port));
    publish();
}

void DiscoveryEngine::apply_description(const std::string& device_id, const DeviceDescription& description) {
    if (!m_running) {
        return;
    }
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(device_id);
        if (it == m_devices.end()) {
            return;
        }
        Device updated = it->second;
        if (!description.friendly_name.empty() &&
            (!is_generic_name(description.friendly_name) || is_generic_name(updated.name))) {
            updated.name = description.friendly_name;
        }
        if (description.model && !description.model->empty()) {
            updated.model = description.model;
        }
        if (!description.manufacturer.empty()) {
            updated.manufacturer = description.manufacturer;
        }
        if (nlohmann::json(updated) != nlohmann::json(it->second)) {
            it->second = updated;
            changed = true;
        }
    }
    if (changed) {
        publish();
    }
}

void DiscoveryEngine::fetch_description(const std::string& device_id, const std::string& location,
                                        CancellationToken token) {
    const auto timeout = std::chrono::milliseconds(ConfigManager::getInstance().getDescriptionFetchTimeoutMs());
    auto body = m_fetcher->fetch(location, timeout);
    if (token.is_cancelled()) {
        return;
    }
    if (!body) {
        // Allow a later sighting to try again.
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fetching.erase(device_id);
        return;
    }
    auto description = parse_device_description(*body);
    if (!description) {
        LOG_DEBUG("[SSDP] Description at " + location + " is not an LG device");
        return;
    }
    apply_description(device_id, *description);
}

void DiscoveryEngine::ssdp_loop(CancellationToken token) {
    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        const int err = errno;
        report_socket_error(err, std::strerror(err));
        return;
    }

    unsigned char ttl = 2;
    setsockopt(sock, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (bind(sock, reinterpret_cast<sockaddr*>(&local), sizeof(local)) != 0) {
        const int err = errno;
        close(sock);
        report_socket_error(err, std::strerror(err));
        return;
    }

    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(kSsdpPort);
    inet_pton(AF_INET, kSsdpMulticastAddress, &group.sin_addr);

    const auto interval = std::chrono::milliseconds(ConfigManager::getInstance().getSsdpIntervalMs());
    auto next_probe = std::chrono::steady_clock::now();
    char buffer[4096];
    bool blocked = false;

    while (!token.is_cancelled() && !blocked) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= next_probe) {
            for (const auto& target : ssdp_search_targets()) {
                const std::string probe = build_msearch(target);
                if (sendto(sock, probe.data(), probe.size(), 0,
                           reinterpret_cast<sockaddr*>(&group), sizeof(group)) < 0) {
                    const int err = errno;
                    report_socket_error(err, std::strerror(err));
                    if (err == EPERM || err == EACCES) {
                        blocked = true;
                    }
                    break;
                }
            }
            next_probe = now + interval;
        }

        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(sock, &read_fds);
        timeval tv{0, 250000};
        if (select(sock + 1, &read_fds, nullptr, nullptr, &tv) <= 0) {
            continue;
        }

        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        const ssize_t received = recvfrom(sock, buffer, sizeof(buffer) - 1, 0,
                                          reinterpret_cast<sockaddr*>(&from), &from_len);
        if (received <= 0) {
            continue;
        }
        char sender[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &from.sin_addr, sender, sizeof(sender));
        ingest_ssdp_response(std::string(buffer, static_cast<size_t>(received)), sender);
    }
    close(sock);
}

void DiscoveryEngine::subnet_fallback_loop(CancellationToken token) {
    const auto delay = std::chrono::milliseconds(ConfigManager::getInstance().getSubnetFallbackDelayMs());
    if (!token.wait_for(delay)) {
        return;
    }
    if (!devices().empty()) {
        return;
    }
    auto local = primary_ipv4_interface();
    if (!local) {
        LOG_WARN("[SubnetScan] No active IPv4 interface, skipping fallback scan");
        return;
    }
    run_subnet_scan(*local, token);
}

void DiscoveryEngine::run_subnet_scan(const LocalInterface& local, CancellationToken token) {
    auto prefix = ipv4_prefix(local.address);
    if (!prefix) {
        return;
    }
    auto& config = ConfigManager::getInstance();
    const size_t batch_size = static_cast<size_t>(std::max(1, config.getSubnetBatchSize()));
    const auto timeout = std::chrono::milliseconds(config.getSubnetProbeTimeoutMs());
    const std::vector<int> ports = config.getControlPorts();

    std::vector<std::string> candidates;
    for (int i = 1; i <= 254; ++i) {
        std::string host = *prefix + "." + std::to_string(i);
        if (host != local.address) {
            candidates.push_back(std::move(host));
        }
    }
    LOG_INFO("[SubnetScan] Probing " + *prefix + ".0/24 from " + local.address);

    std::atomic<bool> denied{false};
    for (size_t index = 0; index < candidates.size(); index += batch_size) {
        if (token.is_cancelled() || !m_running || denied || !devices().empty()) {
            break;
        }
        const size_t end = std::min(index + batch_size, candidates.size());
        std::vector<std::thread> batch;
        batch.reserve(end - index);
        for (size_t i = index; i < end; ++i) {
            const std::string host = candidates[i];
            batch.emplace_back([this, host, timeout, &ports, &denied, token] {
                for (int port : ports) {
                    if (token.is_cancelled()) {
                        return;
                    }
                    const ProbeOutcome outcome = m_probe->probe_outcome(host, port, timeout);
                    if (outcome == ProbeOutcome::Reachable) {
                        ingest_subnet_hit(host, port);
                        return;
                    }
                    if (outcome == ProbeOutcome::PermissionDenied) {
                        denied = true;
                        return;
                    }
                }
            });
        }
        for (auto& t : batch) {
            t.join();
        }
    }
    if (denied) {
        report_failure(TvLinkError(ErrorCode::LocalNetworkPermissionDenied, "Subnet probe denied"));
    }
}

void DiscoveryEngine::empty_hint_loop(CancellationToken token) {
    const auto delay = std::chrono::milliseconds(ConfigManager::getInstance().getEmptyHintDelayMs());
    if (!token.wait_for(delay)) {
        return;
    }
    if (m_running && devices().empty()) {
        report_failure(TvLinkError(ErrorCode::NetworkFailure, kEmptyResultsHint));
    }
}

} // namespace tvlink
