#ifndef TVLINK_DISCOVERY_ENGINE_H
#define TVLINK_DISCOVERY_ENGINE_H

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "address_probe.h"
#include "cancellation.h"
#include "description_fetcher.h"
#include "device.h"
#include "mdns_browser.h"
#include "network_interfaces.h"
#include "tvlink_error.h"

namespace tvlink {

/**
 * @brief Finds webOS TVs on the LAN with three concurrent strategies
 * (mDNS/DNS-SD browse, SSDP M-SEARCH, and a /24 subnet fallback scan) and
 * publishes the merged, de-duplicated device list.
 *
 * Handlers run on discovery threads and are serialized; each publication is the
 * complete list ordered by display name.
 */
class DiscoveryEngine {
public:
    using DevicesHandler = std::function<void(const std::vector<Device>& devices)>;
    // Non-fatal; permission denial and the empty-results hint both arrive here.
    using FailureHandler = std::function<void(const TvLinkError& error)>;

    explicit DiscoveryEngine(std::shared_ptr<AddressProbe> probe = std::make_shared<AddressProbe>(),
                             std::shared_ptr<DescriptionFetcher> fetcher = std::make_shared<DescriptionFetcher>());
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    void set_devices_handler(DevicesHandler handler);
    void set_failure_handler(FailureHandler handler);

    // Publishes an empty list, then launches every enabled strategy.
    void start();
    // Cancels all strategies and clears results. Safe to call repeatedly.
    void stop();
    bool is_running() const { return m_running.load(); }

    std::vector<Device> devices() const;

    // Strategy entry points. Ignored unless a scan is running.
    void ingest_ssdp_response(const std::string& response, const std::string& sender_ip);
    void ingest_mdns_service(const MdnsService& service);
    void ingest_subnet_hit(const std::string& host, int port);
    void apply_description(const std::string& device_id, const DeviceDescription& description);

    // Probes prefix.1..254 (excluding self) in batches until a device is known.
    void run_subnet_scan(const LocalInterface& local, CancellationToken token);

private:
    void ssdp_loop(CancellationToken token);
    void subnet_fallback_loop(CancellationToken token);
    void empty_hint_loop(CancellationToken token);
    void fetch_description(const std::string& device_id, const std::string& location, CancellationToken token);

    // Inserts or merges; returns true when the published list changed.
    bool upsert_locked(const Device& incoming);
    void publish();
    void report_failure(const TvLinkError& error);
    void report_socket_error(int err, const std::string& message);
    void spawn(std::function<void()> work);

    std::shared_ptr<AddressProbe> m_probe;
    std::shared_ptr<DescriptionFetcher> m_fetcher;

    mutable std::mutex m_mutex;
    std::map<std::string, Device> m_devices;
    std::set<std::string> m_fetching;
    DevicesHandler m_devices_handler;
    FailureHandler m_failure_handler;
    bool m_permission_reported = false;

    std::mutex m_publish_mutex;
    std::atomic<bool> m_running{false};
    CancellationSource m_cancel;
    std::mutex m_threads_mutex;
    std::vector<std::thread> m_threads;
    MdnsBrowser m_mdns;
};

} // namespace tvlink

#endif // TVLINK_DISCOVERY_ENGINE_H
