#ifndef TVLINK_NETWORK_MONITOR_H
#define TVLINK_NETWORK_MONITOR_H

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>

#include "cancellation.h"

namespace tvlink {

// Polls local interfaces and reports reachability changes. The first poll
// always reports.
class NetworkMonitor {
public:
    using ReachabilityHandler = std::function<void(bool reachable)>;
    using ReachabilityCheck = std::function<bool()>;

    // Default check: an up, running, non-loopback IPv4 interface exists.
    explicit NetworkMonitor(ReachabilityCheck check = ReachabilityCheck());
    ~NetworkMonitor();

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    // Interval 0 uses network_monitor.poll_interval_ms.
    void start(ReachabilityHandler handler, std::chrono::milliseconds interval = std::chrono::milliseconds(0));
    void stop();

    std::optional<bool> last_known() const;

private:
    void poll_loop(CancellationToken token, ReachabilityHandler handler, std::chrono::milliseconds interval);

    ReachabilityCheck m_check;
    std::atomic<int> m_last{-1};
    TaskSlot m_task;
};

} // namespace tvlink

#endif // TVLINK_NETWORK_MONITOR_H
