#include "network_monitor.h"
#include "config_manager.h"
#include "logger.h"
#include "network_interfaces.h"

namespace tvlink {

NetworkMonitor::NetworkMonitor(ReachabilityCheck check)
    : m_check(check ? std::move(check) : ReachabilityCheck(has_usable_ipv4_interface)) {}

NetworkMonitor::~NetworkMonitor() {
    stop();
}

void NetworkMonitor::start(ReachabilityHandler handler, std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds(ConfigManager::getInstance().getNetworkPollIntervalMs());
    }
    m_last.store(-1);
    m_task.start([this, handler = std::move(handler), interval](CancellationToken token) {
        poll_loop(token, handler, interval);
    });
}

void NetworkMonitor::stop() {
    m_task.shutdown();
}

std::optional<bool> NetworkMonitor::last_known() const {
    const int last = m_last.load();
    if (last < 0) {
        return std::nullopt;
    }
    return last == 1;
}

void NetworkMonitor::poll_loop(CancellationToken token, ReachabilityHandler handler,
                               std::chrono::milliseconds interval) {
    do {
        const int reachable = m_check() ? 1 : 0;
        const int previous = m_last.exchange(reachable);
        if (previous != reachable) {
            LOG_INFO(std::string("[Session] Network ") + (reachable ? "reachable" : "unreachable"));
            if (handler) {
                handler(reachable == 1);
            }
        }
    } while (token.wait_for(interval));
}

} // namespace tvlink
