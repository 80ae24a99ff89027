#ifndef TVLINK_NETWORK_INTERFACES_H
#define TVLINK_NETWORK_INTERFACES_H

#include <optional>
#include <string>
#include <vector>

namespace tvlink {

struct LocalInterface {
    std::string name;
    std::string address;
    std::string netmask;
    std::string broadcast;
};

// Up, running, non-loopback IPv4 interfaces, in kernel order.
std::vector<LocalInterface> list_ipv4_interfaces();

// The interface discovery scans from; wireless names are preferred.
std::optional<LocalInterface> primary_ipv4_interface();

bool has_usable_ipv4_interface();

// "192.168.1.20" -> "192.168.1"
std::optional<std::string> ipv4_prefix(const std::string& address);

// "192.168.1.20" -> "192.168.1.255"
std::optional<std::string> slash24_broadcast(const std::string& address);

bool is_ipv4_literal(const std::string& text);

} // namespace tvlink

#endif // TVLINK_NETWORK_INTERFACES_H
