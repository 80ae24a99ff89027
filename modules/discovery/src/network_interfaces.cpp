#include "network_interfaces.h"
#include "string_utils.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace tvlink {

namespace {

std::string to_text(const sockaddr* addr) {
    if (!addr || addr->sa_family != AF_INET) {
        return {};
    }
    char buf[INET_ADDRSTRLEN] = {0};
    const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
    if (!inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf))) {
        return {};
    }
    return buf;
}

bool looks_wireless(const std::string& name) {
    return name.rfind("wl", 0) == 0 || name.rfind("wlan", 0) == 0 || name.rfind("en", 0) == 0;
}

} // namespace

std::vector<LocalInterface> list_ipv4_interfaces() {
    std::vector<LocalInterface> result;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0 || !ifaddr) {
        return result;
    }
    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_RUNNING) == 0) {
            continue;
        }
        if ((ifa->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        LocalInterface entry;
        entry.name = ifa->ifa_name ? ifa->ifa_name : "";
        entry.address = to_text(ifa->ifa_addr);
        entry.netmask = to_text(ifa->ifa_netmask);
        if ((ifa->ifa_flags & IFF_BROADCAST) != 0) {
            entry.broadcast = to_text(ifa->ifa_broadaddr);
        }
        if (entry.broadcast.empty()) {
            entry.broadcast = slash24_broadcast(entry.address).value_or("");
        }
        if (!entry.address.empty()) {
            result.push_back(entry);
        }
    }
    freeifaddrs(ifaddr);
    return result;
}

std::optional<LocalInterface> primary_ipv4_interface() {
    const auto interfaces = list_ipv4_interfaces();
    for (const auto& entry : interfaces) {
        if (looks_wireless(entry.name)) {
            return entry;
        }
    }
    if (!interfaces.empty()) {
        return interfaces.front();
    }
    return std::nullopt;
}

bool has_usable_ipv4_interface() {
    return !list_ipv4_interfaces().empty();
}

bool is_ipv4_literal(const std::string& text) {
    in_addr addr{};
    return inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

std::optional<std::string> ipv4_prefix(const std::string& address) {
    if (!is_ipv4_literal(address)) {
        return std::nullopt;
    }
    const auto parts = split(address, '.');
    if (parts.size() != 4) {
        return std::nullopt;
    }
    return parts[0] + "." + parts[1] + "." + parts[2];
}

std::optional<std::string> slash24_broadcast(const std::string& address) {
    auto prefix = ipv4_prefix(address);
    if (!prefix) {
        return std::nullopt;
    }
    return *prefix + ".255";
}

} // namespace tvlink
