#include "wake_on_lan.h"
#include "logger.h"
#include "network_interfaces.h"
#include "tvlink_error.h"

#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace tvlink {

namespace {
const int kWakePorts[] = {9, 7};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}
} // namespace

std::optional<std::string> normalize_mac_address(const std::string& raw) {
    std::string digits;
    for (char c : raw) {
        if (c == ':' || c == '-' || c == '.' || std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (hex_value(c) < 0) {
            return std::nullopt;
        }
        digits.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (digits.size() != 12) {
        return std::nullopt;
    }
    std::string out;
    for (size_t i = 0; i < digits.size(); i += 2) {
        if (!out.empty()) out.push_back(':');
        out.append(digits, i, 2);
    }
    return out;
}

std::vector<uint8_t> build_magic_packet(const std::string& mac) {
    const auto normalized = normalize_mac_address(mac);
    if (!normalized) {
        throw TvLinkError(ErrorCode::InvalidWakeAddress, mac);
    }
    uint8_t bytes[6];
    for (size_t i = 0; i < 6; ++i) {
        bytes[i] = static_cast<uint8_t>(hex_value((*normalized)[i * 3]) * 16 + hex_value((*normalized)[i * 3 + 1]));
    }

    std::vector<uint8_t> packet(6, 0xFF);
    packet.reserve(kMagicPacketSize);
    for (int i = 0; i < 16; ++i) {
        packet.insert(packet.end(), bytes, bytes + 6);
    }
    return packet;
}

std::vector<std::string> wake_targets(const std::optional<std::string>& host) {
    std::vector<std::string> targets;
    auto add = [&targets](const std::string& target) {
        for (const auto& existing : targets) {
            if (existing == target) return;
        }
        targets.push_back(target);
    };
    if (host && is_ipv4_literal(*host)) {
        add(*host);
        if (auto broadcast = slash24_broadcast(*host)) {
            add(*broadcast);
        }
    }
    add("255.255.255.255");
    return targets;
}

void WakeOnLanSender::send(const std::string& mac, const std::optional<std::string>& host) {
    const std::vector<uint8_t> packet = build_magic_packet(mac);
    const auto targets = wake_targets(host);

    int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        throw TvLinkError(ErrorCode::NetworkFailure, std::string("Wake-on-LAN socket failed: ") + std::strerror(errno));
    }
    int broadcast = 1;
    setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast));

    int sent = 0;
    int last_errno = 0;
    for (int burst = 0; burst < kBursts; ++burst) {
        if (burst > 0) {
            std::this_thread::sleep_for(kBurstSpacing);
        }
        for (const auto& target : targets) {
            for (int port : kWakePorts) {
                sockaddr_in dest{};
                dest.sin_family = AF_INET;
                dest.sin_port = htons(static_cast<uint16_t>(port));
                if (inet_pton(AF_INET, target.c_str(), &dest.sin_addr) != 1) {
                    continue;
                }
                ssize_t n = ::sendto(sock, packet.data(), packet.size(), 0,
                                     reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
                if (n == static_cast<ssize_t>(packet.size())) {
                    ++sent;
                } else {
                    last_errno = errno;
                }
            }
        }
    }
    close(sock);

    if (sent == 0) {
        throw TvLinkError(ErrorCode::NetworkFailure,
                          std::string("Wake-on-LAN packet could not be sent: ") + std::strerror(last_errno));
    }
    LOG_INFO("[WoL] Sent " + std::to_string(sent) + " magic packets for " + *normalize_mac_address(mac));
}

} // namespace tvlink
