#ifndef TVLINK_WAKE_ON_LAN_H
#define TVLINK_WAKE_ON_LAN_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tvlink {

constexpr size_t kMagicPacketSize = 102;

// "aa-bb-cc-dd-ee-ff", "aabb.ccdd.eeff", "AABBCCDDEEFF" -> "AA:BB:CC:DD:EE:FF".
std::optional<std::string> normalize_mac_address(const std::string& raw);

// 6 x 0xFF followed by the MAC repeated 16 times. Throws InvalidWakeAddress.
std::vector<uint8_t> build_magic_packet(const std::string& mac);

// Device address, its /24 broadcast, then the limited broadcast; duplicates removed.
std::vector<std::string> wake_targets(const std::optional<std::string>& host);

// Virtual so session tests can observe wake requests without sending datagrams.
class WakeOnLanSender {
public:
    virtual ~WakeOnLanSender() = default;

    // Sends the configured number of bursts to every target on UDP 9 and 7.
    // Throws InvalidWakeAddress, or NetworkFailure when nothing could be sent.
    virtual void send(const std::string& mac, const std::optional<std::string>& host);

    static constexpr int kBursts = 3;
    static constexpr std::chrono::milliseconds kBurstSpacing{140};
};

} // namespace tvlink

#endif // TVLINK_WAKE_ON_LAN_H
