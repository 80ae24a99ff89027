#ifndef TVLINK_DEVICE_H
#define TVLINK_DEVICE_H

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tvlink {

enum class Capability {
    Power,
    Volume,
    DirectionalPad,
    Home,
    Back,
    Mute,
    LaunchApp,
    InputSwitch,
    NowPlaying,
    Keyboard
};

const char* capability_name(Capability capability);
std::optional<Capability> capability_from_name(const std::string& name);
std::set<Capability> all_capabilities();

using SystemTime = std::chrono::system_clock::time_point;

struct Device {
    std::string id;
    std::string name;
    std::string host;
    std::string manufacturer = "LG";
    std::optional<std::string> model;
    std::set<Capability> capabilities;
    int port = 3000;
    std::optional<SystemTime> last_connected_at;
    std::optional<std::string> wake_mac;
    // USN or DNS-SD instance name reported by the device, if any.
    std::string service_name;

    bool has(Capability capability) const { return capabilities.count(capability) != 0; }
    bool secure() const { return port == 3001; }
};

constexpr const char* kGenericDeviceName = "LG webOS TV";

std::string device_id_for_host(const std::string& host);
// Placeholder names: the generic label and the "LG TV (<host>)" form.
bool is_generic_name(const std::string& name);

// A device as first seen by discovery: generic name, every capability assumed.
Device make_discovered_device(const std::string& host, int port);

// Subnet hits and manually entered addresses.
Device make_manual_device(const std::string& host, int port);

// Result of a re-sighting: learned name/model survive unless the new data is strictly better.
Device merge_sighting(const Device& existing, const Device& incoming);

// Case-insensitive ordering by name, then id.
bool device_name_less(const Device& lhs, const Device& rhs);

std::string describe_capabilities(const std::set<Capability>& capabilities);

int64_t to_epoch_ms(SystemTime t);
SystemTime from_epoch_ms(int64_t ms);

void to_json(nlohmann::json& j, const Device& device);
void from_json(const nlohmann::json& j, Device& device);

} // namespace tvlink

#endif // TVLINK_DEVICE_H
