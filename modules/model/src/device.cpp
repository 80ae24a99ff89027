#include "device.h"
#include "string_utils.h"

namespace tvlink {

namespace {
const std::vector<std::pair<Capability, const char*>>& capability_names() {
    static const std::vector<std::pair<Capability, const char*>> names = {
        {Capability::Power, "power"},
        {Capability::Volume, "volume"},
        {Capability::DirectionalPad, "dpad"},
        {Capability::Home, "home"},
        {Capability::Back, "back"},
        {Capability::Mute, "mute"},
        {Capability::LaunchApp, "launchApp"},
        {Capability::InputSwitch, "inputSwitch"},
        {Capability::NowPlaying, "nowPlaying"},
        {Capability::Keyboard, "keyboard"},
    };
    return names;
}
} // namespace

const char* capability_name(Capability capability) {
    for (const auto& entry : capability_names()) {
        if (entry.first == capability) {
            return entry.second;
        }
    }
    return "unknown";
}

std::optional<Capability> capability_from_name(const std::string& name) {
    for (const auto& entry : capability_names()) {
        if (equals_ci(name, entry.second)) {
            return entry.first;
        }
    }
    if (equals_ci(name, "directionalPad")) {
        return Capability::DirectionalPad;
    }
    return std::nullopt;
}

std::set<Capability> all_capabilities() {
    std::set<Capability> out;
    for (const auto& entry : capability_names()) {
        out.insert(entry.first);
    }
    return out;
}

std::string device_id_for_host(const std::string& host) {
    return "lg-" + to_lower(trim(host));
}

bool is_generic_name(const std::string& name) {
    return name.empty() || name == kGenericDeviceName || name.rfind("LG TV (", 0) == 0;
}

Device make_discovered_device(const std::string& host, int port) {
    Device device;
    device.id = device_id_for_host(host);
    device.name = kGenericDeviceName;
    device.host = host;
    device.port = port;
    device.capabilities = all_capabilities();
    return device;
}

Device make_manual_device(const std::string& host, int port) {
    Device device = make_discovered_device(host, port);
    device.name = "LG TV (" + host + ")";
    return device;
}

Device merge_sighting(const Device& existing, const Device& incoming) {
    Device merged = incoming;
    if (!is_generic_name(existing.name) && is_generic_name(incoming.name)) {
        merged.name = existing.name;
    }
    if (existing.model && !existing.model->empty() && (!incoming.model || incoming.model->empty())) {
        merged.model = existing.model;
    }
    if (!merged.last_connected_at) {
        merged.last_connected_at = existing.last_connected_at;
    }
    if (!merged.wake_mac) {
        merged.wake_mac = existing.wake_mac;
    }
    if (merged.service_name.empty()) {
        merged.service_name = existing.service_name;
    }
    return merged;
}

bool device_name_less(const Device& lhs, const Device& rhs) {
    const std::string l = to_lower(lhs.name);
    const std::string r = to_lower(rhs.name);
    if (l != r) {
        return l < r;
    }
    return lhs.id < rhs.id;
}

std::string describe_capabilities(const std::set<Capability>& capabilities) {
    std::string out;
    for (Capability c : capabilities) {
        if (!out.empty()) {
            out += ",";
        }
        out += capability_name(c);
    }
    return out;
}

int64_t to_epoch_ms(SystemTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

SystemTime from_epoch_ms(int64_t ms) {
    return SystemTime(std::chrono::milliseconds(ms));
}

void to_json(nlohmann::json& j, const Device& device) {
    nlohmann::json caps = nlohmann::json::array();
    for (Capability c : device.capabilities) {
        caps.push_back(capability_name(c));
    }
    j = nlohmann::json{
        {"id", device.id},
        {"name", device.name},
        {"ip", device.host},
        {"manufacturer", device.manufacturer},
        {"port", device.port},
        {"capabilities", caps},
    };
    if (device.model) j["model"] = *device.model;
    if (device.last_connected_at) j["lastConnectedAt"] = to_epoch_ms(*device.last_connected_at);
    if (device.wake_mac) j["wakeMACAddress"] = *device.wake_mac;
    if (!device.service_name.empty()) j["serviceName"] = device.service_name;
}

void from_json(const nlohmann::json& j, Device& device) {
    device.id = j.at("id").get<std::string>();
    device.host = j.at("ip").get<std::string>();
    device.name = j.value("name", std::string(kGenericDeviceName));
    device.manufacturer = j.value("manufacturer", std::string("LG"));
    device.port = j.value("port", 3000);
    device.model.reset();
    device.last_connected_at.reset();
    device.wake_mac.reset();
    if (j.contains("model") && j["model"].is_string()) {
        device.model = j["model"].get<std::string>();
    }
    if (j.contains("lastConnectedAt") && j["lastConnectedAt"].is_number_integer()) {
        device.last_connected_at = from_epoch_ms(j["lastConnectedAt"].get<int64_t>());
    }
    if (j.contains("wakeMACAddress") && j["wakeMACAddress"].is_string()) {
        device.wake_mac = j["wakeMACAddress"].get<std::string>();
    }
    device.service_name = j.value("serviceName", std::string());
    device.capabilities.clear();
    if (j.contains("capabilities") && j["capabilities"].is_array()) {
        for (const auto& c : j["capabilities"]) {
            if (!c.is_string()) continue;
            if (auto cap = capability_from_name(c.get<std::string>())) {
                device.capabilities.insert(*cap);
            }
        }
    }
}

} // namespace tvlink
