#include "known_devices_store.h"
#include "file_utils.h"
#include "logger.h"
#include "string_utils.h"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace tvlink {

bool KnownDevicesStore::sort_rule(const Device& lhs, const Device& rhs) {
    if (lhs.last_connected_at && rhs.last_connected_at) {
        if (*lhs.last_connected_at != *rhs.last_connected_at) {
            return *lhs.last_connected_at > *rhs.last_connected_at;
        }
    } else if (lhs.last_connected_at) {
        return true;
    } else if (rhs.last_connected_at) {
        return false;
    }
    return device_name_less(lhs, rhs);
}

std::vector<Device> KnownDevicesStore::load() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto devices = read_snapshot().devices;
    std::sort(devices.begin(), devices.end(), sort_rule);
    return devices;
}

bool KnownDevicesStore::save(std::vector<Device> devices) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Snapshot snapshot = read_snapshot();
    std::sort(devices.begin(), devices.end(), sort_rule);
    snapshot.devices = std::move(devices);
    return write_snapshot(snapshot);
}

bool KnownDevicesStore::upsert(const Device& device) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Snapshot snapshot = read_snapshot();
    auto it = std::find_if(snapshot.devices.begin(), snapshot.devices.end(),
                           [&](const Device& d) { return d.id == device.id; });
    if (it == snapshot.devices.end()) {
        snapshot.devices.push_back(device);
    } else {
        Device merged = device;
        if (!merged.last_connected_at) {
            merged.last_connected_at = it->last_connected_at;
        }
        if (!merged.wake_mac) {
            merged.wake_mac = it->wake_mac;
        }
        *it = merged;
    }
    std::sort(snapshot.devices.begin(), snapshot.devices.end(), sort_rule);
    return write_snapshot(snapshot);
}

Device KnownDevicesStore::mark_connected(const Device& device) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Device stamped = device;
    stamped.last_connected_at = std::chrono::system_clock::now();
    upsert(stamped);

    Snapshot snapshot = read_snapshot();
    snapshot.last_connected_id = stamped.id;
    if (!write_snapshot(snapshot)) {
        LOG_WARN("[Store] Could not record last connected device " + stamped.id);
    }
    if (auto stored = find(stamped.id)) {
        return *stored;
    }
    return stamped;
}

std::optional<Device> KnownDevicesStore::last_connected_device() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const Snapshot snapshot = read_snapshot();
    auto devices = snapshot.devices;
    std::sort(devices.begin(), devices.end(), sort_rule);
    if (!snapshot.last_connected_id.empty()) {
        for (const auto& device : devices) {
            if (device.id == snapshot.last_connected_id) {
                return device;
            }
        }
    }
    if (devices.empty()) {
        return std::nullopt;
    }
    return devices.front();
}

std::optional<Device> KnownDevicesStore::find(const std::string& device_id) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    for (const auto& device : read_snapshot().devices) {
        if (device.id == device_id) {
            return device;
        }
    }
    return std::nullopt;
}

JsonKnownDevicesStore::JsonKnownDevicesStore(std::string path) : m_path(std::move(path)) {}

KnownDevicesStore::Snapshot JsonKnownDevicesStore::read_snapshot() {
    Snapshot snapshot;
    const auto raw = read_file(m_path);
    if (!raw || trim(*raw).empty()) {
        return snapshot;
    }
    try {
        const auto doc = nlohmann::json::parse(*raw);
        snapshot.last_connected_id = doc.value("lastConnectedId", std::string());
        if (doc.contains("devices") && doc["devices"].is_array()) {
            for (const auto& entry : doc["devices"]) {
                try {
                    snapshot.devices.push_back(entry.get<Device>());
                } catch (const nlohmann::json::exception& e) {
                    LOG_WARN("[Store] Skipping malformed device record: " + std::string(e.what()));
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("[Store] Cannot parse " + m_path + ": " + e.what());
    }
    return snapshot;
}

bool JsonKnownDevicesStore::write_snapshot(const Snapshot& snapshot) {
    nlohmann::json doc = {
        {"version", 1},
        {"lastConnectedId", snapshot.last_connected_id},
        {"devices", snapshot.devices},
    };
    if (!write_file_atomically(m_path, doc.dump(2))) {
        LOG_ERROR("[Store] Failed to persist known devices to " + m_path);
        return false;
    }
    return true;
}

} // namespace tvlink
