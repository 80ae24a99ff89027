#ifndef TVLINK_KNOWN_DEVICES_STORE_H
#define TVLINK_KNOWN_DEVICES_STORE_H

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "device.h"

namespace tvlink {

// Devices seen or paired before, plus the id of the last connected one.
// Lists come back most recently connected first, never-connected last, then by name.
class KnownDevicesStore {
public:
    virtual ~KnownDevicesStore() = default;

    std::vector<Device> load();
    bool save(std::vector<Device> devices);

    // Keeps the stored lastConnectedAt and wake address when the new record lacks them.
    bool upsert(const Device& device);

    // Stamps lastConnectedAt with now and remembers the id. Returns the stamped record.
    Device mark_connected(const Device& device);

    // The remembered device, else the most recently connected one.
    std::optional<Device> last_connected_device();

    std::optional<Device> find(const std::string& device_id);

    static bool sort_rule(const Device& lhs, const Device& rhs);

protected:
    struct Snapshot {
        std::vector<Device> devices;
        std::string last_connected_id;
    };

    virtual Snapshot read_snapshot() = 0;
    virtual bool write_snapshot(const Snapshot& snapshot) = 0;

private:
    std::recursive_mutex m_mutex;
};

class InMemoryKnownDevicesStore : public KnownDevicesStore {
protected:
    Snapshot read_snapshot() override { return m_snapshot; }
    bool write_snapshot(const Snapshot& snapshot) override {
        m_snapshot = snapshot;
        return true;
    }

private:
    Snapshot m_snapshot;
};

// {"version": 1, "lastConnectedId": "...", "devices": [...]}, replaced atomically on write.
class JsonKnownDevicesStore : public KnownDevicesStore {
public:
    explicit JsonKnownDevicesStore(std::string path);

    const std::string& path() const { return m_path; }

protected:
    Snapshot read_snapshot() override;
    bool write_snapshot(const Snapshot& snapshot) override;

private:
    std::string m_path;
};

} // namespace tvlink

#endif // TVLINK_KNOWN_DEVICES_STORE_H
