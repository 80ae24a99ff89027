#ifndef TVLINK_SESSION_DEPENDENCIES_H
#define TVLINK_SESSION_DEPENDENCIES_H

#include <memory>

#include "address_probe.h"
#include "discovery_engine.h"
#include "frame_channel.h"
#include "known_devices_store.h"
#include "network_monitor.h"
#include "secret_store.h"
#include "wake_on_lan.h"

namespace tvlink {

/**
 * @brief Factory interface for the collaborators a SessionController needs.
 *
 * Production code uses DefaultSessionDependenciesFactory; tests substitute
 * scripted channels, probes and in-memory stores.
 */
class ISessionDependenciesFactory {
public:
    virtual ~ISessionDependenciesFactory() = default;

    virtual FrameChannelFactory createChannelFactory() = 0;
    virtual std::shared_ptr<AddressProbe> createAddressProbe() = 0;
    virtual std::shared_ptr<SecretStore> createSecretStore() = 0;
    virtual std::shared_ptr<KnownDevicesStore> createKnownDevicesStore() = 0;
    virtual std::shared_ptr<WakeOnLanSender> createWakeOnLanSender() = 0;
    // May return null to run without discovery.
    virtual std::unique_ptr<DiscoveryEngine> createDiscoveryEngine() = 0;
    // May return null to run without reachability monitoring.
    virtual std::unique_ptr<NetworkMonitor> createNetworkMonitor() = 0;
};

// WebSocket channels, the sodium secret store and the JSON known-devices file
// at the paths named in the storage config section.
class DefaultSessionDependenciesFactory : public ISessionDependenciesFactory {
public:
    FrameChannelFactory createChannelFactory() override;
    std::shared_ptr<AddressProbe> createAddressProbe() override;
    std::shared_ptr<SecretStore> createSecretStore() override;
    std::shared_ptr<KnownDevicesStore> createKnownDevicesStore() override;
    std::shared_ptr<WakeOnLanSender> createWakeOnLanSender() override;
    std::unique_ptr<DiscoveryEngine> createDiscoveryEngine() override;
    std::unique_ptr<NetworkMonitor> createNetworkMonitor() override;
};

} // namespace tvlink

#endif // TVLINK_SESSION_DEPENDENCIES_H
