#include "session_dependencies.h"
#include "config_manager.h"
#include "websocket_channel.h"

namespace tvlink {

FrameChannelFactory DefaultSessionDependenciesFactory::createChannelFactory() {
    return WebSocketChannel::factory();
}

std::shared_ptr<AddressProbe> DefaultSessionDependenciesFactory::createAddressProbe() {
    return std::make_shared<AddressProbe>();
}

std::shared_ptr<SecretStore> DefaultSessionDependenciesFactory::createSecretStore() {
    const auto& config = ConfigManager::getInstance();
    return std::make_shared<SodiumSecretStore>(config.getSecretStorePath(), config.getSecretKeyPath());
}

std::shared_ptr<KnownDevicesStore> DefaultSessionDependenciesFactory::createKnownDevicesStore() {
    return std::make_shared<JsonKnownDevicesStore>(ConfigManager::getInstance().getKnownDevicesPath());
}

std::shared_ptr<WakeOnLanSender> DefaultSessionDependenciesFactory::createWakeOnLanSender() {
    return std::make_shared<WakeOnLanSender>();
}

std::unique_ptr<DiscoveryEngine> DefaultSessionDependenciesFactory::createDiscoveryEngine() {
    return std::make_unique<DiscoveryEngine>(createAddressProbe(), std::make_shared<DescriptionFetcher>());
}

std::unique_ptr<NetworkMonitor> DefaultSessionDependenciesFactory::createNetworkMonitor() {
    return std::make_unique<NetworkMonitor>();
}

} // namespace tvlink
