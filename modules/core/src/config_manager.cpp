#include "config_manager.h"
#include "logger.h"
#include <fstream>
#include <iostream>

namespace tvlink {

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            std::cerr << "ERROR: Failed to open config file: " << config_path << std::endl;
            return false;
        }
        json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            std::cerr << "ERROR: Config root must be an object: " << config_path << std::endl;
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_config = std::move(parsed);
        }
        LOG_INFO("[Config] Loaded " + config_path);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Config loading failed: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = std::move(parsed);
    return true;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (!child.is_object()) {
            child = json::object();
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

json ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

template <typename T>
T ConfigManager::valueAt(std::initializer_list<const char*> path, const T& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const json* node = &m_config;
    for (const char* key : path) {
        if (!node->is_object()) {
            return fallback;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return fallback;
        }
        node = &(*it);
    }
    try {
        return node->get<T>();
    } catch (const json::exception&) {
        return fallback;
    }
}

std::string ConfigManager::getLogLevel() const {
    return valueAt<std::string>({"logging", "level"}, "info");
}

bool ConfigManager::isAsyncLogging() const {
    return valueAt<bool>({"logging", "async"}, false);
}

bool ConfigManager::isSsdpEnabled() const {
    return valueAt<bool>({"discovery", "ssdp_enabled"}, true);
}

bool ConfigManager::isMdnsEnabled() const {
    return valueAt<bool>({"discovery", "mdns_enabled"}, true);
}

bool ConfigManager::isSubnetScanEnabled() const {
    return valueAt<bool>({"discovery", "subnet_scan_enabled"}, true);
}

int ConfigManager::getSsdpIntervalMs() const {
    return valueAt<int>({"discovery", "ssdp_interval_ms"}, 3000);
}

int ConfigManager::getEmptyHintDelayMs() const {
    return valueAt<int>({"discovery", "empty_hint_delay_ms"}, 9000);
}

int ConfigManager::getSubnetFallbackDelayMs() const {
    return valueAt<int>({"discovery", "subnet_fallback_delay_ms"}, 4000);
}

int ConfigManager::getSubnetBatchSize() const {
    return valueAt<int>({"discovery", "subnet_batch_size"}, 24);
}

int ConfigManager::getSubnetProbeTimeoutMs() const {
    return valueAt<int>({"discovery", "subnet_probe_timeout_ms"}, 450);
}

int ConfigManager::getDescriptionFetchTimeoutMs() const {
    return valueAt<int>({"discovery", "description_fetch_timeout_ms"}, 2500);
}

std::vector<int> ConfigManager::getControlPorts() const {
    return valueAt<std::vector<int>>({"discovery", "control_ports"}, {3000, 3001});
}

int ConfigManager::getConnectTimeoutMs() const {
    return valueAt<int>({"transport", "connect_timeout_ms"}, 4000);
}

int ConfigManager::getDefaultRequestTimeoutMs() const {
    return valueAt<int>({"transport", "request_timeout_ms"}, 12000);
}

int ConfigManager::getDefaultRegisterTimeoutMs() const {
    return valueAt<int>({"transport", "register_timeout_ms"}, 30000);
}

std::vector<std::string> ConfigManager::getFailureTextFields() const {
    return valueAt<std::vector<std::string>>(
        {"transport", "failure_fields", "text"},
        {"errorText", "message", "errorDescription", "reason"});
}

std::vector<std::string> ConfigManager::getFailureCodeFields() const {
    return valueAt<std::vector<std::string>>({"transport", "failure_fields", "code"}, {"errorCode"});
}

int ConfigManager::getControlCommandTimeoutMs() const {
    return valueAt<int>({"session", "control_command_timeout_ms"}, 1400);
}

int ConfigManager::getStateQueryTimeoutMs() const {
    return valueAt<int>({"session", "state_query_timeout_ms"}, 1900);
}

int ConfigManager::getLaunchDataTimeoutMs() const {
    return valueAt<int>({"session", "launch_data_timeout_ms"}, 3200);
}

int ConfigManager::getPingTimeoutMs() const {
    return valueAt<int>({"session", "ping_timeout_ms"}, 1200);
}

int ConfigManager::getPairingRegistrationTimeoutMs() const {
    return valueAt<int>({"session", "pairing_registration_timeout_ms"}, 30000);
}

int ConfigManager::getReconnectRegistrationTimeoutMs() const {
    return valueAt<int>({"session", "reconnect_registration_timeout_ms"}, 3200);
}

int ConfigManager::getFallbackProbeTimeoutMs() const {
    return valueAt<int>({"session", "fallback_probe_timeout_ms"}, 250);
}

int ConfigManager::getLatencyWindowSize() const {
    return valueAt<int>({"session", "latency_window"}, 80);
}

int ConfigManager::getReconnectInitialDelayMs() const {
    return valueAt<int>({"reconnect", "initial_delay_ms"}, 50);
}

double ConfigManager::getReconnectBaseSeconds() const {
    return valueAt<double>({"reconnect", "base_seconds"}, 0.30);
}

double ConfigManager::getReconnectFactor() const {
    return valueAt<double>({"reconnect", "factor"}, 1.70);
}

double ConfigManager::getReconnectCapSeconds() const {
    return valueAt<double>({"reconnect", "cap_seconds"}, 6.5);
}

double ConfigManager::getReconnectJitterSeconds() const {
    return valueAt<double>({"reconnect", "jitter_seconds"}, 0.12);
}

int ConfigManager::getReconnectMaxExponent() const {
    return valueAt<int>({"reconnect", "max_exponent"}, 6);
}

int ConfigManager::getKeepaliveIntervalMs() const {
    return valueAt<int>({"keepalive", "interval_ms"}, 18000);
}

int ConfigManager::getKeepaliveTimeoutMs() const {
    return valueAt<int>({"keepalive", "timeout_ms"}, 1000);
}

int ConfigManager::getKeepaliveGraceMs() const {
    return valueAt<int>({"keepalive", "command_grace_ms"}, 4000);
}

int ConfigManager::getKeepaliveFailureThreshold() const {
    return valueAt<int>({"keepalive", "failure_threshold"}, 2);
}

int ConfigManager::getRateLimitMs(const std::string& command_class) const {
    int fallback = 160;
    if (command_class == "volume") {
        fallback = 110;
    } else if (command_class == "set_volume") {
        fallback = 50;
    } else if (command_class == "dpad") {
        fallback = 75;
    }
    return valueAt<int>({"rate_limits", command_class.c_str()}, fallback);
}

std::string ConfigManager::getKnownDevicesPath() const {
    return valueAt<std::string>({"storage", "known_devices_path"}, "tvlink_known_devices.json");
}

std::string ConfigManager::getSecretStorePath() const {
    return valueAt<std::string>({"storage", "secret_store_path"}, "tvlink_secrets.json");
}

std::string ConfigManager::getSecretKeyPath() const {
    return valueAt<std::string>({"storage", "secret_key_path"}, "tvlink_secret.key");
}

int ConfigManager::getNetworkPollIntervalMs() const {
    return valueAt<int>({"network_monitor", "poll_interval_ms"}, 2000);
}

bool ConfigManager::isTelemetryEnabled() const {
    return valueAt<bool>({"telemetry", "enabled"}, true);
}

int ConfigManager::getTelemetryFlushIntervalMs() const {
    return valueAt<int>({"telemetry", "flush_interval_ms"}, 30000);
}

} // namespace tvlink
