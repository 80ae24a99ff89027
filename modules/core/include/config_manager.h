#pragma once

#include <nlohmann/json.hpp>
#include <initializer_list>
#include <mutex>
#include <string>
#include <vector>

namespace tvlink {

using json = nlohmann::json;

// Process-wide configuration backed by config.json. Every getter falls back to a
// built-in default, so a partial (or missing) file is valid.
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& text);
    void reset();

    // Runtime override, e.g. {"keepalive", "interval_ms"}. Creates intermediate objects.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);
    json snapshot() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

    // Discovery
    bool isSsdpEnabled() const;
    bool isMdnsEnabled() const;
    bool isSubnetScanEnabled() const;
    int getSsdpIntervalMs() const;
    int getEmptyHintDelayMs() const;
    int getSubnetFallbackDelayMs() const;
    int getSubnetBatchSize() const;
    int getSubnetProbeTimeoutMs() const;
    int getDescriptionFetchTimeoutMs() const;
    std::vector<int> getControlPorts() const;

    // Transport
    int getConnectTimeoutMs() const;
    int getDefaultRequestTimeoutMs() const;
    int getDefaultRegisterTimeoutMs() const;
    std::vector<std::string> getFailureTextFields() const;
    std::vector<std::string> getFailureCodeFields() const;

    // Session
    int getControlCommandTimeoutMs() const;
    int getStateQueryTimeoutMs() const;
    int getLaunchDataTimeoutMs() const;
    int getPingTimeoutMs() const;
    int getPairingRegistrationTimeoutMs() const;
    int getReconnectRegistrationTimeoutMs() const;
    int getFallbackProbeTimeoutMs() const;
    int getLatencyWindowSize() const;

    // Reconnect backoff
    int getReconnectInitialDelayMs() const;
    double getReconnectBaseSeconds() const;
    double getReconnectFactor() const;
    double getReconnectCapSeconds() const;
    double getReconnectJitterSeconds() const;
    int getReconnectMaxExponent() const;

    // Keepalive
    int getKeepaliveIntervalMs() const;
    int getKeepaliveTimeoutMs() const;
    int getKeepaliveGraceMs() const;
    int getKeepaliveFailureThreshold() const;

    // Rate limits ("volume", "set_volume", "dpad", "default")
    int getRateLimitMs(const std::string& command_class) const;

    // Storage
    std::string getKnownDevicesPath() const;
    std::string getSecretStorePath() const;
    std::string getSecretKeyPath() const;

    // Network monitor
    int getNetworkPollIntervalMs() const;

    // Telemetry
    bool isTelemetryEnabled() const;
    int getTelemetryFlushIntervalMs() const;

private:
    ConfigManager() = default;

    template <typename T>
    T valueAt(std::initializer_list<const char*> path, const T& fallback) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};

} // namespace tvlink
