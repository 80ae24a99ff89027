#ifndef TVLINK_SECRET_STORE_H
#define TVLINK_SECRET_STORE_H

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tvlink {

// Opaque key/value store for pairing credentials. A failed read is reported
// as "no stored value"; writers return false and log.
class SecretStore {
public:
    virtual ~SecretStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
};

// "lg.webos.clientKey.<device id lowercased>"
std::string client_key_slot(const std::string& device_id);

class InMemorySecretStore : public SecretStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_values;
};

/**
 * @brief File-backed store; every value is sealed with crypto_secretbox.
 *
 * The 32-byte key lives in its own file (mode 0600) and is generated on first
 * use. The store file is a JSON object of {"nonce": hex, "box": hex} entries.
 */
class SodiumSecretStore : public SecretStore {
public:
    SodiumSecretStore(std::string store_path, std::string key_path);

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

private:
    bool ensure_key_locked();
    nlohmann::json load_locked() const;
    bool save_locked(const nlohmann::json& entries) const;

    std::string m_store_path;
    std::string m_key_path;
    std::mutex m_mutex;
    std::vector<unsigned char> m_key;
};

} // namespace tvlink

#endif // TVLINK_SECRET_STORE_H
