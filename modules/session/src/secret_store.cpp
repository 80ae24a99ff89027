#include "secret_store.h"
#include "file_utils.h"
#include "logger.h"
#include "string_utils.h"

#include <sodium.h>

#include <sys/stat.h>

namespace tvlink {

namespace {

bool sodium_ready() {
    static const bool ready = sodium_init() >= 0;
    if (!ready) {
        LOG_ERROR("[Store] libsodium initialization failed");
    }
    return ready;
}

std::string to_hex(const unsigned char* data, size_t len) {
    std::string hex(len * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), data, len);
    hex.resize(len * 2);
    return hex;
}

bool from_hex(const std::string& hex, std::vector<unsigned char>& out) {
    out.assign(hex.size() / 2, 0);
    size_t written = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.c_str(), hex.size(), nullptr, &written, nullptr) != 0) {
        return false;
    }
    out.resize(written);
    return true;
}

} // namespace

std::string client_key_slot(const std::string& device_id) {
    return "lg.webos.clientKey." + to_lower(device_id);
}

std::optional<std::string> InMemorySecretStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemorySecretStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values[key] = value;
    return true;
}

bool InMemorySecretStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values.erase(key) > 0;
}

size_t InMemorySecretStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values.size();
}

SodiumSecretStore::SodiumSecretStore(std::string store_path, std::string key_path)
    : m_store_path(std::move(store_path)), m_key_path(std::move(key_path)) {}

bool SodiumSecretStore::ensure_key_locked() {
    if (m_key.size() == crypto_secretbox_KEYBYTES) {
        return true;
    }
    if (!sodium_ready()) {
        return false;
    }

    if (auto raw = read_file(m_key_path)) {
        std::vector<unsigned char> key(raw->begin(), raw->end());
        if (key.size() == crypto_secretbox_KEYBYTES) {
            m_key = std::move(key);
            return true;
        }
        LOG_WARN("[Store] Secret key file " + m_key_path + " has the wrong size; regenerating");
    }

    std::vector<unsigned char> key(crypto_secretbox_KEYBYTES);
    crypto_secretbox_keygen(key.data());
    if (!write_file_atomically(m_key_path, std::string(key.begin(), key.end()), S_IRUSR | S_IWUSR)) {
        return false;
    }
    ::chmod(m_key_path.c_str(), S_IRUSR | S_IWUSR);
    LOG_INFO("[Store] Generated secret key at " + m_key_path);
    m_key = std::move(key);
    return true;
}

nlohmann::json SodiumSecretStore::load_locked() const {
    const auto raw = read_file(m_store_path);
    if (!raw) {
        return nlohmann::json::object();
    }
    try {
        const nlohmann::json entries = nlohmann::json::parse(*raw);
        if (entries.is_object()) {
            return entries;
        }
        LOG_WARN("[Store] " + m_store_path + " is not a JSON object; ignoring");
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("[Store] Cannot parse " + m_store_path + ": " + e.what());
    }
    return nlohmann::json::object();
}

bool SodiumSecretStore::save_locked(const nlohmann::json& entries) const {
    return write_file_atomically(m_store_path, entries.dump(2), S_IRUSR | S_IWUSR);
}

std::optional<std::string> SodiumSecretStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensure_key_locked()) {
        return std::nullopt;
    }
    const nlohmann::json entries = load_locked();
    auto it = entries.find(key);
    if (it == entries.end() || !it->is_object()) {
        return std::nullopt;
    }

    std::vector<unsigned char> nonce;
    std::vector<unsigned char> box;
    if (!from_hex(it->value("nonce", std::string()), nonce) || nonce.size() != crypto_secretbox_NONCEBYTES ||
        !from_hex(it->value("box", std::string()), box) || box.size() < crypto_secretbox_MACBYTES) {
        LOG_WARN("[Store] Malformed entry for " + key);
        return std::nullopt;
    }

    std::vector<unsigned char> plain(box.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), box.data(), box.size(), nonce.data(), m_key.data()) != 0) {
        LOG_WARN("[Store] Entry for " + key + " failed authentication");
        return std::nullopt;
    }
    return std::string(plain.begin(), plain.end());
}

bool SodiumSecretStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensure_key_locked()) {
        return false;
    }

    std::vector<unsigned char> nonce(crypto_secretbox_NONCEBYTES);
    randombytes_buf(nonce.data(), nonce.size());
    std::vector<unsigned char> box(value.size() + crypto_secretbox_MACBYTES);
    crypto_secretbox_easy(box.data(), reinterpret_cast<const unsigned char*>(value.data()), value.size(),
                          nonce.data(), m_key.data());

    nlohmann::json entries = load_locked();
    entries[key] = {
        {"nonce", to_hex(nonce.data(), nonce.size())},
        {"box", to_hex(box.data(), box.size())},
    };
    return save_locked(entries);
}

bool SodiumSecretStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    nlohmann::json entries = load_locked();
    if (entries.erase(key) == 0) {
        return false;
    }
    return save_locked(entries);
}

} // namespace tvlink
