#include "file_utils.h"
#include "known_devices_store.h"
#include "logger.h"
#include "secret_store.h"
#include "tvlink_error.h"
#include "wake_on_lan.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

using namespace tvlink;
namespace fs = std::filesystem;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static fs::path make_scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("tvlink_" + name + "_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static Device named_device(const std::string& host, const std::string& name) {
    Device d = make_discovered_device(host, 3000);
    d.name = name;
    return d;
}

bool test_known_devices_ordering() {
    std::cout << "Testing known devices ordering..." << std::endl;

    InMemoryKnownDevicesStore store;
    TEST_ASSERT(store.load().empty(), "empty store");
    TEST_ASSERT(!store.last_connected_device(), "no last device");

    Device kitchen = named_device("192.168.1.10", "kitchen");
    Device attic = named_device("192.168.1.11", "Attic");
    Device den = named_device("192.168.1.12", "Den");
    Device bedroom = named_device("192.168.1.13", "Bedroom");
    den.last_connected_at = from_epoch_ms(1700000000000LL);
    bedroom.last_connected_at = from_epoch_ms(1700000500000LL);

    TEST_ASSERT(store.save({kitchen, attic, den, bedroom}), "save");
    const auto devices = store.load();
    TEST_ASSERT(devices.size() == 4, "all stored");
    TEST_ASSERT(devices[0].id == bedroom.id && devices[1].id == den.id, "most recent connection first");
    TEST_ASSERT(devices[2].id == attic.id && devices[3].id == kitchen.id, "never connected last, by name");

    // Without a remembered id the most recent connection wins.
    auto last = store.last_connected_device();
    TEST_ASSERT(last && last->id == bedroom.id, "fallback to the most recent connection");

    std::cout << "Known devices ordering Passed!" << std::endl;
    return true;
}

bool test_known_devices_upsert_and_mark() {
    std::cout << "Testing known devices upsert..." << std::endl;

    InMemoryKnownDevicesStore store;
    Device den = named_device("192.168.1.12", "Den");
    den.wake_mac = std::string("AA:BB:CC:DD:EE:FF");
    den.last_connected_at = from_epoch_ms(1700000000000LL);
    TEST_ASSERT(store.upsert(den), "insert");

    Device rediscovered = named_device("192.168.1.12", "Den TV");
    rediscovered.port = 3001;
    TEST_ASSERT(store.upsert(rediscovered), "update");
    auto stored = store.find(den.id);
    TEST_ASSERT(stored && stored->name == "Den TV" && stored->port == 3001, "new fields win");
    TEST_ASSERT(stored->wake_mac == den.wake_mac, "wake address survives an upsert without one");
    TEST_ASSERT(stored->last_connected_at == den.last_connected_at, "connect time survives");
    TEST_ASSERT(store.load().size() == 1, "no duplicate");

    Device attic = named_device("192.168.1.11", "Attic");
    const auto before = std::chrono::system_clock::now();
    const Device stamped = store.mark_connected(attic);
    TEST_ASSERT(stamped.last_connected_at && *stamped.last_connected_at >= before, "mark stamps now");

    auto last = store.last_connected_device();
    TEST_ASSERT(last && last->id == attic.id, "marked device is the last connected");
    TEST_ASSERT(store.load().front().id == attic.id, "marked device sorts first");

    // The remembered id wins even when another record is newer.
    Device newer = named_device("192.168.1.20", "Newer");
    newer.last_connected_at = std::chrono::system_clock::now() + std::chrono::hours(1);
    store.upsert(newer);
    TEST_ASSERT(store.last_connected_device()->id == attic.id, "remembered id wins");
    TEST_ASSERT(!store.find("lg-10.9.9.9"), "unknown id");

    std::cout << "Known devices upsert Passed!" << std::endl;
    return true;
}

bool test_json_known_devices_store() {
    std::cout << "Testing JSON known devices store..." << std::endl;

    const fs::path dir = make_scratch_dir("known");
    const std::string path = (dir / "known_devices.json").string();

    {
        JsonKnownDevicesStore store(path);
        TEST_ASSERT(store.load().empty(), "missing file reads as empty");
        Device den = named_device("192.168.1.12", "Den");
        den.model = std::string("OLED55C1");
        den.wake_mac = std::string("AA:BB:CC:DD:EE:FF");
        store.upsert(den);
        store.mark_connected(den);
    }

    JsonKnownDevicesStore reopened(path);
    auto last = reopened.last_connected_device();
    TEST_ASSERT(last && last->name == "Den", "record survives a reopen");
    TEST_ASSERT(last->model == std::optional<std::string>("OLED55C1"), "model persisted");
    TEST_ASSERT(last->wake_mac == std::optional<std::string>("AA:BB:CC:DD:EE:FF"), "wake address persisted");
    TEST_ASSERT(last->last_connected_at.has_value(), "connect time persisted");

    const auto raw = read_file(path);
    TEST_ASSERT(raw.has_value(), "file written");
    const auto doc = nlohmann::json::parse(*raw);
    TEST_ASSERT(doc.at("version") == 1 && doc.at("lastConnectedId") == "lg-192.168.1.12", "document header");
    TEST_ASSERT(!fs::exists(path + ".tmp"), "temporary file renamed away");

    {
        std::ofstream corrupt(path, std::ios::trunc);
        corrupt << "{ not json";
    }
    TEST_ASSERT(reopened.load().empty(), "corrupt file reads as empty");
    TEST_ASSERT(reopened.upsert(named_device("192.168.1.30", "Fresh")), "corrupt file is replaced on write");
    TEST_ASSERT(reopened.load().size() == 1, "fresh record readable");

    fs::remove_all(dir);
    std::cout << "JSON known devices store Passed!" << std::endl;
    return true;
}

bool test_secret_stores() {
    std::cout << "Testing secret stores..." << std::endl;

    TEST_ASSERT(client_key_slot("LG-192.168.1.50") == "lg.webos.clientKey.lg-192.168.1.50", "slot naming");

    InMemorySecretStore memory;
    TEST_ASSERT(!memory.get("a"), "missing value");
    TEST_ASSERT(memory.set("a", "1") && memory.get("a") == std::optional<std::string>("1"), "set then get");
    TEST_ASSERT(memory.remove("a") && !memory.remove("a"), "remove reports presence");
    TEST_ASSERT(memory.size() == 0, "empty after remove");

    const fs::path dir = make_scratch_dir("secrets");
    const std::string store_path = (dir / "secrets.json").string();
    const std::string key_path = (dir / "secret.key").string();
    const std::string slot = client_key_slot("lg-192.168.1.50");

    {
        SodiumSecretStore store(store_path, key_path);
        TEST_ASSERT(!store.get(slot), "nothing stored yet");
        TEST_ASSERT(store.set(slot, "0123456789abcdef"), "sealed write");
    }

    struct stat st{};
    TEST_ASSERT(::stat(key_path.c_str(), &st) == 0, "key file created");
    TEST_ASSERT((st.st_mode & 0777) == 0600, "key file is private");
    TEST_ASSERT(read_file(key_path)->size() == 32, "key is 32 bytes");

    const auto sealed = read_file(store_path);
    TEST_ASSERT(sealed && sealed->find("0123456789abcdef") == std::string::npos, "value is not stored in clear");

    SodiumSecretStore reopened(store_path, key_path);
    TEST_ASSERT(reopened.get(slot) == std::optional<std::string>("0123456789abcdef"), "value survives a reopen");
    TEST_ASSERT(reopened.set(slot, "rotated"), "overwrite");
    TEST_ASSERT(reopened.get(slot) == std::optional<std::string>("rotated"), "overwritten value");

    // A different key cannot open the entries.
    SodiumSecretStore foreign(store_path, (dir / "other.key").string());
    TEST_ASSERT(!foreign.get(slot), "foreign key reads nothing");

    TEST_ASSERT(reopened.remove(slot), "remove");
    TEST_ASSERT(!reopened.get(slot), "gone after remove");
    TEST_ASSERT(!reopened.remove(slot), "second remove reports absence");

    fs::remove_all(dir);
    std::cout << "Secret stores Passed!" << std::endl;
    return true;
}

bool test_wake_on_lan() {
    std::cout << "Testing Wake-on-LAN..." << std::endl;

    TEST_ASSERT(normalize_mac_address("aa-bb-cc-dd-ee-ff") == std::optional<std::string>("AA:BB:CC:DD:EE:FF"),
                "dashes");
    TEST_ASSERT(normalize_mac_address("aabb.ccdd.eeff") == std::optional<std::string>("AA:BB:CC:DD:EE:FF"), "dots");
    TEST_ASSERT(normalize_mac_address(" A1B2C3D4E5F6 ") == std::optional<std::string>("A1:B2:C3:D4:E5:F6"), "bare");
    TEST_ASSERT(!normalize_mac_address("AA:BB:CC:DD:EE"), "too short");
    TEST_ASSERT(!normalize_mac_address("GG:BB:CC:DD:EE:FF"), "not hex");

    const auto packet = build_magic_packet("a1:b2:c3:d4:e5:f6");
    TEST_ASSERT(packet.size() == kMagicPacketSize, "magic packet length");
    for (size_t i = 0; i < 6; ++i) {
        TEST_ASSERT(packet[i] == 0xFF, "sync stream");
    }
    TEST_ASSERT(packet[6] == 0xA1 && packet[11] == 0xF6, "first repetition");
    TEST_ASSERT(packet[96] == 0xA1 && packet[101] == 0xF6, "last repetition");

    bool rejected = false;
    try {
        build_magic_packet("not-a-mac");
    } catch (const TvLinkError& e) {
        rejected = e.code() == ErrorCode::InvalidWakeAddress;
    }
    TEST_ASSERT(rejected, "invalid address throws InvalidWakeAddress");

    const auto targets = wake_targets(std::string("192.168.1.50"));
    TEST_ASSERT(targets.size() == 3, "host, subnet broadcast, limited broadcast");
    TEST_ASSERT(targets[0] == "192.168.1.50" && targets[1] == "192.168.1.255" && targets[2] == "255.255.255.255",
                "target order");
    const auto fallback = wake_targets(std::nullopt);
    TEST_ASSERT(fallback.size() == 1 && fallback[0] == "255.255.255.255", "no host still broadcasts");
    TEST_ASSERT(wake_targets(std::string("tv.local")).back() == "255.255.255.255", "hostnames broadcast");

    std::cout << "Wake-on-LAN Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running Store Tests..." << std::endl;

    test_known_devices_ordering();
    test_known_devices_upsert_and_mark();
    test_json_known_devices_store();
    test_secret_stores();
    test_wake_on_lan();

    if (tests_failed == 0) {
        std::cout << "ALL STORE TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
