#include "config_manager.h"
#include "description_fetcher.h"
#include "discovery_engine.h"
#include "logger.h"
#include "mdns_browser.h"
#include "network_interfaces.h"
#include "ssdp_codec.h"
#include "tvlink_error.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace tvlink;
using namespace std::chrono_literals;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

template <typename Pred>
static bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

static const char* kLivingRoomResponse =
    "HTTP/1.1 200 OK\r\n"
    "CACHE-CONTROL: max-age=1800\r\n"
    "ST: urn:lge-com:service:webos-second-screen:1\r\n"
    "LOCATION: http://192.168.1.50:3000/desc.xml\r\n"
    "USN: uuid:4b1f-living::urn:lge-com:service:webos-second-screen:1\r\n"
    "SERVER: WebOS/4.1.0 UPnP/1.0\r\n"
    "\r\n";

static const char* kLivingRoomDescription =
    "<?xml version=\"1.0\"?><root><device>"
    "<friendlyName> Living Room TV </friendlyName>"
    "<manufacturer>LG Electronics</manufacturer>"
    "<modelName>OLED55C1</modelName>"
    "</device></root>";

// Serves canned description XML and counts fetches per URL.
class CannedDescriptionFetcher : public DescriptionFetcher {
public:
    std::optional<std::string> fetch(const std::string& url, std::chrono::milliseconds) const override {
        std::lock_guard<std::mutex> lock(mu);
        fetched.push_back(url);
        auto it = bodies.find(url);
        if (it == bodies.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t fetch_count() const {
        std::lock_guard<std::mutex> lock(mu);
        return fetched.size();
    }

    mutable std::mutex mu;
    mutable std::vector<std::string> fetched;
    std::map<std::string, std::string> bodies;
};

// Answers for exactly one host:port; optionally denies everything.
class ScriptedProbe : public AddressProbe {
public:
    ProbeOutcome probe_outcome(const std::string& host, int port, std::chrono::milliseconds) const override {
        ++probes;
        if (deny_all) {
            return ProbeOutcome::PermissionDenied;
        }
        return host == reachable_host && port == reachable_port ? ProbeOutcome::Reachable : ProbeOutcome::Unreachable;
    }

    std::string reachable_host;
    int reachable_port = 0;
    bool deny_all = false;
    mutable std::atomic<int> probes{0};
};

// Records every publication and failure.
struct DiscoveryRecorder {
    std::mutex mu;
    std::vector<std::vector<Device>> publications;
    std::vector<TvLinkError> failures;

    void attach(DiscoveryEngine& engine) {
        engine.set_devices_handler([this](const std::vector<Device>& devices) {
            std::lock_guard<std::mutex> lock(mu);
            publications.push_back(devices);
        });
        engine.set_failure_handler([this](const TvLinkError& error) {
            std::lock_guard<std::mutex> lock(mu);
            failures.push_back(error);
        });
    }

    size_t publication_count() {
        std::lock_guard<std::mutex> lock(mu);
        return publications.size();
    }

    std::vector<Device> latest() {
        std::lock_guard<std::mutex> lock(mu);
        return publications.empty() ? std::vector<Device>() : publications.back();
    }

    size_t failure_count() {
        std::lock_guard<std::mutex> lock(mu);
        return failures.size();
    }
};

// Only the empty-results hint timer runs; strategies are driven by the test.
static void configure_passive_discovery(int empty_hint_delay_ms) {
    auto& config = ConfigManager::getInstance();
    config.reset();
    config.setValueAtPath({"discovery", "ssdp_enabled"}, false);
    config.setValueAtPath({"discovery", "mdns_enabled"}, false);
    config.setValueAtPath({"discovery", "subnet_scan_enabled"}, false);
    config.setValueAtPath({"discovery", "empty_hint_delay_ms"}, empty_hint_delay_ms);
}

// ---------------------------------------------------------------------------

bool test_ssdp_codec() {
    std::cout << "Testing SSDP codec..." << std::endl;

    const std::string probe = build_msearch("urn:lge-com:service:webos-second-screen:1");
    TEST_ASSERT(probe.rfind("M-SEARCH * HTTP/1.1\r\n", 0) == 0, "request line");
    TEST_ASSERT(probe.find("MAN: \"ssdp:discover\"\r\n") != std::string::npos, "MAN header");
    TEST_ASSERT(probe.find("ST: urn:lge-com:service:webos-second-screen:1\r\n") != std::string::npos, "ST header");
    TEST_ASSERT(probe.size() >= 4 && probe.compare(probe.size() - 4, 4, "\r\n\r\n") == 0, "blank line terminates");
    TEST_ASSERT(ssdp_search_targets().size() == 7, "every search target is probed");

    const auto headers = parse_ssdp_headers(kLivingRoomResponse);
    TEST_ASSERT(headers.at("location") == "http://192.168.1.50:3000/desc.xml", "header values are trimmed");
    TEST_ASSERT(looks_like_webos_ssdp(headers), "webOS response is recognised");

    auto sighting = device_from_ssdp_response(kLivingRoomResponse, "192.168.1.50");
    TEST_ASSERT(sighting.has_value(), "webOS response yields a sighting");
    TEST_ASSERT(sighting->device.id == "lg-192.168.1.50", "id derives from the sender");
    TEST_ASSERT(sighting->device.port == 3000, "port comes from LOCATION");
    TEST_ASSERT(sighting->device.name == kGenericDeviceName, "name is generic until described");
    TEST_ASSERT(sighting->location == std::optional<std::string>("http://192.168.1.50:3000/desc.xml"), "location kept");

    auto from_location = device_from_ssdp_response(kLivingRoomResponse, "");
    TEST_ASSERT(from_location && from_location->device.host == "192.168.1.50", "LOCATION host is the fallback");

    const std::string printer =
        "HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\nSERVER: Linux UPnP/1.0 PrintServer\r\n"
        "LOCATION: http://192.168.1.9:80/\r\n\r\n";
    TEST_ASSERT(!device_from_ssdp_response(printer, "192.168.1.9"), "non-LG responders are ignored");
    TEST_ASSERT(!device_from_ssdp_response("NOTIFY * HTTP/1.1\r\nST: webos-second-screen\r\n\r\n", "10.0.0.1"),
                "only 200 responses count");

    auto url = parse_http_url("http://10.0.0.5:1234/dd.xml");
    TEST_ASSERT(url && url->host == "10.0.0.5" && url->port == 1234 && url->target == "/dd.xml", "url parts");
    auto bare = parse_http_url("http://tv.local");
    TEST_ASSERT(bare && !bare->has_port && bare->port == 80 && bare->target == "/", "url defaults");
    TEST_ASSERT(!parse_http_url("https://10.0.0.5/"), "only http descriptions are fetched");
    TEST_ASSERT(!parse_http_url("http://10.0.0.5:99999/"), "port out of range");

    std::cout << "SSDP codec Passed!" << std::endl;
    return true;
}

bool test_device_description_parsing() {
    std::cout << "Testing device description parsing..." << std::endl;

    auto description = parse_device_description(kLivingRoomDescription);
    TEST_ASSERT(description.has_value(), "LG description parses");
    TEST_ASSERT(description->friendly_name == "Living Room TV", "friendly name is trimmed");
    TEST_ASSERT(description->model == std::optional<std::string>("OLED55C1"), "model name");

    TEST_ASSERT(!parse_device_description("<manufacturer>Samsung</manufacturer>"), "other vendors are rejected");
    auto minimal = parse_device_description("<root></root>");
    TEST_ASSERT(minimal && minimal->friendly_name == kGenericDeviceName, "missing fields fall back to defaults");
    TEST_ASSERT(!xml_tag("friendlyName", "<friendlyName>   </friendlyName>"), "blank tags are absent");

    std::cout << "Device description parsing Passed!" << std::endl;
    return true;
}

bool test_mdns_service_mapping() {
    std::cout << "Testing mDNS service mapping..." << std::endl;

    const auto webos = make_mdns_service("Bedroom TV", kWebOsServiceType, "local", "192.168.1.60", 3001,
                                         {"model=OLED65G2", "Manufacturer=LG Electronics", "flag", "=orphan"});
    TEST_ASSERT(webos.instance == "Bedroom TV._webos-second-screen._tcp.local", "instance name");
    TEST_ASSERT(webos.display_name == "Bedroom TV", "display name is the instance label");
    TEST_ASSERT(webos.host == "192.168.1.60" && webos.port == 3001, "address and SSAP port");
    TEST_ASSERT(webos.txt.at("model") == "OLED65G2", "txt value");
    TEST_ASSERT(webos.txt.at("manufacturer") == "LG Electronics", "txt keys are lower-cased");
    TEST_ASSERT(webos.txt.count("flag") == 1 && webos.txt.at("flag").empty(), "bare txt key");
    TEST_ASSERT(webos.txt.size() == 3, "empty txt key dropped");

    // AirPlay advertises its own port; the TV still takes SSAP on 3000.
    const auto airplay = make_mdns_service("[LG] webOS TV OLED55C1", kAirPlayServiceType, "", "192.168.1.61", 7000,
                                           {"model=OLED55C1PUB", "manufacturer=LG Electronics"});
    TEST_ASSERT(airplay.instance == "[LG] webOS TV OLED55C1._airplay._tcp.local", "empty domain is local");
    TEST_ASSERT(airplay.port == kSsapDefaultPort, "AirPlay sighting uses the SSAP port");

    TEST_ASSERT(looks_like_webos_device("Bedroom TV", "OLED65G2", "LG Electronics"), "LG manufacturer matches");
    TEST_ASSERT(looks_like_webos_device("[LG] webOS TV", "", ""), "name match");
    TEST_ASSERT(!looks_like_webos_device("Kitchen Speaker", "One", "Sonos"), "other devices do not match");

    std::cout << "mDNS service mapping Passed!" << std::endl;
    return true;
}

bool test_ipv4_helpers() {
    std::cout << "Testing IPv4 helpers..." << std::endl;
    TEST_ASSERT(ipv4_prefix("192.168.1.20") == std::optional<std::string>("192.168.1"), "prefix");
    TEST_ASSERT(slash24_broadcast("10.0.7.3") == std::optional<std::string>("10.0.7.255"), "broadcast");
    TEST_ASSERT(!ipv4_prefix("tv.local"), "hostnames have no prefix");
    TEST_ASSERT(is_ipv4_literal("172.16.0.1"), "literal");
    TEST_ASSERT(!is_ipv4_literal("256.1.1.1") && !is_ipv4_literal("1.2.3"), "malformed literals");
    std::cout << "IPv4 helpers Passed!" << std::endl;
    return true;
}

bool test_engine_merges_sightings() {
    std::cout << "Testing discovery merge and publication..." << std::endl;

    configure_passive_discovery(60000);
    auto fetcher = std::make_shared<CannedDescriptionFetcher>();
    fetcher->bodies["http://192.168.1.50:3000/desc.xml"] = kLivingRoomDescription;
    DiscoveryEngine engine(std::make_shared<ScriptedProbe>(), fetcher);
    DiscoveryRecorder recorder;
    recorder.attach(engine);

    engine.ingest_ssdp_response(kLivingRoomResponse, "192.168.1.50");
    TEST_ASSERT(recorder.publication_count() == 0, "sightings before start are ignored");

    engine.start();
    TEST_ASSERT(recorder.publication_count() == 1 && recorder.latest().empty(), "start publishes an empty list");

    engine.ingest_ssdp_response(kLivingRoomResponse, "192.168.1.50");
    TEST_ASSERT(wait_until([&] {
        const auto latest = recorder.latest();
        return latest.size() == 1 && latest[0].name == "Living Room TV";
    }, 2000ms), "description names the device");

    auto devices = engine.devices();
    TEST_ASSERT(devices.size() == 1, "one device");
    TEST_ASSERT(devices[0].id == "lg-192.168.1.50" && devices[0].port == 3000, "identity");
    TEST_ASSERT(devices[0].model == std::optional<std::string>("OLED55C1"), "model from the description");
    TEST_ASSERT(devices[0].manufacturer == "LG Electronics", "manufacturer from the description");

    // Re-sightings and subnet hits never regress the learned fields.
    const size_t before = recorder.publication_count();
    engine.ingest_ssdp_response(kLivingRoomResponse, "192.168.1.50");
    engine.ingest_subnet_hit("192.168.1.50", 3000);
    std::this_thread::sleep_for(50ms);
    TEST_ASSERT(recorder.publication_count() == before, "unchanged sightings are not republished");
    TEST_ASSERT(engine.devices()[0].name == "Living Room TV", "name survives");
    TEST_ASSERT(fetcher->fetch_count() == 1, "description fetched once per scan");

    MdnsService bedroom;
    bedroom.instance = "Bedroom TV._webos-second-screen._tcp.local";
    bedroom.display_name = "Bedroom TV";
    bedroom.host = "192.168.1.60";
    bedroom.port = 3001;
    bedroom.txt["model"] = "OLED65G2";
    engine.ingest_mdns_service(bedroom);

    engine.ingest_mdns_service(make_mdns_service("Kitchen", kAirPlayServiceType, "local", "192.168.1.70", 7000,
                                                 {"manufacturer=Sonos"}));

    devices = recorder.latest();
    TEST_ASSERT(devices.size() == 2, "mDNS device added, non-LG service ignored");
    TEST_ASSERT(devices[0].name == "Bedroom TV" && devices[1].name == "Living Room TV", "ordered by name");
    TEST_ASSERT(devices[0].port == 3001 && devices[0].secure(), "secure port from SRV");

    engine.ingest_subnet_hit("192.168.1.80", 3000);
    devices = recorder.latest();
    TEST_ASSERT(devices.size() == 3, "subnet hit added");
    TEST_ASSERT(devices[1].id == "lg-192.168.1.80", "placeholder name sorts between the others");
    TEST_ASSERT(devices[1].name == "LG TV (192.168.1.80)", "subnet hits carry a host placeholder name");

    engine.stop();
    TEST_ASSERT(engine.devices().empty(), "stop clears results");
    engine.ingest_subnet_hit("192.168.1.90", 3000);
    TEST_ASSERT(engine.devices().empty(), "hits after stop are ignored");
    engine.stop();

    engine.start();
    TEST_ASSERT(recorder.latest().empty(), "a new scan starts empty");
    engine.ingest_ssdp_response(kLivingRoomResponse, "192.168.1.50");
    TEST_ASSERT(wait_until([&] { return fetcher->fetch_count() == 2; }, 2000ms), "a new scan fetches again");
    engine.stop();

    TEST_ASSERT(recorder.failure_count() == 0, "no failures reported");
    ConfigManager::getInstance().reset();

    std::cout << "Discovery merge and publication Passed!" << std::endl;
    return true;
}

bool test_subnet_scan() {
    std::cout << "Testing subnet scan..." << std::endl;

    configure_passive_discovery(60000);
    auto probe = std::make_shared<ScriptedProbe>();
    probe->reachable_host = "192.168.1.77";
    probe->reachable_port = 3001;
    DiscoveryEngine engine(probe, std::make_shared<CannedDescriptionFetcher>());
    DiscoveryRecorder recorder;
    recorder.attach(engine);
    engine.start();

    LocalInterface local;
    local.name = "wlan0";
    local.address = "192.168.1.20";
    local.netmask = "255.255.255.0";
    CancellationSource source;
    engine.run_subnet_scan(local, source.token());

    auto devices = engine.devices();
    TEST_ASSERT(devices.size() == 1, "one candidate found");
    TEST_ASSERT(devices[0].host == "192.168.1.77" && devices[0].port == 3001, "both control ports are tried");
    // 24 hosts per batch: the scan stops after the batch holding .77.
    TEST_ASSERT(probe->probes.load() < 254 * 2, "scan stops once a device is known");
    engine.stop();

    auto denying = std::make_shared<ScriptedProbe>();
    denying->deny_all = true;
    DiscoveryEngine denied_engine(denying, std::make_shared<CannedDescriptionFetcher>());
    DiscoveryRecorder denied;
    denied.attach(denied_engine);
    denied_engine.start();
    denied_engine.run_subnet_scan(local, source.token());
    denied_engine.run_subnet_scan(local, source.token());
    TEST_ASSERT(denied.failure_count() == 1, "permission denial is reported once per scan");
    TEST_ASSERT(denied.failures[0].code() == ErrorCode::LocalNetworkPermissionDenied, "denial code");
    denied_engine.stop();

    ConfigManager::getInstance().reset();
    std::cout << "Subnet scan Passed!" << std::endl;
    return true;
}

bool test_empty_results_hint() {
    std::cout << "Testing empty results hint..." << std::endl;

    configure_passive_discovery(40);
    DiscoveryEngine engine(std::make_shared<ScriptedProbe>(), std::make_shared<CannedDescriptionFetcher>());
    DiscoveryRecorder recorder;
    recorder.attach(engine);
    engine.start();

    TEST_ASSERT(wait_until([&] { return recorder.failure_count() == 1; }, 2000ms), "hint reported");
    {
        std::lock_guard<std::mutex> lock(recorder.mu);
        TEST_ASSERT(recorder.failures[0].code() == ErrorCode::NetworkFailure, "hint is a network failure");
        TEST_ASSERT(std::string(recorder.failures[0].what()).find("No LG TVs were discovered") == 0, "hint text");
    }
    TEST_ASSERT(engine.is_running(), "the scan keeps running after the hint");
    engine.stop();

    // No hint once something was found.
    DiscoveryEngine found(std::make_shared<ScriptedProbe>(), std::make_shared<CannedDescriptionFetcher>());
    DiscoveryRecorder found_recorder;
    found_recorder.attach(found);
    found.start();
    found.ingest_subnet_hit("192.168.1.80", 3000);
    std::this_thread::sleep_for(120ms);
    TEST_ASSERT(found_recorder.failure_count() == 0, "no hint when devices exist");
    found.stop();

    ConfigManager::getInstance().reset();
    std::cout << "Empty results hint Passed!" << std::endl;
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    std::cout << "Running Discovery Tests..." << std::endl;

    test_ssdp_codec();
    test_device_description_parsing();
    test_mdns_service_mapping();
    test_ipv4_helpers();
    test_engine_merges_sightings();
    test_subnet_scan();
    test_empty_results_hint();

    if (tests_failed == 0) {
        std::cout << "ALL DISCOVERY TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
