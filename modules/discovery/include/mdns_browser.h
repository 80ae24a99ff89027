#ifndef TVLINK_MDNS_BROWSER_H
#define TVLINK_MDNS_BROWSER_H

#include <atomic>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "cancellation.h"

struct AvahiSimplePoll;
struct AvahiClient;
struct AvahiServiceBrowser;

namespace tvlink {

constexpr const char* kWebOsServiceType = "_webos-second-screen._tcp";
constexpr const char* kAirPlayServiceType = "_airplay._tcp";
constexpr int kSsapDefaultPort = 3000;

struct MdnsService {
    std::string instance;     // full instance name
    std::string display_name; // first label of the instance
    std::string host;         // IPv4
    int port = kSsapDefaultPort;
    std::map<std::string, std::string> txt;
};

// Heuristic vendor match over name/model/manufacturer tokens.
bool looks_like_webos_device(const std::string& name,
                             const std::string& model,
                             const std::string& manufacturer);

// Builds the sighting for one resolved DNS-SD instance. Only the webOS
// service advertises the SSAP port; AirPlay sightings keep the default.
MdnsService make_mdns_service(const std::string& name,
                              const std::string& type,
                              const std::string& domain,
                              const std::string& address,
                              int port,
                              const std::vector<std::string>& txt_entries);

// Browses the webOS second-screen and AirPlay services through the Avahi
// daemon on its own thread.
class MdnsBrowser {
public:
    using ServiceHandler = std::function<void(const MdnsService&)>;
    using ErrorHandler = std::function<void(int err, const std::string& message)>;

    MdnsBrowser() = default;
    ~MdnsBrowser();

    MdnsBrowser(const MdnsBrowser&) = delete;
    MdnsBrowser& operator=(const MdnsBrowser&) = delete;

    bool start(ServiceHandler on_service, ErrorHandler on_error, CancellationToken token);
    void stop();
    bool is_running() const { return m_running; }

    // Called from the Avahi callbacks on the browse thread.
    void report_service(const MdnsService& service);
    void report_error(int avahi_error, const std::string& context);

private:
    void run(CancellationToken token);
    void release();

    AvahiSimplePoll* m_poll = nullptr;
    AvahiClient* m_client = nullptr;
    std::vector<AvahiServiceBrowser*> m_browsers;
    std::atomic<bool> m_running{false};
    std::thread m_thread;
    ServiceHandler m_on_service;
    ErrorHandler m_on_error;
    CancellationToken m_token;
    std::set<std::string> m_reported;
};

} // namespace tvlink

#endif // TVLINK_MDNS_BROWSER_H
