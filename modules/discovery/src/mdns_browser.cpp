#include "mdns_browser.h"
#include "logger.h"
#include "string_utils.h"
#include "telemetry.h"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/simple-watch.h>

#include <cerrno>

namespace tvlink {

namespace {

void resolve_callback(AvahiServiceResolver* resolver,
                      AvahiIfIndex, AvahiProtocol,
                      AvahiResolverEvent event,
                      const char* name, const char* type, const char* domain,
                      const char*, const AvahiAddress* address, uint16_t port,
                      AvahiStringList* txt, AvahiLookupResultFlags, void* userdata) {
    auto* browser = static_cast<MdnsBrowser*>(userdata);
    if (event == AVAHI_RESOLVER_FOUND && address != nullptr) {
        char host[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(host, sizeof(host), address);

        std::vector<std::string> entries;
        for (AvahiStringList* item = txt; item != nullptr; item = avahi_string_list_get_next(item)) {
            entries.emplace_back(reinterpret_cast<const char*>(avahi_string_list_get_text(item)),
                                 avahi_string_list_get_size(item));
        }
        browser->report_service(make_mdns_service(name, type, domain, host, port, entries));
    } else if (event == AVAHI_RESOLVER_FAILURE) {
        LOG_DEBUG(std::string("[mDNS] Resolve failed for ") + name + ": " +
                  avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(resolver))));
    }
    avahi_service_resolver_free(resolver);
}

void browse_callback(AvahiServiceBrowser* b,
                     AvahiIfIndex interface, AvahiProtocol protocol,
                     AvahiBrowserEvent event,
                     const char* name, const char* type, const char* domain,
                     AvahiLookupResultFlags, void* userdata) {
    auto* browser = static_cast<MdnsBrowser*>(userdata);
    AvahiClient* client = avahi_service_browser_get_client(b);
    switch (event) {
    case AVAHI_BROWSER_NEW:
        if (avahi_service_resolver_new(client, interface, protocol, name, type, domain,
                                       AVAHI_PROTO_INET, static_cast<AvahiLookupFlags>(0),
                                       resolve_callback, browser) == nullptr) {
            LOG_DEBUG(std::string("[mDNS] Cannot resolve ") + name + ": " +
                      avahi_strerror(avahi_client_errno(client)));
        }
        break;
    case AVAHI_BROWSER_FAILURE:
        browser->report_error(avahi_client_errno(client), std::string("Browsing ") + type);
        break;
    default:
        break;
    }
}

void client_callback(AvahiClient* client, AvahiClientState state, void* userdata) {
    auto* browser = static_cast<MdnsBrowser*>(userdata);
    // Failures during avahi_client_new are reported by start().
    if (state == AVAHI_CLIENT_FAILURE && browser->is_running()) {
        browser->report_error(avahi_client_errno(client), "Avahi client");
    }
}

} // namespace

bool looks_like_webos_device(const std::string& name,
                             const std::string& model,
                             const std::string& manufacturer) {
    const std::string n = to_lower(name);
    const std::string m = to_lower(model);
    const std::string v = to_lower(manufacturer);
    return v.find("lg") != std::string::npos ||
           m.find("webos") != std::string::npos || m.find("lg") != std::string::npos ||
           n.find("webos") != std::string::npos || n.find("lg") != std::string::npos;
}

MdnsService make_mdns_service(const std::string& name,
                              const std::string& type,
                              const std::string& domain,
                              const std::string& address,
                              int port,
                              const std::vector<std::string>& txt_entries) {
    MdnsService service;
    service.display_name = trim(name);
    service.instance = name + "." + type + "." + (domain.empty() ? std::string("local") : domain);
    service.host = address;
    if (type == kWebOsServiceType && port > 0) {
        service.port = port;
    }
    for (const auto& entry : txt_entries) {
        const auto eq = entry.find('=');
        const std::string key = to_lower(trim(entry.substr(0, eq)));
        if (key.empty()) {
            continue;
        }
        service.txt[key] = eq == std::string::npos ? std::string() : entry.substr(eq + 1);
    }
    return service;
}

MdnsBrowser::~MdnsBrowser() {
    stop();
}

bool MdnsBrowser::start(ServiceHandler on_service, ErrorHandler on_error, CancellationToken token) {
    stop();

    m_on_service = std::move(on_service);
    m_on_error = std::move(on_error);
    m_token = token;
    m_reported.clear();

    m_poll = avahi_simple_poll_new();
    if (m_poll == nullptr) {
        LOG_WARN("[mDNS] Cannot create Avahi poll");
        return false;
    }

    int error = 0;
    m_client = avahi_client_new(avahi_simple_poll_get(m_poll), static_cast<AvahiClientFlags>(0),
                                client_callback, this, &error);
    if (m_client == nullptr) {
        report_error(error, "Avahi client");
        release();
        return false;
    }

    for (const char* type : {kWebOsServiceType, kAirPlayServiceType}) {
        AvahiServiceBrowser* browser = avahi_service_browser_new(
            m_client, AVAHI_IF_UNSPEC, AVAHI_PROTO_INET, type, nullptr,
            static_cast<AvahiLookupFlags>(0), browse_callback, this);
        if (browser == nullptr) {
            report_error(avahi_client_errno(m_client), std::string("Browsing ") + type);
            continue;
        }
        m_browsers.push_back(browser);
    }
    if (m_browsers.empty()) {
        release();
        return false;
    }

    m_running = true;
    m_thread = std::thread(&MdnsBrowser::run, this, token);
    LOG_DEBUG(std::string("[mDNS] Browsing ") + kWebOsServiceType + " and " + kAirPlayServiceType);
    return true;
}

void MdnsBrowser::stop() {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
    release();
}

void MdnsBrowser::release() {
    for (AvahiServiceBrowser* browser : m_browsers) {
        avahi_service_browser_free(browser);
    }
    m_browsers.clear();
    if (m_client != nullptr) {
        avahi_client_free(m_client);
        m_client = nullptr;
    }
    if (m_poll != nullptr) {
        avahi_simple_poll_free(m_poll);
        m_poll = nullptr;
    }
}

void MdnsBrowser::run(CancellationToken token) {
    while (m_running && !token.is_cancelled()) {
        if (avahi_simple_poll_iterate(m_poll, 100) != 0) {
            break;
        }
    }
}

void MdnsBrowser::report_service(const MdnsService& service) {
    if (m_token.is_cancelled()) {
        return;
    }
    if (!m_reported.insert(to_lower(service.instance) + "@" + service.host).second) {
        return;
    }
    Telemetry::getInstance().inc_counter("discovery.mdns_responses");
    LOG_DEBUG("[mDNS] Resolved " + service.display_name + " at " + service.host + ":" + std::to_string(service.port));
    if (m_on_service) {
        m_on_service(service);
    }
}

void MdnsBrowser::report_error(int avahi_error, const std::string& context) {
    const std::string message = context + ": " + avahi_strerror(avahi_error);
    if (avahi_error == AVAHI_ERR_NO_DAEMON) {
        LOG_WARN("[mDNS] " + message + ", continuing without mDNS");
        return;
    }
    const bool denied = avahi_error == AVAHI_ERR_ACCESS_DENIED || avahi_error == AVAHI_ERR_NOT_PERMITTED;
    if (m_on_error) {
        m_on_error(denied ? EACCES : 0, message);
    }
}

} // namespace tvlink
