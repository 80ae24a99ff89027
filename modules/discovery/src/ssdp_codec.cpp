#include "ssdp_codec.h"
#include "string_utils.h"

namespace tvlink {

const std::vector<std::string>& ssdp_search_targets() {
    static const std::vector<std::string> targets = {
        "ssdp:all",
        "upnp:rootdevice",
        "urn:lge-com:device:LGSmartTV:1",
        "urn:lge-com:service:webos-second-screen:1",
        "urn:schemas-upnp-org:device:Basic:1",
        "urn:schemas-upnp-org:service:dial:1",
        "urn:schemas-upnp-org:device:MediaRenderer:1"
    };
    return targets;
}

std::string build_msearch(const std::string& search_target) {
    return "M-SEARCH * HTTP/1.1\r\n"
           "HOST: 239.255.255.250:1900\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "MX: 2\r\n"
           "ST: " + search_target + "\r\n"
           "USER-AGENT: tvlink/1.0 UPnP/1.1\r\n"
           "\r\n";
}

std::map<std::string, std::string> parse_ssdp_headers(const std::string& response) {
    std::map<std::string, std::string> headers;
    for (std::string line : split(response, '\n')) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = to_lower(trim(line.substr(0, colon)));
        if (key.empty()) {
            continue;
        }
        headers[key] = trim(line.substr(colon + 1));
    }
    return headers;
}

bool is_ssdp_success(const std::string& response) {
    return contains_ci(response, "HTTP/1.1 200");
}

bool looks_like_webos_ssdp(const std::map<std::string, std::string>& headers) {
    auto lowered = [&headers](const char* key) {
        auto it = headers.find(key);
        return it == headers.end() ? std::string() : to_lower(it->second);
    };
    const std::string st = lowered("st");
    const std::string usn = lowered("usn");
    const std::string server = lowered("server");
    const std::string location = lowered("location");

    return st.find("webos-second-screen") != std::string::npos ||
           usn.find("lge") != std::string::npos ||
           server.find("webos") != std::string::npos ||
           server.find("lge") != std::string::npos ||
           location.find("lge") != std::string::npos;
}

std::optional<HttpUrl> parse_http_url(const std::string& url) {
    const std::string scheme = "http://";
    if (to_lower(url.substr(0, scheme.size())) != scheme) {
        return std::nullopt;
    }
    std::string rest = url.substr(scheme.size());
    HttpUrl parsed;

    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        parsed.target = rest.substr(slash);
        rest = rest.substr(0, slash);
    }

    const auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        const std::string port_text = rest.substr(colon + 1);
        rest = rest.substr(0, colon);
        try {
            parsed.port = std::stoi(port_text);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        parsed.has_port = true;
        if (parsed.port <= 0 || parsed.port > 65535) {
            return std::nullopt;
        }
    }
    if (rest.empty()) {
        return std::nullopt;
    }
    parsed.host = rest;
    return parsed;
}

std::optional<SsdpSighting> device_from_ssdp_response(const std::string& response,
                                                      const std::string& sender_ip) {
    if (!is_ssdp_success(response)) {
        return std::nullopt;
    }
    const auto headers = parse_ssdp_headers(response);
    if (!looks_like_webos_ssdp(headers)) {
        return std::nullopt;
    }

    std::optional<HttpUrl> location_url;
    std::optional<std::string> location;
    auto loc = headers.find("location");
    if (loc != headers.end() && !loc->second.empty()) {
        location = loc->second;
        location_url = parse_http_url(loc->second);
    }

    std::string host = trim(sender_ip);
    if (host.empty() && location_url) {
        host = location_url->host;
    }
    if (host.empty()) {
        return std::nullopt;
    }
    const int port = location_url && location_url->has_port ? location_url->port : 3000;

    SsdpSighting sighting;
    sighting.device = make_discovered_device(host, port);
    auto usn = headers.find("usn");
    if (usn != headers.end()) {
        sighting.device.service_name = usn->second;
    }
    sighting.location = location;
    return sighting;
}

} // namespace tvlink
