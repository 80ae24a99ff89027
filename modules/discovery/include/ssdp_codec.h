#ifndef TVLINK_SSDP_CODEC_H
#define TVLINK_SSDP_CODEC_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "device.h"

namespace tvlink {

constexpr const char* kSsdpMulticastAddress = "239.255.255.250";
constexpr int kSsdpPort = 1900;

const std::vector<std::string>& ssdp_search_targets();

std::string build_msearch(const std::string& search_target);

// Header names are lowercased; values are trimmed. Later duplicates win.
std::map<std::string, std::string> parse_ssdp_headers(const std::string& response);

bool is_ssdp_success(const std::string& response);
bool looks_like_webos_ssdp(const std::map<std::string, std::string>& headers);

struct HttpUrl {
    std::string host;
    int port = 80;
    bool has_port = false;
    std::string target = "/";
};

// http://host[:port][/path]; nullopt for anything else.
std::optional<HttpUrl> parse_http_url(const std::string& url);

struct SsdpSighting {
    Device device;
    std::optional<std::string> location;
};

// `sender_ip` is the datagram source and takes priority over the LOCATION host.
std::optional<SsdpSighting> device_from_ssdp_response(const std::string& response,
                                                      const std::string& sender_ip);

} // namespace tvlink

#endif // TVLINK_SSDP_CODEC_H
