#ifndef TVLINK_DESCRIPTION_FETCHER_H
#define TVLINK_DESCRIPTION_FETCHER_H

#include <chrono>
#include <optional>
#include <string>

namespace tvlink {

struct DeviceDescription {
    std::string friendly_name;
    std::string manufacturer;
    std::optional<std::string> model;
};

// Text between the first <tag> and </tag>, trimmed; nullopt when absent or empty.
std::optional<std::string> xml_tag(const std::string& tag, const std::string& xml);

// UPnP device description. Nullopt unless the manufacturer looks like LG.
std::optional<DeviceDescription> parse_device_description(const std::string& xml);

// HTTP GET of a UPnP LOCATION URL. Virtual so discovery tests can serve canned XML.
class DescriptionFetcher {
public:
    virtual ~DescriptionFetcher() = default;

    // Body of a 2xx response, or nullopt on any failure or timeout.
    virtual std::optional<std::string> fetch(const std::string& url,
                                             std::chrono::milliseconds timeout) const;
};

} // namespace tvlink

#endif // TVLINK_DESCRIPTION_FETCHER_H
