#ifndef TVLINK_ADDRESS_PROBE_H
#define TVLINK_ADDRESS_PROBE_H

#include <chrono>
#include <string>

namespace tvlink {

enum class ProbeOutcome {
    Reachable,
    Unreachable,
    PermissionDenied
};

// Bounded-timeout TCP connect check. Virtual so discovery and reconnect tests
// can script which host:port pairs answer.
class AddressProbe {
public:
    virtual ~AddressProbe() = default;

    virtual ProbeOutcome probe_outcome(const std::string& host, int port,
                                       std::chrono::milliseconds timeout) const;

    bool probe(const std::string& host, int port, std::chrono::milliseconds timeout) const {
        return probe_outcome(host, port, timeout) == ProbeOutcome::Reachable;
    }
};

} // namespace tvlink

#endif // TVLINK_ADDRESS_PROBE_H
