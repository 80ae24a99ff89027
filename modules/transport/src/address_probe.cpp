#include "address_probe.h"
#include "logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tvlink {

namespace {

bool resolve_ipv4(const std::string& host, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return false;
    }
    out.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

ProbeOutcome outcome_for_errno(int err) {
    return (err == EPERM || err == EACCES) ? ProbeOutcome::PermissionDenied : ProbeOutcome::Unreachable;
}

} // namespace

ProbeOutcome AddressProbe::probe_outcome(const std::string& host, int port,
                                         std::chrono::milliseconds timeout) const {
    if (port <= 0 || port > 65535) {
        return ProbeOutcome::Unreachable;
    }

    sockaddr_in dest_addr{};
    if (!resolve_ipv4(host, dest_addr)) {
        LOG_DEBUG("[Probe] Cannot resolve " + host);
        return ProbeOutcome::Unreachable;
    }
    dest_addr.sin_port = htons(static_cast<uint16_t>(port));

    int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        return outcome_for_errno(errno);
    }

    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    ProbeOutcome outcome = ProbeOutcome::Unreachable;
    int result = ::connect(sock, reinterpret_cast<sockaddr*>(&dest_addr), sizeof(dest_addr));
    if (result == 0) {
        outcome = ProbeOutcome::Reachable;
    } else if (errno == EINPROGRESS) {
        fd_set write_fds;
        FD_ZERO(&write_fds);
        FD_SET(sock, &write_fds);

        timeval tv;
        tv.tv_sec = static_cast<long>(timeout.count() / 1000);
        tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

        result = select(sock + 1, nullptr, &write_fds, nullptr, &tv);
        if (result > 0) {
            int error = 0;
            socklen_t len = sizeof(error);
            if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len) == 0 && error == 0) {
                outcome = ProbeOutcome::Reachable;
            } else if (error != 0) {
                outcome = outcome_for_errno(error);
            }
        }
    } else {
        outcome = outcome_for_errno(errno);
    }

    close(sock);
    return outcome;
}

} // namespace tvlink
