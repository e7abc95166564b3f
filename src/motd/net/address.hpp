#pragma once

#include "motd/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <sys/socket.h>

namespace motd::net {

struct HostPort {
    std::string host;
    uint16_t port = 0;
};

// Accepts "host", "host:port", "[v6]" and "[v6]:port". A bare IPv6 literal
// with more than one ':' is taken as a host without a port.
std::optional<HostPort> ParseHostPort(const std::string &address, uint16_t defaultPort);

struct DatagramTarget {
    sockaddr_storage address{};
    socklen_t length = 0;
    int family = AF_UNSPEC;
};

std::optional<DatagramTarget> ResolveDatagramTarget(const std::string &address,
                                                    uint16_t defaultPort,
                                                    MotdError *error = nullptr);

std::string FormatSockaddr(const sockaddr_storage &address);

} // namespace motd::net
