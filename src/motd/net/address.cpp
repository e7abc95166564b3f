#include "motd/net/address.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <charconv>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>

namespace {

bool ParsePort(const std::string &text, uint16_t &port) {
    if (text.empty()) {
        return false;
    }
    uint16_t value = 0;
    const char *first = text.data();
    const char *last = first + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value == 0) {
        return false;
    }
    port = value;
    return true;
}

} // namespace

namespace motd::net {

std::optional<HostPort> ParseHostPort(const std::string &address, uint16_t defaultPort) {
    if (address.empty()) {
        return std::nullopt;
    }

    HostPort result;
    result.port = defaultPort;

    if (address.front() == '[') {
        const auto close = address.find(']');
        if (close == std::string::npos || close == 1) {
            return std::nullopt;
        }
        result.host = address.substr(1, close - 1);
        const std::string rest = address.substr(close + 1);
        if (rest.empty()) {
            return result;
        }
        if (rest.front() != ':' || !ParsePort(rest.substr(1), result.port)) {
            return std::nullopt;
        }
        return result;
    }

    const auto colons = std::count(address.begin(), address.end(), ':');
    if (colons != 1) {
        // No port, or an unbracketed IPv6 literal.
        result.host = address;
        return result;
    }

    const auto colon = address.find(':');
    result.host = address.substr(0, colon);
    if (result.host.empty() || !ParsePort(address.substr(colon + 1), result.port)) {
        return std::nullopt;
    }
    return result;
}

std::optional<DatagramTarget> ResolveDatagramTarget(const std::string &address,
                                                    uint16_t defaultPort,
                                                    MotdError *error) {
    const auto hostPort = ParseHostPort(address, defaultPort);
    if (!hostPort) {
        Fail(error, MotdErrorCode::CantSendTo, "Invalid server address '" + address + "'");
        return std::nullopt;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;

    addrinfo *results = nullptr;
    const std::string service = std::to_string(hostPort->port);
    const int rc = getaddrinfo(hostPort->host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0 || !results) {
        Fail(error, MotdErrorCode::CantSendTo,
             "Couldn't resolve '" + hostPort->host + "': " + gai_strerror(rc));
        if (results) {
            freeaddrinfo(results);
        }
        return std::nullopt;
    }

    // Prefer IPv4 when the resolver returns both families.
    const addrinfo *chosen = results;
    for (const addrinfo *it = results; it != nullptr; it = it->ai_next) {
        if (it->ai_family == AF_INET) {
            chosen = it;
            break;
        }
    }

    DatagramTarget target;
    std::memcpy(&target.address, chosen->ai_addr, chosen->ai_addrlen);
    target.length = static_cast<socklen_t>(chosen->ai_addrlen);
    target.family = chosen->ai_family;
    freeaddrinfo(results);

    spdlog::trace("ResolveDatagramTarget: {} -> {}", address, FormatSockaddr(target.address));
    return target;
}

std::string FormatSockaddr(const sockaddr_storage &address) {
    char buffer[INET6_ADDRSTRLEN] = {0};
    if (address.ss_family == AF_INET) {
        const auto *v4 = reinterpret_cast<const sockaddr_in *>(&address);
        inet_ntop(AF_INET, &v4->sin_addr, buffer, sizeof(buffer));
        return std::string(buffer) + ":" + std::to_string(ntohs(v4->sin_port));
    }
    if (address.ss_family == AF_INET6) {
        const auto *v6 = reinterpret_cast<const sockaddr_in6 *>(&address);
        inet_ntop(AF_INET6, &v6->sin6_addr, buffer, sizeof(buffer));
        return "[" + std::string(buffer) + "]:" + std::to_string(ntohs(v6->sin6_port));
    }
    return "<unknown>";
}

} // namespace motd::net
