#include "motd/net/udp_exchange.hpp"

#include "motd/net/raknet_protocol.hpp"
#include "motd/protocol/pong_decoder.hpp"
#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

std::string ErrnoText(const char *what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

namespace motd::net {

UdpExchange::~UdpExchange() {
    closeSocket();
}

std::optional<std::vector<uint8_t>> UdpExchange::query(const std::string &address,
                                                       const QueryOptions &options,
                                                       MotdError *error) {
    const auto target = ResolveDatagramTarget(address, options.defaultPort, error);
    if (!target) {
        return std::nullopt;
    }

    if (!open(target->family, error)) {
        return std::nullopt;
    }

    const auto ping = motd::protocol::BuildUnconnectedPing();
    if (!sendTo(*target, ping.data(), ping.size(), error)) {
        closeSocket();
        return std::nullopt;
    }

    auto reply = receive(options.timeout, error);
    closeSocket();
    return reply;
}

bool UdpExchange::open(int family, MotdError *error) {
    closeSocket();

    socketFd = socket(family, SOCK_DGRAM, IPPROTO_UDP);
    if (socketFd < 0) {
        return Fail(error, MotdErrorCode::CantBind, ErrnoText("Unable to create UDP socket"));
    }

    sockaddr_storage local{};
    socklen_t localLength = 0;
    if (family == AF_INET6) {
        auto *v6 = reinterpret_cast<sockaddr_in6 *>(&local);
        v6->sin6_family = AF_INET6;
        v6->sin6_addr = in6addr_any;
        v6->sin6_port = 0;
        localLength = sizeof(sockaddr_in6);
    } else {
        auto *v4 = reinterpret_cast<sockaddr_in *>(&local);
        v4->sin_family = AF_INET;
        v4->sin_addr.s_addr = htonl(INADDR_ANY);
        v4->sin_port = 0;
        localLength = sizeof(sockaddr_in);
    }

    if (bind(socketFd, reinterpret_cast<sockaddr *>(&local), localLength) < 0) {
        const std::string message = ErrnoText("Couldn't bind UDP socket to an ephemeral port");
        closeSocket();
        return Fail(error, MotdErrorCode::CantBind, message);
    }

    spdlog::debug("UdpExchange: bound local port {}", localPort());
    return true;
}

bool UdpExchange::sendTo(const DatagramTarget &target, const uint8_t *data, std::size_t size, MotdError *error) {
    if (socketFd < 0) {
        return Fail(error, MotdErrorCode::CantSendTo, "Socket is not open");
    }

    const auto sent = sendto(socketFd, data, size, 0,
                             reinterpret_cast<const sockaddr *>(&target.address), target.length);
    if (sent < 0 || static_cast<std::size_t>(sent) != size) {
        const std::string reason = sent < 0 ? std::strerror(errno) : "short write";
        return Fail(error, MotdErrorCode::CantSendTo,
                    "Couldn't send to " + FormatSockaddr(target.address) + ": " + reason);
    }

    spdlog::trace("UdpExchange: sent {} bytes to {}", size, FormatSockaddr(target.address));
    return true;
}

std::optional<std::vector<uint8_t>> UdpExchange::receive(std::chrono::milliseconds timeout, MotdError *error) {
    if (socketFd < 0) {
        Fail(error, MotdErrorCode::ReceiveFailed, "Socket is not open");
        return std::nullopt;
    }

    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(socketFd, &readSet);

        timeval wait{};
        timeval *waitPtr = nullptr;
        if (bounded) {
            const auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                Fail(error, MotdErrorCode::Timeout,
                     "No reply within " + std::to_string(timeout.count()) + " ms");
                return std::nullopt;
            }
            wait.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
            wait.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);
            waitPtr = &wait;
        }

        const int ready = select(socketFd + 1, &readSet, nullptr, nullptr, waitPtr);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Fail(error, MotdErrorCode::ReceiveFailed, ErrnoText("select() failed"));
            return std::nullopt;
        }
        if (ready == 0) {
            Fail(error, MotdErrorCode::Timeout,
                 "No reply within " + std::to_string(timeout.count()) + " ms");
            return std::nullopt;
        }
        break;
    }

    std::vector<uint8_t> buffer(RakNetProtocol::MAX_DATAGRAM_SIZE);
    sockaddr_storage from{};
    socklen_t fromLength = sizeof(from);
    const auto received = recvfrom(socketFd, buffer.data(), buffer.size(), 0,
                                   reinterpret_cast<sockaddr *>(&from), &fromLength);
    if (received < 0) {
        Fail(error, MotdErrorCode::ReceiveFailed, ErrnoText("recvfrom failed"));
        return std::nullopt;
    }

    buffer.resize(static_cast<std::size_t>(received));
    spdlog::trace("UdpExchange: received {} bytes from {}", buffer.size(), FormatSockaddr(from));
    return buffer;
}

bool UdpExchange::isOpen() const {
    return socketFd >= 0;
}

uint16_t UdpExchange::localPort() const {
    if (socketFd < 0) {
        return 0;
    }
    sockaddr_storage local{};
    socklen_t length = sizeof(local);
    if (getsockname(socketFd, reinterpret_cast<sockaddr *>(&local), &length) < 0) {
        return 0;
    }
    if (local.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6 *>(&local)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in *>(&local)->sin_port);
}

void UdpExchange::closeSocket() {
    if (socketFd >= 0) {
        close(socketFd);
        socketFd = -1;
    }
}

} // namespace motd::net
