#pragma once

#include "motd/errors.hpp"
#include "motd/net/address.hpp"
#include "motd/query_options.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace motd::net {

/**
 * One ping/pong round trip over an ephemeral UDP socket.
 *
 * The socket is bound to the wildcard address of the target's family on an
 * OS-chosen port and closed when the exchange is destroyed or reopened.
 */
class UdpExchange {
public:
    UdpExchange() = default;
    ~UdpExchange();

    UdpExchange(const UdpExchange&) = delete;
    UdpExchange& operator=(const UdpExchange&) = delete;

    // Resolves, sends the unconnected ping and waits for one datagram.
    std::optional<std::vector<uint8_t>> query(const std::string &address,
                                              const QueryOptions &options,
                                              MotdError *error = nullptr);

    bool open(int family, MotdError *error = nullptr);
    bool sendTo(const DatagramTarget &target, const uint8_t *data, std::size_t size, MotdError *error = nullptr);
    std::optional<std::vector<uint8_t>> receive(std::chrono::milliseconds timeout, MotdError *error = nullptr);

    bool isOpen() const;
    uint16_t localPort() const;

private:
    void closeSocket();

    int socketFd = -1;
};

} // namespace motd::net
