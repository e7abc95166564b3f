#pragma once

#include "motd/net/raknet_protocol.hpp"

#include <chrono>
#include <cstdint>

namespace motd {

struct QueryOptions {
    // Zero waits for a reply indefinitely.
    std::chrono::milliseconds timeout{5000};
    bool validateMagic = true;
    uint16_t defaultPort = RakNetProtocol::DEFAULT_PORT;
};

} // namespace motd
