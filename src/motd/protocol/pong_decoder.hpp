#pragma once

#include "motd/errors.hpp"
#include "motd/net/raknet_protocol.hpp"
#include "motd/protocol/server_id_string.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace motd::protocol {

struct UnconnectedPong {
    uint8_t id = 0;                 // 0x1c, not enforced
    int64_t timeSinceStart = 0;     // server uptime in ms
    int64_t serverGuid = 0;
    std::array<uint8_t, 16> magic = RakNetProtocol::MAGIC;
    int16_t serverIdStringLength = 0;
    std::string serverIdStringRaw;
    bool serverIdStringParsedOk = false;
    ServerIdString serverIdString;
};

std::array<uint8_t, RakNetProtocol::PING_SIZE> BuildUnconnectedPing();

/**
 * Decodes an unconnected pong datagram.
 *
 * Every fixed offset and the declared string length are checked against
 * `size` before reading; a short reply fails with MotdErrorCode::Truncated.
 * With `validateMagic` the 16 magic bytes must match RakNetProtocol::MAGIC,
 * otherwise they are ignored. Errors from ParseServerIdString are passed
 * through unchanged.
 */
std::optional<UnconnectedPong> DecodeUnconnectedPong(const uint8_t *data,
                                                     std::size_t size,
                                                     bool validateMagic = true,
                                                     MotdError *error = nullptr);

std::optional<UnconnectedPong> DecodeUnconnectedPong(const std::vector<uint8_t> &bytes,
                                                     bool validateMagic = true,
                                                     MotdError *error = nullptr);

} // namespace motd::protocol
