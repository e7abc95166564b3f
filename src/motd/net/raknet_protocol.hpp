#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace RakNetProtocol {

constexpr uint16_t DEFAULT_PORT = 19132;

constexpr std::array<uint8_t, 16> MAGIC = {
    0x00, 0xff, 0xff, 0x00, 0xfe, 0xfe, 0xfe, 0xfe,
    0xfd, 0xfd, 0xfd, 0xfd, 0x12, 0x34, 0x56, 0x78
};

enum class PacketId : uint8_t {
    UnconnectedPing = 0x01,
    UnconnectedPong = 0x1c
};

// Unconnected ping: id | timestamp(8) | magic(16) | client guid(8)
constexpr std::size_t PING_SIZE = 33;

// Unconnected pong offsets, all integers big-endian.
constexpr std::size_t PONG_ID_OFFSET = 0;
constexpr std::size_t PONG_TIME_OFFSET = 1;
constexpr std::size_t PONG_GUID_OFFSET = 9;
constexpr std::size_t PONG_MAGIC_OFFSET = 17;
constexpr std::size_t PONG_STRING_LENGTH_OFFSET = 33;
constexpr std::size_t PONG_STRING_OFFSET = 35;
constexpr std::size_t PONG_MIN_SIZE = PONG_STRING_OFFSET;

// Largest UDP payload; a receive buffer of this size never truncates.
constexpr std::size_t MAX_DATAGRAM_SIZE = 65535;

} // namespace RakNetProtocol
