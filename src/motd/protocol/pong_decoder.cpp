#include "motd/protocol/pong_decoder.hpp"

#include "motd/protocol/utf8.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <type_traits>

namespace {

template <typename T>
T ReadBigEndian(const uint8_t *data) {
    using Unsigned = std::make_unsigned_t<T>;
    Unsigned value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<Unsigned>((value << 8) | data[i]);
    }
    return static_cast<T>(value);
}

std::string Truncation(std::size_t size, std::size_t needed, const char *what) {
    return "Pong is " + std::to_string(size) + " bytes, " + std::to_string(needed)
        + " needed for " + what;
}

} // namespace

namespace motd::protocol {

std::array<uint8_t, RakNetProtocol::PING_SIZE> BuildUnconnectedPing() {
    std::array<uint8_t, RakNetProtocol::PING_SIZE> packet{};
    packet[0] = static_cast<uint8_t>(RakNetProtocol::PacketId::UnconnectedPing);
    // Timestamp (bytes 1..8) and client guid (bytes 25..32) stay zero.
    std::copy(RakNetProtocol::MAGIC.begin(), RakNetProtocol::MAGIC.end(), packet.begin() + 9);
    return packet;
}

std::optional<UnconnectedPong> DecodeUnconnectedPong(const uint8_t *data,
                                                     std::size_t size,
                                                     bool validateMagic,
                                                     MotdError *error) {
    using namespace RakNetProtocol;

    if (!data || size < PONG_MIN_SIZE) {
        Fail(error, MotdErrorCode::Truncated, Truncation(data ? size : 0, PONG_MIN_SIZE, "the fixed header"));
        return std::nullopt;
    }

    UnconnectedPong pong;
    pong.id = data[PONG_ID_OFFSET];
    if (pong.id != static_cast<uint8_t>(PacketId::UnconnectedPong)) {
        spdlog::debug("DecodeUnconnectedPong: unexpected packet id 0x{:02x}", pong.id);
    }

    pong.timeSinceStart = ReadBigEndian<int64_t>(data + PONG_TIME_OFFSET);
    pong.serverGuid = ReadBigEndian<int64_t>(data + PONG_GUID_OFFSET);

    if (validateMagic && !std::equal(MAGIC.begin(), MAGIC.end(), data + PONG_MAGIC_OFFSET)) {
        Fail(error, MotdErrorCode::MagicMismatch, "Pong magic does not match the RakNet offline message id");
        return std::nullopt;
    }
    pong.magic = MAGIC;

    pong.serverIdStringLength = ReadBigEndian<int16_t>(data + PONG_STRING_LENGTH_OFFSET);
    if (pong.serverIdStringLength < 0) {
        Fail(error, MotdErrorCode::Truncated,
             "Pong declares a negative server id string length (" + std::to_string(pong.serverIdStringLength) + ")");
        return std::nullopt;
    }

    const auto stringLength = static_cast<std::size_t>(pong.serverIdStringLength);
    if (size - PONG_STRING_OFFSET < stringLength) {
        Fail(error, MotdErrorCode::Truncated,
             Truncation(size, PONG_STRING_OFFSET + stringLength, "the server id string"));
        return std::nullopt;
    }

    pong.serverIdStringRaw = DecodeUtf8Lossy(data + PONG_STRING_OFFSET, stringLength);
    if (size > PONG_STRING_OFFSET + stringLength) {
        spdlog::trace("DecodeUnconnectedPong: {} trailing byte(s) ignored", size - PONG_STRING_OFFSET - stringLength);
    }

    auto parsed = ParseServerIdString(pong.serverIdStringRaw, &pong.serverIdStringParsedOk, error);
    if (!parsed) {
        return std::nullopt;
    }
    pong.serverIdString = std::move(*parsed);
    return pong;
}

std::optional<UnconnectedPong> DecodeUnconnectedPong(const std::vector<uint8_t> &bytes,
                                                     bool validateMagic,
                                                     MotdError *error) {
    return DecodeUnconnectedPong(bytes.data(), bytes.size(), validateMagic, error);
}

} // namespace motd::protocol
