#pragma once

#include "motd/net/raknet_protocol.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace motd::test {

inline void AppendBigEndian(std::vector<uint8_t> &out, uint64_t value, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * (width - 1 - i))));
    }
}

// Builds an unconnected pong. `declaredLength` < 0 means "use the real length".
inline std::vector<uint8_t> MakePong(const std::string &serverIdString,
                                     int64_t uptime = 0x0102030405060708LL,
                                     int64_t guid = 0x1122334455667788LL,
                                     int declaredLength = -1) {
    std::vector<uint8_t> out;
    out.push_back(0x1c);
    AppendBigEndian(out, static_cast<uint64_t>(uptime), 8);
    AppendBigEndian(out, static_cast<uint64_t>(guid), 8);
    out.insert(out.end(), RakNetProtocol::MAGIC.begin(), RakNetProtocol::MAGIC.end());
    const auto length = declaredLength < 0 ? serverIdString.size() : static_cast<std::size_t>(declaredLength);
    AppendBigEndian(out, length, 2);
    out.insert(out.end(), serverIdString.begin(), serverIdString.end());
    return out;
}

inline const std::string FULL_SERVER_ID_STRING =
    "MCPE;Dedicated Server;618;1.20.40;3;10;13253860892328930865;Bedrock level;Survival;1;19132;19133;";

} // namespace motd::test
