#pragma once

#include "motd/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace motd::protocol {

constexpr std::size_t REQUIRED_FIELD_COUNT = 4;
constexpr std::size_t KNOWN_FIELD_COUNT = 12;

/**
 * Parsed server id string of an unconnected pong.
 *
 * Optional trailing fields that the server omitted hold the defaults the
 * game client itself assumes (-1 player counts, "Survival", port 19132).
 */
struct ServerIdString {
    std::string edition;          // MCPE or MCEE
    std::string motd;
    int16_t protocolVersion = 0;
    std::string versionName;
    int32_t playerCount = -1;
    int32_t maxPlayerCount = -1;
    std::string serverUniqueId;
    std::string levelName;
    std::string gamemode = "Survival";
    uint8_t gamemodeNumeric = 0;
    uint16_t portV4 = 19132;
    uint16_t portV6 = 19132;
};

// Splits on ';' and drops empty tokens, preserving order.
std::vector<std::string_view> SplitServerIdString(std::string_view text);

/**
 * Parses the semicolon-delimited server id string.
 *
 * The first four tokens are required. A later token that is present must
 * parse as its declared type or the call fails with that field's error code;
 * a token that is simply absent is replaced by its default. *parsedOk is set
 * to false when a player count, gamemode number or port had to be defaulted.
 */
std::optional<ServerIdString> ParseServerIdString(std::string_view text,
                                                  bool *parsedOk = nullptr,
                                                  MotdError *error = nullptr);

} // namespace motd::protocol
