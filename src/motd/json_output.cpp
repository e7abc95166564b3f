#include "motd/json_output.hpp"

#include <cstdio>
#include <string>

namespace {

std::string HexBytes(const std::array<uint8_t, 16> &bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    char pair[3];
    for (const auto byte : bytes) {
        std::snprintf(pair, sizeof(pair), "%02x", byte);
        out += pair;
    }
    return out;
}

} // namespace

namespace motd {

motd::json::Value ToJson(const protocol::ServerIdString &status) {
    auto value = motd::json::Object();
    value["edition"] = status.edition;
    value["motd"] = status.motd;
    value["protocol_version"] = status.protocolVersion;
    value["version_name"] = status.versionName;
    value["player_count"] = status.playerCount;
    value["max_player_count"] = status.maxPlayerCount;
    value["server_unique_id"] = status.serverUniqueId;
    value["level_name"] = status.levelName;
    value["gamemode"] = status.gamemode;
    value["gamemode_numeric"] = status.gamemodeNumeric;
    value["port_v4"] = status.portV4;
    value["port_v6"] = status.portV6;
    return value;
}

motd::json::Value ToJson(const protocol::UnconnectedPong &pong) {
    auto value = motd::json::Object();
    value["id"] = pong.id;
    value["time_since_start"] = pong.timeSinceStart;
    value["server_guid"] = pong.serverGuid;
    value["magic"] = HexBytes(pong.magic);
    value["server_id_string_len"] = pong.serverIdStringLength;
    value["server_id_string_raw"] = pong.serverIdStringRaw;
    value["server_id_string_parsed_ok"] = pong.serverIdStringParsedOk;
    value["server_id_string_parsed"] = ToJson(pong.serverIdString);
    return value;
}

} // namespace motd
