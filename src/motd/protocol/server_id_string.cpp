#include "motd/protocol/server_id_string.hpp"

#include "spdlog/spdlog.h"

#include <array>
#include <charconv>
#include <system_error>

namespace {

using motd::MotdErrorCode;
using motd::protocol::ServerIdString;

// Whole-token decimal parse. A single leading '+' is accepted, a leading '-'
// only where the target type is signed; anything out of range fails.
template <typename T>
bool ParseDecimal(std::string_view token, T &out) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        if (!token.empty() && token.front() == '-') {
            return false;
        }
    }
    if (token.empty()) {
        return false;
    }

    T value{};
    const char *first = token.data();
    const char *last = first + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return false;
    }
    out = value;
    return true;
}

struct FieldRule {
    std::size_t index;
    const char *name;
    bool flagsIncomplete;
    MotdErrorCode error;
    bool (*assign)(ServerIdString &out, std::string_view token);
    void (*fallback)(ServerIdString &out);
};

// Ordered by token position. Rules below REQUIRED_FIELD_COUNT never fall back.
const std::array<FieldRule, motd::protocol::KNOWN_FIELD_COUNT> &FieldRules() {
    static const std::array<FieldRule, motd::protocol::KNOWN_FIELD_COUNT> rules = {{
        {0, "edition", false, MotdErrorCode::None,
         [](ServerIdString &out, std::string_view token) { out.edition = std::string(token); return true; },
         nullptr},
        {1, "motd", false, MotdErrorCode::None,
         [](ServerIdString &out, std::string_view token) { out.motd = std::string(token); return true; },
         nullptr},
        {2, "protocol_version", false, MotdErrorCode::CantParseProtocolVersion,
         [](ServerIdString &out, std::string_view token) { return ParseDecimal(token, out.protocolVersion); },
         nullptr},
        {3, "version_name", false, MotdErrorCode::None,
         [](ServerIdString &out, std::string_view token) { out.versionName = std::string(token); return true; },
         nullptr},
        {4, "player_count", true, MotdErrorCode::CantParsePlayerCount,
         [](ServerIdString &out, std::string_view token) { return ParseDecimal(token, out.playerCount); },
         [](ServerIdString &out) { out.playerCount = -1; }},
        {5, "max_player_count", true, MotdErrorCode::CantParsePlayerMaxCount,
         [](ServerIdString &out, std::string_view token) { return ParseDecimal(token, out.maxPlayerCount); },
         [](ServerIdString &out) { out.maxPlayerCount = -1; }},
        {6, "server_unique_id", false, MotdErrorCode::None,
         [](ServerIdString &out, std::string_view token) { out.serverUniqueId = std::string(token); return true; },
         [](ServerIdString &out) { out.serverUniqueId.clear(); }},
        {7, "level_name", false, MotdErrorCode::None,
         [](ServerIdString &out, std::string_view token) { out.levelName = std::string(token); return true; },
         [](ServerIdString &out) { out.levelName.clear(); }},
        {8, "gamemode", false, MotdErrorCode::None,
         [](ServerIdString &out, std::string_view token) { out.gamemode = std::string(token); return true; },
         [](ServerIdString &out) { out.gamemode = "Survival"; }},
        {9, "gamemode_numeric", true, MotdErrorCode::CantParseGameModeNum,
         [](ServerIdString &out, std::string_view token) { return ParseDecimal(token, out.gamemodeNumeric); },
         [](ServerIdString &out) { out.gamemodeNumeric = 0; }},
        {10, "port_v4", true, MotdErrorCode::CantParsePort4,
         [](ServerIdString &out, std::string_view token) { return ParseDecimal(token, out.portV4); },
         [](ServerIdString &out) { out.portV4 = 19132; }},
        {11, "port_v6", true, MotdErrorCode::CantParsePort6,
         [](ServerIdString &out, std::string_view token) { return ParseDecimal(token, out.portV6); },
         [](ServerIdString &out) { out.portV6 = 19132; }}
    }};
    return rules;
}

} // namespace

namespace motd::protocol {

std::vector<std::string_view> SplitServerIdString(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find(';', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        if (end > start) {
            tokens.push_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return tokens;
}

std::optional<ServerIdString> ParseServerIdString(std::string_view text,
                                                  bool *parsedOk,
                                                  MotdError *error) {
    const auto tokens = SplitServerIdString(text);
    if (tokens.size() < REQUIRED_FIELD_COUNT) {
        Fail(error, MotdErrorCode::ServerIdStringTooSmall,
             "Server id string has " + std::to_string(tokens.size())
                 + " fields, at least " + std::to_string(REQUIRED_FIELD_COUNT) + " are required");
        return std::nullopt;
    }

    ServerIdString parsed;
    bool complete = true;

    for (const auto &rule : FieldRules()) {
        if (rule.index < tokens.size()) {
            if (!rule.assign(parsed, tokens[rule.index])) {
                Fail(error, rule.error,
                     std::string("Couldn't parse ") + rule.name + " field from server id string: '"
                         + std::string(tokens[rule.index]) + "'");
                return std::nullopt;
            }
            continue;
        }

        rule.fallback(parsed);
        if (rule.flagsIncomplete) {
            complete = false;
        }
        spdlog::trace("ServerIdString: {} missing, using default", rule.name);
    }

    if (tokens.size() > KNOWN_FIELD_COUNT) {
        spdlog::debug("ServerIdString: ignoring {} trailing field(s)", tokens.size() - KNOWN_FIELD_COUNT);
    }

    if (parsedOk) {
        *parsedOk = complete;
    }
    return parsed;
}

} // namespace motd::protocol
