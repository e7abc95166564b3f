#include "motd/errors.hpp"

#include <utility>

namespace motd {

const char *ToString(MotdErrorCode code) {
    switch (code) {
    case MotdErrorCode::None:
        return "none";
    case MotdErrorCode::CantBind:
        return "cant_bind";
    case MotdErrorCode::CantSendTo:
        return "cant_send_to";
    case MotdErrorCode::ServerIdStringTooSmall:
        return "server_id_string_too_small";
    case MotdErrorCode::CantParseProtocolVersion:
        return "cant_parse_protocol_version";
    case MotdErrorCode::CantParsePlayerCount:
        return "cant_parse_player_count";
    case MotdErrorCode::CantParsePlayerMaxCount:
        return "cant_parse_player_max_count";
    case MotdErrorCode::CantParseGameModeNum:
        return "cant_parse_game_mode_num";
    case MotdErrorCode::CantParsePort4:
        return "cant_parse_port_v4";
    case MotdErrorCode::CantParsePort6:
        return "cant_parse_port_v6";
    case MotdErrorCode::Timeout:
        return "timeout";
    case MotdErrorCode::ReceiveFailed:
        return "receive_failed";
    case MotdErrorCode::Truncated:
        return "truncated";
    case MotdErrorCode::MagicMismatch:
        return "magic_mismatch";
    }
    return "unknown";
}

bool Fail(MotdError *error, MotdErrorCode code, std::string message) {
    if (error) {
        error->code = code;
        error->message = std::move(message);
    }
    return false;
}

} // namespace motd
