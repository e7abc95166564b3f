#pragma once

#include <string>

namespace motd {

// Values are stable and double as the CLI exit code offset.
enum class MotdErrorCode {
    None = 0,
    CantBind = 1,
    CantSendTo = 2,
    ServerIdStringTooSmall = 3,
    CantParseProtocolVersion = 4,
    CantParsePlayerCount = 5,
    CantParsePlayerMaxCount = 6,
    CantParseGameModeNum = 7,
    CantParsePort4 = 8,
    CantParsePort6 = 9,
    Timeout = 10,
    ReceiveFailed = 11,
    Truncated = 12,
    MagicMismatch = 13
};

struct MotdError {
    MotdErrorCode code = MotdErrorCode::None;
    std::string message;
};

const char *ToString(MotdErrorCode code);

// Fills *error when non-null. Always returns false so callers can write
// `return Fail(error, ...);`.
bool Fail(MotdError *error, MotdErrorCode code, std::string message);

} // namespace motd
