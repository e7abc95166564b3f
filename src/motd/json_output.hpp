#pragma once

#include "motd/common/json.hpp"
#include "motd/protocol/pong_decoder.hpp"
#include "motd/protocol/server_id_string.hpp"

namespace motd {

motd::json::Value ToJson(const protocol::ServerIdString &status);
motd::json::Value ToJson(const protocol::UnconnectedPong &pong);

} // namespace motd
