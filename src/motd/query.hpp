#pragma once

#include "motd/errors.hpp"
#include "motd/protocol/pong_decoder.hpp"
#include "motd/protocol/server_id_string.hpp"
#include "motd/query_options.hpp"

#include <optional>
#include <string>

namespace motd {

using protocol::ServerIdString;
using protocol::UnconnectedPong;

/**
 * Pings `address` ("host", "host:port" or "[v6]:port") once and decodes the
 * unconnected pong.
 *
 * Returns std::nullopt and fills *error on any transport, framing or parse
 * failure. Missing optional server id string fields are not failures; check
 * UnconnectedPong::serverIdStringParsedOk to tell whether defaults were used.
 */
std::optional<UnconnectedPong> FetchUnconnectedPong(const std::string &address,
                                                    const QueryOptions &options = {},
                                                    MotdError *error = nullptr);

// FetchUnconnectedPong, keeping only the parsed server id string.
std::optional<ServerIdString> FetchServerIdString(const std::string &address,
                                                  const QueryOptions &options = {},
                                                  MotdError *error = nullptr);

} // namespace motd
