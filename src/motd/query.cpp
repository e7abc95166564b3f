#include "motd/query.hpp"

#include "motd/net/udp_exchange.hpp"
#include "spdlog/spdlog.h"

#include <utility>

namespace motd {

std::optional<UnconnectedPong> FetchUnconnectedPong(const std::string &address,
                                                    const QueryOptions &options,
                                                    MotdError *error) {
    net::UdpExchange exchange;
    const auto reply = exchange.query(address, options, error);
    if (!reply) {
        return std::nullopt;
    }

    auto pong = protocol::DecodeUnconnectedPong(*reply, options.validateMagic, error);
    if (pong) {
        spdlog::debug("FetchUnconnectedPong: {} answered (guid {}, uptime {} ms, parsed ok: {})",
                      address, pong->serverGuid, pong->timeSinceStart, pong->serverIdStringParsedOk);
    }
    return pong;
}

std::optional<ServerIdString> FetchServerIdString(const std::string &address,
                                                  const QueryOptions &options,
                                                  MotdError *error) {
    auto pong = FetchUnconnectedPong(address, options, error);
    if (!pong) {
        return std::nullopt;
    }
    return std::move(pong->serverIdString);
}

} // namespace motd
