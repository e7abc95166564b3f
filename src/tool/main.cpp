#include "spdlog/spdlog.h"
#include "motd/common/config_helpers.hpp"
#include "motd/json_output.hpp"
#include "motd/query.hpp"
#include "motd/query_config.hpp"
#include "tool/cli_options.hpp"
#include <iostream>

spdlog::level::level_enum ParseLogLevel(const std::string &level) {
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn") {
        return spdlog::level::warn;
    }
    if (level == "err") {
        return spdlog::level::err;
    }
    if (level == "critical") {
        return spdlog::level::critical;
    }
    if (level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

void ConfigureLogging(spdlog::level::level_enum level, bool includeTimestamp) {
    if (includeTimestamp) {
        spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    } else {
        spdlog::set_pattern("[%^%l%$] %v");
    }
    spdlog::set_level(level);
}

namespace {

constexpr int EXIT_QUERY_FAILURE_BASE = 10;

void PrintStatus(const motd::ServerIdString &status) {
    std::cout << "Edition:          " << status.edition << "\n"
              << "MOTD:             " << status.motd << "\n"
              << "Protocol:         " << status.protocolVersion << "\n"
              << "Version:          " << status.versionName << "\n"
              << "Players:          " << status.playerCount << " / " << status.maxPlayerCount << "\n"
              << "Server id:        " << status.serverUniqueId << "\n"
              << "Level:            " << status.levelName << "\n"
              << "Gamemode:         " << status.gamemode << " (" << static_cast<int>(status.gamemodeNumeric) << ")\n"
              << "Ports (v4 / v6):  " << status.portV4 << " / " << status.portV6 << std::endl;
}

void PrintPong(const motd::UnconnectedPong &pong) {
    std::cout << "Server GUID:      " << pong.serverGuid << "\n"
              << "Uptime (ms):      " << pong.timeSinceStart << "\n"
              << "Fully parsed:     " << (pong.serverIdStringParsedOk ? "yes" : "no") << "\n"
              << "Raw id string:    " << pong.serverIdStringRaw << "\n";
    PrintStatus(pong.serverIdString);
}

} // namespace

int main(int argc, char *argv[]) {
    ConfigureLogging(spdlog::level::info, false);

    QueryCLIOptions cliOptions = ParseQueryCLIOptions(argc, argv);

    const spdlog::level::level_enum logLevel = cliOptions.logLevelExplicit
        ? ParseLogLevel(cliOptions.logLevel)
        : (cliOptions.verbose >= 2 ? spdlog::level::trace
           : cliOptions.verbose == 1 ? spdlog::level::debug
           : spdlog::level::info);
    ConfigureLogging(logLevel, cliOptions.timestampLogging);

    motd::QueryOptions queryOptions;
    if (cliOptions.configExplicit) {
        auto configOpt = motd::config::LoadJsonFile(cliOptions.configPath, "query config", spdlog::level::err);
        if (!configOpt || !configOpt->is_object()) {
            spdlog::error("main: Failed to load config object from {}", cliOptions.configPath);
            return 1;
        }
        queryOptions = motd::config::ReadQueryOptions(*configOpt, queryOptions);
    }
    if (cliOptions.timeoutExplicit) {
        queryOptions.timeout = std::chrono::milliseconds(cliOptions.timeoutMs);
    }
    if (cliOptions.noValidateMagic) {
        queryOptions.validateMagic = false;
    }

    spdlog::debug("Querying {} (timeout {} ms, validate magic: {})",
                  cliOptions.address, queryOptions.timeout.count(), queryOptions.validateMagic);

    motd::MotdError error;
    if (cliOptions.statusOnly) {
        const auto status = motd::FetchServerIdString(cliOptions.address, queryOptions, &error);
        if (!status) {
            spdlog::error("{}: {} ({})", cliOptions.address, error.message, motd::ToString(error.code));
            return EXIT_QUERY_FAILURE_BASE + static_cast<int>(error.code);
        }
        if (cliOptions.json) {
            std::cout << motd::json::Dump(motd::ToJson(*status), 2) << std::endl;
        } else {
            PrintStatus(*status);
        }
        return 0;
    }

    const auto pong = motd::FetchUnconnectedPong(cliOptions.address, queryOptions, &error);
    if (!pong) {
        spdlog::error("{}: {} ({})", cliOptions.address, error.message, motd::ToString(error.code));
        return EXIT_QUERY_FAILURE_BASE + static_cast<int>(error.code);
    }

    if (!pong->serverIdStringParsedOk) {
        spdlog::warn("{}: server id string is incomplete, defaults were substituted", cliOptions.address);
    }

    if (cliOptions.json) {
        std::cout << motd::json::Dump(motd::ToJson(*pong), 2) << std::endl;
    } else {
        PrintPong(*pong);
    }
    return 0;
}
