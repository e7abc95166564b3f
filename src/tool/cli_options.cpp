#include "tool/cli_options.hpp"

#include "cxxopts.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

bool IsValidLogLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return level == "trace" ||
           level == "debug" ||
           level == "info" ||
           level == "warn" ||
           level == "error" ||
           level == "err" ||
           level == "critical" ||
           level == "off";
}

std::string NormalizeLogLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (level == "error") {
        return "err";
    }
    return level;
}

QueryCLIOptions ParseQueryCLIOptions(int argc, char *argv[]) {
    cxxopts::Options options("mcpe-motd", "Query a Bedrock server with a RakNet unconnected ping");
    options.add_options()
        ("a,addr", "Server address (host, host:port or [v6]:port)", cxxopts::value<std::string>())
        ("c,config", "JSON config file path", cxxopts::value<std::string>())
        ("t,timeout", "Reply timeout in milliseconds (0 waits forever)", cxxopts::value<uint32_t>())
        ("no-validate-magic", "Accept replies whose magic bytes differ")
        ("j,json", "Print the decoded pong as JSON")
        ("s,status-only", "Print only the parsed server id string")
        ("v,verbose", "Increase logging verbosity (-v debug, -vv trace)")
        ("L,log-level", "Logging level (trace, debug, info, warn, err, critical, off)", cxxopts::value<std::string>())
        ("T,timestamp-logging", "Enable timestamped logging output")
        ("h,help", "Show help");
    options.parse_positional({"addr"});
    options.positional_help("<address>");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (!result.count("addr")) {
        std::cerr << "Error: no server address given.\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }

    QueryCLIOptions parsed;
    parsed.address = result["addr"].as<std::string>();
    parsed.configPath = result.count("config") ? result["config"].as<std::string>() : std::string();
    parsed.configExplicit = result.count("config") > 0;
    parsed.timeoutMs = result.count("timeout") ? result["timeout"].as<uint32_t>() : 0;
    parsed.timeoutExplicit = result.count("timeout") > 0;
    parsed.noValidateMagic = result.count("no-validate-magic") > 0;
    parsed.json = result.count("json") > 0;
    parsed.statusOnly = result.count("status-only") > 0;
    parsed.verbose = static_cast<int>(result.count("verbose"));
    parsed.logLevel = result.count("log-level") ? result["log-level"].as<std::string>() : std::string();
    parsed.logLevelExplicit = result.count("log-level") > 0;
    parsed.timestampLogging = result.count("timestamp-logging") > 0;
    if (parsed.logLevelExplicit && !IsValidLogLevel(parsed.logLevel)) {
        std::cerr << "Error: invalid --log-level value '" << parsed.logLevel << "'.\n";
        std::cerr << options.help() << std::endl;
        std::exit(1);
    }
    if (parsed.logLevelExplicit) {
        parsed.logLevel = NormalizeLogLevel(parsed.logLevel);
    }
    return parsed;
}
