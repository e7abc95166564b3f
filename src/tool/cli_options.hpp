#pragma once

#include <cstdint>
#include <string>

struct QueryCLIOptions {
    std::string address;
    std::string configPath;
    bool configExplicit = false;
    uint32_t timeoutMs = 0;
    bool timeoutExplicit = false;
    bool noValidateMagic = false;
    bool json = false;
    bool statusOnly = false;
    int verbose = 0;
    std::string logLevel;
    bool logLevelExplicit = false;
    bool timestampLogging = false;
};

bool IsValidLogLevel(std::string level);
std::string NormalizeLogLevel(std::string level);

QueryCLIOptions ParseQueryCLIOptions(int argc, char *argv[]);
