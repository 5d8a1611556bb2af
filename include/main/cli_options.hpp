#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/cancellation.hpp"
#include "common/config.hpp"

struct CliOptions {
    std::string configPath;
    std::string remote;
    std::string destinationPath;
    std::string since;
    std::string prefix;
    std::string sourceType = "zfs";
    std::string sinkType = "zfs";
    std::optional<uint64_t> shardSize;
    bool full = false;
    bool yes = false;
    bool force = false;
    bool verbose = false;
    bool help = false;
    std::vector<std::string> positional;
};

// Throws ConfigurationError on unknown options or missing values.
CliOptions parseCliOptions(int argc, char* argv[]);

// Accepts plain bytes or a K/M/G/T suffix (powers of 1024).
uint64_t parseByteSize(const std::string& text);

// Loads configuration and sets up the logger from it.
AppConfig loadCliConfig(const CliOptions& options);

// SIGINT and SIGTERM cancel the token; SIGPIPE is ignored so a dead
// child surfaces as a write error.
void installSignalHandlers(CancellationToken& token);

// Process exit status for an exception reaching the command boundary.
int exitCodeFor(const std::exception& e);
