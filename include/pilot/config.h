#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/config.h — Command line and environment configuration
// ═══════════════════════════════════════════════════════════════════
//
//  Precedence: command line, then PILOT_* environment variables, then
//  defaults.
//
//    resilience_pilot --port 9090 --threads 2
//    PILOT_LOG_LEVEL=debug resilience_pilot
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace pilot {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::size_t threads = 1;
    console::Level logLevel = console::Level::Info;
    bool accessLog = true;
    bool help = false;
};

// Returns the value of an environment variable, or nullopt if unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> systemEnv(const std::string& name);

// Throws ConfigError on unknown options or invalid values
Config parseConfig(int argc, const char* const argv[], const EnvLookup& env = systemEnv);

// Option summary for --help
std::string usage();

} // namespace pilot
