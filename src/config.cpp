// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — Boost.Program_options backed configuration
// ═══════════════════════════════════════════════════════════════════

#include "pilot/config.h"

#include <boost/asio/ip/address.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <thread>

namespace po = boost::program_options;

namespace pilot {

namespace {

const std::string ENV_PREFIX = "PILOT_";

int defaultThreads() {
    return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

po::options_description describe() {
    po::options_description cmdOnly("Command line only");
    cmdOnly.add_options()
        ("help,h", "Shows this information");

    po::options_description server("Server (env: PILOT_<OPTION>, dashes become underscores)");
    server.add_options()
        ("host",
            po::value<std::string>()->default_value("0.0.0.0"),
            "bind address")
        ("port",
            po::value<int>()->default_value(8080),
            "listen port")
        ("threads",
            po::value<int>()->default_value(defaultThreads()),
            "number of I/O threads")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "debug, info, warn or error")
        ("access-log",
            po::value<bool>()->default_value(true),
            "log one line per request");

    po::options_description all("Resilience Pilot options");
    all.add(cmdOnly).add(server);
    return all;
}

// "log-level" -> "PILOT_LOG_LEVEL"
std::string envName(const std::string& option) {
    std::string name = ENV_PREFIX;
    for (char c : option) {
        name += (c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

po::parsed_options environmentOptions(const po::options_description& desc, const EnvLookup& env) {
    po::parsed_options parsed{&desc};
    for (const auto& option : desc.options()) {
        const auto& key = option->long_name();
        if (key == "help") continue;

        auto value = env(envName(key));
        if (!value) continue;

        po::option opt;
        opt.string_key = key;
        opt.value.push_back(*value);
        parsed.options.push_back(std::move(opt));
    }
    return parsed;
}

} // namespace

std::optional<std::string> systemEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

Config parseConfig(int argc, const char* const argv[], const EnvLookup& env) {
    auto desc = describe();
    po::variables_map vm;

    try {
        // First stored wins: command line over environment
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::store(environmentOptions(desc, env), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }

    Config config;
    config.help = vm.count("help") > 0;

    config.host = vm["host"].as<std::string>();
    boost::system::error_code ec;
    boost::asio::ip::make_address(config.host, ec);
    if (ec) {
        throw ConfigError("invalid host '" + config.host + "': " + ec.message());
    }

    config.port = vm["port"].as<int>();
    if (config.port < 1 || config.port > 65535) {
        throw ConfigError("port must be between 1 and 65535, got " + std::to_string(config.port));
    }

    auto threads = vm["threads"].as<int>();
    if (threads < 1) {
        throw ConfigError("threads must be at least 1, got " + std::to_string(threads));
    }
    config.threads = static_cast<std::size_t>(threads);

    auto level = vm["log-level"].as<std::string>();
    auto parsedLevel = console::parseLevel(level);
    if (!parsedLevel) {
        throw ConfigError("unknown log level '" + level + "'");
    }
    config.logLevel = *parsedLevel;

    config.accessLog = vm["access-log"].as<bool>();
    return config;
}

std::string usage() {
    std::ostringstream out;
    out << "Usage: resilience_pilot [options]\n\n" << describe();
    return out.str();
}

} // namespace pilot
