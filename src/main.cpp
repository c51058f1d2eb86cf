// ═══════════════════════════════════════════════════════════════════
//  main.cpp — The Resilience Pilot: health, RED metrics, chaos control
// ═══════════════════════════════════════════════════════════════════

#include <pilot/app.h>
#include <pilot/config.h>
#include <pilot/console.h>
#include <pilot/handlers.h>
#include <pilot/lifecycle.h>

#include <iostream>

using namespace pilot;

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parseConfig(argc, argv);
    } catch (const ConfigError& e) {
        console::error("Configuration error:", e.what());
        std::cerr << usage();
        return 2;
    }

    if (config.help) {
        std::cout << usage();
        return 0;
    }

    console::setLevel(config.logLevel);

    AppContext ctx;
    auto app = createApp(ctx, {.accessLog = config.accessLog});
    lifecycle::enableGracefulShutdown(app);

    console::info(handlers::kApplication, handlers::kVersion, "starting up...");

    try {
        app.listen(config.host, config.port, config.threads, [&config] {
            auto base = "http://" + config.host + ":" + std::to_string(config.port);
            console::success("Listening on", base, "with", config.threads, "I/O threads");
            console::log("  GET  /                application info");
            console::log("  GET  /health          liveness and readiness probe");
            console::log("  GET  /metrics         Prometheus metrics");
            console::log("  POST /simulate-crash  chaos control (mode=immediate|degraded|reset)");
        });
    } catch (const std::exception& e) {
        console::error("Failed to start:", e.what());
        return 1;
    }

    if (auto sig = lifecycle::shutdownSignal()) {
        console::info("Received signal", *sig);
    }
    console::info(handlers::kApplication, "shutting down...");
    return 0;
}
