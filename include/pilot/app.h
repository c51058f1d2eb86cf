#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/app.h — Application context and route wiring
// ═══════════════════════════════════════════════════════════════════
//
//  AppContext ctx;
//  auto app = createApp(ctx);
//  app.listen("0.0.0.0", 8080, 4);
//
//  AppContext owns every piece of shared mutable state; middleware and
//  handlers only ever see it by reference.
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "metrics.h"
#include "chaos.h"
#include "uptime.h"

namespace pilot {

struct AppContext {
    metrics::Registry registry;
    ChaosState chaos;
    UptimeTracker uptime;

    explicit AppContext(bool processMetrics = true)
        : registry(processMetrics) {}

    // Deterministic chaos draws for tests
    AppContext(ChaosState::UniformSource source, bool processMetrics)
        : registry(processMetrics)
        , chaos(std::move(source)) {}

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;
};

struct AppOptions {
    bool accessLog = true;
};

// Routes: GET /, GET /health, GET /metrics, POST /simulate-crash.
// RED instrumentation wraps everything, the access log sits inside it.
http::Server createApp(AppContext& ctx, const AppOptions& options = {});

} // namespace pilot
