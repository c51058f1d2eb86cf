// ═══════════════════════════════════════════════════════════════════
//  src/app.cpp — Route and middleware wiring
// ═══════════════════════════════════════════════════════════════════

#include "pilot/app.h"
#include "pilot/handlers.h"
#include "pilot/instrumentation.h"
#include "pilot/middleware.h"

#include <optional>

namespace pilot {

http::Server createApp(AppContext& ctx, const AppOptions& options) {
    http::Server app;

    // Outermost, so it sees every exit path of everything below
    app.use(instrumentation::red(ctx.registry));
    if (options.accessLog) {
        app.use(middleware::accessLog());
    }

    app.get("/", [](http::Request&, http::Response& res) {
        handlers::respond(res, handlers::info());
    });

    app.get("/health", [&ctx](http::Request&, http::Response& res) {
        handlers::respond(res, handlers::health(ctx));
    });

    app.get("/metrics", [&ctx](http::Request&, http::Response& res) {
        handlers::respond(res, handlers::metricsExport(ctx));
    });

    app.post("/simulate-crash", [&ctx](http::Request& req, http::Response& res) {
        // Validated for every mode, before any chaos state changes
        std::optional<double> probability;
        if (req.hasQuery("probability")) {
            const auto& raw = req.query.at("probability");
            probability = handlers::parseProbability(raw);
            if (!probability) {
                handlers::respond(res, handlers::invalidProbability(raw));
                return;
            }
        }
        handlers::respond(res, handlers::simulateCrash(
            ctx, req.queryOr("mode", "immediate"), probability));
    });

    return app;
}

} // namespace pilot
