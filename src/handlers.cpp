// ═══════════════════════════════════════════════════════════════════
//  src/handlers.cpp — info, health, metrics and chaos-control handlers
// ═══════════════════════════════════════════════════════════════════

#include "pilot/handlers.h"
#include "pilot/console.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <string_view>

namespace pilot::handlers {

Reply Reply::json(const nlohmann::json& payload, int status) {
    return Reply{status, "application/json; charset=utf-8", payload.dump()};
}

void respond(http::Response& res, const Outcome& outcome) {
    if (auto* fault = std::get_if<Fault>(&outcome)) {
        res.detail(fault->status, fault->detail);
        return;
    }
    const auto& reply = std::get<Reply>(outcome);
    res.status(reply.status).type(reply.contentType).send(reply.body);
}

std::optional<double> parseProbability(const std::string& text) {
    std::string_view view(text);
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.front()))) view.remove_prefix(1);
    while (!view.empty() && std::isspace(static_cast<unsigned char>(view.back())))  view.remove_suffix(1);
    // from_chars has no leading '+'
    if (!view.empty() && view.front() == '+') view.remove_prefix(1);
    if (view.empty()) return std::nullopt;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
    if (ec != std::errc() || ptr != view.data() + view.size() || std::isnan(value)) {
        return std::nullopt;
    }
    return value;
}

Outcome info() {
    InfoPayload payload{
        kApplication,
        kVersion,
        EndpointMap{"/health", "/metrics", "/simulate-crash"}
    };
    return Reply::json(payload);
}

Outcome health(AppContext& ctx) {
    auto uptime = ctx.uptime.elapsed();
    ctx.registry.setUptime(uptime.count());

    if (ctx.chaos.shouldFail()) {
        console::warn("Health check failed by chaos draw");
        return Fault{503, kServiceDegraded};
    }

    HealthPayload payload;
    payload.status = "healthy";
    payload.uptime = std::round(uptime.count() * 100.0) / 100.0;
    payload.uptime_formatted = UptimeTracker::format(uptime);
    payload.chaos_mode = ctx.chaos.enabled();
    return Reply::json(payload);
}

Outcome metricsExport(AppContext& ctx) {
    ctx.registry.setUptime(ctx.uptime.elapsed().count());
    return Reply{200, metrics::Registry::contentType(), ctx.registry.exportText()};
}

Fault invalidProbability(const std::string& text) {
    return Fault{422, "Invalid probability: " + text};
}

Outcome simulateCrash(AppContext& ctx, const std::string& mode,
                      std::optional<double> probability) {
    if (mode == "immediate") {
        console::warn("Chaos injected: immediate crash requested");
        return Fault{500, kChaosInjected};
    }

    if (mode == "degraded") {
        double requested = probability.value_or(1.0);
        auto applied = ctx.chaos.enableDegraded(requested);
        console::warn("Chaos enabled: /health fails with probability", applied);

        ChaosEnabledPayload payload{
            "chaos_enabled",
            "degraded",
            applied,
            "Health endpoint will fail " + metrics::formatValue(applied * 100) + "% of the time"
        };
        return Reply::json(payload);
    }

    if (mode == "reset") {
        ctx.chaos.reset();
        console::info("Chaos disabled: service restored");
        return Reply::json(ChaosDisabledPayload{"chaos_disabled", "Service restored to healthy state"});
    }

    return Fault{400, "Unknown mode: " + mode + ". Use 'immediate', 'degraded', or 'reset'"};
}

} // namespace pilot::handlers
