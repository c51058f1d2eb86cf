#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/handlers.h — Endpoint handlers returning typed outcomes
// ═══════════════════════════════════════════════════════════════════
//
//  Each handler returns an Outcome: either a Reply (status, content
//  type, body) or a Fault (status, detail). respond() is the single
//  place an Outcome becomes an HTTP response; a Fault always goes out
//  as {"detail": "<message>"}.
//
// ═══════════════════════════════════════════════════════════════════

#include "app.h"
#include "http.h"
#include "json_utils.h"
#include <optional>
#include <string>
#include <variant>

namespace pilot::handlers {

inline constexpr const char* kApplication    = "The Resilience Pilot";
inline constexpr const char* kVersion        = "1.0.0";
inline constexpr const char* kChaosInjected  = "Chaos injected! This is an intentional crash for testing.";
inline constexpr const char* kServiceDegraded = "Service degraded (chaos mode active)";

struct Reply {
    int status = 200;
    std::string contentType;
    std::string body;

    static Reply json(const nlohmann::json& payload, int status = 200);
};

struct Fault {
    int status = 500;
    std::string detail;
};

using Outcome = std::variant<Reply, Fault>;

void respond(http::Response& res, const Outcome& outcome);

// ── Payloads ──
struct EndpointMap {
    std::string health;
    std::string metrics;
    std::string chaos;
    PILOT_SERIALIZE(EndpointMap, health, metrics, chaos)
};

struct InfoPayload {
    std::string application;
    std::string version;
    EndpointMap endpoints;
    PILOT_SERIALIZE(InfoPayload, application, version, endpoints)
};

struct HealthPayload {
    std::string status;
    double uptime = 0.0;
    std::string uptime_formatted;
    bool chaos_mode = false;
    PILOT_SERIALIZE(HealthPayload, status, uptime, uptime_formatted, chaos_mode)
};

struct ChaosEnabledPayload {
    std::string status;
    std::string mode;
    double failure_probability = 0.0;
    std::string message;
    PILOT_SERIALIZE(ChaosEnabledPayload, status, mode, failure_probability, message)
};

struct ChaosDisabledPayload {
    std::string status;
    std::string message;
    PILOT_SERIALIZE(ChaosDisabledPayload, status, message)
};

// ── GET / ──
Outcome info();

// ── GET /health ──
//    Updates the uptime gauge; 503 when the chaos draw says so.
Outcome health(AppContext& ctx);

// ── GET /metrics ──
Outcome metricsExport(AppContext& ctx);

// ── POST /simulate-crash?mode=&probability= ──
//    mode: immediate (default) | degraded | reset
//    probability: already parsed; only used by degraded, defaults to 1.0
Outcome simulateCrash(AppContext& ctx, const std::string& mode,
                      std::optional<double> probability);

// 422 for a probability query value that does not parse, whatever the mode
Fault invalidProbability(const std::string& text);

// Parses a probability query value; nullopt for text that is not a number or NaN
std::optional<double> parseProbability(const std::string& text);

} // namespace pilot::handlers
