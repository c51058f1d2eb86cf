#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/json_utils.h — JSON payload helpers over nlohmann/json
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <string>

namespace pilot {

// ─────────────────────────────────────────────
//  PILOT_SERIALIZE(Type, fields...)
//  Declares to_json/from_json for a payload struct; the JSON keys
//  are the field names.
//
//    struct HealthPayload {
//        std::string status;
//        double uptime;
//        PILOT_SERIALIZE(HealthPayload, status, uptime)
//    };
// ─────────────────────────────────────────────
#define PILOT_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// Fault envelope: {"detail": "<message>"}
inline nlohmann::json detailBody(const std::string& message) {
    return {{"detail", message}};
}

} // namespace pilot
