#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/instrumentation.h — RED request instrumentation middleware
// ═══════════════════════════════════════════════════════════════════
//
//  app.use(instrumentation::red(registry));
//
//  Every request that reaches the middleware records exactly one
//  http_requests_total increment and one latency observation, whether
//  the rest of the chain returns or throws. Faults are rethrown
//  unchanged after their status is noted.
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "metrics.h"
#include "console.h"
#include <chrono>
#include <optional>
#include <string>

namespace pilot::instrumentation {

// ═══════════════════════════════════════════
//  RequestTimer — records the request when it goes out of scope
// ═══════════════════════════════════════════
class RequestTimer {
public:
    RequestTimer(metrics::Registry& registry, const http::Request& req, const http::Response& res)
        : registry_(registry)
        , req_(req)
        , res_(res)
        , start_(std::chrono::steady_clock::now())
    {}

    RequestTimer(const RequestTimer&) = delete;
    RequestTimer& operator=(const RequestTimer&) = delete;

    ~RequestTimer() {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
        // Nothing sent means the server answers 500 once the chain unwinds
        int status = faultStatus_.value_or(res_.sent() ? res_.statusCode() : 500);
        try {
            registry_.recordRequest(req_.method, endpoint(), status);
            registry_.observeLatency(req_.method, endpoint(), elapsed.count());
        } catch (const std::exception& e) {
            console::error("Failed to record", req_.method, req_.path, "-", e.what());
        }
    }

    // The chain ended in a fault; its status overrides the response's
    void fault(int status) { faultStatus_ = status; }

    // Matched route pattern, or the raw path when nothing matched
    const std::string& endpoint() const {
        return req_.route.empty() ? req_.path : req_.route;
    }

private:
    metrics::Registry& registry_;
    const http::Request& req_;
    const http::Response& res_;
    std::chrono::steady_clock::time_point start_;
    std::optional<int> faultStatus_;
};

// ═══════════════════════════════════════════
//  red — Rate / Errors / Duration middleware
// ═══════════════════════════════════════════
inline http::MiddlewareFunction red(metrics::Registry& registry) {
    return [&registry](http::Request& req, http::Response& res, http::NextFunction next) {
        RequestTimer timer(registry, req, res);
        try {
            next();
        } catch (const http::HttpError& e) {
            timer.fault(e.status());
            throw;
        } catch (...) {
            timer.fault(500);
            throw;
        }
    };
}

} // namespace pilot::instrumentation
