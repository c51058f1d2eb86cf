#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/middleware.h — Access logging middleware
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>

namespace pilot::middleware {

namespace detail {

inline void logAccess(const http::Request& req, int status,
                      std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;

    std::ostringstream line;
    line << req.ip << " - \"" << req.method << ' ' << req.url << "\" " << status
         << ' ' << std::fixed << std::setprecision(2) << ms << "ms";

    if (status >= 500) {
        console::error(line.str());
    } else if (status >= 400) {
        console::warn(line.str());
    } else {
        console::success(line.str());
    }
}

} // namespace detail

// ═══════════════════════════════════════════
//  accessLog — one line per request, faults included
// ═══════════════════════════════════════════
inline http::MiddlewareFunction accessLog() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        auto start = std::chrono::steady_clock::now();
        try {
            next();
        } catch (const http::HttpError& e) {
            detail::logAccess(req, e.status(), start);
            throw;
        } catch (...) {
            detail::logAccess(req, 500, start);
            throw;
        }
        detail::logAccess(req, res.statusCode(), start);
    };
}

} // namespace pilot::middleware
