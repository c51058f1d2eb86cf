#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/lifecycle.h — Graceful shutdown on SIGINT / SIGTERM
// ═══════════════════════════════════════════════════════════════════
//
//  lifecycle::enableGracefulShutdown(app);
//  app.listen(...);                       // returns after a signal
//  if (auto sig = lifecycle::shutdownSignal()) { ... }
//
//  The server's I/O loop receives the signal and stops itself. A
//  signal that lands before listen() makes listen() return at once.
//  Logging happens on the main thread once listen() returns.
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <atomic>
#include <csignal>
#include <optional>

namespace pilot::lifecycle {

namespace detail {
    inline std::atomic<int>& receivedSignal() {
        static std::atomic<int> sig{0};
        return sig;
    }
} // namespace detail

// ── Stop `server` on SIGINT and SIGTERM ──
inline void enableGracefulShutdown(http::Server& server) {
    server.stopOnSignals({SIGINT, SIGTERM}, [](int sig) {
        detail::receivedSignal().store(sig);
    });
}

// ── The signal that triggered shutdown, if any ──
inline std::optional<int> shutdownSignal() {
    int sig = detail::receivedSignal().load();
    if (sig == 0) return std::nullopt;
    return sig;
}

} // namespace pilot::lifecycle
