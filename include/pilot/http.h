#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/http.h — HTTP Server, Request, Response and HttpError
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    http::Server app;
//    app.use(instrumentation::red(registry));
//    app.get("/health", [](auto& req, auto& res) {
//        res.json({{"status", "healthy"}});
//    });
//    app.listen("0.0.0.0", 8080, 4, []{ console::info("ready"); });
//
//  Routes are literal segments or ":name" parameters; a path that
//  matches no route is a 404, one that matches only under another
//  method is a 405.
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace pilot::http {

class Request;
class Response;

using Headers            = std::unordered_map<std::string, std::string>;
using NextFunction       = std::function<void()>;
using MiddlewareFunction = std::function<void(Request&, Response&, NextFunction)>;
using RouteHandler       = std::function<void(Request&, Response&)>;

// ═══════════════════════════════════════════════════════════════════
//  class HttpError
//  A fault carrying an HTTP status. Thrown through the middleware
//  chain and turned into {"detail": what()} by the server.
// ═══════════════════════════════════════════════════════════════════
class HttpError : public std::runtime_error {
public:
    HttpError(int status, const std::string& detail)
        : std::runtime_error(detail), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

// ═══════════════════════════════════════════════════════════════════
//  class Request
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    std::string method;
    std::string url;            // Request target as received, query included
    std::string path;           // Decoded target without the query
    std::string route;          // Pattern of the matched route, empty if none matched
    std::string ip;

    Headers headers;            // Lowercase keys
    Headers params;             // ":id" segments of the matched route
    Headers query;

    // Case-insensitive; empty when absent
    std::string header(const std::string& name) const;

    std::string queryOr(const std::string& key, const std::string& fallback) const {
        auto it = query.find(key);
        return it != query.end() ? it->second : fallback;
    }

    bool hasQuery(const std::string& key) const {
        return query.count(key) > 0;
    }
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  Collects status, headers and body; the first send() hands them to
//  the transport through the Sink and later sends are ignored.
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using Sink = std::function<void(int status, const Headers& headers, const std::string& body)>;

    Response() = default;
    explicit Response(Sink sink) : sink_(std::move(sink)) {}

    Response& status(int code) {
        status_ = code;
        return *this;
    }

    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    Response& type(const std::string& contentType) {
        return set("Content-Type", contentType);
    }

    // Defaults to text/plain when no Content-Type was set
    void send(const std::string& body);

    // res.json({{"status", "healthy"}}) or res.json(payloadStruct)
    void json(const nlohmann::json& payload) {
        type("application/json; charset=utf-8").send(payload.dump());
    }

    // ── Fault envelope: status + {"detail": message} ──
    void detail(int code, const std::string& message) {
        status(code).json(detailBody(message));
    }

    bool sent() const { return sent_; }

    int statusCode() const { return status_; }
    const std::string& body() const { return body_; }
    const Headers& headers() const { return headers_; }

private:
    Sink sink_;
    int status_ = 200;
    Headers headers_;
    std::string body_;
    bool sent_ = false;
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  Middleware chain and router in front of a Boost.Beast listener.
//  Uses pimpl to keep Beast out of this header.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    Server();
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ── Middleware ──
    //    Runs in registration order; the route handler runs when the
    //    last one calls next().
    Server& use(MiddlewareFunction middleware);

    // ── Routes ──
    Server& route(const std::string& method, const std::string& pattern, RouteHandler handler);

    Server& get(const std::string& pattern, RouteHandler handler) {
        return route("GET", pattern, std::move(handler));
    }

    Server& post(const std::string& pattern, RouteHandler handler) {
        return route("POST", pattern, std::move(handler));
    }

    // ── Listen ──
    //    Blocks until close(). The calling thread is one of `threads`
    //    I/O threads. Throws std::runtime_error if the address cannot
    //    be bound.
    void listen(const std::string& host, int port, std::size_t threads,
                std::function<void()> onListening = nullptr);

    // ── Stop on signals ──
    //    Once registered, any of `signals` stops the server: during
    //    listen() through the I/O loop, and one that arrives earlier
    //    makes the next listen() return at once. `onSignal` runs on an
    //    I/O thread (or the listening thread) before the stop.
    using SignalHandler = std::function<void(int)>;
    Server& stopOnSignals(std::vector<int> signals, SignalHandler onSignal = nullptr);

    // Safe from any thread; a no-op unless listening
    void close();

    bool running() const;

    // ── Process one request through middleware and routing ──
    //    Never throws; faults become responses.
    void handleRequest(Request& req, Response& res);

private:
    friend class HttpSession;
    friend class HttpListener;

    void stopFromSignal(int sig);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pilot::http
