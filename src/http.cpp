// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Routing, middleware chain and the Beast transport
// ═══════════════════════════════════════════════════════════════════

#include "pilot/http.h"
#include "pilot/console.h"

#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pilot::http {

namespace beast = boost::beast;
namespace net   = boost::asio;
namespace bhttp = beast::http;
using tcp       = net::ip::tcp;

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Percent-decoding; '+' is a space only inside query strings
std::string decode(const std::string& text, bool plusIsSpace) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
            out += static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2]));
            i += 2;
        } else if (c == '+' && plusIsSpace) {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

// "a=1&b=&c" -> {a:1, b:"", c:""}; a repeated key keeps its last value
Headers parseQuery(const std::string& text) {
    Headers query;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('&', start);
        if (end == std::string::npos) end = text.size();

        auto pair = text.substr(start, end - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                query[decode(pair, true)] = "";
            } else {
                query[decode(pair.substr(0, eq), true)] = decode(pair.substr(eq + 1), true);
            }
        }
        start = end + 1;
    }
    return query;
}

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start < path.size()) {
        auto end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (end > start) segments.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    return segments;
}

// Set by the process-level handler until a listen() picks it up
std::atomic<int> pendingSignal{0};

void recordPendingSignal(int sig) {
    pendingSignal.store(sig);
}

} // namespace

std::string Request::header(const std::string& name) const {
    auto it = headers.find(lowercase(name));
    return it != headers.end() ? it->second : "";
}

void Response::send(const std::string& body) {
    if (sent_) return;
    sent_ = true;
    headers_.emplace("Content-Type", "text/plain; charset=utf-8");
    body_ = body;
    if (sink_) {
        sink_(status_, headers_, body_);
    }
}

// ═══════════════════════════════════════════
//  Route — pattern split into segments
// ═══════════════════════════════════════════
struct Route {
    std::string method;
    std::string pattern;
    std::vector<std::string> segments;
    RouteHandler handler;

    // Fills `params` on a path match, regardless of method
    bool matches(const std::vector<std::string>& path, Headers& params) const {
        if (path.size() != segments.size()) return false;

        Headers found;
        for (std::size_t i = 0; i < segments.size(); ++i) {
            const auto& want = segments[i];
            if (!want.empty() && want.front() == ':') {
                found[want.substr(1)] = path[i];
            } else if (want != path[i]) {
                return false;
            }
        }
        params = std::move(found);
        return true;
    }
};

// ═══════════════════════════════════════════
//  Server::Impl
// ═══════════════════════════════════════════
struct Server::Impl {
    std::vector<MiddlewareFunction> middlewares;
    std::vector<Route> routes;
    std::unique_ptr<net::io_context> ioc;
    std::atomic<bool> running{false};
    std::vector<int> stopSignals;
    Server::SignalHandler onSignal;

    // Middleware `index`, or the router once every middleware called next()
    void runChain(Request& req, Response& res, std::size_t index) {
        if (res.sent()) return;
        if (index == middlewares.size()) {
            dispatch(req, res);
            return;
        }
        middlewares[index](req, res, [this, &req, &res, index] {
            runChain(req, res, index + 1);
        });
    }

    void dispatch(Request& req, Response& res) {
        auto path = splitSegments(req.path);

        bool pathKnown = false;
        for (const auto& route : routes) {
            if (!route.matches(path, req.params)) continue;
            pathKnown = true;
            if (route.method != req.method) continue;

            req.route = route.pattern;
            route.handler(req, res);
            return;
        }

        req.params.clear();
        res.detail(pathKnown ? 405 : 404, pathKnown ? "Method Not Allowed" : "Not Found");
    }

    void handle(Request& req, Response& res) {
        try {
            runChain(req, res, 0);
        } catch (const HttpError& e) {
            console::warn(req.method, req.path, "failed with", e.status(), "-", e.what());
            if (!res.sent()) res.detail(e.status(), e.what());
        } catch (const std::exception& e) {
            console::error("Unhandled fault in", req.method, req.path, "-", e.what());
            if (!res.sent()) res.detail(500, "Internal Server Error");
        } catch (...) {
            console::error("Unhandled non-standard fault in", req.method, req.path);
            if (!res.sent()) res.detail(500, "Internal Server Error");
        }

        // A handler that returns without responding is a server fault
        if (!res.sent()) {
            console::error(req.method, req.path, "produced no response");
            res.detail(500, "Internal Server Error");
        }
    }
};

// ═══════════════════════════════════════════
//  HttpSession — one keep-alive connection
// ═══════════════════════════════════════════
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, Server::Impl& server)
        : socket_(std::move(socket))
        , server_(server)
    {}

    void run() {
        // Start on the connection's strand
        net::dispatch(socket_.get_executor(),
                      beast::bind_front_handler(&HttpSession::read, shared_from_this()));
    }

private:
    using BeastRequest  = bhttp::request<bhttp::string_body>;
    using BeastResponse = bhttp::response<bhttp::string_body>;

    tcp::socket socket_;
    beast::flat_buffer buffer_;
    BeastRequest request_;
    Server::Impl& server_;

    void read() {
        request_ = {};
        bhttp::async_read(socket_, buffer_, request_,
                          beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == bhttp::error::end_of_stream) {
            close();
            return;
        }
        if (ec) {
            console::debug("read failed:", ec.message());
            return;
        }
        respond(std::move(request_));
    }

    void respond(BeastRequest beastReq) {
        Request req;
        req.method = std::string(beastReq.method_string());
        req.url = std::string(beastReq.target());

        auto queryStart = req.url.find('?');
        req.path = decode(req.url.substr(0, queryStart), false);
        if (queryStart != std::string::npos) {
            req.query = parseQuery(req.url.substr(queryStart + 1));
        }

        beast::error_code ec;
        auto remote = socket_.remote_endpoint(ec);
        req.ip = ec ? "unknown" : remote.address().to_string();

        for (const auto& field : beastReq) {
            req.headers[lowercase(std::string(field.name_string()))] = std::string(field.value());
        }

        auto reply = std::make_shared<BeastResponse>();
        reply->version(beastReq.version());
        reply->keep_alive(beastReq.keep_alive());

        Response res([&reply](int status, const Headers& headers, const std::string& body) {
            reply->result(static_cast<unsigned>(status));
            for (const auto& [key, value] : headers) {
                if (!value.empty()) reply->set(key, value);
            }
            reply->body() = body;
            reply->prepare_payload();
        });

        server_.handle(req, res);
        write(std::move(reply));
    }

    void write(std::shared_ptr<BeastResponse> reply) {
        bool keepAlive = reply->keep_alive();
        auto& message = *reply;
        bhttp::async_write(socket_, message,
            [self = shared_from_this(), reply = std::move(reply), keepAlive](beast::error_code ec, std::size_t) {
                if (ec) {
                    console::debug("write failed:", ec.message());
                    return;
                }
                if (keepAlive) {
                    self->read();
                } else {
                    self->close();
                }
            });
    }

    void close() {
        beast::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_send, ec);
    }
};

// ═══════════════════════════════════════════
//  HttpListener — accepts connections
// ═══════════════════════════════════════════
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(net::io_context& ioc, const tcp::endpoint& endpoint, Server::Impl& server)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(server)
    {
        beast::error_code ec;
        auto check = [&ec, &endpoint](const char* step) {
            if (ec) {
                throw std::runtime_error(std::string(step) + " " + endpoint.address().to_string() + ":" +
                                         std::to_string(endpoint.port()) + " failed: " + ec.message());
            }
        };

        acceptor_.open(endpoint.protocol(), ec);
        check("open");
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        check("reuse_address on");
        acceptor_.bind(endpoint, ec);
        check("bind");
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        check("listen on");
    }

    void accept() {
        // Each connection gets its own strand
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&HttpListener::onAccept, shared_from_this()));
    }

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    Server::Impl& server_;

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            console::warn("accept failed:", ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), server_)->run();
        }
        accept();
    }
};

// ═══════════════════════════════════════════
//  Server
// ═══════════════════════════════════════════

Server::Server() : impl_(std::make_unique<Impl>()) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::use(MiddlewareFunction middleware) {
    impl_->middlewares.push_back(std::move(middleware));
    return *this;
}

Server& Server::route(const std::string& method, const std::string& pattern, RouteHandler handler) {
    impl_->routes.push_back(Route{method, pattern, splitSegments(pattern), std::move(handler)});
    return *this;
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->handle(req, res);
}

void Server::listen(const std::string& host, int port, std::size_t threads,
                    std::function<void()> onListening) {
    threads = std::max<std::size_t>(threads, 1);
    impl_->ioc = std::make_unique<net::io_context>(static_cast<int>(threads));

    tcp::endpoint endpoint(net::ip::make_address(host), static_cast<unsigned short>(port));
    std::make_shared<HttpListener>(*impl_->ioc, endpoint, *impl_)->accept();

    // The I/O loop owns the stop signals while it runs
    std::optional<net::signal_set> signals;
    if (!impl_->stopSignals.empty()) {
        signals.emplace(*impl_->ioc);
        for (int sig : impl_->stopSignals) {
            signals->add(sig);
        }
        signals->async_wait([this](const beast::error_code& ec, int sig) {
            if (ec) return;
            stopFromSignal(sig);
        });
    }

    impl_->running = true;

    // A signal caught before the set was installed
    if (signals) {
        if (int sig = pendingSignal.exchange(0); sig != 0) {
            stopFromSignal(sig);
        }
    }

    if (onListening && impl_->running) {
        onListening();
    }

    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    for (std::size_t i = 1; i < threads; ++i) {
        workers.emplace_back([&ioc = *impl_->ioc] { ioc.run(); });
    }
    impl_->ioc->run();

    for (auto& worker : workers) {
        worker.join();
    }
    impl_->running = false;
}

Server& Server::stopOnSignals(std::vector<int> signals, SignalHandler onSignal) {
    impl_->stopSignals = std::move(signals);
    impl_->onSignal = std::move(onSignal);
    pendingSignal.store(0);
    for (int sig : impl_->stopSignals) {
        std::signal(sig, recordPendingSignal);
    }
    return *this;
}

void Server::stopFromSignal(int sig) {
    if (impl_->onSignal) {
        impl_->onSignal(sig);
    }
    close();
}

void Server::close() {
    if (impl_->ioc && impl_->running.exchange(false)) {
        impl_->ioc->stop();
    }
}

bool Server::running() const {
    return impl_->running.load();
}

} // namespace pilot::http
