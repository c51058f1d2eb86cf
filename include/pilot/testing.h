#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/testing.h — In-process TestClient and mock requests
// ═══════════════════════════════════════════════════════════════════
//
//  TestClient client(app);
//  auto result = client.post("/simulate-crash").query("mode", "reset").exec();
//  EXPECT_EQ(result.status, 200);
//
//  Requests go through the full middleware chain and router without
//  touching a socket.
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <cctype>
#include <map>
#include <stdexcept>
#include <string>

namespace pilot::testing {

// ── Build a Request as the transport would ──
//    The url carries the query pairs in key order.
inline http::Request createRequest(const std::string& method = "GET",
                                   const std::string& path = "/",
                                   const http::Headers& query = {},
                                   const http::Headers& headers = {}) {
    http::Request req;
    req.method = method;
    req.path = path;
    req.url = path;
    req.query = query;
    req.ip = "127.0.0.1";

    const std::map<std::string, std::string> sorted(query.begin(), query.end());
    for (const auto& [key, value] : sorted) {
        req.url += (req.url.size() == path.size() ? "?" : "&") + key + "=" + value;
    }

    for (const auto& [name, value] : headers) {
        std::string key;
        for (unsigned char c : name) key += static_cast<char>(std::tolower(c));
        req.headers[key] = value;
    }
    return req;
}

struct TestResult {
    int status = 0;
    std::string body;
    http::Headers headers;

    nlohmann::json json() const { return nlohmann::json::parse(body); }

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? "" : it->second;
    }
};

// ═══════════════════════════════════════════
//  TestClient — supertest-style API
// ═══════════════════════════════════════════
class TestClient {
public:
    explicit TestClient(http::Server& app) : app_(app) {}

    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, std::string method, std::string path)
            : app_(app), method_(std::move(method)), path_(std::move(path)) {}

        RequestBuilder& set(const std::string& header, const std::string& value) {
            headers_[header] = value;
            return *this;
        }

        RequestBuilder& query(const std::string& key, const std::string& value) {
            query_[key] = value;
            return *this;
        }

        TestResult exec() {
            auto req = createRequest(method_, path_, query_, headers_);
            http::Response res;
            app_.handleRequest(req, res);
            return TestResult{res.statusCode(), res.body(), res.headers()};
        }

        // exec(), throwing std::runtime_error on any other status
        TestResult expect(int status) {
            auto result = exec();
            if (result.status != status) {
                throw std::runtime_error("expected " + std::to_string(status) + ", got " +
                                         std::to_string(result.status) + ": " + result.body);
            }
            return result;
        }

    private:
        http::Server& app_;
        std::string method_;
        std::string path_;
        http::Headers headers_;
        http::Headers query_;
    };

    RequestBuilder get(const std::string& path) { return {app_, "GET", path}; }
    RequestBuilder post(const std::string& path) { return {app_, "POST", path}; }

private:
    http::Server& app_;
};

} // namespace pilot::testing
