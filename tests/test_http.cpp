// ═══════════════════════════════════════════════════════════════════
//  test_http.cpp — Request, Response, routing and the fault boundary
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "pilot/http.h"
#include "pilot/testing.h"

#include <stdexcept>
#include <vector>

using namespace pilot;
using namespace pilot::http;
using pilot::testing::TestClient;

// ═══════════════════════════════════════════
//  Request Tests
// ═══════════════════════════════════════════

TEST(RequestTest, HeaderLookupCaseInsensitive) {
    Request req;
    req.headers["content-type"] = "application/json";

    EXPECT_EQ(req.header("Content-Type"), "application/json");
    EXPECT_EQ(req.header("content-type"), "application/json");
    EXPECT_EQ(req.header("nonexistent"), "");
}

TEST(RequestTest, QueryFallback) {
    Request req;
    req.query["mode"] = "reset";

    EXPECT_EQ(req.queryOr("mode", "immediate"), "reset");
    EXPECT_EQ(req.queryOr("probability", "1.0"), "1.0");
    EXPECT_TRUE(req.hasQuery("mode"));
    EXPECT_FALSE(req.hasQuery("probability"));
}

// ═══════════════════════════════════════════
//  Response Tests
// ═══════════════════════════════════════════

TEST(ResponseTest, DefaultStatus200) {
    int sentStatus = 0;
    Response res([&](int s, const auto&, const auto&) { sentStatus = s; });

    res.send("OK");
    EXPECT_EQ(sentStatus, 200);
}

TEST(ResponseTest, StatusChaining) {
    int sentStatus = 0;
    Response res([&](int s, const auto&, const auto&) { sentStatus = s; });

    res.status(404).send("Not Found");
    EXPECT_EQ(sentStatus, 404);
}

TEST(ResponseTest, SendOnlyOnce) {
    int callCount = 0;
    Response res([&](int, const auto&, const auto&) { callCount++; });

    res.send("first");
    res.send("second");

    EXPECT_EQ(callCount, 1);
    EXPECT_TRUE(res.sent());
    EXPECT_EQ(res.body(), "first");
}

TEST(ResponseTest, JsonSetsContentType) {
    std::unordered_map<std::string, std::string> sentHeaders;
    std::string sentBody;
    Response res([&](int, const auto& h, const std::string& b) {
        sentHeaders = h;
        sentBody = b;
    });

    res.json({{"status", "healthy"}});

    EXPECT_EQ(sentHeaders["Content-Type"], "application/json; charset=utf-8");
    EXPECT_EQ(nlohmann::json::parse(sentBody)["status"], "healthy");
}

TEST(ResponseTest, DetailEnvelope) {
    Response res;
    res.detail(400, "bad input");

    EXPECT_EQ(res.statusCode(), 400);
    EXPECT_EQ(nlohmann::json::parse(res.body()), nlohmann::json({{"detail", "bad input"}}));
}

TEST(ResponseTest, PlainTextDefault) {
    Response res;
    res.send("hello");
    EXPECT_EQ(res.headers().at("Content-Type"), "text/plain; charset=utf-8");
}

// ═══════════════════════════════════════════
//  Routing Tests
// ═══════════════════════════════════════════

class RoutingTest : public ::testing::Test {
protected:
    Server app;

    void SetUp() override {
        app.get("/items", [](Request&, Response& res) {
            res.json({{"items", nlohmann::json::array()}});
        });

        app.get("/items/:id", [](Request& req, Response& res) {
            res.json({{"id", req.params["id"]}, {"route", req.route}});
        });

        app.post("/items", [](Request&, Response& res) {
            res.status(201).json({{"created", true}});
        });

        app.get("/http-error", [](Request&, Response&) {
            throw HttpError(418, "short and stout");
        });

        app.get("/boom", [](Request&, Response&) {
            throw std::runtime_error("unexpected");
        });

        app.get("/odd-throw", [](Request&, Response&) {
            throw 42;
        });

        app.get("/silent", [](Request&, Response&) {});
    }
};

TEST_F(RoutingTest, MatchesMethodAndPath) {
    TestClient client(app);

    EXPECT_EQ(client.get("/items").exec().status, 200);
    EXPECT_EQ(client.post("/items").exec().status, 201);
}

TEST_F(RoutingTest, RouteParametersAndPattern) {
    TestClient client(app);
    auto j = client.get("/items/42").expect(200).json();

    EXPECT_EQ(j["id"], "42");
    EXPECT_EQ(j["route"], "/items/:id");
}

TEST_F(RoutingTest, UnknownPathIs404WithDetail) {
    TestClient client(app);
    auto result = client.get("/nowhere").exec();

    EXPECT_EQ(result.status, 404);
    EXPECT_EQ(result.json()["detail"], "Not Found");
}

TEST_F(RoutingTest, WrongMethodIs405WithDetail) {
    TestClient client(app);
    auto result = client.post("/items/7").exec();

    EXPECT_EQ(result.status, 405);
    EXPECT_EQ(result.json()["detail"], "Method Not Allowed");
}

TEST_F(RoutingTest, HttpErrorBecomesItsStatus) {
    TestClient client(app);
    auto result = client.get("/http-error").exec();

    EXPECT_EQ(result.status, 418);
    EXPECT_EQ(result.json()["detail"], "short and stout");
}

TEST_F(RoutingTest, UnhandledExceptionBecomesGeneric500) {
    TestClient client(app);
    auto result = client.get("/boom").exec();

    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.json()["detail"], "Internal Server Error");
}

TEST_F(RoutingTest, NonStandardExceptionBecomesGeneric500) {
    TestClient client(app);
    auto result = client.get("/odd-throw").exec();

    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.json()["detail"], "Internal Server Error");
}

TEST_F(RoutingTest, HandlerWithoutResponseIs500) {
    TestClient client(app);
    auto result = client.get("/silent").exec();

    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.json()["detail"], "Internal Server Error");
}

// ═══════════════════════════════════════════
//  Middleware chain
// ═══════════════════════════════════════════

TEST(MiddlewareChainTest, RunsInRegistrationOrder) {
    Server app;
    std::vector<std::string> order;

    app.use([&](Request&, Response&, NextFunction next) {
        order.push_back("first:before");
        next();
        order.push_back("first:after");
    });
    app.use([&](Request&, Response&, NextFunction next) {
        order.push_back("second");
        next();
    });
    app.get("/", [&](Request&, Response& res) {
        order.push_back("handler");
        res.send("ok");
    });

    TestClient client(app);
    client.get("/").expect(200);

    std::vector<std::string> expected = {"first:before", "second", "handler", "first:after"};
    EXPECT_EQ(order, expected);
}

TEST(MiddlewareChainTest, ShortCircuitSkipsHandler) {
    Server app;
    bool handlerCalled = false;

    app.use([](Request&, Response& res, NextFunction) {
        res.detail(403, "nope");
    });
    app.get("/", [&](Request&, Response& res) {
        handlerCalled = true;
        res.send("ok");
    });

    TestClient client(app);
    EXPECT_EQ(client.get("/").exec().status, 403);
    EXPECT_FALSE(handlerCalled);
}

TEST(ServerTest, NotRunningBeforeListen) {
    Server app;
    EXPECT_FALSE(app.running());
    app.close();    // no-op
    EXPECT_FALSE(app.running());
}
