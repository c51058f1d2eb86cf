// ═══════════════════════════════════════════════════════════════════
//  test_app.cpp — Endpoints end to end through the TestClient
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <pilot/app.h>
#include <pilot/handlers.h>
#include <pilot/testing.h>

#include <memory>
#include <regex>

using namespace pilot;
using pilot::testing::TestClient;

class AppTest : public ::testing::Test {
protected:
    // Every chaos draw returns *draw
    std::shared_ptr<double> draw = std::make_shared<double>(0.5);
    AppContext ctx{[d = draw] { return *d; }, false};
    http::Server app = createApp(ctx, {.accessLog = false});
    TestClient client{app};

    double count(const std::string& method, const std::string& endpoint, int status) {
        return ctx.registry.requestCount(method, endpoint, status);
    }
};

// ═══════════════════════════════════════════
//  GET /
// ═══════════════════════════════════════════

TEST_F(AppTest, InfoDescribesService) {
    auto result = client.get("/").expect(200);
    auto j = result.json();

    EXPECT_EQ(j["application"], "The Resilience Pilot");
    EXPECT_EQ(j["version"], "1.0.0");
    EXPECT_EQ(j["endpoints"]["health"], "/health");
    EXPECT_EQ(j["endpoints"]["metrics"], "/metrics");
    EXPECT_EQ(j["endpoints"]["chaos"], "/simulate-crash");
    EXPECT_EQ(result.header("Content-Type"), "application/json; charset=utf-8");
}

// ═══════════════════════════════════════════
//  GET /health
// ═══════════════════════════════════════════

TEST_F(AppTest, HealthyByDefault) {
    auto j = client.get("/health").expect(200).json();

    EXPECT_EQ(j["status"], "healthy");
    EXPECT_TRUE(j["uptime"].is_number());
    EXPECT_GE(j["uptime"].get<double>(), 0.0);
    EXPECT_TRUE(std::regex_match(j["uptime_formatted"].get<std::string>(),
                                 std::regex(R"(^(\d+d )?(\d+h )?(\d+m )?\d+s$)")));
    EXPECT_EQ(j["chaos_mode"], false);
}

TEST_F(AppTest, HealthUpdatesUptimeGauge) {
    client.get("/health").expect(200);
    EXPECT_GE(ctx.registry.uptime(), 0.0);
    EXPECT_LE(ctx.registry.uptime(), ctx.uptime.elapsed().count());
}

TEST_F(AppTest, DegradedAtOneFailsEveryHealthCheck) {
    client.post("/simulate-crash").query("mode", "degraded").query("probability", "1.0").expect(200);

    for (int i = 0; i < 20; ++i) {
        auto result = client.get("/health").exec();
        ASSERT_EQ(result.status, 503);
        EXPECT_EQ(result.json()["detail"], handlers::kServiceDegraded);
    }
    EXPECT_DOUBLE_EQ(count("GET", "/health", 503), 20.0);
    EXPECT_DOUBLE_EQ(count("GET", "/health", 200), 0.0);
}

TEST_F(AppTest, DegradedHealthFollowsDraws) {
    client.post("/simulate-crash").query("mode", "degraded").query("probability", "0.3").expect(200);

    *draw = 0.29;
    EXPECT_EQ(client.get("/health").exec().status, 503);

    *draw = 0.3;
    auto j = client.get("/health").expect(200).json();
    EXPECT_EQ(j["chaos_mode"], true);
}

TEST_F(AppTest, ResetRestoresHealth) {
    client.post("/simulate-crash").query("mode", "degraded").expect(200);
    *draw = 0.0;
    EXPECT_EQ(client.get("/health").exec().status, 503);

    auto j = client.post("/simulate-crash").query("mode", "reset").expect(200).json();
    EXPECT_EQ(j["status"], "chaos_disabled");
    EXPECT_EQ(j["message"], "Service restored to healthy state");

    for (int i = 0; i < 20; ++i) {
        ASSERT_EQ(client.get("/health").exec().status, 200);
    }
    EXPECT_FALSE(ctx.chaos.enabled());
}

// ═══════════════════════════════════════════
//  POST /simulate-crash
// ═══════════════════════════════════════════

TEST_F(AppTest, ImmediateCrashIs500AndCounted) {
    for (int i = 1; i <= 3; ++i) {
        auto result = client.post("/simulate-crash").query("mode", "immediate").exec();
        EXPECT_EQ(result.status, 500);
        EXPECT_EQ(result.json()["detail"], handlers::kChaosInjected);
        EXPECT_DOUBLE_EQ(count("POST", "/simulate-crash", 500), i);
    }
    EXPECT_FALSE(ctx.chaos.enabled());
}

TEST_F(AppTest, ModeDefaultsToImmediate) {
    auto result = client.post("/simulate-crash").exec();
    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.json()["detail"], handlers::kChaosInjected);
}

TEST_F(AppTest, DegradedResponseBody) {
    auto j = client.post("/simulate-crash")
        .query("mode", "degraded")
        .query("probability", "0.5")
        .expect(200)
        .json();

    EXPECT_EQ(j["status"], "chaos_enabled");
    EXPECT_EQ(j["mode"], "degraded");
    EXPECT_DOUBLE_EQ(j["failure_probability"].get<double>(), 0.5);
    EXPECT_EQ(j["message"], "Health endpoint will fail 50.0% of the time");
    EXPECT_TRUE(ctx.chaos.enabled());
}

TEST_F(AppTest, DegradedProbabilityDefaultsToOne) {
    auto j = client.post("/simulate-crash").query("mode", "degraded").expect(200).json();

    EXPECT_DOUBLE_EQ(j["failure_probability"].get<double>(), 1.0);
    EXPECT_EQ(j["message"], "Health endpoint will fail 100.0% of the time");
}

TEST_F(AppTest, DegradedProbabilityIsClamped) {
    auto high = client.post("/simulate-crash")
        .query("mode", "degraded").query("probability", "7").expect(200).json();
    EXPECT_DOUBLE_EQ(high["failure_probability"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(ctx.chaos.probability(), 1.0);

    auto low = client.post("/simulate-crash")
        .query("mode", "degraded").query("probability", "-0.5").expect(200).json();
    EXPECT_DOUBLE_EQ(low["failure_probability"].get<double>(), 0.0);
    EXPECT_EQ(low["message"], "Health endpoint will fail 0.0% of the time");
    EXPECT_TRUE(ctx.chaos.enabled());
}

TEST_F(AppTest, InvalidProbabilityIs422) {
    auto result = client.post("/simulate-crash")
        .query("mode", "degraded").query("probability", "lots").exec();

    EXPECT_EQ(result.status, 422);
    EXPECT_EQ(result.json()["detail"], "Invalid probability: lots");
    EXPECT_FALSE(ctx.chaos.enabled());
}

TEST_F(AppTest, UnknownModeIs400AndLeavesChaosAlone) {
    client.post("/simulate-crash").query("mode", "degraded").query("probability", "0.4").expect(200);

    auto result = client.post("/simulate-crash").query("mode", "bogus").exec();
    EXPECT_EQ(result.status, 400);
    EXPECT_EQ(result.json()["detail"],
              "Unknown mode: bogus. Use 'immediate', 'degraded', or 'reset'");

    EXPECT_TRUE(ctx.chaos.enabled());
    EXPECT_DOUBLE_EQ(ctx.chaos.probability(), 0.4);
    EXPECT_DOUBLE_EQ(count("POST", "/simulate-crash", 400), 1.0);
}

TEST_F(AppTest, InvalidProbabilityRejectedForEveryMode) {
    client.post("/simulate-crash").query("mode", "degraded").query("probability", "1.0").expect(200);

    for (const char* mode : {"reset", "immediate", "bogus", "degraded"}) {
        auto result = client.post("/simulate-crash")
            .query("mode", mode).query("probability", "junk").exec();
        EXPECT_EQ(result.status, 422) << mode;
        EXPECT_EQ(result.json()["detail"], "Invalid probability: junk") << mode;
    }

    // Nothing ran: still degraded at 1.0
    EXPECT_TRUE(ctx.chaos.enabled());
    EXPECT_DOUBLE_EQ(ctx.chaos.probability(), 1.0);
    EXPECT_DOUBLE_EQ(count("POST", "/simulate-crash", 422), 4.0);
    EXPECT_DOUBLE_EQ(count("POST", "/simulate-crash", 500), 0.0);
}

TEST_F(AppTest, ValidProbabilityAcceptedOutsideDegraded) {
    client.post("/simulate-crash").query("mode", "degraded").expect(200);
    client.post("/simulate-crash").query("mode", "reset").query("probability", "0.5").expect(200);
    EXPECT_FALSE(ctx.chaos.enabled());
}

// ═══════════════════════════════════════════
//  GET /metrics
// ═══════════════════════════════════════════

TEST_F(AppTest, MetricsExposition) {
    client.get("/health").expect(200);
    auto result = client.get("/metrics").expect(200);

    EXPECT_EQ(result.header("Content-Type"), "text/plain; version=0.0.4; charset=utf-8");
    EXPECT_NE(result.body.find(
        "http_requests_total{method=\"GET\",endpoint=\"/health\",status=\"200\"} 1.0"),
        std::string::npos);
    EXPECT_NE(result.body.find(
        "http_request_duration_seconds_count{method=\"GET\",endpoint=\"/health\"} 1.0"),
        std::string::npos);
    EXPECT_NE(result.body.find("# TYPE app_uptime_seconds gauge"), std::string::npos);
}

TEST_F(AppTest, ScrapeSeesEarlierScrapes) {
    client.get("/metrics").expect(200);
    auto body = client.get("/metrics").expect(200).body;

    EXPECT_NE(body.find(
        "http_requests_total{method=\"GET\",endpoint=\"/metrics\",status=\"200\"} 1.0"),
        std::string::npos);
}

// ═══════════════════════════════════════════
//  Instrumentation across endpoints
// ═══════════════════════════════════════════

TEST_F(AppTest, EveryRequestRecordedExactlyOnce) {
    client.get("/").exec();
    client.get("/health").exec();
    client.get("/metrics").exec();
    client.post("/simulate-crash").query("mode", "immediate").exec();
    client.post("/simulate-crash").query("mode", "reset").exec();
    client.get("/missing").exec();

    EXPECT_DOUBLE_EQ(count("GET", "/", 200), 1.0);
    EXPECT_DOUBLE_EQ(count("GET", "/health", 200), 1.0);
    EXPECT_DOUBLE_EQ(count("GET", "/metrics", 200), 1.0);
    EXPECT_DOUBLE_EQ(count("POST", "/simulate-crash", 500), 1.0);
    EXPECT_DOUBLE_EQ(count("POST", "/simulate-crash", 200), 1.0);
    EXPECT_DOUBLE_EQ(count("GET", "/missing", 404), 1.0);

    EXPECT_EQ(ctx.registry.latencyCount("GET", "/"), 1u);
    EXPECT_EQ(ctx.registry.latencyCount("GET", "/health"), 1u);
    EXPECT_EQ(ctx.registry.latencyCount("GET", "/metrics"), 1u);
    EXPECT_EQ(ctx.registry.latencyCount("POST", "/simulate-crash"), 2u);
    EXPECT_EQ(ctx.registry.latencyCount("GET", "/missing"), 1u);
}

TEST_F(AppTest, WrongMethodIs405) {
    auto result = client.get("/simulate-crash").exec();
    EXPECT_EQ(result.status, 405);
    EXPECT_DOUBLE_EQ(count("GET", "/simulate-crash", 405), 1.0);
}

TEST(AppAccessLogTest, AccessLogDoesNotChangeCounts) {
    AppContext ctx(false);
    auto app = createApp(ctx);
    TestClient client(app);

    client.get("/").expect(200);
    client.post("/simulate-crash").exec();

    EXPECT_DOUBLE_EQ(ctx.registry.requestCount("GET", "/", 200), 1.0);
    EXPECT_DOUBLE_EQ(ctx.registry.requestCount("POST", "/simulate-crash", 500), 1.0);
    EXPECT_EQ(ctx.registry.latencyCount("POST", "/simulate-crash"), 1u);
}
