// ═══════════════════════════════════════════════════════════════════
//  test_lifecycle.cpp — Signal driven shutdown of a listening server
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <pilot/lifecycle.h>

#include <chrono>
#include <csignal>
#include <thread>

using namespace pilot;

TEST(LifecycleTest, NoSignalBeforeShutdown) {
    EXPECT_FALSE(lifecycle::shutdownSignal().has_value());
}

TEST(LifecycleTest, SigtermStopsListeningServer) {
    http::Server app;
    app.get("/", [](http::Request&, http::Response& res) { res.send("ok"); });
    lifecycle::enableGracefulShutdown(app);

    bool ready = false;
    // Port 0 binds an ephemeral port; the signal arrives before the loop runs
    app.listen("127.0.0.1", 0, 2, [&] {
        ready = true;
        EXPECT_TRUE(app.running());
        std::raise(SIGTERM);
    });

    EXPECT_TRUE(ready);
    EXPECT_FALSE(app.running());
    ASSERT_TRUE(lifecycle::shutdownSignal().has_value());
    EXPECT_EQ(*lifecycle::shutdownSignal(), SIGTERM);
}

TEST(LifecycleTest, SignalBeforeListenMakesListenReturn) {
    http::Server app;
    lifecycle::enableGracefulShutdown(app);

    std::raise(SIGINT);
    EXPECT_FALSE(app.running());

    bool ready = false;
    std::thread loop([&] { app.listen("127.0.0.1", 0, 1, [&] { ready = true; }); });
    loop.join();

    EXPECT_FALSE(ready);
    EXPECT_FALSE(app.running());
    EXPECT_EQ(lifecycle::shutdownSignal(), SIGINT);
}

TEST(LifecycleTest, SignalFromAnotherThreadStopsRunningServer) {
    http::Server app;
    lifecycle::enableGracefulShutdown(app);

    std::thread loop([&] { app.listen("127.0.0.1", 0, 2); });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!app.running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(app.running());

    std::raise(SIGTERM);
    loop.join();

    EXPECT_FALSE(app.running());
    EXPECT_EQ(lifecycle::shutdownSignal(), SIGTERM);
}

TEST(LifecycleTest, ListenFailureThrows) {
    http::Server app;
    EXPECT_THROW(app.listen("203.0.113.7", 8080, 1), std::runtime_error);
    EXPECT_FALSE(app.running());
}
