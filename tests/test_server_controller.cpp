#include <gtest/gtest.h>
#include <managers/server_controller.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <mutex>
#include <vector>

// Runs a real /bin/sh child; readiness and port checks are stubbed so no
// sockets are involved.
class ServerControllerTest : public ::testing::Test {
protected:
    std::unique_ptr<ServerController> make(const std::string& script, bool ready = true,
                                           bool port_free = true) {
        ServerConfig config;
        config.bind = "127.0.0.1";
        config.startup_timeout_ms = 400;
        config.grace_period_ms = 500;
        auto launch = [script](int, const std::string&) {
            LaunchSpec spec;
            spec.program = "/bin/sh";
            spec.args = {"-c", script};
            return spec;
        };
        auto controller = std::make_unique<ServerController>(
            config, launch, posix_supervisor_factory(),
            [ready](int) { return ready; },
            [port_free](int, const std::string&) { return port_free; });
        controller->set_listener([this](const ServerProcessState& s) {
            std::lock_guard<std::mutex> lock(mutex);
            phases.push_back(s.phase);
        });
        return controller;
    }

    bool wait_for_phase(ServerController& c, ServerPhase phase, int timeout_ms = 3000) {
        for (int waited = 0; waited < timeout_ms; waited += 20) {
            if (c.state().phase == phase) return true;
            platform::sleep_ms(20);
        }
        return false;
    }

    std::mutex mutex;
    std::vector<ServerPhase> phases;
};

TEST_F(ServerControllerTest, StartStopStart) {
    auto c = make("sleep 30");
    EXPECT_EQ(c->state().phase, ServerPhase::NotStarted);

    auto started = c->start(6123);
    ASSERT_TRUE(started.is_ok()) << started.error;
    EXPECT_EQ(started.value.phase, ServerPhase::Running);
    EXPECT_EQ(started.value.port, 6123);
    EXPECT_GT(started.value.pid, 0);
    EXPECT_EQ(started.value.url, "http://127.0.0.1:6123/");

    // Already running: no second child
    auto again = c->start();
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value.pid, started.value.pid);

    auto stopped = c->stop();
    ASSERT_TRUE(stopped.is_ok());
    EXPECT_EQ(stopped.value.phase, ServerPhase::Stopped);
    EXPECT_EQ(stopped.value.pid, -1);
    EXPECT_TRUE(stopped.value.url.empty());

    EXPECT_TRUE(c->stop().is_ok());
    EXPECT_EQ(c->state().phase, ServerPhase::Stopped);

    auto restarted = c->start(6124);
    ASSERT_TRUE(restarted.is_ok());
    EXPECT_EQ(restarted.value.phase, ServerPhase::Running);
    EXPECT_NE(restarted.value.pid, started.value.pid);
    EXPECT_TRUE(c->stop().is_ok());

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_GE(phases.size(), 4u);
    EXPECT_EQ(phases.front(), ServerPhase::Starting);
    EXPECT_EQ(phases.back(), ServerPhase::Stopped);
}

TEST_F(ServerControllerTest, StopBeforeStartIsNoOp) {
    auto c = make("sleep 30");
    auto r = c->stop();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.phase, ServerPhase::NotStarted);
}

TEST_F(ServerControllerTest, RestartKeepsPort) {
    auto c = make("sleep 30");
    auto first = c->start(6200);
    ASSERT_TRUE(first.is_ok());
    auto second = c->restart();
    ASSERT_TRUE(second.is_ok()) << second.error;
    EXPECT_EQ(second.value.port, 6200);
    EXPECT_NE(second.value.pid, first.value.pid);
    EXPECT_TRUE(c->stop().is_ok());
}

TEST_F(ServerControllerTest, RandomPortWhenUnconfigured) {
    auto c = make("sleep 30");
    auto r = c->start();
    ASSERT_TRUE(r.is_ok());
    EXPECT_GE(r.value.port, SERVER_RANDOM_PORT_MIN);
    EXPECT_LE(r.value.port, SERVER_RANDOM_PORT_MAX);
    EXPECT_TRUE(c->stop().is_ok());
}

TEST_F(ServerControllerTest, UnexpectedExitBecomesCrashed) {
    auto c = make("sleep 0.3; exit 3");
    ASSERT_TRUE(c->start(6300).is_ok());
    ASSERT_TRUE(wait_for_phase(*c, ServerPhase::Crashed));

    auto s = c->state();
    ASSERT_TRUE(s.exit_code.has_value());
    EXPECT_EQ(*s.exit_code, 3);
    EXPECT_TRUE(s.url.empty());

    // Crashed → Starting is allowed
    auto again = c->start(6301);
    ASSERT_TRUE(again.is_ok()) << again.error;
    EXPECT_EQ(again.value.phase, ServerPhase::Running);
    EXPECT_TRUE(c->stop().is_ok());
}

TEST_F(ServerControllerTest, ExitBeforeReadyIsLifecycleError) {
    auto c = make("exit 5", false);
    auto r = c->start(6400);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ProcessLifecycle);
    EXPECT_EQ(r.value.phase, ServerPhase::Crashed);
    ASSERT_TRUE(r.value.exit_code.has_value());
    EXPECT_EQ(*r.value.exit_code, 5);
}

TEST_F(ServerControllerTest, NeverReadyIsKilledAfterTimeout) {
    auto c = make("sleep 30", false);
    auto r = c->start(6500);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ProcessLifecycle);
    EXPECT_EQ(c->state().phase, ServerPhase::Crashed);
}

TEST_F(ServerControllerTest, BusyPortIsRejectedBeforeSpawning) {
    auto c = make("sleep 30", true, false);
    auto r = c->start(6600);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::PortInUse);
    EXPECT_EQ(c->state().phase, ServerPhase::NotStarted);
    EXPECT_EQ(c->start(70000).kind, ErrorKind::InvalidArgument);
}

TEST_F(ServerControllerTest, MissingProgramIsLifecycleError) {
    ServerConfig config;
    config.startup_timeout_ms = 400;
    ServerController c(config, [](int, const std::string&) {
        LaunchSpec spec;
        spec.program = "/nonexistent/vpsx-server";
        return spec;
    }, posix_supervisor_factory(), [](int) { return false; },
       [](int, const std::string&) { return true; });

    auto r = c.start(6700);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ProcessLifecycle);
    EXPECT_EQ(c.state().phase, ServerPhase::Crashed);
}

TEST(PortOpen, ChecksTheGivenAddress) {
    namespace asio = boost::asio;
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, {asio::ip::make_address("127.0.0.2"), 0});
    int port = acceptor.local_endpoint().port();

    EXPECT_TRUE(platform::is_port_open(port, "127.0.0.2"));
    EXPECT_FALSE(platform::is_port_open(port, "127.0.0.1"));
    EXPECT_FALSE(platform::is_port_open(port, "not-an-address"));
}

#ifdef VPSX_BINARY
// The real `vpsx serve` child on a non-loopback-default address, with the
// default readiness and port checks.
TEST(ServerControllerRealServer, StartStopStartOnSpecificBind) {
    ServerConfig config;
    config.bind = "127.0.0.2";
    config.startup_timeout_ms = 5000;
    config.grace_period_ms = 2000;
    ServerController c(config, [](int port, const std::string& bind) {
        LaunchSpec spec;
        spec.program = VPSX_BINARY;
        spec.args = {"serve", "--port", std::to_string(port), "--bind", bind};
        return spec;
    });

    int port = 0;
    for (int candidate = 7300; candidate < 7400 && port == 0; candidate++) {
        if (platform::is_port_available(candidate, "127.0.0.2")) port = candidate;
    }
    ASSERT_NE(port, 0);

    auto first = c.start(port);
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_EQ(first.value.phase, ServerPhase::Running);
    EXPECT_EQ(first.value.url, "http://127.0.0.2:" + std::to_string(port) + "/");
    EXPECT_TRUE(platform::is_port_open(port, "127.0.0.2"));

    ASSERT_TRUE(c.stop().is_ok());
    EXPECT_EQ(c.state().phase, ServerPhase::Stopped);

    auto second = c.start(port);
    ASSERT_TRUE(second.is_ok()) << second.error;
    EXPECT_EQ(second.value.phase, ServerPhase::Running);
    EXPECT_NE(second.value.pid, first.value.pid);
    EXPECT_TRUE(c.stop().is_ok());
}
#endif
